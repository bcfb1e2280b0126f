/**
 * test_activation.cpp - OTA response classification and a loopback activation check
 */

#include "xvc/net/ActivationClient.hpp"

#include <httplib.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace xvc;
using namespace xvc::net;
using session::ActivationResult;
using session::ActivationStatus;

void test_interpret() {
    ActivationResult pending = ActivationClient::interpret(
        R"({"activation": {"message": "Enter 123456 at xiaozhi.me", "code": "123456"}})");
    assert(pending.status == ActivationStatus::PENDING);
    assert(pending.message == "Enter 123456 at xiaozhi.me (code 123456)");
    assert(pending.identity_token.empty());

    ActivationResult activated = ActivationClient::interpret(
        R"({"firmware": {"version": "1.6.0"}, "websocket": {"url": "wss://x/v1/", "token": "tok-9"}})");
    assert(activated.status == ActivationStatus::ACTIVATED);
    assert(activated.identity_token == "tok-9");

    ActivationResult bare = ActivationClient::interpret(R"({"server_time": {}})");
    assert(bare.status == ActivationStatus::ACTIVATED);
    assert(bare.identity_token.empty());

    ActivationResult mistyped = ActivationClient::interpret(
        R"({"activation": {"message": 5, "code": 777}, "websocket": {"token": 1}})");
    assert(mistyped.status == ActivationStatus::PENDING);
    assert(mistyped.message == "Enter the verification code in the control panel");

    ActivationResult withMqtt = ActivationClient::interpret(
        R"({"websocket": {"token": 1}, "mqtt": {"endpoint": "mq.example:8883", "client_id": "c9"}})");
    assert(withMqtt.status == ActivationStatus::ACTIVATED);
    assert(withMqtt.identity_token.empty());
    assert(withMqtt.mqtt["client_id"] == "c9");

    assert(ActivationClient::interpret("<html>").status == ActivationStatus::FAILED);
    assert(ActivationClient::interpret("[]").status == ActivationStatus::FAILED);

    std::cout << "[PASS] test_interpret" << std::endl;
}

void test_request_body() {
    ActivationOptions options;
    options.identity.device_id = "aa:bb:cc:dd:ee:ff";
    options.identity.client_id = "client-uuid";
    ActivationClient client(options);

    nlohmann::json body = client.requestBody();
    assert(body["mac_address"] == "aa:bb:cc:dd:ee:ff");
    assert(body["uuid"] == "client-uuid");
    assert(body["application"]["version"] == "1.6.0");

    std::cout << "[PASS] test_request_body" << std::endl;
}

static ActivationResult checkOnce(ActivationClient& client) {
    auto promise = std::make_shared<std::promise<ActivationResult>>();
    auto future = promise->get_future();
    client.check([promise](ActivationResult r) { promise->set_value(std::move(r)); });
    assert(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    return future.get();
}

void test_unconfigured_url_fails() {
    ActivationClient client(ActivationOptions{});
    ActivationResult r = checkOnce(client);
    assert(r.status == ActivationStatus::FAILED);
    assert(!r.message.empty());

    std::cout << "[PASS] test_unconfigured_url_fails" << std::endl;
}

void test_loopback_activation() {
    httplib::Server server;
    std::atomic<int> requests{0};
    std::mutex headerMutex;
    std::string deviceHeader;

    server.Post("/xiaozhi/ota/", [&](const httplib::Request& req, httplib::Response& res) {
        int n = ++requests;
        {
            std::lock_guard<std::mutex> lock(headerMutex);
            deviceHeader = req.get_header_value("Device-Id");
        }
        if (n == 1) {
            res.set_content(R"({"activation": {"message": "Enter code", "code": "777"}})", "application/json");
        } else {
            res.set_content(R"({"websocket": {"url": "ws://127.0.0.1/", "token": "fresh"},
                               "mqtt": {"endpoint": "mqtt.example:8883", "client_id": "c1"}})",
                            "application/json");
        }
    });
    server.Post("/broken/", [](const httplib::Request&, httplib::Response& res) { res.status = 500; });

    int port = server.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread listener([&server]() { server.listen_after_bind(); });
    while (!server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    ActivationOptions options;
    options.ota_url = "http://127.0.0.1:" + std::to_string(port) + "/xiaozhi/ota/";
    options.identity.device_id = "aa:bb";
    options.timeout_ms = 3000;
    ActivationClient client(options);

    ActivationResult first = checkOnce(client);
    assert(first.status == ActivationStatus::PENDING);
    assert(first.message == "Enter code (code 777)");
    assert(first.mqtt.is_null());

    ActivationResult second = checkOnce(client);
    assert(second.status == ActivationStatus::ACTIVATED);
    assert(second.identity_token == "fresh");
    assert(second.mqtt["client_id"] == "c1");
    {
        std::lock_guard<std::mutex> lock(headerMutex);
        assert(deviceHeader == "aa:bb");
    }

    ActivationOptions brokenOptions = options;
    brokenOptions.ota_url = "http://127.0.0.1:" + std::to_string(port) + "/broken/";
    ActivationClient broken(brokenOptions);
    assert(checkOnce(broken).status == ActivationStatus::FAILED);

    server.stop();
    listener.join();
    assert(requests == 2);

    std::cout << "[PASS] test_loopback_activation" << std::endl;
}

int main() {
    std::cout << "=== Activation Tests ===" << std::endl;

    test_interpret();
    test_request_body();
    test_unconfigured_url_fails();
    test_loopback_activation();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
