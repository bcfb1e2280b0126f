/**
 * ActivationClient.cpp - OTA activation polling over cpp-httplib
 */

#include "xvc/net/ActivationClient.hpp"
#include "xvc/config/ConfigStore.hpp"

#include <iostream>
#include <thread>

#include <httplib.h>

using json = nlohmann::json;

namespace xvc::net {

namespace {

// Server fields of the wrong type read as empty
std::string textField(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

ActivationOptions ActivationOptions::fromConfig(const config::ConfigStore& store) {
    ActivationOptions o;
    o.ota_url = store.getString("SYSTEM_OPTIONS.NETWORK.OTA_VERSION_URL");
    o.identity.device_id = store.getString("SYSTEM_OPTIONS.DEVICE_ID");
    o.identity.client_id = store.getString("SYSTEM_OPTIONS.CLIENT_ID");
    return o;
}

struct ActivationClient::Impl {
    ActivationOptions options;
    std::string base;   // scheme://host[:port]
    std::string path;

    std::thread worker;

    explicit Impl(ActivationOptions opts) : options(std::move(opts)) {
        size_t scheme = options.ota_url.find("://");
        size_t slash = options.ota_url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
        base = options.ota_url.substr(0, slash);
        path = slash == std::string::npos ? "/" : options.ota_url.substr(slash);
    }

    ~Impl() {
        if (worker.joinable()) {
            worker.join();
        }
    }

    session::ActivationResult request(const std::string& body) {
        session::ActivationResult result;

        if (options.ota_url.empty()) {
            result.message = "OTA_VERSION_URL not configured";
            return result;
        }

        httplib::Client client(base);
        client.set_connection_timeout(options.timeout_ms / 1000, (options.timeout_ms % 1000) * 1000);
        client.set_read_timeout(options.timeout_ms / 1000, (options.timeout_ms % 1000) * 1000);

        httplib::Headers headers = {
            {"Activation-Version", options.app_version},
            {"Device-Id", options.identity.device_id},
            {"Client-Id", options.identity.client_id},
            {"User-Agent", "xvc/" + options.app_version},
            {"Accept-Language", "zh-CN"},
        };

        auto res = client.Post(path, headers, body, "application/json");
        if (!res || res->status != 200) {
            result.message = "OTA request failed: " + (res ? std::to_string(res->status) : httplib::to_string(res.error()));
            std::cerr << "[Activation] " << result.message << std::endl;
            return result;
        }

        return interpret(res->body);
    }
};

ActivationClient::ActivationClient(ActivationOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
}

ActivationClient::~ActivationClient() = default;

void ActivationClient::check(Completion done) {
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }

    std::string body = requestBody().dump();
    impl_->worker = std::thread([impl = impl_.get(), body, done = std::move(done)]() {
        session::ActivationResult result = impl->request(body);
        if (done) done(std::move(result));
    });
}

session::ActivationResult ActivationClient::interpret(const std::string& body) {
    session::ActivationResult result;

    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        result.message = std::string("Malformed OTA response: ") + e.what();
        std::cerr << "[Activation] " << result.message << std::endl;
        return result;
    }

    if (!response.is_object()) {
        result.message = "OTA response is not an object";
        return result;
    }

    if (response.contains("activation") && response["activation"].is_object()) {
        const json& activation = response["activation"];
        result.status = session::ActivationStatus::PENDING;
        result.message = textField(activation, "message");
        if (result.message.empty()) {
            result.message = "Enter the verification code in the control panel";
        }
        std::string code = textField(activation, "code");
        if (!code.empty()) {
            result.message += " (code " + code + ")";
        }
        return result;
    }

    result.status = session::ActivationStatus::ACTIVATED;
    if (response.contains("websocket") && response["websocket"].is_object()) {
        result.identity_token = textField(response["websocket"], "token");
    }
    if (response.contains("mqtt") && response["mqtt"].is_object()) {
        result.mqtt = response["mqtt"];
    }
    return result;
}

json ActivationClient::requestBody() const {
    const auto& o = impl_->options;
    return {
        {"version", 2},
        {"mac_address", o.identity.device_id},
        {"uuid", o.identity.client_id},
        {"application", {
            {"name", "xiaozhi"},
            {"version", o.app_version},
        }},
        {"board", {
            {"type", "xvc-desktop"},
            {"name", "xvc"},
        }},
    };
}

} // namespace xvc::net
