/**
 * MqttTransport.cpp - libmosquitto control channel + Asio UDP audio
 *
 * libmosquitto runs its own network thread; its callbacks only post into
 * the transport strand, where all state lives.
 */

#include "xvc/transport/MqttTransport.hpp"
#include "xvc/protocol/Messages.hpp"
#include "xvc/transport/AudioCipher.hpp"

#include <mosquitto.h>

#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace xvc::transport {

namespace {

// Mistyped fields read as empty
std::string textField(const nlohmann::json& info, const char* key) {
    auto it = info.find(key);
    return it != info.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

MqttOptions MqttOptions::fromJson(const nlohmann::json& info) {
    MqttOptions o;
    if (!info.is_object()) return o;

    std::string endpoint = textField(info, "endpoint");
    size_t colon = endpoint.rfind(':');
    if (colon != std::string::npos) {
        o.host = endpoint.substr(0, colon);
        try {
            o.port = std::stoi(endpoint.substr(colon + 1));
        } catch (const std::exception&) {
            std::cerr << "[MQTT] Bad port in endpoint '" << endpoint << "'" << std::endl;
        }
    } else {
        o.host = endpoint;
    }
    o.tls = (o.port == 8883);

    o.client_id = textField(info, "client_id");
    o.username = textField(info, "username");
    o.password = textField(info, "password");
    o.publish_topic = textField(info, "publish_topic");
    o.subscribe_topic = textField(info, "subscribe_topic");
    return o;
}

namespace {

std::once_flag g_libInit;

constexpr size_t kMaxDatagram = 2048;

} // namespace

struct MqttTransport::Impl : std::enable_shared_from_this<MqttTransport::Impl> {
    // Userdata handed to libmosquitto; identifies which client a callback belongs to
    struct ClientContext {
        std::weak_ptr<Impl> impl;
        uint64_t gen = 0;
    };

    asio::strand<asio::io_context::executor_type> strand;
    MqttOptions options;

    // Client, guarded by clientMutex (publish runs on the caller's thread)
    mosquitto* client = nullptr;
    std::unique_ptr<ClientContext> clientContext;
    std::mutex clientMutex;

    // Strand-only state
    uint64_t gen = 0;
    bool connecting = false;
    bool closing = false;
    bool reported = false;
    std::string sessionId;

    // UDP audio
    udp::resolver resolver;
    std::unique_ptr<udp::socket> socket;
    std::optional<AudioCipher> cipher;
    std::array<uint8_t, kMaxDatagram> recvBuffer{};
    uint64_t udpGen = 0;
    uint32_t localSeq = 0;
    std::optional<uint32_t> remoteSeq;
    uint64_t droppedOut = 0;
    uint64_t droppedIn = 0;

    std::atomic<bool> connected{false};
    std::atomic<bool> udpReady{false};

    std::mutex handlerMutex;
    ControlHandler controlHandler;
    AudioHandler audioHandler;
    DisconnectHandler disconnectHandler;
    ConnectedHandler connectedHandler;

    Impl(asio::io_context& io, MqttOptions opts)
        : strand(asio::make_strand(io))
        , options(std::move(opts))
        , resolver(strand) {
        std::call_once(g_libInit, []() { mosquitto_lib_init(); });
    }

    ~Impl() {
        teardownClient();
    }

    // libmosquitto thread

    static void onConnectCb(mosquitto*, void* obj, int rc) {
        auto* ctx = static_cast<ClientContext*>(obj);
        if (auto self = ctx->impl.lock()) {
            uint64_t id = ctx->gen;
            asio::post(self->strand, [self, id, rc]() { self->onClientConnected(id, rc); });
        }
    }

    static void onDisconnectCb(mosquitto*, void* obj, int rc) {
        auto* ctx = static_cast<ClientContext*>(obj);
        if (auto self = ctx->impl.lock()) {
            uint64_t id = ctx->gen;
            asio::post(self->strand, [self, id, rc]() { self->onClientDisconnected(id, rc); });
        }
    }

    static void onMessageCb(mosquitto*, void* obj, const mosquitto_message* msg) {
        auto* ctx = static_cast<ClientContext*>(obj);
        if (!msg || !msg->payload) return;
        if (auto self = ctx->impl.lock()) {
            uint64_t id = ctx->gen;
            std::string text(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen));
            asio::post(self->strand, [self, id, text = std::move(text)]() { self->onClientMessage(id, text); });
        }
    }

    // Control channel

    void doConnect() {
        if (connecting || connected) return;

        ++gen;
        reported = false;
        closing = false;
        sessionId.clear();
        closeUdp();

        if (options.host.empty() || options.publish_topic.empty()) {
            report("MQTT endpoint or publish topic not configured");
            return;
        }

        std::lock_guard<std::mutex> lock(clientMutex);
        clientContext = std::make_unique<ClientContext>();
        clientContext->impl = weak_from_this();
        clientContext->gen = gen;

        client = mosquitto_new(options.client_id.empty() ? nullptr : options.client_id.c_str(), true,
                               clientContext.get());
        if (!client) {
            clientContext.reset();
            asio::post(strand, [self = shared_from_this()]() { self->report("mosquitto_new failed"); });
            return;
        }

        if (!options.username.empty()) {
            mosquitto_username_pw_set(client, options.username.c_str(), options.password.c_str());
        }
        if (options.tls) {
            int rc = mosquitto_tls_set(client, nullptr, options.ca_path.c_str(), nullptr, nullptr, nullptr);
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] TLS setup failed: " << mosquitto_strerror(rc) << std::endl;
            }
        }

        mosquitto_connect_callback_set(client, &Impl::onConnectCb);
        mosquitto_disconnect_callback_set(client, &Impl::onDisconnectCb);
        mosquitto_message_callback_set(client, &Impl::onMessageCb);

        std::cout << "[MQTT] Connecting to " << options.host << ":" << options.port << std::endl;
        connecting = true;

        int rc = mosquitto_connect_async(client, options.host.c_str(), options.port, options.keepalive_s);
        if (rc == MOSQ_ERR_SUCCESS) {
            rc = mosquitto_loop_start(client);
        }
        if (rc != MOSQ_ERR_SUCCESS) {
            std::string reason = std::string("connect failed: ") + mosquitto_strerror(rc);
            asio::post(strand, [self = shared_from_this(), reason]() { self->report(reason); });
        }
    }

    void onClientConnected(uint64_t id, int rc) {
        if (id != gen || closing) return;

        if (rc != 0) {
            report(std::string("broker refused connection: ") + mosquitto_connack_string(rc));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(clientMutex);
            if (!client) return;
            if (!options.subscribe_topic.empty()) {
                int sub = mosquitto_subscribe(client, nullptr, options.subscribe_topic.c_str(), 0);
                if (sub != MOSQ_ERR_SUCCESS) {
                    std::cerr << "[MQTT] Subscribe failed: " << mosquitto_strerror(sub) << std::endl;
                }
            }
        }

        connecting = false;
        connected = true;
        std::cout << "[MQTT] Connected" << std::endl;

        ConnectedHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = connectedHandler;
        }
        if (handler) handler();
    }

    void onClientDisconnected(uint64_t id, int rc) {
        if (id != gen || closing) return;
        report(std::string("broker connection lost: ") + mosquitto_strerror(rc));
    }

    void onClientMessage(uint64_t id, const std::string& text) {
        if (id != gen || closing) return;

        auto message = protocol::parse(text);
        if (!message) return;

        switch (protocol::typeOf(*message)) {
            case protocol::MessageType::Hello:
            case protocol::MessageType::HelloAck:
                if (auto ack = protocol::parseHelloAck(*message)) {
                    sessionId = ack->session_id;
                    if (ack->udp) {
                        openUdp(*ack->udp);
                    } else {
                        std::cerr << "[MQTT] Hello reply without udp block" << std::endl;
                    }
                }
                break;
            case protocol::MessageType::Unknown:
                if (protocol::stringField(*message, "type") == "goodbye") {
                    std::cout << "[MQTT] Peer ended the audio session" << std::endl;
                    closeUdp();
                    return;
                }
                break;
            default:
                break;
        }

        ControlHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = controlHandler;
        }
        if (handler) handler(*message);
    }

    // UDP audio

    void openUdp(const protocol::UdpParams& params) {
        closeUdp();

        cipher = AudioCipher::create(params.key, params.nonce);
        if (!cipher) {
            std::cerr << "[MQTT] Unusable UDP key/nonce, audio disabled" << std::endl;
            return;
        }

        auto self = shared_from_this();
        uint64_t id = udpGen;
        resolver.async_resolve(params.server, std::to_string(params.port),
            [self, id](const boost::system::error_code& ec, udp::resolver::results_type results) {
                if (id != self->udpGen) return;
                if (ec || results.empty()) {
                    std::cerr << "[MQTT] UDP resolve failed: " << ec.message() << std::endl;
                    return;
                }
                self->bindUdp(results.begin()->endpoint());
            });
    }

    void bindUdp(const udp::endpoint& endpoint) {
        boost::system::error_code ec;
        auto sock = std::make_unique<udp::socket>(strand);
        sock->open(endpoint.protocol(), ec);
        if (!ec) sock->connect(endpoint, ec);
        if (!ec) sock->non_blocking(true, ec);
        if (ec) {
            std::cerr << "[MQTT] UDP setup failed: " << ec.message() << std::endl;
            return;
        }

        socket = std::move(sock);
        localSeq = 0;
        remoteSeq.reset();
        udpReady = true;
        std::cout << "[MQTT] UDP audio to " << endpoint << std::endl;
        receive();
    }

    void closeUdp() {
        ++udpGen;
        udpReady = false;
        resolver.cancel();
        if (socket) {
            boost::system::error_code ignored;
            socket->close(ignored);
            socket.reset();
        }
        cipher.reset();
        remoteSeq.reset();
    }

    void receive() {
        auto self = shared_from_this();
        uint64_t id = udpGen;
        socket->async_receive(asio::buffer(recvBuffer),
            [self, id](const boost::system::error_code& ec, size_t n) {
                if (id != self->udpGen) return;
                if (ec == asio::error::operation_aborted) return;
                if (ec) {
                    std::cerr << "[MQTT] UDP receive: " << ec.message() << std::endl;
                } else {
                    self->deliver(n);
                }
                if (self->socket) self->receive();
            });
    }

    void deliver(size_t size) {
        auto packet = cipher->open(recvBuffer.data(), size);
        if (!packet) {
            if (droppedIn++ % 50 == 0) {
                std::cerr << "[MQTT] Dropping malformed UDP packet (" << size << " bytes)" << std::endl;
            }
            return;
        }

        if (remoteSeq && packet->sequence <= *remoteSeq) {
            if (droppedIn++ % 50 == 0) {
                std::cerr << "[MQTT] Dropping out-of-order packet seq=" << packet->sequence
                          << " after " << *remoteSeq << std::endl;
            }
            return;
        }
        remoteSeq = packet->sequence;

        audio::AudioFrame frame;
        frame.session_id = sessionId;
        frame.sequence = packet->sequence;
        frame.timestamp = packet->timestamp;
        frame.payload = std::move(packet->payload);

        AudioHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = audioHandler;
        }
        if (handler) handler(std::move(frame));
    }

    void sendUdp(const audio::AudioFrame& frame) {
        if (!socket || !cipher) return;

        auto sealed = cipher->seal(frame.payload, frame.timestamp, ++localSeq);
        if (!sealed) return;

        boost::system::error_code ec;
        socket->send(asio::buffer(*sealed), 0, ec);
        if (ec && droppedOut++ % 50 == 0) {
            std::cerr << "[MQTT] UDP send dropped frame: " << ec.message() << std::endl;
        }
    }

    // Teardown

    void teardownClient() {
        std::lock_guard<std::mutex> lock(clientMutex);
        if (!client) return;

        mosquitto_disconnect(client);
        mosquitto_loop_stop(client, false);
        mosquitto_destroy(client);
        client = nullptr;
        clientContext.reset();
    }

    void doDisconnect() {
        closing = true;
        ++gen;
        connecting = false;
        connected = false;
        closeUdp();
        teardownClient();
        std::cout << "[MQTT] Disconnected" << std::endl;
    }

    void report(const std::string& reason) {
        ++gen;
        connecting = false;
        connected = false;
        closeUdp();
        teardownClient();

        if (reported) return;
        reported = true;

        std::cerr << "[MQTT] Connection lost: " << reason << std::endl;
        DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = disconnectHandler;
        }
        if (handler) handler(reason);
    }
};

MqttTransport::MqttTransport(asio::io_context& io, MqttOptions options)
    : impl_(std::make_shared<Impl>(io, std::move(options))) {
}

MqttTransport::~MqttTransport() {
    {
        std::lock_guard<std::mutex> lock(impl_->handlerMutex);
        impl_->controlHandler = nullptr;
        impl_->audioHandler = nullptr;
        impl_->disconnectHandler = nullptr;
        impl_->connectedHandler = nullptr;
    }
    impl_->connected = false;
    impl_->udpReady = false;
    impl_->teardownClient();
    disconnect();
}

void MqttTransport::connect() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->doConnect(); });
}

void MqttTransport::disconnect() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->doDisconnect(); });
}

bool MqttTransport::isConnected() const {
    return impl_->connected;
}

bool MqttTransport::sendControlMessage(const nlohmann::json& message) {
    if (!impl_->connected) return false;

    std::string text = message.dump();
    std::lock_guard<std::mutex> lock(impl_->clientMutex);
    if (!impl_->client) return false;

    int rc = mosquitto_publish(impl_->client, nullptr, impl_->options.publish_topic.c_str(),
                               static_cast<int>(text.size()), text.data(), 0, false);
    if (rc != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MQTT] Publish failed: " << mosquitto_strerror(rc) << std::endl;
        return false;
    }
    return true;
}

bool MqttTransport::sendAudioFrame(const audio::AudioFrame& frame) {
    if (!impl_->udpReady) return false;

    auto impl = impl_;
    asio::post(impl->strand, [impl, frame]() { impl->sendUdp(frame); });
    return true;
}

void MqttTransport::setCredentials(const Credentials& credentials) {
    if (!credentials.mqtt.is_object()) return;

    MqttOptions issued = MqttOptions::fromJson(credentials.mqtt);
    auto impl = impl_;
    asio::post(impl->strand, [impl, issued]() mutable {
        std::lock_guard<std::mutex> lock(impl->clientMutex);
        issued.keepalive_s = impl->options.keepalive_s;
        issued.ca_path = impl->options.ca_path;
        impl->options = std::move(issued);
        std::cout << "[MQTT] Using server-issued endpoint " << impl->options.host << ":"
                  << impl->options.port << std::endl;
    });
}

void MqttTransport::onControlMessage(ControlHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->controlHandler = std::move(handler);
}

void MqttTransport::onAudioFrame(AudioHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->audioHandler = std::move(handler);
}

void MqttTransport::onDisconnect(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->disconnectHandler = std::move(handler);
}

void MqttTransport::onConnected(ConnectedHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->connectedHandler = std::move(handler);
}

} // namespace xvc::transport
