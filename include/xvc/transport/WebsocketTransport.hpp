/**
 * WebsocketTransport.hpp - Control and audio over one WebSocket (Boost.Beast)
 *
 * Text frames carry JSON control messages, binary frames carry Opus audio.
 * Both ws:// and wss:// URLs are supported.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "xvc/protocol/Messages.hpp"
#include "xvc/transport/Transport.hpp"

namespace xvc::transport {

struct WebsocketUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/** Split ws://host[:port]/path. Returns nullopt for any other scheme. */
std::optional<WebsocketUrl> parseWebsocketUrl(const std::string& url);

struct WebsocketOptions {
    std::string url;
    std::string access_token;
    protocol::Identity identity;
    size_t max_queued_audio = 100;  // audio frames waiting in the write queue
    bool verify_peer = false;
};

class WebsocketTransport : public Transport {
public:
    WebsocketTransport(boost::asio::io_context& io, WebsocketOptions options);
    ~WebsocketTransport() override;

    WebsocketTransport(const WebsocketTransport&) = delete;
    WebsocketTransport& operator=(const WebsocketTransport&) = delete;

    void connect() override;
    void disconnect() override;
    bool isConnected() const override;

    bool sendControlMessage(const nlohmann::json& message) override;
    bool sendAudioFrame(const audio::AudioFrame& frame) override;

    void onControlMessage(ControlHandler handler) override;
    void onAudioFrame(AudioHandler handler) override;
    void onDisconnect(DisconnectHandler handler) override;
    void onConnected(ConnectedHandler handler) override;
    void setCredentials(const Credentials& credentials) override;

    std::string name() const override { return "websocket"; }

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace xvc::transport
