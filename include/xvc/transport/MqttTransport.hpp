/**
 * MqttTransport.hpp - Control over MQTT (libmosquitto), audio over encrypted UDP
 *
 * The peer's hello reply announces the UDP endpoint and AES key. Until it
 * arrives, audio frames are refused.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "xvc/transport/Transport.hpp"

namespace xvc::transport {

struct MqttOptions {
    std::string host;
    int port = 8883;
    bool tls = true;
    std::string client_id;
    std::string username;
    std::string password;
    std::string publish_topic;
    std::string subscribe_topic;
    int keepalive_s = 90;
    std::string ca_path = "/etc/ssl/certs";

    /**
     * Build from SYSTEM_OPTIONS.NETWORK.MQTT_INFO
     * ({endpoint, client_id, username, password, publish_topic, subscribe_topic}).
     * Port 8883 (the default) implies TLS.
     */
    static MqttOptions fromJson(const nlohmann::json& info);
};

class MqttTransport : public Transport {
public:
    MqttTransport(boost::asio::io_context& io, MqttOptions options);
    ~MqttTransport() override;

    MqttTransport(const MqttTransport&) = delete;
    MqttTransport& operator=(const MqttTransport&) = delete;

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

    std::string name() const override { return "udp"; }

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace xvc::transport
