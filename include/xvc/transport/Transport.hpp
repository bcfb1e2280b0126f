/**
 * Transport.hpp - Carrier-independent wire protocol client
 *
 * One implementation per carrier (WebSocket, MQTT + UDP). Both deliver
 * messages in order and report a lost connection exactly once through
 * the disconnect handler. Handlers run on the transport's I/O thread.
 */

#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "xvc/audio/AudioFrame.hpp"

namespace xvc::transport {

/** Values issued by the OTA server once the device is activated. */
struct Credentials {
    std::string access_token;   // websocket.token
    nlohmann::json mqtt;        // mqtt block: endpoint, client_id, username, ...
};

class Transport {
public:
    using ControlHandler = std::function<void(const nlohmann::json&)>;
    using AudioHandler = std::function<void(audio::AudioFrame)>;
    using DisconnectHandler = std::function<void(const std::string& reason)>;
    using ConnectedHandler = std::function<void()>;

    virtual ~Transport() = default;

    /**
     * Start connecting. Completion is reported through onConnected, failure
     * through onDisconnect. Never blocks.
     */
    virtual void connect() = 0;

    /** Close the carrier. Does not fire onDisconnect. */
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * Queue a control message. Control messages are never dropped.
     * @return false if the transport is not connected
     */
    virtual bool sendControlMessage(const nlohmann::json& message) = 0;

    /**
     * Queue one encoded audio frame. Under backpressure the oldest queued
     * audio is dropped first.
     * @return false if the frame could not be queued
     */
    virtual bool sendAudioFrame(const audio::AudioFrame& frame) = 0;

    virtual void onControlMessage(ControlHandler handler) = 0;
    virtual void onAudioFrame(AudioHandler handler) = 0;
    virtual void onDisconnect(DisconnectHandler handler) = 0;
    virtual void onConnected(ConnectedHandler handler) = 0;

    /**
     * Replace the server-issued credentials. Empty fields keep the configured
     * values. Applies from the next connect().
     */
    virtual void setCredentials(const Credentials& credentials) = 0;

    /** Human-readable carrier name, also sent as hello.transport */
    virtual std::string name() const = 0;
};

} // namespace xvc::transport
