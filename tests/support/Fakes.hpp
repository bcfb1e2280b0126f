/**
 * Fakes.hpp - Scripted collaborators shared by the test programs
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include "xvc/audio/VADProcessor.hpp"
#include "xvc/session/Collaborators.hpp"
#include "xvc/transport/Transport.hpp"

namespace xvc::testing {

using nlohmann::json;

/** Run every ready handler, including ones posted while running. */
inline void pump(boost::asio::io_context& io) {
    io.restart();
    io.poll();
}

/** Run handlers and timers for a wall-clock duration. */
inline void runFor(boost::asio::io_context& io, int ms) {
    io.restart();
    io.run_for(std::chrono::milliseconds(ms));
}

/**
 * In-memory transport. With autoAck set it answers hello with a session id
 * and start_audio with audio_channel_opened, the way a cooperative peer does.
 */
class FakeTransport : public transport::Transport {
public:
    explicit FakeTransport(boost::asio::io_context& io) : io_(io) {}

    bool autoAck = true;
    bool connectSucceeds = true;
    bool refuseSends = false;
    std::string sessionPrefix = "sess-";

    void connect() override {
        ++connectCalls;
        boost::asio::post(io_, [this]() {
            if (connectSucceeds) {
                connected_ = true;
                if (connectedHandler_) connectedHandler_();
            } else if (disconnectHandler_) {
                disconnectHandler_("connection refused");
            }
        });
    }

    void disconnect() override { connected_ = false; }

    bool isConnected() const override { return connected_; }

    bool sendControlMessage(const json& message) override {
        if (!connected_ || refuseSends) return false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(message);
        }
        if (autoAck) acknowledge(message);
        return true;
    }

    bool sendAudioFrame(const audio::AudioFrame& frame) override {
        if (!connected_) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        audio_.push_back(frame);
        return true;
    }

    void onControlMessage(ControlHandler handler) override { controlHandler_ = std::move(handler); }
    void onAudioFrame(AudioHandler handler) override { audioHandler_ = std::move(handler); }
    void onDisconnect(DisconnectHandler handler) override { disconnectHandler_ = std::move(handler); }
    void onConnected(ConnectedHandler handler) override { connectedHandler_ = std::move(handler); }

    void setCredentials(const transport::Credentials& credentials) override {
        ++credentialUpdates;
        credentials_ = credentials;
    }

    std::string name() const override { return "websocket"; }

    // Test drivers

    void setConnected(bool connected) { connected_ = connected; }

    void deliverControl(const json& message) {
        if (controlHandler_) controlHandler_(message);
    }

    void deliverAudio(audio::AudioFrame frame) {
        if (audioHandler_) audioHandler_(std::move(frame));
    }

    /** Peer vanished: mark down and report once. */
    void dropConnection(const std::string& reason) {
        connected_ = false;
        if (disconnectHandler_) disconnectHandler_(reason);
    }

    std::vector<json> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::vector<json> sentOfType(const std::string& type) const {
        std::vector<json> out;
        for (const auto& m : sent()) {
            if (m.value("type", "") == type) out.push_back(m);
        }
        return out;
    }

    size_t audioSent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return audio_.size();
    }

    void clearSent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
        audio_.clear();
    }

    std::string currentSessionId() const { return sessionPrefix + std::to_string(sessions_); }

    const transport::Credentials& credentials() const { return credentials_; }

    int connectCalls = 0;
    int credentialUpdates = 0;

private:
    void acknowledge(const json& message) {
        std::string type = message.value("type", "");
        json reply;
        if (type == "hello") {
            ++sessions_;
            reply = {{"type", "hello"}, {"transport", "websocket"}, {"session_id", currentSessionId()}};
        } else if (type == "start_audio") {
            reply = {{"type", "audio_channel_opened"}, {"session_id", message.value("session_id", "")}};
        } else {
            return;
        }
        boost::asio::post(io_, [this, reply]() { deliverControl(reply); });
    }

    boost::asio::io_context& io_;
    bool connected_ = false;
    int sessions_ = 0;
    transport::Credentials credentials_;

    mutable std::mutex mutex_;
    std::vector<json> sent_;
    std::vector<audio::AudioFrame> audio_;

    ControlHandler controlHandler_;
    AudioHandler audioHandler_;
    DisconnectHandler disconnectHandler_;
    ConnectedHandler connectedHandler_;
};

/** Renderer that keeps frames until cleared. */
class RecordingRenderer : public session::AudioRenderer {
public:
    void enqueue(const audio::AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(frame);
        ++total_;
    }

    size_t clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++clearCalls;
        size_t n = frames_.size();
        frames_.clear();
        return n;
    }

    size_t pending() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    /** Simulate the speaker consuming everything queued. */
    void drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.clear();
    }

    size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    int clearCalls = 0;

private:
    mutable std::mutex mutex_;
    std::vector<audio::AudioFrame> frames_;
    size_t total_ = 0;
};

/** Activation gate replaying a fixed script; the last entry repeats. */
class ScriptedActivation : public session::ActivationGate {
public:
    explicit ScriptedActivation(const std::vector<session::ActivationResult>& script)
        : script_(script.begin(), script.end()) {}

    void check(Completion done) override {
        session::ActivationResult r = script_.empty() ? activated() : script_.front();
        if (script_.size() > 1) script_.pop_front();
        ++checkCalls;
        done(r);
    }

    static session::ActivationResult activated(const std::string& token = "token-1") {
        return {session::ActivationStatus::ACTIVATED, token, ""};
    }

    static session::ActivationResult pending() {
        return {session::ActivationStatus::PENDING, "", "enter code 123456"};
    }

    int checkCalls = 0;

private:
    std::deque<session::ActivationResult> script_;
};

/** Classifier returning scripted verdicts, then `fallback` forever. */
class ScriptedClassifier : public audio::SpeechClassifier {
public:
    explicit ScriptedClassifier(std::vector<int> verdicts = {}, int fallback = 1)
        : verdicts_(verdicts.begin(), verdicts.end()), fallback_(fallback) {}

    int classify(const int16_t*, size_t) override {
        ++calls;
        if (verdicts_.empty()) return fallback_;
        int v = verdicts_.front();
        verdicts_.pop_front();
        return v;
    }

    int calls = 0;

private:
    std::deque<int> verdicts_;
    int fallback_;
};

} // namespace xvc::testing
