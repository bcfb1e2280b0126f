/**
 * Session.hpp - Top-level voice session state machine
 *
 * STARTING -> ACTIVATING -> IDLE -> CONNECTING -> LISTENING <-> SPEAKING -> IDLE
 *
 * All inputs (detections, user intents, transport events, timers) are posted
 * into one strand on the caller's io_context and processed one at a time.
 * An AudioChannel exists exactly while the session is CONNECTING, LISTENING
 * or SPEAKING.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "xvc/audio/Detection.hpp"
#include "xvc/protocol/Messages.hpp"
#include "xvc/session/AudioChannel.hpp"
#include "xvc/session/Collaborators.hpp"

namespace xvc {

namespace config { class ConfigStore; }
namespace iot { class ThingRegistry; }
namespace transport { class Transport; }

enum class SessionState {
    STARTING,
    ACTIVATING,
    IDLE,
    CONNECTING,
    LISTENING,
    SPEAKING
};

enum class ListenMode {
    PUSH_TO_TALK,
    AUTO,
    WAKE_WORD
};

const char* sessionStateName(SessionState state);
const char* listenModeName(ListenMode mode);

/** Accepts "push_to_talk", "auto", "wake_word" (also "manual" for push-to-talk). */
std::optional<ListenMode> parseListenMode(const std::string& text);

struct SessionConfig {
    int open_timeout_ms = 10000;
    int silence_timeout_ms = 8000;
    int activation_max_retries = 60;
    int activation_retry_interval_ms = 5000;
    float barge_in_confidence = 0.5f;
    int playback_drain_checks = 30;
    int playback_drain_interval_ms = 100;
    ListenMode listen_mode = ListenMode::AUTO;
    protocol::Identity identity;
    protocol::AudioParams audio_params;

    static SessionConfig fromConfig(const config::ConfigStore& store);
};

struct SessionCallbacks {
    std::function<void(SessionState from, SessionState to)> onStateChange;
    std::function<void(const std::string& error)> onError;
    std::function<void(const std::string& error)> onActivationFailed;
    std::function<void(const std::string& role, const std::string& text)> onChatMessage;
    std::function<void(const std::string& emotion)> onEmotion;

    /** Carrier came up or went down; reason is empty when connected. */
    std::function<void(bool connected, const std::string& reason)> onConnectionChanged;
};

struct SessionStats {
    uint64_t sent = 0;
    uint64_t dropped_outbound = 0;
    uint64_t received = 0;
    uint64_t dropped_inbound = 0;
};

class Session {
public:
    /**
     * The transport, activation gate, renderer and registry must outlive
     * the session. Callbacks run on the io_context thread.
     */
    Session(boost::asio::io_context& io,
            transport::Transport& transport,
            session::ActivationGate& activation,
            session::AudioRenderer& renderer,
            iot::ThingRegistry& things,
            SessionConfig config = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void setCallbacks(SessionCallbacks callbacks);

    // Inputs. Thread-safe; each posts one event.

    /** Configuration and transport are ready: STARTING -> ACTIVATING. */
    void start();
    void onDetection(const audio::Detection& detection);
    void manualTrigger();
    void release();
    void cancel();
    void switchMode(ListenMode mode);

    /**
     * Hand one encoded capture frame to the active channel. Called from the
     * capture thread; never blocks on the event path.
     */
    void submitAudio(std::vector<uint8_t> payload, uint32_t timestamp_ms);

    // Observers. Thread-safe.

    SessionState state() const;
    ListenMode listenMode() const;
    bool hasActiveChannel() const;
    session::ChannelState channelState() const;
    std::string identityToken() const;
    bool activationHalted() const;
    SessionStats stats() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace xvc
