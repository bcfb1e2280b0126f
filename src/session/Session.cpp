/**
 * Session.cpp - Voice session state machine
 *
 * Connects: detectors / user intents -> Session -> AudioChannel -> Transport
 *           Transport -> Session (control) and Transport -> renderer (TTS audio)
 */

#include "xvc/Session.hpp"
#include "xvc/config/ConfigStore.hpp"
#include "xvc/iot/ThingRegistry.hpp"
#include "xvc/session/Events.hpp"
#include "xvc/transport/Transport.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace xvc {

using session::AudioChannel;
using session::ChannelState;
using session::Event;
using session::EventKind;

namespace session {

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::ConfigReady: return "ConfigReady";
        case EventKind::ActivationResult: return "ActivationResult";
        case EventKind::Detection: return "Detection";
        case EventKind::ManualTrigger: return "ManualTrigger";
        case EventKind::Release: return "Release";
        case EventKind::Cancel: return "Cancel";
        case EventKind::ModeSwitch: return "ModeSwitch";
        case EventKind::TransportConnected: return "TransportConnected";
        case EventKind::ControlMessage: return "ControlMessage";
        case EventKind::TtsAudioStarted: return "TtsAudioStarted";
        case EventKind::Disconnected: return "Disconnected";
        case EventKind::OpenTimeout: return "OpenTimeout";
        case EventKind::SilenceTimeout: return "SilenceTimeout";
        case EventKind::ActivationRetry: return "ActivationRetry";
        case EventKind::PlaybackDrainCheck: return "PlaybackDrainCheck";
    }
    return "?";
}

} // namespace session

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::STARTING: return "STARTING";
        case SessionState::ACTIVATING: return "ACTIVATING";
        case SessionState::IDLE: return "IDLE";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::LISTENING: return "LISTENING";
        case SessionState::SPEAKING: return "SPEAKING";
    }
    return "?";
}

const char* listenModeName(ListenMode mode) {
    switch (mode) {
        case ListenMode::PUSH_TO_TALK: return "push_to_talk";
        case ListenMode::AUTO: return "auto";
        case ListenMode::WAKE_WORD: return "wake_word";
    }
    return "?";
}

std::optional<ListenMode> parseListenMode(const std::string& text) {
    if (text == "push_to_talk" || text == "manual") return ListenMode::PUSH_TO_TALK;
    if (text == "auto") return ListenMode::AUTO;
    if (text == "wake_word") return ListenMode::WAKE_WORD;
    return std::nullopt;
}

SessionConfig SessionConfig::fromConfig(const config::ConfigStore& store) {
    SessionConfig c;
    c.open_timeout_ms = store.get<int>("SESSION_OPTIONS.OPEN_TIMEOUT_MS", c.open_timeout_ms);
    c.silence_timeout_ms = store.get<int>("SESSION_OPTIONS.SILENCE_TIMEOUT_MS", c.silence_timeout_ms);
    c.activation_max_retries = store.get<int>("SESSION_OPTIONS.ACTIVATION_MAX_RETRIES", c.activation_max_retries);
    c.activation_retry_interval_ms =
        store.get<int>("SESSION_OPTIONS.ACTIVATION_RETRY_INTERVAL_MS", c.activation_retry_interval_ms);
    c.barge_in_confidence = store.get<float>("SESSION_OPTIONS.BARGE_IN_CONFIDENCE", c.barge_in_confidence);
    c.playback_drain_checks = store.get<int>("SESSION_OPTIONS.PLAYBACK_DRAIN_CHECKS", c.playback_drain_checks);

    std::string mode = store.getString("SYSTEM_OPTIONS.LISTEN_MODE", "auto");
    if (auto parsed = parseListenMode(mode)) {
        c.listen_mode = *parsed;
    } else {
        std::cerr << "[Session] Unknown LISTEN_MODE '" << mode << "', using auto" << std::endl;
    }

    c.identity.device_id = store.getString("SYSTEM_OPTIONS.DEVICE_ID");
    c.identity.client_id = store.getString("SYSTEM_OPTIONS.CLIENT_ID");
    c.audio_params.sample_rate = store.get<int>("AUDIO_OPTIONS.INPUT_SAMPLE_RATE", c.audio_params.sample_rate);
    c.audio_params.frame_duration = store.get<int>("AUDIO_OPTIONS.FRAME_DURATION_MS", c.audio_params.frame_duration);
    return c;
}

struct Session::Impl : std::enable_shared_from_this<Session::Impl> {
    // Collaborators
    transport::Transport& transport;
    session::ActivationGate& activation;
    session::AudioRenderer& renderer;
    iot::ThingRegistry& things;
    SessionConfig config;
    SessionCallbacks callbacks;

    // Serialized event path
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer open_timer;
    boost::asio::steady_timer silence_timer;
    boost::asio::steady_timer activation_timer;
    boost::asio::steady_timer drain_timer;
    uint64_t open_gen = 0;
    uint64_t silence_gen = 0;
    uint64_t activation_gen = 0;
    uint64_t drain_gen = 0;

    // State
    std::atomic<SessionState> state{SessionState::STARTING};
    std::atomic<ListenMode> mode{ListenMode::AUTO};
    std::atomic<bool> stopped{false};

    // Active channel; the mutex only guards the pointer snapshot taken by
    // the capture and network threads.
    std::shared_ptr<AudioChannel> channel;
    mutable std::mutex channel_mutex;

    // Activation
    int activation_attempts = 0;
    std::atomic<bool> activation_halted{false};
    std::string identity_token;
    mutable std::mutex token_mutex;

    // Turn bookkeeping
    std::string wake_text;
    std::atomic<bool> tts_audio_seen{false};
    int drain_checks = 0;

    // Counters of channels already destroyed, plus frames with no channel
    std::atomic<uint64_t> closed_sent{0};
    std::atomic<uint64_t> closed_received{0};
    std::atomic<uint64_t> closed_dropped_out{0};
    std::atomic<uint64_t> closed_dropped_in{0};
    std::atomic<uint64_t> orphan_out{0};
    std::atomic<uint64_t> orphan_in{0};

    Impl(boost::asio::io_context& io,
         transport::Transport& t,
         session::ActivationGate& a,
         session::AudioRenderer& r,
         iot::ThingRegistry& reg,
         SessionConfig cfg)
        : transport(t), activation(a), renderer(r), things(reg), config(std::move(cfg)),
          strand(boost::asio::make_strand(io)),
          open_timer(strand), silence_timer(strand), activation_timer(strand), drain_timer(strand) {
        mode = config.listen_mode;
    }

    // Wiring

    void wireTransport() {
        std::weak_ptr<Impl> weak = weak_from_this();

        transport.onConnected([weak]() {
            if (auto self = weak.lock()) self->post(makeEvent(EventKind::TransportConnected));
        });

        transport.onDisconnect([weak](const std::string& reason) {
            if (auto self = weak.lock()) {
                Event ev = makeEvent(EventKind::Disconnected);
                ev.text = reason;
                self->post(std::move(ev));
            }
        });

        transport.onControlMessage([weak](const json& message) {
            if (auto self = weak.lock()) {
                Event ev = makeEvent(EventKind::ControlMessage);
                ev.message = message;
                self->post(std::move(ev));
            }
        });

        transport.onAudioFrame([weak](audio::AudioFrame frame) {
            if (auto self = weak.lock()) self->handleInboundAudio(frame);
        });
    }

    static Event makeEvent(EventKind kind) {
        Event ev;
        ev.kind = kind;
        return ev;
    }

    void post(Event ev) {
        auto self = shared_from_this();
        boost::asio::post(strand, [self, ev = std::move(ev)]() { self->dispatch(ev); });
    }

    // Timers

    void arm(boost::asio::steady_timer& timer, uint64_t& gen, int ms, EventKind kind) {
        uint64_t id = ++gen;
        timer.expires_after(std::chrono::milliseconds(ms));

        std::weak_ptr<Impl> weak = weak_from_this();
        timer.async_wait([weak, kind, id](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (auto self = weak.lock()) {
                Event ev = makeEvent(kind);
                ev.generation = id;
                self->dispatch(ev);
            }
        });
    }

    void disarm(boost::asio::steady_timer& timer, uint64_t& gen) {
        ++gen;
        timer.cancel();
    }

    void disarmAll() {
        disarm(open_timer, open_gen);
        disarm(silence_timer, silence_gen);
        disarm(drain_timer, drain_gen);
    }

    // State

    void setState(SessionState to) {
        SessionState from = state.exchange(to);
        if (from == to) return;

        std::cout << "[Session] " << sessionStateName(from) << " -> " << sessionStateName(to) << std::endl;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(from, to);
        }
    }

    bool isActive() const {
        SessionState s = state.load();
        return s == SessionState::CONNECTING || s == SessionState::LISTENING || s == SessionState::SPEAKING;
    }

    void reportError(const std::string& error) {
        std::cerr << "[Session] " << error << std::endl;
        if (callbacks.onError) {
            callbacks.onError(error);
        }
    }

    std::shared_ptr<AudioChannel> snapshotChannel() const {
        std::lock_guard<std::mutex> lock(channel_mutex);
        return channel;
    }

    std::string sessionId() const {
        return channel ? channel->sessionId() : std::string();
    }

    bool send(const json& message) {
        if (!transport.sendControlMessage(message)) {
            std::cerr << "[Session] Failed to send " << protocol::stringField(message, "type") << std::endl;
            return false;
        }
        return true;
    }

    // Dispatch

    void dispatch(const Event& ev) {
        if (stopped) {
            std::cout << "[Session] Ignoring " << session::eventKindName(ev.kind) << " after shutdown" << std::endl;
            return;
        }

        switch (ev.kind) {
            case EventKind::ConfigReady:
                handleConfigReady();
                break;
            case EventKind::ActivationResult:
                handleActivationResult(ev.activation);
                break;
            case EventKind::ActivationRetry:
                if (ev.generation == activation_gen && state == SessionState::ACTIVATING && !activation_halted) {
                    beginActivation();
                }
                break;
            case EventKind::Detection:
                handleDetection(ev.detection);
                break;
            case EventKind::ManualTrigger:
                handleManualTrigger();
                break;
            case EventKind::Release:
                handleRelease();
                break;
            case EventKind::Cancel:
                handleCancel();
                break;
            case EventKind::ModeSwitch:
                handleModeSwitch(static_cast<ListenMode>(ev.mode));
                break;
            case EventKind::TransportConnected:
                handleTransportConnected();
                break;
            case EventKind::ControlMessage:
                try {
                    handleControlMessage(ev.message);
                } catch (const json::exception& e) {
                    std::cerr << "[Session] Dropping malformed " << protocol::stringField(ev.message, "type")
                              << " message: " << e.what() << std::endl;
                }
                break;
            case EventKind::TtsAudioStarted:
                if (state == SessionState::SPEAKING && channel && channel->state() == ChannelState::PROCESSING) {
                    channel->startPlaying();
                }
                break;
            case EventKind::Disconnected:
                handleDisconnected(ev.text);
                break;
            case EventKind::OpenTimeout:
                if (ev.generation == open_gen && state == SessionState::CONNECTING) {
                    failOpen("Audio channel open timed out");
                }
                break;
            case EventKind::SilenceTimeout:
                if (ev.generation == silence_gen && state == SessionState::LISTENING) {
                    std::cout << "[Session] Silence timeout" << std::endl;
                    closeChannel();
                }
                break;
            case EventKind::PlaybackDrainCheck:
                if (ev.generation == drain_gen && state == SessionState::SPEAKING) {
                    checkPlaybackDrained();
                }
                break;
        }
    }

    // Activation

    void handleConfigReady() {
        if (state != SessionState::STARTING) {
            std::cerr << "[Session] Already started" << std::endl;
            return;
        }
        setState(SessionState::ACTIVATING);
        beginActivation();
    }

    void beginActivation() {
        std::weak_ptr<Impl> weak = weak_from_this();
        activation.check([weak](session::ActivationResult result) {
            if (auto self = weak.lock()) {
                Event ev = makeEvent(EventKind::ActivationResult);
                ev.activation = std::move(result);
                self->post(std::move(ev));
            }
        });
    }

    void handleActivationResult(const session::ActivationResult& result) {
        if (state != SessionState::ACTIVATING || activation_halted) return;

        if (result.status == session::ActivationStatus::ACTIVATED) {
            {
                std::lock_guard<std::mutex> lock(token_mutex);
                identity_token = result.identity_token;
            }
            transport.setCredentials({result.identity_token, result.mqtt});
            activation_attempts = 0;
            std::cout << "[Session] Device activated" << std::endl;
            setState(SessionState::IDLE);
            return;
        }

        ++activation_attempts;
        if (!result.message.empty()) {
            std::cout << "[Session] Activation pending: " << result.message << std::endl;
        }

        if (activation_attempts >= config.activation_max_retries) {
            activation_halted = true;
            std::string error = "Activation failed after " + std::to_string(activation_attempts) + " attempts";
            std::cerr << "[Session] " << error << std::endl;
            if (callbacks.onActivationFailed) {
                callbacks.onActivationFailed(error);
            }
            return;
        }

        arm(activation_timer, activation_gen, config.activation_retry_interval_ms, EventKind::ActivationRetry);
    }

    // Detection and intents

    void handleDetection(const audio::Detection& d) {
        SessionState s = state;

        switch (d.kind) {
            case audio::DetectionKind::Wake:
                if (s == SessionState::IDLE) {
                    std::cout << "[Session] Wake word: " << d.text << std::endl;
                    openChannel(d.text);
                } else if (s == SessionState::SPEAKING) {
                    bargeIn("wake_word_detected", d.text);
                }
                break;

            case audio::DetectionKind::SpeechStart:
                if (s == SessionState::IDLE && mode == ListenMode::AUTO) {
                    openChannel("");
                } else if (s == SessionState::LISTENING) {
                    disarm(silence_timer, silence_gen);
                } else if (s == SessionState::SPEAKING) {
                    if (d.confidence >= config.barge_in_confidence) {
                        bargeIn("wake_word_detected", "");
                    } else {
                        std::cout << "[Session] Ignoring speech below barge-in confidence ("
                                  << d.confidence << ")" << std::endl;
                    }
                }
                break;

            case audio::DetectionKind::SpeechEnd:
                if (s != SessionState::LISTENING) break;
                if (mode == ListenMode::PUSH_TO_TALK) {
                    // Release ends the turn in push-to-talk
                    break;
                }
                endTurn();
                break;

            case audio::DetectionKind::SilenceTimeout:
                if (s == SessionState::LISTENING) {
                    closeChannel();
                }
                break;
        }
    }

    void handleManualTrigger() {
        switch (state.load()) {
            case SessionState::IDLE:
                openChannel("");
                break;
            case SessionState::SPEAKING:
                bargeIn("", "");
                break;
            case SessionState::CONNECTING:
            case SessionState::LISTENING:
                break;
            default:
                reportError(std::string("Cannot start a conversation while ") + sessionStateName(state));
                break;
        }
    }

    void handleRelease() {
        if (mode != ListenMode::PUSH_TO_TALK) return;

        if (state == SessionState::LISTENING) {
            endTurn();
        } else if (state == SessionState::CONNECTING) {
            std::cout << "[Session] Released before the channel opened" << std::endl;
            closeChannel();
        }
    }

    void handleCancel() {
        SessionState s = state;
        if (s == SessionState::SPEAKING) {
            send(protocol::makeAbort(sessionId()));
        }
        if (s == SessionState::CONNECTING || s == SessionState::LISTENING || s == SessionState::SPEAKING) {
            std::cout << "[Session] Cancelled" << std::endl;
            closeChannel();
        }
    }

    void handleModeSwitch(ListenMode to) {
        if (state != SessionState::IDLE) {
            reportError(std::string("Listen mode can only change while IDLE (now ") + sessionStateName(state) + ")");
            return;
        }
        mode = to;
        std::cout << "[Session] Listen mode: " << listenModeName(to) << std::endl;
    }

    // Channel lifecycle

    void openChannel(const std::string& wake) {
        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            channel = std::make_shared<AudioChannel>(transport);
        }
        wake_text = wake;
        setState(SessionState::CONNECTING);
        arm(open_timer, open_gen, config.open_timeout_ms, EventKind::OpenTimeout);

        if (transport.isConnected()) {
            if (!channel->open(config.identity, config.audio_params)) {
                failOpen("Failed to send open request");
            }
        } else {
            std::cout << "[Session] Connecting transport (" << transport.name() << ")" << std::endl;
            transport.connect();
        }
    }

    void handleTransportConnected() {
        if (callbacks.onConnectionChanged) {
            callbacks.onConnectionChanged(true, "");
        }
        if (state != SessionState::CONNECTING || !channel || channel->state() != ChannelState::CLOSED) {
            return;
        }
        if (!channel->open(config.identity, config.audio_params)) {
            failOpen("Failed to send open request");
        }
    }

    void failOpen(const std::string& reason) {
        destroyChannel();
        setState(SessionState::IDLE);
        reportError(reason);
    }

    void onChannelOpened() {
        disarm(open_timer, open_gen);
        send(protocol::makeIotDescriptors(sessionId(), things.descriptors()));
        send(protocol::makeIotStates(sessionId(), things.states()));
        enterListening();
    }

    void enterListening() {
        if (!channel->startRecording()) {
            closeChannel();
            return;
        }

        if (!wake_text.empty()) {
            send(protocol::makeListenDetect(sessionId(), wake_text));
            wake_text.clear();
        }
        send(protocol::makeListenStart(sessionId(), mode == ListenMode::PUSH_TO_TALK ? "manual" : "auto"));

        if (auto delta = things.changedStates()) {
            send(protocol::makeIotStates(sessionId(), *delta));
        }

        setState(SessionState::LISTENING);
        if (mode != ListenMode::PUSH_TO_TALK) {
            arm(silence_timer, silence_gen, config.silence_timeout_ms, EventKind::SilenceTimeout);
        }
    }

    void endTurn() {
        disarm(silence_timer, silence_gen);
        send(protocol::makeListenStop(sessionId()));
        enterSpeaking();
    }

    void enterSpeaking() {
        tts_audio_seen = false;
        if (channel->state() == ChannelState::RECORDING) {
            channel->endOfSpeech();
        }
        setState(SessionState::SPEAKING);
    }

    void bargeIn(const std::string& reason, const std::string& wake) {
        std::cout << "[Session] Barge-in" << std::endl;
        disarm(drain_timer, drain_gen);
        send(protocol::makeAbort(sessionId(), reason));
        size_t cleared = renderer.clear();
        if (cleared > 0) {
            std::cout << "[Session] Discarded " << cleared << " queued frames" << std::endl;
        }
        wake_text = wake;
        enterListening();
    }

    void closeChannel() {
        destroyChannel();
        setState(SessionState::IDLE);
    }

    void destroyChannel() {
        disarmAll();
        std::shared_ptr<AudioChannel> old;
        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            old = std::move(channel);
            channel.reset();
        }
        if (!old) return;

        if (old->close()) old->onClosed();
        renderer.clear();
        wake_text.clear();

        closed_sent += old->sentSeq();
        closed_received += old->recvSeq();
        closed_dropped_out += old->droppedOutbound();
        closed_dropped_in += old->droppedInbound();
    }

    void handleDisconnected(const std::string& reason) {
        if (callbacks.onConnectionChanged) {
            callbacks.onConnectionChanged(false, reason);
        }
        if (!isActive()) {
            std::cout << "[Session] Transport disconnected while " << sessionStateName(state)
                      << ": " << reason << std::endl;
            return;
        }
        closeChannel();
        reportError("Transport disconnected: " + reason);
    }

    // Playback drain

    void checkPlaybackDrained() {
        size_t pending = renderer.pending();
        if (pending == 0 || ++drain_checks >= config.playback_drain_checks) {
            if (pending > 0) {
                std::cerr << "[Session] Playback did not drain, " << pending << " frames left" << std::endl;
            }
            std::cout << "[Session] Playback finished" << std::endl;
            closeChannel();
            return;
        }
        arm(drain_timer, drain_gen, config.playback_drain_interval_ms, EventKind::PlaybackDrainCheck);
    }

    // Control messages

    void handleControlMessage(const json& message) {
        protocol::MessageType type = protocol::typeOf(message);

        if (type != protocol::MessageType::Hello && type != protocol::MessageType::HelloAck) {
            std::string id = protocol::sessionIdOf(message);
            if (!id.empty() && channel && !channel->sessionId().empty() && id != channel->sessionId()) {
                std::cerr << "[Session] Dropping " << protocol::typeName(type)
                          << " for foreign session " << id << std::endl;
                return;
            }
        }

        switch (type) {
            case protocol::MessageType::Hello:
            case protocol::MessageType::HelloAck: {
                if (state != SessionState::CONNECTING || !channel || channel->state() != ChannelState::OPENING) {
                    std::cerr << "[Session] Unexpected handshake reply" << std::endl;
                    return;
                }
                auto ack = protocol::parseHelloAck(message);
                if (!ack) return;
                // A repeated reply is dropped by the channel and leaves the open running
                bool first = channel->sessionId().empty();
                if (!channel->onHelloAck(ack->session_id) && first) {
                    failOpen("Failed to send start_audio");
                }
                break;
            }

            case protocol::MessageType::AudioChannelOpened:
                if (state != SessionState::CONNECTING || !channel || !channel->onOpened()) {
                    std::cerr << "[Session] Unexpected audio_channel_opened" << std::endl;
                    return;
                }
                onChannelOpened();
                break;

            case protocol::MessageType::AudioChannelClosed:
                std::cout << "[Session] Peer confirmed channel close" << std::endl;
                break;

            case protocol::MessageType::Tts:
                handleTts(message);
                break;

            case protocol::MessageType::Stt: {
                std::string text = protocol::stringField(message, "text");
                std::cout << "[Session] User: " << text << std::endl;
                if (callbacks.onChatMessage) callbacks.onChatMessage("user", text);
                break;
            }

            case protocol::MessageType::Llm: {
                std::string emotion = protocol::stringField(message, "emotion");
                if (!emotion.empty() && callbacks.onEmotion) callbacks.onEmotion(emotion);
                break;
            }

            case protocol::MessageType::Iot:
                handleIot(message);
                break;

            default:
                std::cerr << "[Session] Dropping unexpected message: " << protocol::stringField(message, "type") << std::endl;
                break;
        }
    }

    void handleTts(const json& message) {
        std::string tts_state = protocol::stringField(message, "state");

        if (tts_state == "start") {
            if (state == SessionState::LISTENING) {
                disarm(silence_timer, silence_gen);
                enterSpeaking();
            }
        } else if (tts_state == "sentence_start") {
            std::string text = protocol::stringField(message, "text");
            std::cout << "[Session] Assistant: " << text << std::endl;
            if (callbacks.onChatMessage) callbacks.onChatMessage("assistant", text);
        } else if (tts_state == "stop") {
            if (state == SessionState::SPEAKING) {
                drain_checks = 0;
                arm(drain_timer, drain_gen, config.playback_drain_interval_ms, EventKind::PlaybackDrainCheck);
            }
        } else {
            std::cerr << "[Session] Unknown tts state: " << tts_state << std::endl;
        }
    }

    void handleIot(const json& message) {
        if (!message.contains("commands")) return;

        json results = things.invokeAll(message["commands"]);
        if (!channel) {
            std::cout << "[Session] IoT commands run without an open channel" << std::endl;
            return;
        }
        send(protocol::makeIotResults(sessionId(), results));
        if (auto delta = things.changedStates()) {
            send(protocol::makeIotStates(sessionId(), *delta));
        }
    }

    // Frame paths (capture / network threads)

    void submitAudio(std::vector<uint8_t> payload, uint32_t timestamp_ms) {
        auto ch = snapshotChannel();
        if (!ch) {
            ++orphan_out;
            return;
        }
        ch->sendAudio(std::move(payload), timestamp_ms);
    }

    void handleInboundAudio(const audio::AudioFrame& frame) {
        if (stopped) return;

        auto ch = snapshotChannel();
        if (!ch) {
            ++orphan_in;
            return;
        }
        if (!ch->acceptInbound(frame)) return;

        renderer.enqueue(frame);
        if (ch->state() == ChannelState::PROCESSING && !tts_audio_seen.exchange(true)) {
            post(makeEvent(EventKind::TtsAudioStarted));
        }
    }

    void shutdown() {
        stopped = true;
        disarmAll();
        disarm(activation_timer, activation_gen);

        std::shared_ptr<AudioChannel> old;
        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            old = std::move(channel);
            channel.reset();
        }
        if (old && old->close()) {
            old->onClosed();
        }
    }
};

Session::Session(boost::asio::io_context& io,
                 transport::Transport& transport,
                 session::ActivationGate& activation,
                 session::AudioRenderer& renderer,
                 iot::ThingRegistry& things,
                 SessionConfig config)
    : impl_(std::make_shared<Impl>(io, transport, activation, renderer, things, std::move(config))) {
    impl_->wireTransport();
}

Session::~Session() {
    impl_->shutdown();
}

void Session::setCallbacks(SessionCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

void Session::start() {
    impl_->post(Impl::makeEvent(EventKind::ConfigReady));
}

void Session::onDetection(const audio::Detection& detection) {
    Event ev = Impl::makeEvent(EventKind::Detection);
    ev.detection = detection;
    impl_->post(std::move(ev));
}

void Session::manualTrigger() { impl_->post(Impl::makeEvent(EventKind::ManualTrigger)); }

void Session::release() { impl_->post(Impl::makeEvent(EventKind::Release)); }

void Session::cancel() { impl_->post(Impl::makeEvent(EventKind::Cancel)); }

void Session::switchMode(ListenMode mode) {
    Event ev = Impl::makeEvent(EventKind::ModeSwitch);
    ev.mode = static_cast<int>(mode);
    impl_->post(std::move(ev));
}

void Session::submitAudio(std::vector<uint8_t> payload, uint32_t timestamp_ms) {
    impl_->submitAudio(std::move(payload), timestamp_ms);
}

SessionState Session::state() const { return impl_->state; }

ListenMode Session::listenMode() const { return impl_->mode; }

bool Session::hasActiveChannel() const { return impl_->snapshotChannel() != nullptr; }

session::ChannelState Session::channelState() const {
    auto ch = impl_->snapshotChannel();
    return ch ? ch->state() : ChannelState::CLOSED;
}

std::string Session::identityToken() const {
    std::lock_guard<std::mutex> lock(impl_->token_mutex);
    return impl_->identity_token;
}

bool Session::activationHalted() const { return impl_->activation_halted; }

SessionStats Session::stats() const {
    SessionStats s;
    s.sent = impl_->closed_sent;
    s.received = impl_->closed_received;
    s.dropped_outbound = impl_->closed_dropped_out + impl_->orphan_out;
    s.dropped_inbound = impl_->closed_dropped_in + impl_->orphan_in;

    if (auto ch = impl_->snapshotChannel()) {
        s.sent += ch->sentSeq();
        s.received += ch->recvSeq();
        s.dropped_outbound += ch->droppedOutbound();
        s.dropped_inbound += ch->droppedInbound();
    }
    return s;
}

} // namespace xvc
