/**
 * test_session.cpp - Session state machine driven through scripted collaborators
 */

#include "xvc/Session.hpp"
#include "xvc/iot/ThingRegistry.hpp"
#include "../support/Fakes.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <random>

using namespace xvc;
using namespace xvc::testing;

namespace {

SessionConfig fastConfig() {
    SessionConfig c;
    c.open_timeout_ms = 40;
    c.silence_timeout_ms = 60000;
    c.activation_max_retries = 3;
    c.activation_retry_interval_ms = 5;
    c.playback_drain_checks = 5;
    c.playback_drain_interval_ms = 5;
    return c;
}

struct Rig {
    boost::asio::io_context io;
    FakeTransport transport{io};
    ScriptedActivation activation;
    RecordingRenderer renderer;
    iot::ThingRegistry things;
    std::unique_ptr<Session> session;

    std::vector<std::string> errors;
    std::vector<std::string> activationFailures;
    std::vector<std::pair<SessionState, SessionState>> transitions;

    explicit Rig(SessionConfig config = fastConfig(),
                 std::vector<session::ActivationResult> script = {ScriptedActivation::activated()})
        : activation(std::move(script)) {
        things.add(iot::Lamp{});
        things.add(iot::Speaker{});
        session = std::make_unique<Session>(io, transport, activation, renderer, things, config);

        SessionCallbacks callbacks;
        callbacks.onError = [this](const std::string& e) { errors.push_back(e); };
        callbacks.onActivationFailed = [this](const std::string& e) { activationFailures.push_back(e); };
        callbacks.onStateChange = [this](SessionState from, SessionState to) { transitions.emplace_back(from, to); };
        session->setCallbacks(std::move(callbacks));
    }

    void activate() {
        session->start();
        pump(io);
        assert(session->state() == SessionState::IDLE);
    }

    void openListening() {
        session->manualTrigger();
        pump(io);
        assert(session->state() == SessionState::LISTENING);
        assert(session->channelState() == session::ChannelState::RECORDING);
    }

    void toSpeaking() {
        openListening();
        transport.deliverControl({{"type", "tts"}, {"state", "start"}});
        pump(io);
        assert(session->state() == SessionState::SPEAKING);
    }

    void deliverTtsFrame() {
        audio::AudioFrame frame;
        frame.session_id = transport.currentSessionId();
        frame.payload = {0x01, 0x02, 0x03};
        transport.deliverAudio(frame);
        pump(io);
    }

    bool invariantHolds() const {
        SessionState s = session->state();
        bool active = s == SessionState::CONNECTING || s == SessionState::LISTENING || s == SessionState::SPEAKING;
        return active == session->hasActiveChannel();
    }
};

audio::Detection detection(audio::DetectionKind kind, float confidence = 1.0f, const std::string& text = "") {
    audio::Detection d;
    d.kind = kind;
    d.confidence = confidence;
    d.text = text;
    return d;
}

} // namespace

void test_activation_reaches_idle() {
    Rig rig;
    assert(rig.session->state() == SessionState::STARTING);
    rig.activate();

    assert(rig.session->identityToken() == "token-1");
    assert(!rig.session->hasActiveChannel());
    assert(rig.transitions.size() == 2);
    assert(rig.transitions[0].second == SessionState::ACTIVATING);
    assert(rig.transitions[1].second == SessionState::IDLE);

    // The issued token reaches the carrier before the first connect
    assert(rig.transport.credentialUpdates == 1);
    assert(rig.transport.credentials().access_token == "token-1");
    assert(rig.transport.credentials().mqtt.is_null());
    assert(rig.transport.connectCalls == 0);

    std::cout << "[PASS] test_activation_reaches_idle" << std::endl;
}

void test_activation_pending_then_confirmed() {
    Rig rig(fastConfig(), {ScriptedActivation::pending(), ScriptedActivation::activated("later")});
    rig.session->start();
    runFor(rig.io, 100);

    assert(rig.session->state() == SessionState::IDLE);
    assert(rig.session->identityToken() == "later");
    assert(rig.activation.checkCalls == 2);
    assert(rig.activationFailures.empty());

    std::cout << "[PASS] test_activation_pending_then_confirmed" << std::endl;
}

void test_activation_hands_mqtt_settings_to_transport() {
    session::ActivationResult issued = ScriptedActivation::activated("mqtt-token");
    issued.mqtt = {{"endpoint", "mqtt.example:1883"}, {"publish_topic", "device-server"}};
    Rig rig(fastConfig(), {ScriptedActivation::pending(), issued});
    rig.session->start();
    runFor(rig.io, 100);

    assert(rig.session->state() == SessionState::IDLE);
    assert(rig.transport.credentialUpdates == 1);
    assert(rig.transport.credentials().access_token == "mqtt-token");
    assert(rig.transport.credentials().mqtt["endpoint"] == "mqtt.example:1883");

    std::cout << "[PASS] test_activation_hands_mqtt_settings_to_transport" << std::endl;
}

void test_activation_failure_reported_once() {
    Rig rig(fastConfig(), {ScriptedActivation::pending()});
    rig.session->start();
    runFor(rig.io, 200);

    assert(rig.session->state() == SessionState::ACTIVATING);
    assert(rig.session->activationHalted());
    assert(rig.activationFailures.size() == 1);
    assert(rig.activation.checkCalls == 3);

    // Halted: intents do not advance the session
    rig.session->manualTrigger();
    runFor(rig.io, 50);
    assert(rig.session->state() == SessionState::ACTIVATING);
    assert(rig.activationFailures.size() == 1);

    std::cout << "[PASS] test_activation_failure_reported_once" << std::endl;
}

void test_full_turn() {
    Rig rig;
    rig.activate();
    rig.openListening();

    assert(rig.transport.connectCalls == 1);
    assert(rig.transport.sentOfType("hello").size() == 1);
    assert(rig.transport.sentOfType("start_audio").size() == 1);
    assert(rig.transport.sentOfType("start_audio")[0]["session_id"] == rig.transport.currentSessionId());

    auto iot = rig.transport.sentOfType("iot");
    assert(iot.size() == 2);
    assert(iot[0].contains("descriptors"));
    assert(iot[1].contains("states"));

    auto listen = rig.transport.sentOfType("listen");
    assert(listen.size() == 1);
    assert(listen[0]["state"] == "start");
    assert(listen[0]["mode"] == "auto");

    for (uint32_t i = 0; i < 3; ++i) {
        rig.session->submitAudio({0xAA, 0xBB}, i * 60);
    }
    assert(rig.transport.audioSent() == 3);

    rig.session->onDetection(detection(audio::DetectionKind::SpeechEnd));
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);
    assert(rig.session->channelState() == session::ChannelState::PROCESSING);
    assert(rig.transport.sentOfType("listen").back()["state"] == "stop");

    rig.deliverTtsFrame();
    assert(rig.session->channelState() == session::ChannelState::PLAYING);
    assert(rig.renderer.total() == 1);

    rig.transport.deliverControl({{"type", "tts"}, {"state", "stop"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);

    rig.renderer.drain();
    runFor(rig.io, 50);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.transport.sentOfType("stop_audio").size() == 1);

    SessionStats stats = rig.session->stats();
    assert(stats.sent == 3);
    assert(stats.received == 1);

    std::cout << "[PASS] test_full_turn" << std::endl;
}

void test_frames_outside_recording_are_dropped() {
    Rig rig;
    rig.activate();

    // No channel at all
    rig.session->submitAudio({0x01}, 0);
    assert(rig.session->stats().dropped_outbound == 1);

    rig.openListening();

    // TTS audio is not accepted while recording
    rig.deliverTtsFrame();
    assert(rig.renderer.total() == 0);
    assert(rig.session->stats().dropped_inbound == 1);

    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}});
    pump(rig.io);
    assert(rig.session->channelState() == session::ChannelState::PROCESSING);

    size_t before = rig.transport.audioSent();
    for (int i = 0; i < 5; ++i) {
        rig.session->submitAudio({0x01, 0x02}, 0);
    }
    assert(rig.transport.audioSent() == before);
    assert(rig.session->stats().dropped_outbound == 6);

    std::cout << "[PASS] test_frames_outside_recording_are_dropped" << std::endl;
}

void test_barge_in() {
    Rig rig;
    rig.activate();
    rig.toSpeaking();
    rig.deliverTtsFrame();
    rig.deliverTtsFrame();
    assert(rig.renderer.pending() == 2);
    assert(rig.session->channelState() == session::ChannelState::PLAYING);

    // Below the barge-in confidence: ignored
    rig.session->onDetection(detection(audio::DetectionKind::SpeechStart, 0.2f));
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);
    assert(rig.renderer.pending() == 2);

    rig.session->onDetection(detection(audio::DetectionKind::SpeechStart, 0.9f));
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);
    assert(rig.session->channelState() == session::ChannelState::RECORDING);
    assert(rig.renderer.pending() == 0);

    auto aborts = rig.transport.sentOfType("abort");
    assert(aborts.size() == 1);
    assert(aborts[0]["reason"] == "wake_word_detected");

    // Manual interrupt carries no reason
    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}});
    pump(rig.io);
    rig.session->manualTrigger();
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);
    aborts = rig.transport.sentOfType("abort");
    assert(aborts.size() == 2);
    assert(!aborts[1].contains("reason"));

    std::cout << "[PASS] test_barge_in" << std::endl;
}

void test_drain_check_cancelled_by_barge_in() {
    Rig rig;
    rig.activate();
    rig.toSpeaking();
    std::string firstTurn = rig.transport.currentSessionId();

    // End of synthesis arms the drain check, then the user barges in and a
    // new reply starts before the old check would have fired
    rig.transport.deliverControl({{"type", "tts"}, {"state", "stop"}});
    rig.renderer.drain();
    rig.session->onDetection(detection(audio::DetectionKind::Wake, 0.9f, "小智"));
    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);

    runFor(rig.io, 60);
    assert(rig.session->state() == SessionState::SPEAKING);
    assert(rig.session->hasActiveChannel());
    assert(rig.transport.currentSessionId() == firstTurn);
    assert(rig.transport.sentOfType("stop_audio").empty());

    // The new reply still ends through its own drain
    rig.transport.deliverControl({{"type", "tts"}, {"state", "stop"}});
    runFor(rig.io, 60);
    assert(rig.session->state() == SessionState::IDLE);
    assert(rig.transport.sentOfType("stop_audio").size() == 1);

    std::cout << "[PASS] test_drain_check_cancelled_by_barge_in" << std::endl;
}

void test_silence_timeout_closes_channel() {
    SessionConfig config = fastConfig();
    config.silence_timeout_ms = 30;
    Rig rig(config);
    rig.activate();
    rig.openListening();

    runFor(rig.io, 120);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.transport.sentOfType("stop_audio").size() == 1);
    assert(rig.transitions.back().first == SessionState::LISTENING);
    assert(rig.transitions.back().second == SessionState::IDLE);
    assert(rig.errors.empty());

    // Captured audio after the close has nowhere to go
    size_t before = rig.transport.audioSent();
    rig.session->submitAudio({0x01}, 0);
    assert(rig.transport.audioSent() == before);

    std::cout << "[PASS] test_silence_timeout_closes_channel" << std::endl;
}

void test_cancel_while_listening() {
    Rig rig;
    rig.activate();
    rig.openListening();

    rig.session->cancel();
    pump(rig.io);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.transport.sentOfType("stop_audio").size() == 1);
    assert(rig.transport.sentOfType("abort").empty());
    assert(rig.errors.empty());

    // A second cancel in IDLE does nothing
    rig.session->cancel();
    pump(rig.io);
    assert(rig.transport.sentOfType("stop_audio").size() == 1);

    std::cout << "[PASS] test_cancel_while_listening" << std::endl;
}

void test_start_audio_send_failure_fails_open() {
    Rig rig;
    rig.transport.autoAck = false;
    rig.activate();

    rig.session->manualTrigger();
    pump(rig.io);
    assert(rig.session->state() == SessionState::CONNECTING);

    rig.transport.refuseSends = true;
    rig.transport.deliverControl({{"type", "hello"}, {"transport", "websocket"}, {"session_id", "sess-x"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.errors.size() == 1);

    // The open timer was cancelled with the channel
    runFor(rig.io, 100);
    assert(rig.errors.size() == 1);

    std::cout << "[PASS] test_start_audio_send_failure_fails_open" << std::endl;
}

void test_repeated_hello_reply_keeps_open_running() {
    Rig rig;
    rig.transport.autoAck = false;
    rig.activate();

    rig.session->manualTrigger();
    pump(rig.io);
    json reply = {{"type", "hello"}, {"transport", "websocket"}, {"session_id", "sess-x"}};
    rig.transport.deliverControl(reply);
    rig.transport.deliverControl(reply);
    pump(rig.io);
    assert(rig.session->state() == SessionState::CONNECTING);
    assert(rig.errors.empty());
    assert(rig.transport.sentOfType("start_audio").size() == 1);

    rig.transport.deliverControl({{"type", "audio_channel_opened"}, {"session_id", "sess-x"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);

    std::cout << "[PASS] test_repeated_hello_reply_keeps_open_running" << std::endl;
}

void test_mistyped_control_fields_are_tolerated() {
    Rig rig;
    rig.activate();
    rig.openListening();
    rig.transport.clearSent();

    rig.transport.deliverControl({{"type", "tts"}, {"state", 5}});
    rig.transport.deliverControl({{"type", "tts"}, {"state", "sentence_start"}, {"text", 42}});
    rig.transport.deliverControl({{"type", "stt"}, {"text", json::array()}});
    rig.transport.deliverControl({{"type", "llm"}, {"emotion", json::object()}});
    rig.transport.deliverControl({{"type", "hello"}, {"session_id", 9}, {"transport", 3}});
    rig.transport.deliverControl({{"type", "iot"}, {"commands", json::array({{{"name", 1}}})}});
    rig.transport.deliverControl({{"type", "iot"}, {"commands", "TurnOn"}});
    pump(rig.io);

    assert(rig.session->state() == SessionState::LISTENING);
    assert(rig.session->hasActiveChannel());

    auto iot = rig.transport.sentOfType("iot");
    assert(!iot.empty());
    assert(iot[0]["results"].size() == 1);
    assert(iot[0]["results"][0]["name"] == "");
    assert(iot[0]["results"][0]["result"]["success"] == false);

    // The session still completes a normal turn afterwards
    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);

    std::cout << "[PASS] test_mistyped_control_fields_are_tolerated" << std::endl;
}

void test_disconnect_during_listening() {
    Rig rig;
    rig.activate();

    for (int i = 0; i < 100; ++i) {
        rig.openListening();
        rig.transport.dropConnection("socket reset");
        pump(rig.io);
        assert(rig.session->state() == SessionState::IDLE);
        assert(!rig.session->hasActiveChannel());
    }

    assert(rig.errors.size() == 100);
    assert(rig.transport.connectCalls == 100);

    // Disconnect while idle is logged only
    rig.transport.dropConnection("idle drop");
    pump(rig.io);
    assert(rig.errors.size() == 100);

    std::cout << "[PASS] test_disconnect_during_listening (100 cycles)" << std::endl;
}

void test_open_timeout() {
    Rig rig;
    rig.transport.autoAck = false;
    rig.activate();

    rig.session->manualTrigger();
    pump(rig.io);
    assert(rig.session->state() == SessionState::CONNECTING);
    assert(rig.session->channelState() == session::ChannelState::OPENING);

    runFor(rig.io, 120);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.errors.size() == 1);

    std::cout << "[PASS] test_open_timeout" << std::endl;
}

void test_connect_refused() {
    Rig rig;
    rig.transport.connectSucceeds = false;
    rig.activate();

    rig.session->manualTrigger();
    pump(rig.io);
    assert(rig.session->state() == SessionState::IDLE);
    assert(!rig.session->hasActiveChannel());
    assert(rig.errors.size() == 1);

    std::cout << "[PASS] test_connect_refused" << std::endl;
}

void test_push_to_talk() {
    SessionConfig config = fastConfig();
    config.listen_mode = ListenMode::PUSH_TO_TALK;
    Rig rig(config);
    rig.activate();
    rig.openListening();

    assert(rig.transport.sentOfType("listen")[0]["mode"] == "manual");

    // VAD end of speech does not end a push-to-talk turn
    rig.session->onDetection(detection(audio::DetectionKind::SpeechEnd));
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);

    rig.session->release();
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);
    assert(rig.transport.sentOfType("listen").back()["state"] == "stop");

    // Speech start in IDLE never opens a channel outside AUTO
    rig.session->cancel();
    pump(rig.io);
    assert(rig.session->state() == SessionState::IDLE);
    rig.session->onDetection(detection(audio::DetectionKind::SpeechStart));
    pump(rig.io);
    assert(rig.session->state() == SessionState::IDLE);

    std::cout << "[PASS] test_push_to_talk" << std::endl;
}

void test_mode_switch_only_when_idle() {
    Rig rig;
    rig.activate();

    rig.session->switchMode(ListenMode::WAKE_WORD);
    pump(rig.io);
    assert(rig.session->listenMode() == ListenMode::WAKE_WORD);

    rig.session->onDetection(detection(audio::DetectionKind::Wake, 0.95f, "小智"));
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);

    auto listen = rig.transport.sentOfType("listen");
    assert(listen.size() == 2);
    assert(listen[0]["state"] == "detect");
    assert(listen[0]["text"] == "小智");
    assert(listen[1]["state"] == "start");

    rig.session->switchMode(ListenMode::AUTO);
    pump(rig.io);
    assert(rig.session->listenMode() == ListenMode::WAKE_WORD);
    assert(rig.errors.size() == 1);

    std::cout << "[PASS] test_mode_switch_only_when_idle" << std::endl;
}

void test_foreign_session_messages_dropped() {
    Rig rig;
    rig.activate();
    rig.openListening();

    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}, {"session_id", "someone-else"}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::LISTENING);

    rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}, {"session_id", rig.transport.currentSessionId()}});
    pump(rig.io);
    assert(rig.session->state() == SessionState::SPEAKING);

    std::cout << "[PASS] test_foreign_session_messages_dropped" << std::endl;
}

void test_iot_commands() {
    Rig rig;
    rig.activate();
    rig.openListening();
    rig.transport.clearSent();

    rig.transport.deliverControl({
        {"type", "iot"},
        {"commands", json::array({
            {{"name", "Lamp"}, {"method", "TurnOn"}, {"parameters", json::object()}},
            {{"name", "Toaster"}, {"method", "Toast"}},
        })},
    });
    pump(rig.io);

    auto iot = rig.transport.sentOfType("iot");
    assert(iot.size() == 2);
    assert(iot[0]["results"].size() == 2);
    assert(iot[0]["results"][0]["result"]["success"] == true);
    assert(iot[0]["results"][1]["result"]["success"] == false);

    // Only the lamp changed
    assert(iot[1]["states"].size() == 1);
    assert(iot[1]["states"][0]["name"] == "Lamp");

    std::cout << "[PASS] test_iot_commands" << std::endl;
}

void test_random_events_keep_channel_invariant() {
    Rig rig;
    rig.activate();

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 11);
    int checks = 0;

    for (int i = 0; i < 3000; ++i) {
        switch (pick(rng)) {
            case 0: rig.session->manualTrigger(); break;
            case 1: rig.session->release(); break;
            case 2: rig.session->cancel(); break;
            case 3: rig.session->onDetection(detection(audio::DetectionKind::SpeechStart, 0.8f)); break;
            case 4: rig.session->onDetection(detection(audio::DetectionKind::SpeechEnd)); break;
            case 5: rig.session->onDetection(detection(audio::DetectionKind::Wake, 0.9f, "小智")); break;
            case 6: rig.transport.deliverControl({{"type", "tts"}, {"state", "start"}}); break;
            case 7: rig.transport.deliverControl({{"type", "tts"}, {"state", "stop"}}); rig.renderer.drain(); break;
            case 8: rig.transport.dropConnection("random drop"); break;
            case 9: rig.deliverTtsFrame(); break;
            case 10: rig.transport.autoAck = !rig.transport.autoAck; break;
            case 11: runFor(rig.io, 3); break;
        }
        pump(rig.io);
        assert(rig.invariantHolds());
        ++checks;
    }

    std::cout << "[PASS] test_random_events_keep_channel_invariant (" << checks << " checks)" << std::endl;
}

int main() {
    std::cout << "=== Session Tests ===" << std::endl;

    test_activation_reaches_idle();
    test_activation_pending_then_confirmed();
    test_activation_hands_mqtt_settings_to_transport();
    test_activation_failure_reported_once();
    test_full_turn();
    test_frames_outside_recording_are_dropped();
    test_barge_in();
    test_drain_check_cancelled_by_barge_in();
    test_silence_timeout_closes_channel();
    test_cancel_while_listening();
    test_start_audio_send_failure_fails_open();
    test_repeated_hello_reply_keeps_open_running();
    test_mistyped_control_fields_are_tolerated();
    test_disconnect_during_listening();
    test_open_timeout();
    test_connect_refused();
    test_push_to_talk();
    test_mode_switch_only_when_idle();
    test_foreign_session_messages_dropped();
    test_iot_commands();
    test_random_events_keep_channel_invariant();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
