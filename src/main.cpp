/**
 * XVC (Xiaozhi Voice Client) - Main Entry Point
 *
 * Console front-end: wires configuration, transport, session, detectors,
 * audio devices and the Opus codec together, then reads user intents
 * from stdin.
 */

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "xvc/Session.hpp"
#include "xvc/audio/AudioEngine.hpp"
#include "xvc/audio/OpusCodec.hpp"
#include "xvc/audio/OpusPlayer.hpp"
#include "xvc/audio/VADProcessor.hpp"
#include "xvc/config/ConfigStore.hpp"
#include "xvc/iot/ThingRegistry.hpp"
#include "xvc/net/ActivationClient.hpp"
#include "xvc/net/ConnectionSupervisor.hpp"
#include "xvc/stt/StreamingRecognizer.hpp"
#include "xvc/transport/TransportFactory.hpp"
#include "xvc/wakeword/WakeWordMatcher.hpp"

using namespace xvc;

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

static audio::VADConfig loadVadConfig(const config::ConfigStore& store, int sample_rate) {
    audio::VADConfig c;
    c.sample_rate = sample_rate;
    c.frame_ms = store.get<int>("VAD_OPTIONS.FRAME_MS", c.frame_ms);
    c.energy_threshold = store.get<float>("VAD_OPTIONS.ENERGY_THRESHOLD", c.energy_threshold);
    c.start_frames = store.get<int>("VAD_OPTIONS.START_FRAMES", c.start_frames);
    c.end_frames = store.get<int>("VAD_OPTIONS.END_FRAMES", c.end_frames);
    c.window_frames = store.get<int>("VAD_OPTIONS.WINDOW_FRAMES", c.window_frames);
    c.interrupt_energy_threshold =
        store.get<float>("VAD_OPTIONS.INTERRUPT_ENERGY_THRESHOLD", c.interrupt_energy_threshold);
    c.interrupt_frames = store.get<int>("VAD_OPTIONS.INTERRUPT_FRAMES", c.interrupt_frames);
    return c;
}

static audio::VADMode loadVadMode(const config::ConfigStore& store) {
    int mode = store.get<int>("VAD_OPTIONS.MODE", 3);
    if (mode < 0 || mode > 3) {
        std::cerr << "[XVC] VAD_OPTIONS.MODE must be 0..3, using 3" << std::endl;
        mode = 3;
    }
    return static_cast<audio::VADMode>(mode);
}

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config PATH] [--mode push_to_talk|auto|wake_word]"
              << " [--transport websocket|mqtt] [--list-devices]" << std::endl;
}

static void printHelp() {
    std::cout << "Commands:\n"
              << "  t | talk       start a conversation (or interrupt the reply)\n"
              << "  r | release    end the turn in push-to-talk mode\n"
              << "  c | cancel     abandon the current exchange\n"
              << "  m <mode>       switch listen mode (push_to_talk, auto, wake_word)\n"
              << "  s | status     show session state and frame counters\n"
              << "  q | quit       exit" << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath = "config/config.json";
    std::string modeOverride;
    std::string transportOverride;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            modeOverride = argv[++i];
        } else if (std::strcmp(argv[i], "--transport") == 0 && i + 1 < argc) {
            transportOverride = argv[++i];
        } else if (std::strcmp(argv[i], "--list-devices") == 0) {
            for (const auto& name : audio::AudioEngine::listInputDevices()) std::cout << "in:  " << name << std::endl;
            for (const auto& name : audio::AudioEngine::listOutputDevices()) std::cout << "out: " << name << std::endl;
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║        XIAOZHI VOICE CLIENT (XVC) v0.1.0      ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    // Configuration
    config::ConfigStore config;
    config.load(configPath);
    if (!config.ensureIdentity(configPath)) {
        std::cerr << "[XVC] Device identity not saved, a new one is generated next start" << std::endl;
    }

    nlohmann::json overrides = nlohmann::json::object();
    if (!modeOverride.empty()) overrides["SYSTEM_OPTIONS"]["LISTEN_MODE"] = modeOverride;
    if (!transportOverride.empty()) overrides["SYSTEM_OPTIONS"]["NETWORK"]["TRANSPORT"] = transportOverride;
    if (!overrides.empty()) config.loadFromString(overrides.dump());

    const int frameMs = config.get<int>("AUDIO_OPTIONS.FRAME_DURATION_MS", 60);

    // Event loop
    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);
    std::thread ioThread([&io]() { io.run(); });

    auto transport = transport::createTransport(config, io);
    if (!transport) {
        std::cerr << "[XVC] No usable transport, check SYSTEM_OPTIONS.NETWORK" << std::endl;
        work.reset();
        io.stop();
        ioThread.join();
        return 1;
    }

    // Collaborators
    iot::ThingRegistry things;
    things.add(iot::Lamp{});
    things.add(iot::Speaker{});

    audio::AudioConfig audioConfig;
    audioConfig.input_sample_rate = config.get<int>("AUDIO_OPTIONS.INPUT_SAMPLE_RATE", audioConfig.input_sample_rate);
    audioConfig.output_sample_rate = config.get<int>("AUDIO_OPTIONS.OUTPUT_SAMPLE_RATE", audioConfig.output_sample_rate);
    audioConfig.frame_duration_ms = frameMs;
    audio::AudioEngine engine(audioConfig);
    audio::OpusPlayer player(engine, frameMs);
    audio::OpusEncoder encoder(audioConfig.input_sample_rate, audioConfig.channels, frameMs);

    net::ActivationClient activation(net::ActivationOptions::fromConfig(config));

    // Session
    SessionConfig sessionConfig = SessionConfig::fromConfig(config);
    Session session(io, *transport, activation, player, things, sessionConfig);

    net::ConnectionSupervisor supervisor(io, [&transport]() { transport->connect(); });

    // Detectors
    audio::VADProcessor vad(loadVadConfig(config, audioConfig.input_sample_rate), loadVadMode(config));
    vad.setDetectionCallback([&session](const audio::Detection& d) { session.onDetection(d); });

    wakeword::WakeWordMatcher matcher(wakeword::WakeWordConfig::fromConfig(config));
    matcher.setDetectionCallback([&session](const audio::Detection& d) { session.onDetection(d); });

    const bool useWakeWord = config.get<bool>("WAKE_WORD_OPTIONS.USE_WAKE_WORD", false) ||
                             sessionConfig.listen_mode == ListenMode::WAKE_WORD;
    stt::RecognizerConfig recognizerConfig;
    recognizerConfig.model_path = config.getString("WAKE_WORD_OPTIONS.MODEL_PATH", recognizerConfig.model_path);
    recognizerConfig.sample_rate = audioConfig.input_sample_rate;

    std::unique_ptr<stt::StreamingRecognizer> recognizer;
    if (useWakeWord) {
        recognizer = std::make_unique<stt::StreamingRecognizer>(recognizerConfig);
        recognizer->setTranscriptCallback([&matcher](const std::string& text) { matcher.onTranscript(text); });
        recognizer->setErrorCallback([&matcher](const std::string& error) { matcher.onRecognizerError(error); });
        if (!recognizer->start()) {
            std::cerr << "[XVC] Wake word disabled: recognizer unavailable" << std::endl;
            recognizer.reset();
        }
    }

    SessionCallbacks callbacks;
    callbacks.onStateChange = [&vad, &recognizer](SessionState /*from*/, SessionState to) {
        std::cout << "[XVC] State: " << sessionStateName(to) << std::endl;
        vad.setInterruptMode(to == SessionState::SPEAKING);
        // Audio heard in the previous state must not trigger a new wake
        if (recognizer && (to == SessionState::IDLE || to == SessionState::SPEAKING)) {
            recognizer->reset();
        }
    };
    callbacks.onError = [](const std::string& error) {
        std::cerr << "[XVC] Error: " << error << std::endl;
    };
    callbacks.onActivationFailed = [](const std::string& error) {
        std::cerr << "[XVC] Activation halted: " << error << ". Restart after activating the device." << std::endl;
    };
    callbacks.onChatMessage = [](const std::string& role, const std::string& text) {
        std::cout << (role == "user" ? "  You: " : "  Xiaozhi: ") << text << std::endl;
    };
    callbacks.onEmotion = [](const std::string& emotion) {
        std::cout << "  (" << emotion << ")" << std::endl;
    };
    callbacks.onConnectionChanged = [&supervisor](bool connected, const std::string& reason) {
        if (connected) {
            supervisor.onConnected();
        } else {
            supervisor.onDisconnected(reason);
        }
    };
    session.setCallbacks(std::move(callbacks));

    // Capture path: VAD and recognizer see every frame, the session only
    // receives encoded frames while listening.
    std::atomic<uint32_t> captureMs{0};
    engine.setInputCallback([&](const int16_t* samples, size_t count) {
        vad.process(samples, count);

        SessionState state = session.state();
        if (recognizer && (state == SessionState::IDLE || state == SessionState::SPEAKING)) {
            recognizer->feed(samples, count);
        }

        uint32_t ts = captureMs.fetch_add(static_cast<uint32_t>(frameMs));
        if (state != SessionState::LISTENING) return;

        if (auto packet = encoder.encode(samples, count)) {
            session.submitAudio(std::move(*packet), ts);
        }
    });

    if (!player.start()) {
        std::cerr << "[XVC] Playback disabled" << std::endl;
    }
    if (!engine.start()) {
        std::cerr << "[XVC] Audio devices unavailable: " << engine.lastError() << std::endl;
    }

    session.start();
    std::cout << "[XVC] Listen mode: " << listenModeName(session.listenMode()) << std::endl;
    printHelp();

    // Console intents
    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;

        if (cmd.empty()) {
            continue;
        } else if (cmd == "t" || cmd == "talk") {
            session.manualTrigger();
        } else if (cmd == "r" || cmd == "release") {
            session.release();
        } else if (cmd == "c" || cmd == "cancel") {
            session.cancel();
        } else if (cmd == "m" || cmd == "mode") {
            std::string name;
            in >> name;
            if (auto mode = parseListenMode(name)) {
                session.switchMode(*mode);
            } else {
                std::cerr << "[XVC] Unknown mode '" << name << "'" << std::endl;
            }
        } else if (cmd == "s" || cmd == "status") {
            SessionStats stats = session.stats();
            std::cout << "[XVC] " << sessionStateName(session.state())
                      << " channel=" << session::channelStateName(session.channelState())
                      << " mode=" << listenModeName(session.listenMode())
                      << " sent=" << stats.sent << " received=" << stats.received
                      << " dropped_out=" << stats.dropped_outbound << " dropped_in=" << stats.dropped_inbound
                      << " wake_cache=" << matcher.cacheSize() << std::endl;
        } else if (cmd == "q" || cmd == "quit") {
            break;
        } else {
            printHelp();
        }
    }

    std::cout << "\n[XVC] Shutting down..." << std::endl;

    engine.setInputCallback(nullptr);
    engine.stop();
    if (recognizer) recognizer->stop();
    player.stop();
    supervisor.stop();
    transport->disconnect();

    work.reset();
    io.stop();
    ioThread.join();

    std::cout << "[XVC] Goodbye!" << std::endl;
    return 0;
}
