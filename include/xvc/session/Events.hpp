/**
 * Events.hpp - Units funneled through the session's serialized event path
 */

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "xvc/audio/Detection.hpp"
#include "xvc/session/Collaborators.hpp"

namespace xvc::session {

enum class EventKind {
    ConfigReady,
    ActivationResult,
    Detection,
    ManualTrigger,
    Release,
    Cancel,
    ModeSwitch,
    TransportConnected,
    ControlMessage,
    TtsAudioStarted,
    Disconnected,

    // Posted by the session's own timers
    OpenTimeout,
    SilenceTimeout,
    ActivationRetry,
    PlaybackDrainCheck
};

const char* eventKindName(EventKind kind);

struct Event {
    EventKind kind = EventKind::ConfigReady;

    audio::Detection detection;          // Detection
    session::ActivationResult activation; // ActivationResult
    nlohmann::json message;              // ControlMessage
    std::string text;                    // Disconnected reason
    int mode = 0;                        // ModeSwitch, as ListenMode
    uint64_t generation = 0;             // timer events; stale generations are ignored
};

} // namespace xvc::session
