/**
 * Collaborators.hpp - Interfaces the session consumes at its boundary
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "xvc/audio/AudioFrame.hpp"

namespace xvc::session {

enum class ActivationStatus {
    ACTIVATED,
    PENDING,
    FAILED
};

struct ActivationResult {
    ActivationStatus status = ActivationStatus::FAILED;
    std::string identity_token;  // consumed verbatim once ACTIVATED
    std::string message;         // verification code prompt or error text
    nlohmann::json mqtt;         // server-issued MQTT settings, null when absent
};

/**
 * Device activation check. May complete on any thread; the session
 * re-posts the result into its event path.
 */
class ActivationGate {
public:
    using Completion = std::function<void(ActivationResult)>;

    virtual ~ActivationGate() = default;
    virtual void check(Completion done) = 0;
};

/**
 * Playback sink for received TTS frames. enqueue() is called from the
 * network thread, clear() and pending() from the event path.
 */
class AudioRenderer {
public:
    virtual ~AudioRenderer() = default;

    virtual void enqueue(const audio::AudioFrame& frame) = 0;

    /** Drop everything queued. Returns the number of frames discarded. */
    virtual size_t clear() = 0;

    /** Frames queued or still being played. */
    virtual size_t pending() const = 0;
};

} // namespace xvc::session
