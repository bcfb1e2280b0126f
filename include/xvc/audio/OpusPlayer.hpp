/**
 * OpusPlayer.hpp - Renders received Opus frames through the AudioEngine
 *
 * enqueue() is non-blocking: frames land in a bounded queue and are decoded
 * on a dedicated thread, then appended to the engine's playback buffer.
 */

#pragma once

#include <memory>

#include "xvc/session/Collaborators.hpp"

namespace xvc::audio {

class AudioEngine;

class OpusPlayer : public session::AudioRenderer {
public:
    OpusPlayer(AudioEngine& engine, int frame_duration_ms, size_t max_queued_frames = 200);
    ~OpusPlayer() override;

    OpusPlayer(const OpusPlayer&) = delete;
    OpusPlayer& operator=(const OpusPlayer&) = delete;

    bool start();
    void stop();

    void enqueue(const AudioFrame& frame) override;
    size_t clear() override;
    size_t pending() const override;

    /** Packets the decoder rejected. */
    size_t decodeErrors() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace xvc::audio
