/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * Capture delivers fixed-size 16-bit PCM frames to a callback on the
 * PortAudio thread. Playback pulls from an internal bounded sample buffer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace xvc::audio {

struct AudioConfig {
    int input_sample_rate = 16000;
    int output_sample_rate = 24000;
    int channels = 1;
    int frame_duration_ms = 60;   // capture frame = one Opus frame
    int input_device = -1;        // -1 = default device
    int output_device = -1;
    int playback_buffer_ms = 10000;
};

using AudioCallback = std::function<void(const int16_t* samples, size_t count)>;

class AudioEngine {
public:
    explicit AudioEngine(const AudioConfig& config = {});
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    /** Called once per captured frame from the PortAudio thread. */
    void setInputCallback(AudioCallback callback);

    /** Append samples at output_sample_rate. Oldest samples are dropped when full. */
    void queuePlayback(const int16_t* samples, size_t count);
    void clearPlayback();

    /** Samples still waiting to be played. */
    size_t pendingPlayback() const;
    bool isPlaying() const { return pendingPlayback() > 0; }

    const AudioConfig& config() const { return config_; }
    std::string lastError() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace xvc::audio
