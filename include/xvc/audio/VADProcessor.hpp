/**
 * VADProcessor.hpp - Voice Activity Detection with hysteresis
 *
 * A frame counts as speech only when the classifier (libfvad) and the
 * energy gate agree. SPEECH_START fires after K consecutive speech frames,
 * SPEECH_END after M consecutive silence frames following a start.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "xvc/audio/Detection.hpp"

namespace xvc::audio {

enum class VADMode {
    QUALITY = 0,
    LOW_BITRATE = 1,
    AGGRESSIVE = 2,
    VERY_AGGRESSIVE = 3
};

/**
 * Frame-level speech classifier.
 * classify() returns 1 for speech, 0 for silence, -1 on error.
 */
class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;
    virtual int classify(const int16_t* frame, size_t samples) = 0;
    virtual void reset() {}
};

/** libfvad (WebRTC VAD) classifier */
class FvadClassifier : public SpeechClassifier {
public:
    FvadClassifier(int sample_rate, VADMode mode);
    ~FvadClassifier() override;

    bool isReady() const;
    int classify(const int16_t* frame, size_t samples) override;
    void reset() override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

struct VADConfig {
    int sample_rate = 16000;
    int frame_ms = 20;
    float energy_threshold = 300.0f;      // mean absolute amplitude
    int start_frames = 3;
    int end_frames = 25;
    int window_frames = 10;
    float interrupt_energy_threshold = 600.0f;
    int interrupt_frames = 5;
};

class VADProcessor {
public:
    using DetectionCallback = std::function<void(const Detection&)>;

    /** Uses libfvad at the given aggressiveness. */
    VADProcessor(const VADConfig& config, VADMode mode = VADMode::VERY_AGGRESSIVE);

    /** Uses an injected classifier. */
    VADProcessor(const VADConfig& config, std::unique_ptr<SpeechClassifier> classifier);

    ~VADProcessor();

    /**
     * Feed PCM samples of any length. Complete frames are classified as
     * soon as they are available.
     */
    void process(const int16_t* samples, size_t count);

    void setDetectionCallback(DetectionCallback callback);

    /**
     * Interrupt mode applies the stricter energy threshold and frame count
     * and marks its SPEECH_START as barge-in. Used while the assistant speaks.
     */
    void setInterruptMode(bool enabled);
    bool interruptMode() const;

    bool isSpeaking() const;

    /** Fraction of speech frames in the sliding window. */
    float confidence() const;

    size_t frameSamples() const;

    void reset();

private:
    void processFrame();

    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace xvc::audio
