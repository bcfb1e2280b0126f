/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Classifies fixed-length frames and turns the per-frame decisions into
 * SPEECH_START / SPEECH_END detections with hysteresis.
 * Requires libfvad to be installed.
 */

#include "xvc/audio/VADProcessor.hpp"

#include <fvad.h>
#include <atomic>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <mutex>
#include <vector>

namespace xvc::audio {

// FvadClassifier

struct FvadClassifier::Impl {
    Fvad* vad = nullptr;
};

FvadClassifier::FvadClassifier(int sample_rate, VADMode mode)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VAD] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VAD] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VAD] Invalid mode" << std::endl;
    }
}

FvadClassifier::~FvadClassifier() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool FvadClassifier::isReady() const {
    return pImpl_->vad != nullptr;
}

int FvadClassifier::classify(const int16_t* frame, size_t samples) {
    if (!pImpl_->vad) return -1;
    return fvad_process(pImpl_->vad, frame, samples);
}

void FvadClassifier::reset() {
    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

// VADProcessor

namespace {

bool validRate(int rate) {
    return rate == 8000 || rate == 16000 || rate == 32000 || rate == 48000;
}

bool validFrame(int ms) {
    return ms == 10 || ms == 20 || ms == 30;
}

} // namespace

struct VADProcessor::Impl {
    std::unique_ptr<SpeechClassifier> classifier;
    VADConfig config;
    size_t frame_samples = 0;

    // Frame accumulation
    std::vector<int16_t> frameBuffer;

    // Hysteresis
    std::deque<bool> window;
    int speechRun = 0;
    int silenceRun = 0;
    bool inSpeech = false;
    int64_t framesProcessed = 0;
    uint64_t classifierErrors = 0;

    std::atomic<bool> interrupt{false};
    std::atomic<bool> speaking{false};
    std::atomic<float> confidence{0.0f};

    DetectionCallback callback;
    std::mutex callbackMutex;

    float windowFraction() const {
        if (window.empty()) return 0.0f;
        int speech = 0;
        for (bool s : window) speech += s ? 1 : 0;
        return static_cast<float>(speech) / static_cast<float>(window.size());
    }

    void emit(DetectionKind kind, bool bargeIn) {
        Detection d;
        d.kind = kind;
        d.confidence = windowFraction();
        d.timestamp_ms = framesProcessed * config.frame_ms;
        d.bargeIn = bargeIn;

        DetectionCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            cb = callback;
        }
        if (cb) cb(d);
    }
};

namespace {

VADConfig sanitize(VADConfig config) {
    if (!validRate(config.sample_rate)) {
        std::cerr << "[VAD] Unsupported sample rate " << config.sample_rate << ", using 16000" << std::endl;
        config.sample_rate = 16000;
    }
    if (!validFrame(config.frame_ms)) {
        std::cerr << "[VAD] Unsupported frame length " << config.frame_ms << "ms, using 20ms" << std::endl;
        config.frame_ms = 20;
    }
    if (config.start_frames < 1) config.start_frames = 1;
    if (config.end_frames < 1) config.end_frames = 1;
    if (config.window_frames < 1) config.window_frames = 1;
    if (config.interrupt_frames < 1) config.interrupt_frames = 1;
    return config;
}

} // namespace

VADProcessor::VADProcessor(const VADConfig& config, VADMode mode)
    : VADProcessor(config, std::make_unique<FvadClassifier>(sanitize(config).sample_rate, mode))
{
}

VADProcessor::VADProcessor(const VADConfig& config, std::unique_ptr<SpeechClassifier> classifier)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->config = sanitize(config);
    pImpl_->classifier = std::move(classifier);
    pImpl_->frame_samples = static_cast<size_t>(pImpl_->config.sample_rate * pImpl_->config.frame_ms / 1000);
    pImpl_->frameBuffer.reserve(pImpl_->frame_samples);

    std::cout << "[VAD] Initialized (sample_rate=" << pImpl_->config.sample_rate
              << "Hz, frame=" << pImpl_->config.frame_ms << "ms, start=" << pImpl_->config.start_frames
              << ", end=" << pImpl_->config.end_frames << ")" << std::endl;
}

VADProcessor::~VADProcessor() = default;

void VADProcessor::process(const int16_t* samples, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        pImpl_->frameBuffer.push_back(samples[i]);

        // Process complete frame
        if (pImpl_->frameBuffer.size() >= pImpl_->frame_samples) {
            processFrame();
        }
    }
}

void VADProcessor::processFrame() {
    Impl& s = *pImpl_;
    const bool interrupt = s.interrupt.load();
    const float threshold = interrupt ? s.config.interrupt_energy_threshold : s.config.energy_threshold;
    const int startNeeded = interrupt ? s.config.interrupt_frames : s.config.start_frames;

    // Energy gate: mean absolute amplitude
    double sum = 0.0;
    for (int16_t v : s.frameBuffer) sum += std::abs(static_cast<int>(v));
    float energy = static_cast<float>(sum / static_cast<double>(s.frameBuffer.size()));

    // Classifier errors count as silence
    int verdict = s.classifier ? s.classifier->classify(s.frameBuffer.data(), s.frameBuffer.size()) : -1;
    if (verdict < 0) {
        ++s.classifierErrors;
        if (s.classifierErrors == 1 || s.classifierErrors % 500 == 0) {
            std::cerr << "[VAD] Classifier error, treating frame as silence (" << s.classifierErrors << ")" << std::endl;
        }
    }
    bool isSpeech = verdict == 1 && energy >= threshold;

    s.frameBuffer.clear();
    ++s.framesProcessed;

    s.window.push_back(isSpeech);
    while (s.window.size() > static_cast<size_t>(s.config.window_frames)) {
        s.window.pop_front();
    }
    s.confidence = s.windowFraction();

    if (isSpeech) {
        ++s.speechRun;
        s.silenceRun = 0;
    } else {
        ++s.silenceRun;
        s.speechRun = 0;
    }

    if (!s.inSpeech) {
        if (s.speechRun >= startNeeded) {
            s.inSpeech = true;
            s.speaking = true;
            s.emit(DetectionKind::SpeechStart, interrupt);
        }
    } else if (s.silenceRun >= s.config.end_frames) {
        s.inSpeech = false;
        s.speaking = false;
        s.emit(DetectionKind::SpeechEnd, false);
    }
}

void VADProcessor::setDetectionCallback(DetectionCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->callback = std::move(callback);
}

void VADProcessor::setInterruptMode(bool enabled) {
    pImpl_->interrupt = enabled;
}

bool VADProcessor::interruptMode() const {
    return pImpl_->interrupt;
}

bool VADProcessor::isSpeaking() const {
    return pImpl_->speaking;
}

float VADProcessor::confidence() const {
    return pImpl_->confidence;
}

size_t VADProcessor::frameSamples() const {
    return pImpl_->frame_samples;
}

void VADProcessor::reset() {
    pImpl_->frameBuffer.clear();
    pImpl_->window.clear();
    pImpl_->speechRun = 0;
    pImpl_->silenceRun = 0;
    pImpl_->inSpeech = false;
    pImpl_->speaking = false;
    pImpl_->confidence = 0.0f;

    if (pImpl_->classifier) {
        pImpl_->classifier->reset();
    }
}

} // namespace xvc::audio
