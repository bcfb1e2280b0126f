/**
 * AudioEngine.cpp - PortAudio capture and playback for the voice client
 *
 * Capture runs at the uplink rate (16 kHz) with one Opus frame per callback.
 * Playback runs at the TTS rate (24 kHz) and drains a bounded sample buffer.
 */

#include "xvc/audio/AudioEngine.hpp"

#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>

namespace xvc::audio {

struct AudioEngine::Impl {
    PaStream* capture = nullptr;
    PaStream* render = nullptr;

    AudioCallback onCapture;
    std::mutex captureMutex;
    uint64_t captureOverflows = 0;

    std::deque<int16_t> pending;
    size_t pendingLimit = 0;
    uint64_t overrunCount = 0;
    mutable std::mutex pendingMutex;

    std::atomic<bool> running{false};
    std::atomic<bool> paReady{false};

    std::string lastError;

    void fail(const std::string& what, PaError err = paNoError) {
        lastError = err == paNoError ? what : what + ": " + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << lastError << std::endl;
    }

    void closeStreams() {
        for (PaStream** stream : {&capture, &render}) {
            if (*stream) {
                Pa_StopStream(*stream);
                Pa_CloseStream(*stream);
                *stream = nullptr;
            }
        }
    }

    static int captureCallback(const void* input, void*, unsigned long frames,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags flags,
                               void* userData) {
        auto* self = static_cast<Impl*>(userData);
        const auto* samples = static_cast<const int16_t*>(input);

        std::lock_guard<std::mutex> lock(self->captureMutex);
        if ((flags & paInputOverflow) && self->captureOverflows++ % 50 == 0) {
            std::cerr << "[AudioEngine] Capture overflow (" << self->captureOverflows << " total)" << std::endl;
        }
        if (samples && self->onCapture) {
            self->onCapture(samples, frames);
        }
        return paContinue;
    }

    static int renderCallback(const void*, void* output, unsigned long frames,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                              void* userData) {
        auto* self = static_cast<Impl*>(userData);
        auto* out = static_cast<int16_t*>(output);

        std::lock_guard<std::mutex> lock(self->pendingMutex);
        size_t n = std::min<size_t>(frames, self->pending.size());
        std::copy_n(self->pending.begin(), n, out);
        self->pending.erase(self->pending.begin(), self->pending.begin() + n);
        std::fill(out + n, out + frames, int16_t{0});
        return paContinue;
    }
};

namespace {

// Resolves -1 to the host default; paNoDevice when nothing is available
PaDeviceIndex pickDevice(int configured, bool input) {
    if (configured >= 0) return configured;
    return input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
}

std::vector<std::string> enumerate(bool input) {
    std::vector<std::string> names;
    if (Pa_Initialize() != paNoError) {
        return names;
    }
    for (PaDeviceIndex i = 0; i < Pa_GetDeviceCount(); ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && (input ? info->maxInputChannels : info->maxOutputChannels) > 0) {
            names.emplace_back(info->name);
        }
    }
    Pa_Terminate();
    return names;
}

} // namespace

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    pImpl_->pendingLimit =
        static_cast<size_t>(config_.output_sample_rate) * config_.channels * config_.playback_buffer_ms / 1000;
}

AudioEngine::~AudioEngine() {
    stop();
    if (pImpl_->paReady) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->paReady) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail("PortAudio init failed", err);
        return false;
    }
    pImpl_->paReady = true;

    std::cout << "[AudioEngine] " << Pa_GetDeviceCount() << " devices, PortAudio "
              << Pa_GetVersionText() << std::endl;
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }
    if (!initialize()) {
        return false;
    }

    PaDeviceIndex mic = pickDevice(config_.input_device, true);
    PaDeviceIndex speaker = pickDevice(config_.output_device, false);
    if (mic == paNoDevice || speaker == paNoDevice) {
        pImpl_->fail(mic == paNoDevice ? "No capture device" : "No playback device");
        return false;
    }

    PaStreamParameters in{};
    in.device = mic;
    in.channelCount = config_.channels;
    in.sampleFormat = paInt16;
    in.suggestedLatency = Pa_GetDeviceInfo(mic)->defaultLowInputLatency;

    PaStreamParameters out{};
    out.device = speaker;
    out.channelCount = config_.channels;
    out.sampleFormat = paInt16;
    out.suggestedLatency = Pa_GetDeviceInfo(speaker)->defaultLowOutputLatency;

    const auto samplesPerFrame =
        static_cast<unsigned long>(config_.input_sample_rate * config_.frame_duration_ms / 1000);

    PaError err = Pa_OpenStream(&pImpl_->capture, &in, nullptr, config_.input_sample_rate,
                                samplesPerFrame, paClipOff, &Impl::captureCallback, pImpl_.get());
    if (err == paNoError) {
        err = Pa_OpenStream(&pImpl_->render, nullptr, &out, config_.output_sample_rate,
                            paFramesPerBufferUnspecified, paClipOff, &Impl::renderCallback, pImpl_.get());
    }
    if (err == paNoError) err = Pa_StartStream(pImpl_->capture);
    if (err == paNoError) err = Pa_StartStream(pImpl_->render);

    if (err != paNoError) {
        pImpl_->fail("Opening audio streams failed", err);
        pImpl_->closeStreams();
        return false;
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Capturing from \"" << Pa_GetDeviceInfo(mic)->name << "\" at "
              << config_.input_sample_rate << "Hz/" << config_.frame_duration_ms << "ms, playing to \""
              << Pa_GetDeviceInfo(speaker)->name << "\" at " << config_.output_sample_rate << "Hz" << std::endl;
    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running.exchange(false)) {
        return;
    }
    pImpl_->closeStreams();
    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::setInputCallback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->captureMutex);
    pImpl_->onCapture = std::move(callback);
}

void AudioEngine::queuePlayback(const int16_t* samples, size_t count) {
    std::lock_guard<std::mutex> lock(pImpl_->pendingMutex);
    auto& pending = pImpl_->pending;
    pending.insert(pending.end(), samples, samples + count);

    if (pending.size() > pImpl_->pendingLimit) {
        size_t excess = pending.size() - pImpl_->pendingLimit;
        pending.erase(pending.begin(), pending.begin() + excess);
        if (pImpl_->overrunCount++ % 50 == 0) {
            std::cerr << "[AudioEngine] Playback backlog full, dropped " << excess << " oldest samples" << std::endl;
        }
    }
}

void AudioEngine::clearPlayback() {
    std::lock_guard<std::mutex> lock(pImpl_->pendingMutex);
    pImpl_->pending.clear();
}

size_t AudioEngine::pendingPlayback() const {
    std::lock_guard<std::mutex> lock(pImpl_->pendingMutex);
    return pImpl_->pending.size();
}

std::vector<std::string> AudioEngine::listInputDevices() {
    return enumerate(true);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return enumerate(false);
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

} // namespace xvc::audio
