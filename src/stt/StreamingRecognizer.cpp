/**
 * StreamingRecognizer.cpp - Partial transcripts for wake-word spotting using whisper.cpp
 *
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "xvc/stt/StreamingRecognizer.hpp"
#include "xvc/audio/FrameQueue.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

#include "whisper.h"

namespace xvc::stt {

namespace {
constexpr size_t kMaxQueuedChunks = 64;
}

struct StreamingRecognizer::Impl {
    RecognizerConfig config;

    whisper_context* ctx = nullptr;
    whisper_full_params params;
    Backend backend;

    audio::FrameQueue<std::vector<int16_t>> chunks{kMaxQueuedChunks};
    std::vector<float> window;
    size_t newSamples = 0;
    std::atomic<uint64_t> epoch{0};  // bumped by reset()

    std::atomic<bool> running{false};
    std::thread worker;

    std::mutex callbackMutex;
    TranscriptCallback onTranscript;
    ErrorCallback onError;

    explicit Impl(const RecognizerConfig& cfg) : config(cfg) {
        // Initialize whisper context from model file
        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(config.model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[STT] Failed to load model: " << config.model_path << std::endl;
            return;
        }

        // Greedy decoding, single segment: only short partials are needed
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = config.language.c_str();
        params.n_threads = config.n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = true;
        params.no_context = true;

        std::cout << "[STT] Model loaded: " << config.model_path << " (language " << config.language << ")" << std::endl;
    }

    Impl(const RecognizerConfig& cfg, Backend fn) : config(cfg), backend(std::move(fn)) {
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }

    void reportError(const std::string& error) {
        ErrorCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            cb = onError;
        }
        if (cb) cb(error);
    }

    void reportTranscript(const std::string& text) {
        TranscriptCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            cb = onTranscript;
        }
        if (cb) cb(text);
    }

    bool ready() const {
        return ctx != nullptr || static_cast<bool>(backend);
    }

    std::optional<std::string> run(const std::vector<float>& audio) {
        if (backend) {
            return backend(audio);
        }

        int result = whisper_full(ctx, params, audio.data(), static_cast<int>(audio.size()));
        if (result != 0) {
            return std::nullopt;
        }

        std::string text;
        const int n_segments = whisper_full_n_segments(ctx);
        for (int i = 0; i < n_segments; ++i) {
            const char* segment_text = whisper_full_get_segment_text(ctx, i);
            if (segment_text) {
                text += segment_text;
            }
        }
        return text;
    }

    void loop() {
        const size_t windowSamples = static_cast<size_t>(config.sample_rate) * config.window_ms / 1000;
        const size_t stepSamples = static_cast<size_t>(config.sample_rate) * config.step_ms / 1000;

        uint64_t seen = epoch.load();
        while (running) {
            auto chunk = chunks.popWait(std::chrono::milliseconds(100));

            // A chunk popped across a reset may predate it
            uint64_t current = epoch.load();
            if (current != seen) {
                seen = current;
                window.clear();
                newSamples = 0;
                continue;
            }
            if (!chunk) continue;

            for (int16_t s : *chunk) {
                window.push_back(static_cast<float>(s) / 32768.0f);
            }
            newSamples += chunk->size();

            if (window.size() > windowSamples) {
                window.erase(window.begin(), window.begin() + (window.size() - windowSamples));
            }
            if (newSamples < stepSamples) continue;
            newSamples = 0;

            auto text = run(window);
            if (epoch.load() != seen) {
                continue;
            }
            if (!text) {
                reportError("whisper_full failed");
                continue;
            }
            if (!text->empty()) {
                reportTranscript(*text);
            }
        }
    }
};

StreamingRecognizer::StreamingRecognizer(const RecognizerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

StreamingRecognizer::StreamingRecognizer(const RecognizerConfig& config, Backend backend)
    : impl_(std::make_unique<Impl>(config, std::move(backend))) {
}

StreamingRecognizer::~StreamingRecognizer() {
    stop();
}

bool StreamingRecognizer::isReady() const {
    return impl_ && impl_->ready();
}

void StreamingRecognizer::setTranscriptCallback(TranscriptCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->onTranscript = std::move(callback);
}

void StreamingRecognizer::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->onError = std::move(callback);
}

bool StreamingRecognizer::start() {
    if (!isReady()) {
        std::cerr << "[STT] Cannot start: model not loaded" << std::endl;
        return false;
    }
    if (impl_->running.exchange(true)) return true;

    impl_->worker = std::thread([this]() { impl_->loop(); });
    std::cout << "[STT] Recognition thread started" << std::endl;
    return true;
}

void StreamingRecognizer::stop() {
    if (!impl_->running.exchange(false)) return;
    impl_->chunks.close();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

void StreamingRecognizer::feed(const int16_t* samples, size_t count) {
    if (!impl_->running || count == 0) return;
    impl_->chunks.push(std::vector<int16_t>(samples, samples + count));
}

void StreamingRecognizer::reset() {
    ++impl_->epoch;
    size_t dropped = impl_->chunks.clear();
    if (dropped > 0) {
        std::cout << "[STT] Reset, dropped " << dropped << " queued chunks" << std::endl;
    }
}

std::string StreamingRecognizer::transcribe(const std::vector<float>& audio) {
    if (!impl_->ready() || audio.empty()) {
        return "";
    }
    if (impl_->running) {
        std::cerr << "[STT] transcribe() unavailable while streaming" << std::endl;
        return "";
    }

    auto text = impl_->run(audio);
    if (!text) {
        std::cerr << "[STT] Transcription failed" << std::endl;
        return "";
    }
    return *text;
}

} // namespace xvc::stt
