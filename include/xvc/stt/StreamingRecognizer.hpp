/**
 * StreamingRecognizer.hpp - Rolling-window partial transcripts via whisper.cpp
 *
 * Capture audio is fed from the audio thread; a recognition thread
 * transcribes the most recent window every step and hands the text to the
 * wake-word matcher.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xvc::stt {

struct RecognizerConfig {
    std::string model_path = "models/whisper/ggml-base-q5_1.bin";
    std::string language = "zh";
    int n_threads = 4;
    int sample_rate = 16000;
    int window_ms = 2000;  // audio transcribed per pass
    int step_ms = 500;     // new audio required before the next pass
};

class StreamingRecognizer {
public:
    using TranscriptCallback = std::function<void(const std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;
    // Transcribes one window; nullopt on failure
    using Backend = std::function<std::optional<std::string>(const std::vector<float>&)>;

    explicit StreamingRecognizer(const RecognizerConfig& config);

    /** Uses `backend` in place of the whisper model; no model file is loaded. */
    StreamingRecognizer(const RecognizerConfig& config, Backend backend);
    ~StreamingRecognizer();

    bool isReady() const;

    void setTranscriptCallback(TranscriptCallback callback);
    void setErrorCallback(ErrorCallback callback);

    /** Start the recognition thread. */
    bool start();
    void stop();

    /** Queue capture samples. Never blocks; old chunks are dropped when behind. */
    void feed(const int16_t* samples, size_t count);

    /**
     * Forget buffered audio. Nothing captured before the call reaches a
     * later transcript, including a pass already running.
     */
    void reset();

    /** Synchronous transcription of a whole buffer (16 kHz mono float). */
    std::string transcribe(const std::vector<float>& audio);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xvc::stt
