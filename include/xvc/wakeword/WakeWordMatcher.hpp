/**
 * WakeWordMatcher.hpp - Fuzzy phonetic wake-word matching on transcripts
 *
 * Each configured phrase is expanded once into tonal, tone-stripped and
 * initials-only forms. Partial transcripts are compared window by window
 * (candidate length +-1 syllables) by normalized edit distance. Errors
 * never reach the session: the matcher simply reports no match.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "xvc/audio/Detection.hpp"

namespace xvc::config { class ConfigStore; }

namespace xvc::wakeword {

struct WakeWordConfig {
    std::vector<std::string> phrases;
    float threshold = 0.85f;
    float initials_floor = 0.5f;  // tone-stripped similarity required for an initials match
    size_t cache_capacity = 1024;
    int cooldown_ms = 2000;
    std::string lexicon_path;

    static WakeWordConfig fromConfig(const config::ConfigStore& store);
};

class WakeWordMatcher {
public:
    using DetectionCallback = std::function<void(const audio::Detection&)>;
    using Clock = std::chrono::steady_clock;

    explicit WakeWordMatcher(const WakeWordConfig& config);
    ~WakeWordMatcher();

    /** Configured phrases that produced a usable phonetic form. */
    size_t candidateCount() const;

    /**
     * Match one partial transcript.
     * @return a WAKE detection carrying the phrase, or nullopt
     */
    std::optional<audio::Detection> match(const std::string& transcript);
    std::optional<audio::Detection> match(const std::string& transcript, Clock::time_point now);

    /** Feed path from the recognizer: match() and invoke the callback on a hit. */
    void onTranscript(const std::string& transcript);

    /** Recognizer failure: logged, no detection. */
    void onRecognizerError(const std::string& error);

    void setDetectionCallback(DetectionCallback callback);

    uint64_t cacheHits() const;
    uint64_t cacheMisses() const;
    size_t cacheSize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace xvc::wakeword
