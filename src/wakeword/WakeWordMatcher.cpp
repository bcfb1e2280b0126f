/**
 * WakeWordMatcher.cpp - Phonetic fuzzy matching with a memoized similarity cache
 */

#include "xvc/wakeword/WakeWordMatcher.hpp"
#include "xvc/config/ConfigStore.hpp"
#include "xvc/wakeword/LruCache.hpp"
#include "xvc/wakeword/Phonetics.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace xvc::wakeword {

WakeWordConfig WakeWordConfig::fromConfig(const config::ConfigStore& store) {
    WakeWordConfig c;
    c.phrases = store.get<std::vector<std::string>>("WAKE_WORD_OPTIONS.WAKE_WORDS", c.phrases);
    c.threshold = store.get<float>("WAKE_WORD_OPTIONS.THRESHOLD", c.threshold);
    c.cache_capacity = store.get<size_t>("WAKE_WORD_OPTIONS.CACHE_CAPACITY", c.cache_capacity);
    c.cooldown_ms = store.get<int>("WAKE_WORD_OPTIONS.COOLDOWN_MS", c.cooldown_ms);
    c.initials_floor = store.get<float>("WAKE_WORD_OPTIONS.INITIALS_FLOOR", c.initials_floor);
    c.lexicon_path = store.getString("WAKE_WORD_OPTIONS.PINYIN_LEXICON");
    return c;
}

namespace {

enum class Representation : char {
    TONAL = 't',
    PLAIN = 'p',
    INITIALS = 'i'
};

struct Candidate {
    std::string phrase;
    PhoneticForm form;
    WakeWordMatcher::Clock::time_point lastFired{};
    bool fired = false;
};

} // namespace

struct WakeWordMatcher::Impl {
    WakeWordConfig config;
    PinyinLexicon lexicon;
    std::vector<Candidate> candidates;
    LruCache<std::string, float> cache;

    std::mutex cooldownMutex;
    std::mutex callbackMutex;
    DetectionCallback callback;
    uint64_t recognizerErrors = 0;

    explicit Impl(const WakeWordConfig& cfg) : config(cfg), cache(cfg.cache_capacity) {}

    float compare(Representation rep, const std::string& candidate, const std::string& window) {
        std::string key;
        key.reserve(candidate.size() + window.size() + 2);
        key += static_cast<char>(rep);
        key += candidate;
        key += '\x1f';
        key += window;

        if (auto cached = cache.get(key)) {
            return *cached;
        }
        float score = similarity(candidate, window);
        cache.put(key, score);
        return score;
    }

    /** Best score of one candidate over all windows of the transcript. */
    float score(const Candidate& c, const std::vector<std::string>& syllables) {
        const size_t len = c.form.length();
        const size_t minLen = len > 1 ? len - 1 : 1;
        const size_t maxLen = len + 1;
        float best = 0.0f;

        for (size_t w = minLen; w <= maxLen && w <= syllables.size(); ++w) {
            for (size_t start = 0; start + w <= syllables.size(); ++start) {
                PhoneticForm window = makeForm(
                    std::vector<std::string>(syllables.begin() + start, syllables.begin() + start + w));

                float tonal = compare(Representation::TONAL, c.form.tonal, window.tonal);
                float plain = compare(Representation::PLAIN, c.form.plain, window.plain);
                float s = std::max(tonal, plain);

                // Initials alone are too short to trust
                if (c.form.initials.size() >= 2 && window.initials == c.form.initials &&
                    plain >= config.initials_floor) {
                    float initials = compare(Representation::INITIALS, c.form.initials, window.initials);
                    s = std::max(s, std::min(initials, config.threshold));
                }

                best = std::max(best, s);
            }
        }
        return best;
    }
};

WakeWordMatcher::WakeWordMatcher(const WakeWordConfig& config)
    : pImpl_(std::make_unique<Impl>(config))
{
    if (!config.lexicon_path.empty()) {
        pImpl_->lexicon.loadFile(config.lexicon_path);
    }

    for (const auto& phrase : config.phrases) {
        Candidate c;
        c.phrase = phrase;
        c.form = pImpl_->lexicon.form(phrase);

        bool unknown = std::find(c.form.syllables.begin(), c.form.syllables.end(), "?") != c.form.syllables.end();
        if (c.form.empty() || unknown) {
            std::cerr << "[WakeWord] Skipping phrase without a full pinyin form: " << phrase << std::endl;
            continue;
        }

        std::cout << "[WakeWord] Candidate '" << phrase << "' -> " << c.form.tonal << " / "
                  << c.form.plain << " / " << c.form.initials << std::endl;
        pImpl_->candidates.push_back(std::move(c));
    }

    std::cout << "[WakeWord] Matcher ready (" << pImpl_->candidates.size() << " phrases, threshold="
              << config.threshold << ")" << std::endl;
}

WakeWordMatcher::~WakeWordMatcher() = default;

size_t WakeWordMatcher::candidateCount() const {
    return pImpl_->candidates.size();
}

std::optional<audio::Detection> WakeWordMatcher::match(const std::string& transcript) {
    return match(transcript, Clock::now());
}

std::optional<audio::Detection> WakeWordMatcher::match(const std::string& transcript, Clock::time_point now) {
    if (transcript.empty() || pImpl_->candidates.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> syllables = pImpl_->lexicon.syllables(transcript);
    if (syllables.empty()) {
        return std::nullopt;
    }

    Candidate* bestCandidate = nullptr;
    float bestScore = 0.0f;
    for (auto& c : pImpl_->candidates) {
        float s = pImpl_->score(c, syllables);
        if (s > bestScore) {
            bestScore = s;
            bestCandidate = &c;
        }
    }

    if (!bestCandidate || bestScore < pImpl_->config.threshold) {
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(pImpl_->cooldownMutex);
        auto cooldown = std::chrono::milliseconds(pImpl_->config.cooldown_ms);
        if (bestCandidate->fired && now - bestCandidate->lastFired < cooldown) {
            return std::nullopt;
        }
        bestCandidate->fired = true;
        bestCandidate->lastFired = now;
    }

    audio::Detection d;
    d.kind = audio::DetectionKind::Wake;
    d.confidence = bestScore;
    d.text = bestCandidate->phrase;
    d.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    std::cout << "[WakeWord] Detected '" << d.text << "' in \"" << transcript << "\" (score="
              << bestScore << ")" << std::endl;
    return d;
}

void WakeWordMatcher::onTranscript(const std::string& transcript) {
    auto detection = match(transcript);
    if (!detection) return;

    DetectionCallback cb;
    {
        std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
        cb = pImpl_->callback;
    }
    if (cb) cb(*detection);
}

void WakeWordMatcher::onRecognizerError(const std::string& error) {
    ++pImpl_->recognizerErrors;
    std::cerr << "[WakeWord] Recognizer error (no match): " << error << std::endl;
}

void WakeWordMatcher::setDetectionCallback(DetectionCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->callback = std::move(callback);
}

uint64_t WakeWordMatcher::cacheHits() const { return pImpl_->cache.hits(); }

uint64_t WakeWordMatcher::cacheMisses() const { return pImpl_->cache.misses(); }

size_t WakeWordMatcher::cacheSize() const { return pImpl_->cache.size(); }

} // namespace xvc::wakeword
