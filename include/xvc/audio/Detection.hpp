/**
 * Detection.hpp - Output of the VAD and wake-word detectors
 */

#pragma once

#include <cstdint>
#include <string>

namespace xvc::audio {

enum class DetectionKind {
    Wake,
    SpeechStart,
    SpeechEnd,
    SilenceTimeout
};

struct Detection {
    DetectionKind kind = DetectionKind::SpeechStart;
    float confidence = 0.0f;
    int64_t timestamp_ms = 0;
    std::string text;       // matched phrase for Wake
    bool bargeIn = false;   // produced by the VAD interrupt path
};

inline const char* detectionKindName(DetectionKind kind) {
    switch (kind) {
        case DetectionKind::Wake: return "WAKE";
        case DetectionKind::SpeechStart: return "SPEECH_START";
        case DetectionKind::SpeechEnd: return "SPEECH_END";
        case DetectionKind::SilenceTimeout: return "SILENCE_TIMEOUT";
    }
    return "?";
}

} // namespace xvc::audio
