/**
 * test_vad.cpp - VAD hysteresis with a scripted classifier
 */

#include "xvc/audio/VADProcessor.hpp"
#include "../support/Fakes.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>

using namespace xvc::audio;
using xvc::testing::ScriptedClassifier;

namespace {

constexpr size_t kFrame = 320;  // 20 ms at 16 kHz

VADConfig testConfig() {
    VADConfig c;
    c.sample_rate = 16000;
    c.frame_ms = 20;
    c.energy_threshold = 300.0f;
    c.start_frames = 3;
    c.end_frames = 5;
    c.window_frames = 10;
    c.interrupt_energy_threshold = 600.0f;
    c.interrupt_frames = 5;
    return c;
}

void feed(VADProcessor& vad, int16_t amplitude, int frames) {
    std::vector<int16_t> pcm(kFrame);
    for (size_t i = 0; i < kFrame; ++i) {
        pcm[i] = (i % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
    }
    for (int f = 0; f < frames; ++f) {
        vad.process(pcm.data(), pcm.size());
    }
}

struct Recorder {
    std::vector<Detection> events;

    void attach(VADProcessor& vad) {
        vad.setDetectionCallback([this](const Detection& d) { events.push_back(d); });
    }
};

} // namespace

void test_start_and_end_with_hysteresis() {
    VADProcessor vad(testConfig(), std::make_unique<ScriptedClassifier>());
    Recorder rec;
    rec.attach(vad);

    feed(vad, 1000, 2);
    assert(rec.events.empty());
    feed(vad, 1000, 1);
    assert(rec.events.size() == 1);
    assert(rec.events[0].kind == DetectionKind::SpeechStart);
    assert(!rec.events[0].bargeIn);
    assert(rec.events[0].confidence > 0.99f);
    assert(vad.isSpeaking());

    // Quiet frames fail the energy gate even though the classifier says speech
    feed(vad, 10, 4);
    assert(rec.events.size() == 1);
    feed(vad, 10, 1);
    assert(rec.events.size() == 2);
    assert(rec.events[1].kind == DetectionKind::SpeechEnd);
    assert(!vad.isSpeaking());

    std::cout << "[PASS] test_start_and_end_with_hysteresis" << std::endl;
}

void test_short_burst_is_ignored() {
    VADProcessor vad(testConfig(), std::make_unique<ScriptedClassifier>());
    Recorder rec;
    rec.attach(vad);

    for (int i = 0; i < 10; ++i) {
        feed(vad, 1000, 2);
        feed(vad, 10, 1);
    }
    assert(rec.events.empty());

    std::cout << "[PASS] test_short_burst_is_ignored" << std::endl;
}

void test_classifier_and_energy_must_agree() {
    // Loud but classified as silence
    VADProcessor vad(testConfig(), std::make_unique<ScriptedClassifier>(std::vector<int>{}, 0));
    Recorder rec;
    rec.attach(vad);

    feed(vad, 2000, 10);
    assert(rec.events.empty());

    // Classifier errors count as silence
    VADProcessor failing(testConfig(), std::make_unique<ScriptedClassifier>(std::vector<int>{}, -1));
    Recorder rec2;
    rec2.attach(failing);
    feed(failing, 2000, 10);
    assert(rec2.events.empty());

    std::cout << "[PASS] test_classifier_and_energy_must_agree" << std::endl;
}

void test_interrupt_mode_is_stricter() {
    VADProcessor vad(testConfig(), std::make_unique<ScriptedClassifier>());
    Recorder rec;
    rec.attach(vad);
    vad.setInterruptMode(true);
    assert(vad.interruptMode());

    // Above the normal threshold, below the interrupt one
    feed(vad, 400, 10);
    assert(rec.events.empty());

    feed(vad, 1000, 4);
    assert(rec.events.empty());
    feed(vad, 1000, 1);
    assert(rec.events.size() == 1);
    assert(rec.events[0].kind == DetectionKind::SpeechStart);
    assert(rec.events[0].bargeIn);

    std::cout << "[PASS] test_interrupt_mode_is_stricter" << std::endl;
}

void test_arbitrary_chunk_sizes() {
    VADProcessor vad(testConfig(), std::make_unique<ScriptedClassifier>());
    Recorder rec;
    rec.attach(vad);
    assert(vad.frameSamples() == kFrame);

    std::vector<int16_t> pcm(kFrame * 3, 1500);
    size_t offset = 0;
    while (offset < pcm.size()) {
        size_t n = std::min<size_t>(100, pcm.size() - offset);
        vad.process(pcm.data() + offset, n);
        offset += n;
    }
    assert(rec.events.size() == 1);

    vad.reset();
    assert(!vad.isSpeaking());
    assert(vad.confidence() == 0.0f);

    std::cout << "[PASS] test_arbitrary_chunk_sizes" << std::endl;
}

void test_unsupported_config_is_sanitized() {
    VADConfig c = testConfig();
    c.sample_rate = 22050;
    c.frame_ms = 25;
    VADProcessor vad(c, std::make_unique<ScriptedClassifier>());
    assert(vad.frameSamples() == 320);

    std::cout << "[PASS] test_unsupported_config_is_sanitized" << std::endl;
}

int main() {
    std::cout << "=== VAD Tests ===" << std::endl;

    test_start_and_end_with_hysteresis();
    test_short_burst_is_ignored();
    test_classifier_and_energy_must_agree();
    test_interrupt_mode_is_stricter();
    test_arbitrary_chunk_sizes();
    test_unsupported_config_is_sanitized();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
