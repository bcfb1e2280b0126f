/**
 * test_recognizer.cpp - Rolling-window recognition with a scripted backend
 */

#include "xvc/stt/StreamingRecognizer.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace xvc::stt;

namespace {

RecognizerConfig smallWindow() {
    RecognizerConfig c;
    c.model_path = "";
    c.window_ms = 200;
    c.step_ms = 100;
    return c;
}

// "Hears" the wake word whenever the window holds any non-silent sample
std::optional<std::string> wakeIfLoud(const std::vector<float>& audio) {
    bool loud = std::any_of(audio.begin(), audio.end(), [](float s) { return s != 0.0f; });
    return loud ? std::string("小智") : std::string();
}

// 500 ms of capture in 60 ms chunks
void feedHalfSecond(StreamingRecognizer& recognizer, int16_t value) {
    std::vector<int16_t> chunk(960, value);
    for (int i = 0; i < 9; ++i) {
        recognizer.feed(chunk.data(), chunk.size());
    }
}

bool waitFor(const std::atomic<int>& counter, int target, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (counter.load() < target) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

void test_backend_transcribes() {
    StreamingRecognizer recognizer(smallWindow(), wakeIfLoud);
    assert(recognizer.isReady());
    assert(recognizer.transcribe({0.0f, 0.5f}) == "小智");
    assert(recognizer.transcribe({0.0f, 0.0f}).empty());
    assert(recognizer.transcribe({}).empty());

    std::cout << "[PASS] test_backend_transcribes" << std::endl;
}

void test_missing_model_not_ready() {
    RecognizerConfig config = smallWindow();
    config.model_path = "does-not-exist.bin";
    StreamingRecognizer recognizer(config);
    assert(!recognizer.isReady());
    assert(!recognizer.start());

    std::cout << "[PASS] test_missing_model_not_ready" << std::endl;
}

void test_streaming_partials() {
    StreamingRecognizer recognizer(smallWindow(), wakeIfLoud);
    std::atomic<int> hits{0};
    recognizer.setTranscriptCallback([&hits](const std::string& text) {
        if (text == "小智") ++hits;
    });
    assert(recognizer.start());

    feedHalfSecond(recognizer, 1000);
    assert(waitFor(hits, 1, 2000));

    recognizer.stop();
    std::cout << "[PASS] test_streaming_partials" << std::endl;
}

void test_reset_forgets_buffered_audio() {
    StreamingRecognizer recognizer(smallWindow(), wakeIfLoud);
    std::atomic<int> hits{0};
    recognizer.setTranscriptCallback([&](const std::string& text) {
        if (text == "小智") ++hits;
    });
    assert(recognizer.start());

    feedHalfSecond(recognizer, 1000);
    assert(waitFor(hits, 1, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    // Silence after a reset never re-reports the word heard before it
    recognizer.reset();
    int before = hits.load();
    feedHalfSecond(recognizer, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    assert(hits.load() == before);

    // Fresh speech after the reset is still heard
    feedHalfSecond(recognizer, 1000);
    assert(waitFor(hits, before + 1, 2000));

    recognizer.stop();
    std::cout << "[PASS] test_reset_forgets_buffered_audio" << std::endl;
}

void test_without_reset_window_carries_over() {
    StreamingRecognizer recognizer(smallWindow(), wakeIfLoud);
    std::atomic<int> hits{0};
    recognizer.setTranscriptCallback([&hits](const std::string& text) {
        if (text == "小智") ++hits;
    });
    assert(recognizer.start());

    feedHalfSecond(recognizer, 1000);
    assert(waitFor(hits, 1, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    int before = hits.load();

    // The first step of silence still overlaps the loud tail of the window
    std::vector<int16_t> silence(1600, 0);
    recognizer.feed(silence.data(), silence.size());
    assert(waitFor(hits, before + 1, 2000));

    recognizer.stop();
    std::cout << "[PASS] test_without_reset_window_carries_over" << std::endl;
}

int main() {
    std::cout << "=== Recognizer Tests ===" << std::endl;

    test_backend_transcribes();
    test_missing_model_not_ready();
    test_streaming_partials();
    test_reset_forgets_buffered_audio();
    test_without_reset_window_carries_over();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
