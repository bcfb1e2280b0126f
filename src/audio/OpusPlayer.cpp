/**
 * OpusPlayer.cpp - Decode thread between the network and the speaker
 */

#include "xvc/audio/OpusPlayer.hpp"
#include "xvc/audio/AudioEngine.hpp"
#include "xvc/audio/FrameQueue.hpp"
#include "xvc/audio/OpusCodec.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace xvc::audio {

struct OpusPlayer::Impl {
    // Frames carry the clear() generation they were received in
    using Tagged = std::pair<uint64_t, AudioFrame>;

    AudioEngine& engine;
    OpusDecoder decoder;
    FrameQueue<Tagged> queue;
    size_t frameSamples;

    // Held while samples move into the engine and while clear() empties it
    std::mutex playbackMutex;
    std::atomic<uint64_t> generation{0};

    std::atomic<bool> running{false};
    std::atomic<bool> resetDecoder{false};
    std::atomic<size_t> decodeErrors{0};
    std::thread worker;

    Impl(AudioEngine& eng, int frame_ms, size_t capacity)
        : engine(eng)
        , decoder(eng.config().output_sample_rate, eng.config().channels, frame_ms)
        , queue(capacity)
        , frameSamples(static_cast<size_t>(eng.config().output_sample_rate * frame_ms / 1000)) {
    }

    void loop() {
        while (running) {
            auto item = queue.popWait(std::chrono::milliseconds(50));
            if (resetDecoder.exchange(false)) {
                decoder.reset();
            }
            if (!item || item->first != generation) continue;

            const AudioFrame& frame = item->second;
            auto pcm = decoder.decode(frame.payload);
            if (!pcm) {
                if (decodeErrors++ % 50 == 0) {
                    std::cerr << "[OpusPlayer] Dropping undecodable frame seq=" << frame.sequence << std::endl;
                }
                continue;
            }

            std::lock_guard<std::mutex> lock(playbackMutex);
            if (item->first != generation) continue;
            engine.queuePlayback(pcm->data(), pcm->size());
        }
    }
};

OpusPlayer::OpusPlayer(AudioEngine& engine, int frame_duration_ms, size_t max_queued_frames)
    : pImpl_(std::make_unique<Impl>(engine, frame_duration_ms, max_queued_frames)) {
}

OpusPlayer::~OpusPlayer() {
    stop();
}

bool OpusPlayer::start() {
    if (!pImpl_->decoder.isReady()) {
        std::cerr << "[OpusPlayer] Decoder unavailable" << std::endl;
        return false;
    }
    if (pImpl_->running.exchange(true)) return true;

    pImpl_->worker = std::thread([this]() { pImpl_->loop(); });
    return true;
}

void OpusPlayer::stop() {
    if (!pImpl_->running.exchange(false)) return;
    pImpl_->queue.close();
    if (pImpl_->worker.joinable()) {
        pImpl_->worker.join();
    }
}

void OpusPlayer::enqueue(const AudioFrame& frame) {
    if (pImpl_->queue.push({pImpl_->generation.load(), frame}) > 0 && pImpl_->queue.dropped() % 50 == 1) {
        std::cerr << "[OpusPlayer] Queue full, dropped oldest frame (" << pImpl_->queue.dropped() << " total)" << std::endl;
    }
}

size_t OpusPlayer::clear() {
    std::lock_guard<std::mutex> lock(pImpl_->playbackMutex);
    ++pImpl_->generation;
    size_t discarded = pImpl_->queue.clear();
    pImpl_->engine.clearPlayback();
    pImpl_->resetDecoder = true;
    return discarded;
}

size_t OpusPlayer::pending() const {
    size_t samples = pImpl_->engine.pendingPlayback();
    size_t playing = pImpl_->frameSamples == 0 ? 0 : (samples + pImpl_->frameSamples - 1) / pImpl_->frameSamples;
    return pImpl_->queue.size() + playing;
}

size_t OpusPlayer::decodeErrors() const {
    return pImpl_->decodeErrors;
}

} // namespace xvc::audio
