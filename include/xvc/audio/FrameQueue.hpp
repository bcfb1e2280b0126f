/**
 * FrameQueue.hpp - Bounded frame queue with drop-oldest overflow
 *
 * Sits between a producer thread (capture, network receive) and a consumer
 * thread (encoder, renderer). When full, the oldest entry is discarded so the
 * queue always holds the most recent audio.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace xvc::audio {

template <typename T>
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /**
     * Push an item, evicting the oldest one if the queue is full.
     * @return Number of items evicted (0 or 1)
     */
    size_t push(T item) {
        size_t evicted = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                evicted = 1;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return evicted;
    }

    /**
     * Pop the oldest item without waiting.
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * Pop the oldest item, waiting up to `timeout` for one to arrive.
     * Returns nullopt on timeout or after close().
     */
    std::optional<T> popWait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * Discard everything queued.
     * @return Number of items discarded
     */
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = items_.size();
        items_.clear();
        return n;
    }

    /**
     * Wake any waiting consumer; subsequent waits return immediately.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    /** Total items evicted by overflow since construction. */
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    size_t dropped_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace xvc::audio
