// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Bounded Sample Queue

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace apal {

/// Bounded FIFO of audio samples with a drop-oldest overflow policy
///
/// The producer (tick thread) never blocks on a full queue: the oldest
/// queued samples are discarded so the newest ones fit. The consumer is
/// usually a device callback running on the audio thread.
///
/// Capacity is in samples, not frames. Keep it a multiple of the channel
/// count so overflow never splits an interleaved frame.
template <typename T>
class SampleQueue {
public:
    explicit SampleQueue(size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity) {}

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    /// Append samples, evicting the oldest on overflow
    /// @return Number of samples discarded by this call
    size_t push(std::span<const T> samples) {
        std::lock_guard lock(mutex_);
        const size_t cap = buffer_.size();
        size_t dropped = 0;

        if (samples.size() >= cap) {
            // Only the newest `cap` samples survive
            dropped = size_ + (samples.size() - cap);
            std::copy(samples.end() - static_cast<std::ptrdiff_t>(cap),
                      samples.end(), buffer_.begin());
            head_ = 0;
            size_ = cap;
        } else {
            const size_t overflow =
                size_ + samples.size() > cap ? size_ + samples.size() - cap : 0;
            head_ = (head_ + overflow) % cap;
            size_ -= overflow;
            dropped = overflow;

            size_t tail = (head_ + size_) % cap;
            for (const T& s : samples) {
                buffer_[tail] = s;
                tail = (tail + 1) % cap;
            }
            size_ += samples.size();
        }

        dropped_ += dropped;
        return dropped;
    }

    /// Remove up to out.size() samples in FIFO order
    /// @return Number of samples written to out
    size_t pull(std::span<T> out) {
        std::lock_guard lock(mutex_);
        const size_t cap = buffer_.size();
        const size_t n = std::min(out.size(), size_);
        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(head_ + i) % cap];
        }
        head_ = (head_ + n) % cap;
        size_ -= n;
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        head_ = 0;
        size_ = 0;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return size_;
    }

    size_t capacity() const { return buffer_.size(); }

    /// Total samples discarded since construction
    uint64_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<T> buffer_;
    size_t head_ = 0;
    size_t size_ = 0;
    uint64_t dropped_ = 0;
};

/// Queue capacity in samples for buffer_ms of audio, rounded to whole frames
constexpr size_t queueCapacityFor(uint32_t sample_rate, uint16_t channels,
                                  uint16_t buffer_ms) noexcept {
    const size_t frames = (static_cast<size_t>(sample_rate) * buffer_ms) / 1000;
    return (frames == 0 ? 1 : frames) * (channels == 0 ? 1 : channels);
}

/// Pull `count` samples through scratch and hand them to sink in chunks of
/// at most scratch.size(), padding an underrun with silence. Does not
/// allocate, so it is safe on a device callback thread.
template <typename T, typename Sink>
void drainPadded(SampleQueue<T>& queue, std::span<T> scratch, size_t count, Sink&& sink) {
    if (scratch.empty()) {
        return;
    }
    while (count > 0) {
        std::span<T> chunk = scratch.first(std::min(count, scratch.size()));
        const size_t got = queue.pull(chunk);
        std::fill(chunk.begin() + static_cast<std::ptrdiff_t>(got), chunk.end(), T{});
        sink(std::span<const T>(chunk));
        count -= chunk.size();
    }
}

} // namespace apal
