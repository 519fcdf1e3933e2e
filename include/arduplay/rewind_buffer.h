/**
 * @file rewind_buffer.h
 * @brief Fixed-capacity ring of serialized session states.
 *
 * Newest entries are at the back. Pushing at capacity evicts the oldest.
 * Capacity is fixed at construction; a capacity of zero holds nothing.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <vector>

namespace arduplay {

class RewindBuffer {
public:
    using Blob = std::vector<uint8_t>;

    explicit RewindBuffer(size_t capacity) noexcept
        : capacity_(capacity)
    {}

    /**
     * @brief Append a state, evicting the oldest when full.
     * @return true if an entry was evicted
     */
    bool push(Blob blob);

    /**
     * @brief Entry n steps back from the newest (0 = newest).
     * @throws gsl_lite::fail_fast if n is not below size()
     */
    [[nodiscard]] std::span<const uint8_t> peek_back(size_t n) const;

    /**
     * @brief Drop the n newest entries.
     * @throws gsl_lite::fail_fast if n exceeds size()
     */
    void discard_back(size_t n);

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Entries dropped by push() since construction
    [[nodiscard]] uint64_t evicted() const noexcept { return evicted_; }

private:
    size_t capacity_;
    std::deque<Blob> entries_;
    uint64_t evicted_ = 0;
};

} // namespace arduplay
