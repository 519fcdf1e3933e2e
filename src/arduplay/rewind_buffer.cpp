/**
 * @file rewind_buffer.cpp
 * @brief RewindBuffer ring operations.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/rewind_buffer.h"
#include "arduplay/gsl.hpp"

namespace arduplay {

bool RewindBuffer::push(Blob blob) {
    if (capacity_ == 0) {
        return false;
    }
    bool evicted = false;
    if (entries_.size() == capacity_) {
        entries_.pop_front();
        ++evicted_;
        evicted = true;
    }
    entries_.push_back(std::move(blob));
    gsl_Ensures(entries_.size() <= capacity_);
    return evicted;
}

std::span<const uint8_t> RewindBuffer::peek_back(size_t n) const {
    gsl_Expects(n < entries_.size());
    return entries_[entries_.size() - 1 - n];
}

void RewindBuffer::discard_back(size_t n) {
    gsl_Expects(n <= entries_.size());
    entries_.erase(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
}

} // namespace arduplay
