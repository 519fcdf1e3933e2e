// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors

#include <gtest/gtest.h>
#include "arduplay/rewind_buffer.h"

// The public header must stay free of gsl-lite
#ifdef gsl_lite_MAJOR
#error "arduplay/rewind_buffer.h includes gsl-lite"
#endif

#include "arduplay/gsl.hpp"

#include <vector>

namespace arduplay {
namespace {

RewindBuffer::Blob blob(uint8_t tag) {
    return RewindBuffer::Blob(4, tag);
}

uint8_t tag_of(std::span<const uint8_t> data) {
    return data.empty() ? 0 : data.front();
}

// ═══════════════════════════════════════════════════════════════════════════
// Push / Evict
// ═══════════════════════════════════════════════════════════════════════════

TEST(RewindBufferTest, StartsEmpty) {
    RewindBuffer ring(3);
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_EQ(ring.capacity(), 3u);
    EXPECT_EQ(ring.evicted(), 0u);
}

TEST(RewindBufferTest, PushBelowCapacityKeepsAll) {
    RewindBuffer ring(3);
    EXPECT_FALSE(ring.push(blob(1)));
    EXPECT_FALSE(ring.push(blob(2)));
    EXPECT_EQ(ring.size(), 2u);
    EXPECT_EQ(tag_of(ring.peek_back(0)), 2);
    EXPECT_EQ(tag_of(ring.peek_back(1)), 1);
}

TEST(RewindBufferTest, PushAtCapacityEvictsOldest) {
    RewindBuffer ring(3);
    for (uint8_t i = 1; i <= 3; ++i) {
        ring.push(blob(i));
    }
    EXPECT_TRUE(ring.push(blob(4)));
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.evicted(), 1u);
    EXPECT_EQ(tag_of(ring.peek_back(2)), 2);
    EXPECT_EQ(tag_of(ring.peek_back(0)), 4);
}

TEST(RewindBufferTest, NeverExceedsCapacity) {
    RewindBuffer ring(5);
    for (int i = 0; i < 100; ++i) {
        ring.push(blob(static_cast<uint8_t>(i)));
        ASSERT_LE(ring.size(), 5u);
    }
    EXPECT_EQ(ring.evicted(), 95u);
    EXPECT_EQ(tag_of(ring.peek_back(0)), 99);
}

TEST(RewindBufferTest, ZeroCapacityHoldsNothing) {
    RewindBuffer ring(0);
    EXPECT_FALSE(ring.push(blob(1)));
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.evicted(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Discard
// ═══════════════════════════════════════════════════════════════════════════

TEST(RewindBufferTest, DiscardBackDropsNewest) {
    RewindBuffer ring(4);
    for (uint8_t i = 1; i <= 4; ++i) {
        ring.push(blob(i));
    }
    ring.discard_back(2);
    EXPECT_EQ(ring.size(), 2u);
    EXPECT_EQ(tag_of(ring.peek_back(0)), 2);

    ring.discard_back(0);
    EXPECT_EQ(ring.size(), 2u);
}

TEST(RewindBufferTest, ClearEmpties) {
    RewindBuffer ring(2);
    ring.push(blob(1));
    ring.clear();
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.capacity(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Contracts
// ═══════════════════════════════════════════════════════════════════════════

TEST(RewindBufferTest, PeekPastHistoryViolatesContract) {
    RewindBuffer ring(2);
    ring.push(blob(1));
    EXPECT_THROW((void)ring.peek_back(1), gsl::fail_fast);
}

TEST(RewindBufferTest, DiscardPastHistoryViolatesContract) {
    RewindBuffer ring(2);
    ring.push(blob(1));
    EXPECT_THROW(ring.discard_back(2), gsl::fail_fast);
    EXPECT_EQ(ring.size(), 1u);
}

} // namespace
} // namespace arduplay
