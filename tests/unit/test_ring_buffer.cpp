// ============================================================================
// LIFELINE - History Ring Buffer Unit Tests
// ============================================================================

#include "lifeline/core/ring_buffer.hpp"

#include <gtest/gtest.h>

using namespace lifeline;

// Test data structure
struct TestSample {
    int id;
    double latency;
};

// ============================================================================
// History Ring Tests
// ============================================================================

class HistoryRingTest : public ::testing::Test {
protected:
    static constexpr size_t CAPACITY = 8;
    HistoryRing<TestSample, CAPACITY> ring;
};

TEST_F(HistoryRingTest, InitiallyEmpty) {
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_FALSE(ring.latest().has_value());
    EXPECT_TRUE(ring.snapshot().empty());
}

TEST_F(HistoryRingTest, PushAndLatest) {
    ring.push({1, 0.5});
    ring.push({2, 0.7});

    ASSERT_TRUE(ring.latest().has_value());
    EXPECT_EQ(ring.latest()->id, 2);
    EXPECT_EQ(ring.size(), 2u);
}

TEST_F(HistoryRingTest, RecentIndexesFromNewest) {
    for (int i = 0; i < 5; ++i) {
        ring.push({i, 0.0});
    }

    EXPECT_EQ(ring.recent(0)->id, 4);
    EXPECT_EQ(ring.recent(4)->id, 0);
    EXPECT_FALSE(ring.recent(5).has_value());
}

TEST_F(HistoryRingTest, OverwritesOldestWhenFull) {
    for (int i = 0; i < 20; ++i) {
        ring.push({i, 0.0});
    }

    EXPECT_EQ(ring.size(), CAPACITY);
    EXPECT_EQ(ring.total(), 20u);

    const auto items = ring.snapshot();
    ASSERT_EQ(items.size(), CAPACITY);
    for (size_t i = 0; i < CAPACITY; ++i) {
        EXPECT_EQ(items[i].id, static_cast<int>(12 + i));
    }
}

TEST_F(HistoryRingTest, SnapshotOldestFirstBeforeWrap) {
    ring.push({10, 0.0});
    ring.push({11, 0.0});
    ring.push({12, 0.0});

    const auto items = ring.snapshot();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items.front().id, 10);
    EXPECT_EQ(items.back().id, 12);
}

TEST_F(HistoryRingTest, Clear) {
    ring.push({1, 0.0});
    ring.clear();

    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.total(), 0u);
    EXPECT_FALSE(ring.latest().has_value());
}

TEST_F(HistoryRingTest, CapacityIsCompileTime) {
    static_assert(HistoryRing<TestSample, 64>::capacity() == 64);
    EXPECT_EQ(ring.capacity(), CAPACITY);
}
