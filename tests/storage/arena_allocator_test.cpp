// File: tests/storage/arena_allocator_test.cpp
#include "storage/arena_allocator.hpp"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace patex {
namespace {

TEST(ArenaAllocatorTest, AllocationsAreAlignedAndDisjoint) {
    RegionLayout layout = RegionLayout::Standard(4, 256);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator arena(region, layout);

    auto a = arena.Allocate(5);
    auto b = arena.Allocate(8);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_EQ(layout.arena_offset, *a);
    EXPECT_EQ(layout.arena_offset + 8, *b);
    EXPECT_EQ(16u, arena.Used());
    EXPECT_EQ(256u, arena.Capacity());
}

TEST(ArenaAllocatorTest, ZeroSizeYieldsNothing) {
    RegionLayout layout = RegionLayout::Standard(4, 64);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator arena(region, layout);

    EXPECT_FALSE(arena.Allocate(0).has_value());
    EXPECT_EQ(0u, arena.Used());
    EXPECT_EQ(0u, arena.Failures());
}

TEST(ArenaAllocatorTest, OverflowFailsAndRollsBack) {
    RegionLayout layout = RegionLayout::Standard(4, 64);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator arena(region, layout);

    ASSERT_TRUE(arena.Allocate(48).has_value());
    EXPECT_FALSE(arena.Allocate(24).has_value());
    EXPECT_EQ(48u, arena.Used());
    EXPECT_EQ(1u, arena.Failures());

    // Remaining space is still usable after the failed attempt
    EXPECT_TRUE(arena.Allocate(16).has_value());
    EXPECT_EQ(64u, arena.Used());
    EXPECT_FALSE(arena.Allocate(1).has_value());
}

TEST(ArenaAllocatorTest, OversizedRequestFails) {
    RegionLayout layout = RegionLayout::Standard(4, 64);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator arena(region, layout);

    EXPECT_FALSE(arena.Allocate(65).has_value());
    EXPECT_EQ(0u, arena.Used());
}

TEST(ArenaAllocatorTest, RegionTooSmallThrows) {
    RegionLayout layout = RegionLayout::Standard(4, 4096);
    MappedRegion region(512);
    EXPECT_THROW(ArenaAllocator arena(region, layout), std::invalid_argument);
}

TEST(ArenaAllocatorTest, BumpPointerSharedThroughRegion) {
    RegionLayout layout = RegionLayout::Standard(4, 128);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator first(region, layout);
    ArenaAllocator second(region, layout);

    auto a = first.Allocate(16);
    auto b = second.Allocate(16);
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
    EXPECT_EQ(32u, first.Used());
    EXPECT_EQ(32u, second.Used());
}

TEST(ArenaAllocatorTest, ConcurrentAllocationsNeverOverlap) {
    RegionLayout layout = RegionLayout::Standard(4, 8 * 400);
    MappedRegion region(layout.RequiredSize());
    ArenaAllocator arena(region, layout);

    std::vector<std::vector<uint32_t>> results(4);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&arena, &results, t]() {
            for (int i = 0; i < 100; ++i) {
                auto offset = arena.Allocate(8);
                if (offset) {
                    results[t].push_back(*offset);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint32_t> unique;
    for (const auto& list : results) {
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(400u, unique.size());
    EXPECT_EQ(8u * 400, arena.Used());
}

} // namespace
} // namespace patex
