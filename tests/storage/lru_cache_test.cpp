// File: tests/storage/lru_cache_test.cpp
#include "storage/lru_cache.hpp"
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace engram {
namespace {

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(LRUCacheTest, ConstructorSetsCapacity) {
    LRUCache<std::string, Embedding> cache(10);
    EXPECT_EQ(10u, cache.Capacity());
    EXPECT_EQ(0u, cache.Size());
}

TEST(LRUCacheTest, ZeroCapacitySetToOne) {
    LRUCache<std::string, int> cache(0);
    EXPECT_EQ(1u, cache.Capacity());
}

TEST(LRUCacheTest, PutAndGetEmbedding) {
    LRUCache<std::string, Embedding> cache(5);
    cache.Put("dark mode", {0.1f, 0.2f});

    auto result = cache.Get("dark mode");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((Embedding{0.1f, 0.2f}), *result);
    EXPECT_FALSE(cache.Get("light mode").has_value());
}

TEST(LRUCacheTest, UpdateExistingKeyKeepsSize) {
    LRUCache<std::string, int> cache(5);
    cache.Put("a", 1);
    cache.Put("a", 2);

    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ(2, *cache.Get("a"));
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(LRUCacheTest, EvictsLeastRecentlyUsed) {
    LRUCache<std::string, int> cache(2);
    cache.Put("a", 1);
    cache.Put("b", 2);

    // Touch "a" so "b" becomes the eviction candidate
    cache.Get("a");
    cache.Put("c", 3);

    EXPECT_TRUE(cache.Get("a").has_value());
    EXPECT_FALSE(cache.Get("b").has_value());
    EXPECT_TRUE(cache.Get("c").has_value());
    EXPECT_EQ(2u, cache.Size());
}

TEST(LRUCacheTest, NeverExceedsCapacity) {
    LRUCache<int, int> cache(16);
    for (int i = 0; i < 1000; ++i) {
        cache.Put(i, i);
        ASSERT_LE(cache.Size(), 16u);
    }
    EXPECT_EQ(984u, cache.GetStats().evictions);
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(LRUCacheTest, StatsTrackHitsAndMisses) {
    LRUCache<int, int> cache(4);
    cache.Put(1, 1);
    cache.Get(1);
    cache.Get(1);
    cache.Get(2);

    auto stats = cache.GetStats();
    EXPECT_EQ(2u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_NEAR(2.0f / 3.0f, stats.hit_rate, 1e-6f);
}

TEST(LRUCacheTest, ClearRemovesEntriesAndResetsStats) {
    LRUCache<int, int> cache(4);
    cache.Put(1, 1);
    cache.Get(1);
    cache.Clear();

    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(0u, cache.GetStats().hits);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(LRUCacheTest, ConcurrentPutAndGet) {
    LRUCache<int, int> cache(64);
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                int key = (t * 500 + i) % 100;
                cache.Put(key, i);
                cache.Get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.Size(), 64u);
    auto stats = cache.GetStats();
    EXPECT_EQ(2000u, stats.hits + stats.misses);
}

} // namespace
} // namespace engram
