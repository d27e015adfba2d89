/**
 * @file test_memory_cache.cpp
 * @brief Unit tests for MemoryCache.
 */

#include "cache/memory_cache.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace telemetry_hub;

TEST(MemoryCacheTest, SetAndGet) {
    MemoryCache cache;
    cache.set("k", "v");
    EXPECT_EQ(cache.get("k"), "v");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemoryCacheTest, MissingKey) {
    MemoryCache cache;
    EXPECT_FALSE(cache.get("absent").has_value());
}

TEST(MemoryCacheTest, Overwrite) {
    MemoryCache cache;
    cache.set("k", "v1");
    cache.set("k", "v2");
    EXPECT_EQ(cache.get("k"), "v2");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemoryCacheTest, EraseAndClear) {
    MemoryCache cache;
    cache.set("a", "1");
    cache.set("b", "2");

    EXPECT_TRUE(cache.erase("a"));
    EXPECT_FALSE(cache.erase("a"));
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("b").has_value());
}

TEST(MemoryCacheTest, ExpiredEntryIsInvisible) {
    MemoryCache cache;
    cache.set("short", "v", std::chrono::milliseconds{10});
    cache.set("long", "v", std::chrono::seconds{30});
    EXPECT_EQ(cache.get("short"), "v");

    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_EQ(cache.get("long"), "v");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemoryCacheTest, BackendName) {
    MemoryCache cache;
    EXPECT_EQ(cache.backend_name(), "MemoryCache");
}

TEST(MemoryCacheTest, ConcurrentWriters) {
    MemoryCache cache;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 100; ++i) {
                cache.set(std::to_string(t) + ":" + std::to_string(i), "x");
                (void)cache.get(std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(cache.size(), 400u);
}
