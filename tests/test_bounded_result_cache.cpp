// tests/test_bounded_result_cache.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/cache/BoundedResultCache.hpp"

namespace {
    std::shared_ptr<const TableRecord> recordWithHeader(const std::string& name) {
        auto record = std::make_shared<TableRecord>();
        record->header.push_back({name});
        return record;
    }
}

TEST(BoundedResultCacheTest, PutThenGetReturnsSamePayload) {
    BoundedResultCache cache(4, std::chrono::minutes(1));
    auto record = recordWithHeader("Produto");
    cache.put("producao|default", record);

    auto cached = cache.get("producao|default");
    ASSERT_NE(cached, nullptr);
    EXPECT_EQ(cached.get(), record.get());

    BoundedResultCacheStats stats = cache.stats();
    EXPECT_EQ(stats.hits, 1);
    EXPECT_EQ(stats.misses, 0);
}

TEST(BoundedResultCacheTest, MissCountsAndReturnsNull) {
    BoundedResultCache cache(4, std::chrono::minutes(1));
    EXPECT_EQ(cache.get("absent"), nullptr);
    EXPECT_EQ(cache.stats().misses, 1);
}

TEST(BoundedResultCacheTest, EvictsLeastRecentlyUsedAtCapacity) {
    BoundedResultCache cache(2, std::chrono::minutes(1));
    cache.put("a", recordWithHeader("a"));
    cache.put("b", recordWithHeader("b"));
    ASSERT_NE(cache.get("a"), nullptr);  // "b" becomes least recent

    cache.put("c", recordWithHeader("c"));

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.size(), 2);
    EXPECT_EQ(cache.stats().evictions, 1);
}

TEST(BoundedResultCacheTest, SizeNeverExceedsCapacity) {
    BoundedResultCache cache(3, std::chrono::minutes(1));
    for (int i = 0; i < 20; ++i) {
        cache.put("key" + std::to_string(i), recordWithHeader(std::to_string(i)));
        EXPECT_LE(cache.size(), 3);
    }
    EXPECT_EQ(cache.stats().evictions, 17);
}

TEST(BoundedResultCacheTest, ReplacingExistingKeyDoesNotEvict) {
    BoundedResultCache cache(2, std::chrono::minutes(1));
    cache.put("a", recordWithHeader("a1"));
    cache.put("b", recordWithHeader("b"));
    cache.put("a", recordWithHeader("a2"));

    EXPECT_EQ(cache.size(), 2);
    EXPECT_EQ(cache.stats().evictions, 0);
    EXPECT_EQ(cache.get("a")->header[0][0], "a2");
}

TEST(BoundedResultCacheTest, ExpiredEntryIsDropped) {
    BoundedResultCache cache(2, std::chrono::milliseconds(50));
    cache.put("a", recordWithHeader("a"));

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_EQ(cache.get("a"), nullptr);
    BoundedResultCacheStats stats = cache.stats();
    EXPECT_EQ(stats.expired, 1);
    EXPECT_EQ(stats.misses, 1);
    EXPECT_EQ(stats.size, 0);
}

TEST(BoundedResultCacheTest, ClearEmptiesCache) {
    BoundedResultCache cache(2, std::chrono::minutes(1));
    cache.put("a", recordWithHeader("a"));
    cache.clear();
    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.contains("a"));
}

TEST(BoundedResultCacheTest, StatsJsonUsesMaxSize) {
    BoundedResultCache cache(7, std::chrono::minutes(1));
    json stats = cache.stats().to_json();
    EXPECT_EQ(stats["max_size"], 7);
    EXPECT_EQ(stats["size"], 0);
}

TEST(BoundedResultCacheTest, ConcurrentAccessKeepsBound) {
    BoundedResultCache cache(8, std::chrono::minutes(1));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = "k" + std::to_string((t * 200 + i) % 16);
                cache.put(key, recordWithHeader(key));
                cache.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_LE(cache.size(), 8);
}
