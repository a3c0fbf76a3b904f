#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "store/content_cache.hpp"
#include "test_utils.hpp"

using namespace safestore::store;
using namespace std::chrono_literals;

class ContentCacheTest : public ::testing::Test {
protected:
  ContentCache::Clock::time_point now{ContentCache::Clock::now()};

  void SetUp() override {
    init_test_logging();
  }

  ContentCache::ClockFunction fake_clock() {
    return [this]() { return now; };
  }
};

TEST_F(ContentCacheTest, HitAndMissCounting) {
  ContentCache cache(10, 300s, fake_clock());

  EXPECT_FALSE(cache.get("/a").has_value());
  cache.put("/a", "alpha");
  auto hit = cache.get("/a");

  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "alpha");
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);
  EXPECT_DOUBLE_EQ(cache.hit_rate(), 0.5);
}

TEST_F(ContentCacheTest, HitRateIsZeroBeforeAnyLookup) {
  ContentCache cache;
  EXPECT_DOUBLE_EQ(cache.hit_rate(), 0.0);
  EXPECT_EQ(cache.capacity(), ContentCache::DEFAULT_CAPACITY);
  EXPECT_EQ(cache.ttl(), ContentCache::DEFAULT_TTL);
}

TEST_F(ContentCacheTest, EntriesExpireFromInsertion) {
  ContentCache cache(10, 300s, fake_clock());
  cache.put("/a", "alpha");

  now += 4min;
  EXPECT_TRUE(cache.get("/a").has_value());

  // A read does not extend the lifetime
  now += 2min;
  EXPECT_FALSE(cache.contains("/a"));
  EXPECT_FALSE(cache.get("/a").has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ContentCacheTest, EvictsLeastRecentlyAccessedAtCapacity) {
  ContentCache cache(3, 300s, fake_clock());
  cache.put("/a", "a");
  now += 1s;
  cache.put("/b", "b");
  now += 1s;
  cache.put("/c", "c");
  now += 1s;

  // Touch /a so /b becomes the oldest access
  ASSERT_TRUE(cache.get("/a").has_value());
  now += 1s;
  cache.put("/d", "d");

  EXPECT_EQ(cache.size(), 3u);
  EXPECT_TRUE(cache.contains("/a"));
  EXPECT_FALSE(cache.contains("/b"));
  EXPECT_TRUE(cache.contains("/c"));
  EXPECT_TRUE(cache.contains("/d"));
}

TEST_F(ContentCacheTest, PutReplacesExistingEntry) {
  ContentCache cache(2, 300s, fake_clock());
  cache.put("/a", "old");
  cache.put("/a", "new");

  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.get("/a").value_or(""), "new");
}

TEST_F(ContentCacheTest, InvalidateTreeDropsNestedKeysOnly) {
  ContentCache cache(10, 300s, fake_clock());
  cache.put("/base/dir", "d");
  cache.put("/base/dir/one.txt", "1");
  cache.put("/base/dir/sub/two.txt", "2");
  cache.put("/base/directory.txt", "x");

  cache.invalidate_tree("/base/dir");

  EXPECT_EQ(cache.size(), 1u);
  EXPECT_TRUE(cache.contains("/base/directory.txt"));

  cache.invalidate("/base/directory.txt");
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ContentCacheTest, ContainsHasNoSideEffects) {
  ContentCache cache(10, 300s, fake_clock());
  cache.put("/a", "a");

  EXPECT_TRUE(cache.contains("/a"));
  EXPECT_FALSE(cache.contains("/b"));
  EXPECT_EQ(cache.hits(), 0u);
  EXPECT_EQ(cache.misses(), 0u);

  cache.clear();
  EXPECT_FALSE(cache.contains("/a"));
}
