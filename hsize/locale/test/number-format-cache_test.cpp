#include "hsize/number-format-cache.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-number-format.hpp"
#include "hsize/vector.hpp"

namespace hsize {

TEST(NumberFormatCache, ReturnsSameInstanceForSameKey) {
  NumberFormatCache cache;
  const auto first = cache.get("de-DE", NumberFormatOptions{0, 2, true});
  const auto second = cache.get("de-DE", NumberFormatOptions{0, 2, true});
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(cache.size(), 1U);

  const auto other = cache.get("de-DE", NumberFormatOptions{2, 2, true});
  EXPECT_NE(first, other);
  EXPECT_EQ(cache.size(), 2U);
}

TEST(NumberFormatCache, UnknownLocaleIsNotCached) {
  NumberFormatCache cache;
  EXPECT_EQ(cache.get("xx-XX", NumberFormatOptions{}), nullptr);
  EXPECT_EQ(cache.size(), 0U);
}

TEST(NumberFormatCache, InvalidOptions) {
  NumberFormatCache cache;
  EXPECT_THROW(cache.get("en-US", NumberFormatOptions{3, 1, true}), invalid_argument);
  EXPECT_THROW(NumberFormatCache(0), invalid_argument);
}

TEST(NumberFormatCache, EvictsLeastRecentlyUsed) {
  NumberFormatCache cache(2);
  const auto enUs = cache.get("en-US", NumberFormatOptions{});
  cache.get("de-DE", NumberFormatOptions{});
  // touch en-US so that de-DE becomes the oldest
  EXPECT_EQ(cache.get("en-US", NumberFormatOptions{}), enUs);
  cache.get("fr-FR", NumberFormatOptions{});
  EXPECT_EQ(cache.size(), 2U);
  EXPECT_EQ(cache.get("en-US", NumberFormatOptions{}), enUs);
  EXPECT_EQ(cache.size(), 2U);

  // evicted formats stay usable by their holders
  EXPECT_EQ(enUs->format(1234.5), "1,234.5");
}

TEST(NumberFormatCache, Clear) {
  NumberFormatCache cache;
  const auto format = cache.get("it-IT", NumberFormatOptions{});
  cache.clear();
  EXPECT_EQ(cache.size(), 0U);
  EXPECT_NE(cache.get("it-IT", NumberFormatOptions{}), format);
  EXPECT_EQ(format->format(1.5), "1,5");
}

TEST(NumberFormatCache, ConcurrentAccess) {
  NumberFormatCache cache(4);
  vector<std::jthread> threads;
  for (int threadIdx = 0; threadIdx < 8; ++threadIdx) {
    threads.emplace_back([&cache, threadIdx] {
      for (int iter = 0; iter < 200; ++iter) {
        const auto format = cache.get(threadIdx % 2 == 0 ? "de-DE" : "en-US", NumberFormatOptions{0, iter % 6, true});
        ASSERT_NE(format, nullptr);
        EXPECT_EQ(format->format(1.0), "1");
      }
    });
  }
  threads.clear();
  EXPECT_LE(cache.size(), cache.capacity());
}

TEST(NumberFormatCache, DefaultInstance) {
  EXPECT_EQ(&NumberFormatCache::Default(), &NumberFormatCache::Default());
  EXPECT_EQ(NumberFormatCache::Default().capacity(), NumberFormatCache::kDefaultCapacity);
}

}  // namespace hsize
