#include "hsize/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace hsize {

TEST(StringEqualIgnoreCase, EqualStrings) {
  EXPECT_TRUE(CaseInsensitiveEqual("kib", "KiB"));
  EXPECT_TRUE(CaseInsensitiveEqual("de-de", "DE-de"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
}

TEST(StringEqualIgnoreCase, UnequalStrings) {
  EXPECT_FALSE(CaseInsensitiveEqual("kib", "kb"));
  EXPECT_FALSE(CaseInsensitiveEqual("MiB", "Mi"));
}

}  // namespace hsize
