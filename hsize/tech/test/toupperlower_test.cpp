#include "hsize/toupperlower.hpp"

#include <gtest/gtest.h>

#include "hsize/tolower-str.hpp"

namespace hsize {

template <typename T>
class ToUpperLowerTest : public ::testing::Test {};

using MyTypes = ::testing::Types<char, unsigned char>;
TYPED_TEST_SUITE(ToUpperLowerTest, MyTypes, );

TYPED_TEST(ToUpperLowerTest, ToUpperTest) {
  using T = TypeParam;
  EXPECT_EQ(toupper(static_cast<T>('k')), static_cast<T>('K'));
  EXPECT_EQ(toupper(static_cast<T>('i')), static_cast<T>('I'));
  EXPECT_EQ(toupper(static_cast<T>('B')), static_cast<T>('B'));
  EXPECT_EQ(toupper(static_cast<T>('2')), static_cast<T>('2'));
}

TYPED_TEST(ToUpperLowerTest, ToLowerTest) {
  using T = TypeParam;
  EXPECT_EQ(tolower(static_cast<T>('M')), static_cast<T>('m'));
  EXPECT_EQ(tolower(static_cast<T>('o')), static_cast<T>('o'));
  EXPECT_EQ(tolower(static_cast<T>(' ')), static_cast<T>(' '));
}

TEST(ToLowerStrTest, ToLowerStr) {
  EXPECT_EQ(ToLowerStr("KiB"), "kib");
  EXPECT_EQ(ToLowerStr("Megabytes"), "megabytes");
  EXPECT_EQ(ToLowerStr(""), "");
  EXPECT_EQ(ToLowerStr("Ko\xC2\xA0"), "ko\xC2\xA0");
}

TEST(ToLowerStrTest, ToLowerFromTo) {
  const char from[] = "GIBIBYTES";
  char to[sizeof(from)]{};
  tolower_n(from, sizeof(from) - 1, to);
  EXPECT_STREQ(to, "gibibytes");
}

}  // namespace hsize
