#include "hsize/stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string_view>

#include "hsize/invalid_argument_exception.hpp"

namespace hsize {

TEST(IntegralToCharVector, Values) {
  EXPECT_EQ(std::string_view(IntegralToCharVector(0)), "0");
  EXPECT_EQ(std::string_view(IntegralToCharVector(-11)), "-11");
  EXPECT_EQ(std::string_view(IntegralToCharVector(std::numeric_limits<uint64_t>::max())), "18446744073709551615");
  EXPECT_EQ(std::string_view(IntegralToCharVector(std::numeric_limits<int64_t>::min())), "-9223372036854775808");
}

TEST(StringToIntegral, Values) {
  EXPECT_EQ(StringToIntegral<int>("2"), 2);
  EXPECT_EQ(StringToIntegral<int>("-3"), -3);
  EXPECT_EQ(StringToIntegral<uint32_t>("036"), 36);
}

TEST(StringToIntegral, InvalidValue) {
  EXPECT_THROW(StringToIntegral<int32_t>(""), invalid_argument);
  EXPECT_THROW(StringToIntegral<int32_t>("abc"), invalid_argument);
  EXPECT_THROW(StringToIntegral<int32_t>("12abc"), invalid_argument);
  EXPECT_THROW(StringToIntegral<int8_t>("128"), invalid_argument);
}

TEST(DoubleToString, Positional) {
  EXPECT_EQ(DoubleToString(0), "0");
  EXPECT_EQ(DoubleToString(-0.0), "0");
  EXPECT_EQ(DoubleToString(1536), "1536");
  EXPECT_EQ(DoubleToString(1.5), "1.5");
  EXPECT_EQ(DoubleToString(-0.25), "-0.25");
  EXPECT_EQ(DoubleToString(0.1), "0.1");
  EXPECT_EQ(DoubleToString(1e20), "100000000000000000000");
  EXPECT_EQ(DoubleToString(1e-7), "0.0000001");
}

TEST(DoubleToString, Scientific) {
  EXPECT_EQ(DoubleToString(1e21), "1e+21");
  EXPECT_EQ(DoubleToString(1.2089258196146292e24), "1.2089258196146292e+24");
  EXPECT_EQ(DoubleToString(1e-8), "1e-8");
  EXPECT_EQ(DoubleToString(1e300), "1e+300");
}

TEST(DoubleToString, NonFinite) {
  EXPECT_EQ(DoubleToString(std::numeric_limits<double>::quiet_NaN()), "NaN");
  EXPECT_EQ(DoubleToString(std::numeric_limits<double>::infinity()), "Infinity");
  EXPECT_EQ(DoubleToString(-std::numeric_limits<double>::infinity()), "-Infinity");
}

}  // namespace hsize
