#include "hsize/exception.hpp"

#include <gtest/gtest.h>

#include <cstring>

#include "hsize/invalid_argument_exception.hpp"
#include "hsize/range_error_exception.hpp"

namespace hsize {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("Empty string").what(), "Empty string");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Invalid byte string: {} (at {})", "12 zB", 3).what(), "Invalid byte string: 12 zB (at 3)");
}

TEST(ExceptionTest, FormatTruncated) {
  exception ex("Invalid byte string: {}. The input has to be a number optionally followed by a unit such as {} or {}",
               "one thousand two hundred and twelve kilobytes", "KiB", "megabytes");
  EXPECT_EQ(std::strlen(ex.what()), exception::kMsgMaxLen);
  EXPECT_STREQ(ex.what() + exception::kMsgMaxLen - 3, "...");
}

TEST(ExceptionTest, DerivedTypesAreCaughtAsBase) {
  EXPECT_THROW(throw invalid_argument("decimals must be non-negative"), exception);
  EXPECT_THROW(throw range_error("precision would be lost for {}", 42), exception);
  try {
    throw range_error("precision would be lost for {}", 9007199254740993ULL);
  } catch (const exception &ex) {
    EXPECT_STREQ(ex.what(), "precision would be lost for 9007199254740993");
  }
}

}  // namespace hsize
