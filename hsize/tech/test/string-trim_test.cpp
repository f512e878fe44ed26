#include "hsize/string-trim.hpp"

#include <gtest/gtest.h>

namespace hsize {

TEST(TrimSpaces, Empty) {
  EXPECT_EQ(TrimSpaces(""), "");
  EXPECT_EQ(TrimSpaces(" \t\n "), "");
}

TEST(TrimSpaces, AsciiWhiteSpaces) {
  EXPECT_EQ(TrimSpaces("  5 GB  "), "5 GB");
  EXPECT_EQ(TrimSpaces("\t1 KiB\r\n"), "1 KiB");
  EXPECT_EQ(TrimSpaces("1 KiB"), "1 KiB");
}

TEST(TrimSpaces, NoBreakSpaces) {
  EXPECT_EQ(TrimSpaces("\xC2\xA0" "1.5 GiB" "\xC2\xA0"), "1.5 GiB");
  EXPECT_EQ(TrimSpaces(" \xC2\xA0 12 o"), "12 o");
  // inner no-break space is kept
  EXPECT_EQ(TrimSpaces("1\xC2\xA0KiB "), "1\xC2\xA0KiB");
}

TEST(TrimSpaces, LonelyLeadByteKept) { EXPECT_EQ(TrimSpaces("\xC2" "1"), "\xC2" "1"); }

}  // namespace hsize
