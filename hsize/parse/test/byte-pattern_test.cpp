#include "hsize/byte-pattern.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <regex>
#include <string>

namespace hsize {

namespace {

bool Matches(const std::string &str) { return std::regex_match(str, BytePattern()); }

constexpr const char *kSamples[] = {
    "1",        "1.5 GB",     "1,5GB",   "-2 KiB",    "+2e3 kb",   "12 bytes",  "12 BITS", "4 Mo",
    "4 octets", "4 kio",      "",        "GB",        ".5 GB",     "1.5 XB",    "1.5 GB extra",
    "NaN",      "1 000 B",    "1eb",     "1e5b",      "1.e5 B",    "5 ki",      "5 kib",   "7 Eo",
    "3 byt",    "3 bitss",    "2\t\nMB", "1,5.3 kB", "12 apples", "2.5 kilochunks", "3\nch",
};

constexpr const char *kTexts[] = {
    "copied 12 files, 3.5 MB in total",
    "5-3 KB",
    "1.5.3 KB",
    "+-1 KB then +2 kb",
    "v1.2 build 1e5b 2eb 3 byt 4 octets",
    "abc123 xyz 5 KB",
    "no size",
};


}  // namespace

TEST(BytePattern, ValidSizes) {
  EXPECT_TRUE(Matches("1"));
  EXPECT_TRUE(Matches("1.5 GB"));
  EXPECT_TRUE(Matches("1,5GB"));
  EXPECT_TRUE(Matches("-2 KiB"));
  EXPECT_TRUE(Matches("+2e3 kb"));
  EXPECT_TRUE(Matches("12 bytes"));
  EXPECT_TRUE(Matches("12 BITS"));
  EXPECT_TRUE(Matches("4 Mo"));
  EXPECT_TRUE(Matches("4 octets"));
  EXPECT_TRUE(Matches("4 kio"));
}

TEST(BytePattern, InvalidSizes) {
  EXPECT_FALSE(Matches(""));
  EXPECT_FALSE(Matches("GB"));
  EXPECT_FALSE(Matches(".5 GB"));
  EXPECT_FALSE(Matches("1.5 XB"));
  EXPECT_FALSE(Matches("1.5 GB extra"));
  EXPECT_FALSE(Matches("NaN"));
  EXPECT_FALSE(Matches("1 000 B"));
  // long names are not part of the grammar
  EXPECT_FALSE(Matches("3 megabytes"));
}

TEST(BytePattern, Groups) {
  std::smatch match;
  const std::string str = "1.5 GiB";
  ASSERT_TRUE(std::regex_match(str, match, BytePattern()));
  EXPECT_EQ(match.str(1), "1.5");
  EXPECT_EQ(match.str(2), "GiB");
  EXPECT_EQ(match.str(3), "G");
  EXPECT_EQ(match.str(4), "i");
  EXPECT_EQ(match.str(5), "B");
}

TEST(GlobalBytePattern, RequiresUnit) {
  const std::string text = "copied 12 files, 3.5 MB in total";
  std::smatch match;
  ASSERT_TRUE(std::regex_search(text, match, GlobalBytePattern()));
  EXPECT_EQ(match.str(0), "3.5 MB");
  EXPECT_EQ(match.position(0), 17);
}

TEST(CustomBytePattern, AnyUnitText) {
  std::smatch match;
  const std::string str = "2.5 kilochunks";
  ASSERT_TRUE(std::regex_match(str, match, CustomBytePattern()));
  EXPECT_EQ(match.str(1), "2.5");
  EXPECT_EQ(match.str(2), "kilochunks");
}

TEST(ReplaceNoBreakSpaces, Replacement) {
  EXPECT_EQ(ReplaceNoBreakSpaces("1\xC2\xA0KiB"), "1 KiB");
  EXPECT_EQ(ReplaceNoBreakSpaces("1\xC2\xA0KiB", "  "), "1  KiB");
  EXPECT_EQ(ReplaceNoBreakSpaces("no change"), "no change");
  EXPECT_EQ(ReplaceNoBreakSpaces("\xC2"), "\xC2");
}

TEST(MatchByteString, Groups) {
  const auto match = MatchByteString("1.5 GiB");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->number, "1.5");
  EXPECT_EQ(match->unit, "GiB");
  EXPECT_EQ(match->start, 0U);
  EXPECT_EQ(match->end, 7U);

  const auto noUnit = MatchByteString("12");
  ASSERT_TRUE(noUnit);
  EXPECT_EQ(noUnit->number, "12");
  EXPECT_TRUE(noUnit->unit.empty());
}

TEST(MatchByteString, AgreesWithPattern) {
  for (const char *sample : kSamples) {
    const std::string str = sample;
    std::smatch expected;
    const bool matched = std::regex_match(str, expected, BytePattern());
    const auto match = MatchByteString(str);
    ASSERT_EQ(match.has_value(), matched) << str;
    if (matched) {
      EXPECT_EQ(match->number, expected.str(1)) << str;
      EXPECT_EQ(match->unit, expected.str(2)) << str;
    }
  }
}

TEST(MatchCustomByteString, AgreesWithPattern) {
  for (const char *sample : kSamples) {
    const std::string str = sample;
    std::smatch expected;
    const bool matched = std::regex_match(str, expected, CustomBytePattern());
    const auto match = MatchCustomByteString(str);
    ASSERT_EQ(match.has_value(), matched) << str;
    if (matched) {
      EXPECT_EQ(match->number, expected.str(1)) << str;
      EXPECT_EQ(match->unit, expected.str(2)) << str;
    }
  }
}

TEST(SearchByteString, AgreesWithPattern) {
  for (const char *sample : kTexts) {
    const std::string text = sample;
    std::size_t pos = 0;
    for (std::sregex_iterator it(text.begin(), text.end(), GlobalBytePattern()), endIt; it != endIt; ++it) {
      const auto match = SearchByteString(text, pos);
      ASSERT_TRUE(match) << text;
      EXPECT_EQ(match->start, static_cast<std::size_t>(it->position(0))) << text;
      EXPECT_EQ(match->end - match->start, static_cast<std::size_t>(it->length(0))) << text;
      EXPECT_EQ(match->number, it->str(1)) << text;
      EXPECT_EQ(match->unit, it->str(2)) << text;
      pos = match->end;
    }
    EXPECT_FALSE(SearchByteString(text, pos)) << text;
  }
}

TEST(SearchByteString, LongDigitRun) {
  const std::string digits(200000, '7');
  const std::string text = "size " + digits + " KB";
  const auto match = SearchByteString(text);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->start, 5U);
  EXPECT_EQ(match->end, text.size());
  EXPECT_EQ(match->number.size(), digits.size());
  EXPECT_EQ(match->unit, "KB");

  EXPECT_FALSE(SearchByteString(digits + " apples " + digits));
}

}  // namespace hsize
