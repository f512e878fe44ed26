#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <string>

#include "hsize/hsize.hpp"

namespace hsize {

namespace {

constexpr UnitSystem kRoundTripSystems[] = {UnitSystem::SI, UnitSystem::IEC, UnitSystem::JEDEC};

}  // namespace

TEST(Properties, RoundTripOnTierBoundaries) {
  for (const UnitSystem system : kRoundTripSystems) {
    const auto base = BaseOf(system);
    // "1 GB" in SI is only read as 1000 based with iec disabled
    const auto parseSpec = ParseSpec{}.withIec(system != UnitSystem::SI);
    double bytes = 1;
    for (int exponent = 0; exponent <= kMaxExponent; ++exponent) {
      for (const double multiple : {1.0, 2.0, 512.0}) {
        const double value = bytes * multiple;
        const std::string str = Format(value, FormatSpec{}.withSystem(system));
        EXPECT_EQ(Parse(str, parseSpec), value) << str << " in " << UnitSystemName(system);
      }
      bytes *= base;
    }
  }
}

TEST(Properties, RoundTripCommonSizes) {
  for (const double bytes : {1024.0, 1048576.0, 1073741824.0}) {
    EXPECT_EQ(Parse(Format(bytes)), bytes);
    EXPECT_EQ(Parse(Format(bytes, FormatSpec{}.withSystem(UnitSystem::JEDEC))), bytes);
  }
}

TEST(Properties, IdempotentFormatting) {
  const auto spec = FormatSpec{}.withLocale("fr-FR").withLongForm().withDecimals(3);
  for (const double bytes : {0.0, 1.0, 1536.0, 123456789.0, -987654321.0}) {
    EXPECT_EQ(Format(bytes, spec), Format(bytes, spec));
  }
}

TEST(Properties, MonotonicTiering) {
  for (const UnitSystem system : {UnitSystem::SI, UnitSystem::IEC, UnitSystem::JEDEC, UnitSystem::French}) {
    const auto spec = FormatSpec{}.withSystem(system);
    int previous = 0;
    for (double bytes = 1; bytes < 1e27; bytes = std::floor(bytes * 1.7) + 1) {
      const int exponent = FormatExponent(bytes, spec);
      EXPECT_GE(exponent, previous) << bytes;
      EXPECT_EQ(FormatExponent(-bytes, spec), exponent);
      previous = exponent;
    }
    EXPECT_EQ(previous, kMaxExponent);
  }
}

TEST(Properties, BitConversion) {
  EXPECT_EQ(Format(128, FormatSpec{}.withBits()), "1 Kib");
  EXPECT_EQ(Parse("8 b"), 8);
}

TEST(Properties, NegativeZeroCollapses) {
  EXPECT_EQ(Format(-0.0), "0 B");
  EXPECT_EQ(Format(0), "0 B");
}

TEST(Properties, SignSuppressedAtZero) { EXPECT_EQ(Format(0, FormatSpec{}.withShowSign()), "0 B"); }

TEST(Properties, BigIntBoundary) {
  const BigInt maxSafe = (BigInt(1) << 53) - 1;
  EXPECT_NO_THROW((void)ParseBigInt(maxSafe, ParseSpec{}.withStrict()));
  EXPECT_THROW((void)ParseBigInt(BigInt(maxSafe + 2), ParseSpec{}.withStrict()), range_error);
}

TEST(Properties, ExtractionSpans) {
  const auto matches = Extract("Size: 1 KiB");
  ASSERT_EQ(matches.size(), 1U);
  EXPECT_EQ(matches[0].start, 6U);
  EXPECT_EQ(matches[0].end, 11U);
  EXPECT_EQ(matches[0].input, "1 KiB");
  EXPECT_EQ(matches[0].bytes, 1024);
}

TEST(Properties, ExponentValidation) {
  EXPECT_THROW((void)Format(1024, FormatSpec{}.withExponent(9)), invalid_argument);
  EXPECT_NO_THROW((void)Format(1024, FormatSpec{}.withExponent(0)));
  EXPECT_NO_THROW((void)Format(1024, FormatSpec{}.withExponent(8)));
}

TEST(Properties, SystemScenarios) {
  EXPECT_EQ(Format(1000000000, FormatSpec{}.withSystem(UnitSystem::SI)), "1 GB");
  EXPECT_EQ(Format(1073741824, FormatSpec{}.withSystem(UnitSystem::IEC)), "1 GiB");
  EXPECT_EQ(Format(1073741824, FormatSpec{}.withSystem(UnitSystem::JEDEC)), "1 GB");
}

TEST(Properties, AmbiguityHeuristic) {
  EXPECT_EQ(Parse("1 GB"), 1073741824);
  EXPECT_EQ(Parse("1 GB", ParseSpec{}.withIec(false)), 1000000000);
  EXPECT_EQ(Parse("1 GiB"), 1073741824);
  EXPECT_EQ(Parse("1 GiB", ParseSpec{}.withIec(false)), 1073741824);
}

TEST(Properties, ExtractedBytesMatchParse) {
  const std::string text = "disk 931.5 GiB, swap 8GB, cache 512 kB, link 100 mbits";
  const auto matches = Extract(text);
  ASSERT_EQ(matches.size(), 4U);
  for (const auto &match : matches) {
    EXPECT_EQ(text.substr(match.start, match.end - match.start), match.input);
    EXPECT_EQ(match.bytes, Parse(match.input));
  }
  EXPECT_EQ(matches[3].bytes, 100.0 * 1000 * 1000 / 8);
}

}  // namespace hsize
