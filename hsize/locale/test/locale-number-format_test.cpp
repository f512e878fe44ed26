#include "hsize/locale-number-format.hpp"

#include <gtest/gtest.h>

#include "hsize/decimal.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-data.hpp"

namespace hsize {

namespace {

LocaleNumberFormat Make(std::string_view tag, int minDigits = 0, int maxDigits = 2) {
  return {*FindLocale(tag), NumberFormatOptions{minDigits, maxDigits, true}};
}

}  // namespace

TEST(LocaleNumberFormat, DecimalSeparator) {
  EXPECT_EQ(Make("en-US").format(1.5), "1.5");
  EXPECT_EQ(Make("de-DE").format(1.5), "1,5");
  EXPECT_EQ(Make("fr-FR").format(0.25), "0,25");
}

TEST(LocaleNumberFormat, Grouping) {
  EXPECT_EQ(Make("en-US").format(1234567.891), "1,234,567.89");
  EXPECT_EQ(Make("de-DE").format(1234.5), "1.234,5");
  EXPECT_EQ(Make("fr-FR").format(1234.5), "1\xE2\x80\xAF" "234,5");
  EXPECT_EQ(Make("de-CH").format(1234.5), "1\xE2\x80\x99" "234.5");
  EXPECT_EQ(Make("ru-RU").format(12345), "12\xC2\xA0" "345");
  EXPECT_EQ(Make("en-US").format(999), "999");
}

TEST(LocaleNumberFormat, IndianGrouping) {
  EXPECT_EQ(Make("en-IN").format(1234567), "12,34,567");
  EXPECT_EQ(Make("en-IN").format(123456789), "12,34,56,789");
  EXPECT_EQ(Make("en-IN").format(1234), "1,234");
}

TEST(LocaleNumberFormat, MinimumGroupingDigits) {
  EXPECT_EQ(Make("es-ES").format(1234.5), "1234,5");
  EXPECT_EQ(Make("es-ES").format(12345.5), "12.345,5");
  EXPECT_EQ(Make("pl-PL").format(1234), "1234");
}

TEST(LocaleNumberFormat, FractionDigits) {
  EXPECT_EQ(Make("en-US", 2, 2).format(1.5), "1.50");
  EXPECT_EQ(Make("en-US", 0, 0).format(1.5), "2");
  EXPECT_EQ(Make("en-US", 0, 0).format(-1.5), "-2");
  EXPECT_EQ(Make("en-US", 1, 3).format(2), "2.0");
  EXPECT_EQ(Make("en-US", 0, 3).format(1.23456), "1.235");
}

TEST(LocaleNumberFormat, NoNegativeZero) {
  EXPECT_EQ(Make("en-US").format(-0.001), "0");
  EXPECT_EQ(Make("en-US").format(-0.0), "0");
  EXPECT_EQ(Make("de-DE").format(-1234.5), "-1.234,5");
}

TEST(LocaleNumberFormat, WithoutGrouping) {
  const LocaleNumberFormat format(*FindLocale("en-US"), NumberFormatOptions{0, 2, false});
  EXPECT_EQ(format.format(1234567.5), "1234567.5");
}

TEST(NumberFormatOptions, Validate) {
  EXPECT_NO_THROW((NumberFormatOptions{0, 2, true}.validate()));
  EXPECT_THROW((NumberFormatOptions{3, 2, true}.validate()), invalid_argument);
  EXPECT_THROW((NumberFormatOptions{-1, 2, true}.validate()), invalid_argument);
  EXPECT_NE((NumberFormatOptions{0, 2, true}.key()), (NumberFormatOptions{0, 2, false}.key()));
}

}  // namespace hsize
