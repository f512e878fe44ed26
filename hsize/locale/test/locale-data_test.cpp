#include "hsize/locale-data.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace hsize {

TEST(LocaleData, ExactTag) {
  const LocaleData *locale = FindLocale("de-DE");
  ASSERT_NE(locale, nullptr);
  EXPECT_EQ(locale->tag, "de-DE");
  EXPECT_EQ(locale->decimalSeparator, ",");
  EXPECT_EQ(locale->groupSeparator, ".");
}

TEST(LocaleData, CaseInsensitiveAndUnderscore) {
  ASSERT_NE(FindLocale("EN-in"), nullptr);
  EXPECT_EQ(FindLocale("EN-in")->tag, "en-IN");
  ASSERT_NE(FindLocale("de_CH"), nullptr);
  EXPECT_EQ(FindLocale("de_CH")->tag, "de-CH");
}

TEST(LocaleData, LanguageFallback) {
  ASSERT_NE(FindLocale("de"), nullptr);
  EXPECT_EQ(FindLocale("de")->tag, "de-DE");
  EXPECT_EQ(FindLocale("de-AT")->tag, "de-DE");
  EXPECT_EQ(FindLocale("fr_CA")->tag, "fr-FR");
  EXPECT_EQ(FindLocale("en")->tag, "en-US");
}

TEST(LocaleData, Unknown) {
  EXPECT_EQ(FindLocale(""), nullptr);
  EXPECT_EQ(FindLocale("xx-YY"), nullptr);
  EXPECT_EQ(FindLocale("-DE"), nullptr);
  EXPECT_EQ(FindLocale("klingon"), nullptr);
}

TEST(LocaleData, BuiltinLocalesHaveValidGrouping) {
  EXPECT_GE(BuiltinLocales().size(), 15U);
  for (const LocaleData &locale : BuiltinLocales()) {
    EXPECT_GT(locale.primaryGrouping, 0) << locale.tag;
    EXPECT_GT(locale.secondaryGrouping, 0) << locale.tag;
    EXPECT_FALSE(locale.decimalSeparator.empty()) << locale.tag;
    EXPECT_NE(locale.decimalSeparator, locale.groupSeparator) << locale.tag;
    EXPECT_EQ(FindLocale(locale.tag), &locale);
  }
}

}  // namespace hsize
