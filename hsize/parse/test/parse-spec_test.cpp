#include "hsize/parse-spec.hpp"

#include <gtest/gtest.h>

#include "hsize/custom-unit-table.hpp"

namespace hsize {

TEST(ParseSpec, Defaults) {
  const ParseSpec spec;
  EXPECT_TRUE(spec.iec);
  EXPECT_FALSE(spec.bits);
  EXPECT_FALSE(spec.strict);
  EXPECT_FALSE(spec.locale);
  EXPECT_FALSE(spec.customUnits);
}

TEST(ParseSpec, Merged) {
  const ParseSpec base = ParseSpec{}.withIec(false).withLocale("fr-FR");

  ParseOptions overrides;
  overrides.strict = true;
  overrides.customUnits = CustomUnitTable(10, {{"x", "", ""}});

  const ParseSpec merged = base.merged(overrides);
  EXPECT_FALSE(merged.iec);
  EXPECT_TRUE(merged.strict);
  EXPECT_EQ(merged.locale, "fr-FR");
  ASSERT_TRUE(merged.customUnits);
  EXPECT_EQ(merged.customUnits->base(), 10U);

  EXPECT_EQ(base.merged(ParseOptions{}), base);
}

}  // namespace hsize
