#pragma once

#include <string>
#include <string_view>

#include "hsize/decimal.hpp"
#include "hsize/locale-data.hpp"

namespace hsize {

struct NumberFormatOptions {
  int minimumFractionDigits{0};
  int maximumFractionDigits{3};
  bool useGrouping{true};

  /// Throws invalid_argument if fraction digits are negative or if minimum > maximum.
  void validate() const;

  /// Stable textual form, used as cache key.
  [[nodiscard]] std::string key() const;

  bool operator==(const NumberFormatOptions &) const noexcept = default;
};

/// Renders decimals with the symbols and grouping rules of a locale.
/// Values are rounded half away from zero to maximumFractionDigits, trailing zeros are removed down to
/// minimumFractionDigits. Immutable once constructed.
class LocaleNumberFormat {
 public:
  LocaleNumberFormat(const LocaleData &locale, NumberFormatOptions options);

  [[nodiscard]] std::string format(const Decimal &value) const;

  [[nodiscard]] std::string format(double value) const { return format(Decimal(value)); }

  [[nodiscard]] const LocaleData &locale() const noexcept { return *_locale; }

  [[nodiscard]] const NumberFormatOptions &options() const noexcept { return _options; }

 private:
  void appendGroupedIntegerPart(std::string_view digits, std::string &out) const;

  const LocaleData *_locale;
  NumberFormatOptions _options;
};

}  // namespace hsize
