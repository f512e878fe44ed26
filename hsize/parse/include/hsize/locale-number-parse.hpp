#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "hsize/decimal.hpp"
#include "hsize/number-format-cache.hpp"

namespace hsize {

struct NumberSeparators {
  std::string group;  // empty when the locale does not group four digits integers
  std::string decimal{"."};

  bool operator==(const NumberSeparators &) const = default;
};

/// Separators used by 'locale', read from its rendering of 1234.5. std::nullopt for unknown locales.
[[nodiscard]] std::optional<NumberSeparators> LocaleSeparators(std::string_view locale, NumberFormatCache &cache);

/// Parses a plain number where the first ',' is a decimal point ("1,5" -> 1.5).
/// Returns std::nullopt if 'str' is not a number.
[[nodiscard]] std::optional<Decimal> ParseNumberString(std::string_view str);

/// Parses a number written with the separators of 'locale': group separators are removed and the decimal
/// separator is read as '.'. Unknown locales are parsed as ParseNumberString does.
[[nodiscard]] std::optional<Decimal> ParseLocaleNumber(std::string_view str, std::string_view locale,
                                                       NumberFormatCache &cache);

}  // namespace hsize
