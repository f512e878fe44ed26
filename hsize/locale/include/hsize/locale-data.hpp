#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace hsize {

/// Number symbols and grouping rules of a locale.
struct LocaleData {
  std::string_view tag;  // BCP 47, "de-DE"
  std::string_view decimalSeparator;
  std::string_view groupSeparator;
  std::uint8_t primaryGrouping;        // size of the right most group
  std::uint8_t secondaryGrouping;      // size of the other groups (2 for en-IN: 12,34,567)
  std::uint8_t minimumGroupingDigits;  // 2: 4 digits integers are not grouped (es-ES: 1234, 12.345)
};

/// Built-in locales.
[[nodiscard]] std::span<const LocaleData> BuiltinLocales() noexcept;

/// Finds locale 'tag', case insensitively, accepting '_' as subtag separator ("de_ch").
/// Falls back to the first built-in locale of the same language ("de-AT" and "de" give de-DE).
/// Returns nullptr for unknown languages.
[[nodiscard]] const LocaleData *FindLocale(std::string_view tag) noexcept;

}  // namespace hsize
