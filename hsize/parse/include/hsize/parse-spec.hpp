#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/custom-unit-table.hpp"

namespace hsize {

struct ParseOptions;

/// Resolved parsing configuration.
struct ParseSpec {
  /// Interpretation of ambiguous upper case units ("KB", "GB"): 1024 based when set, 1000 based otherwise.
  /// Explicit units ("KiB", "kB", "Mo") are not affected.
  bool iec{true};

  /// Values are bits: the result is divided by 8.
  bool bits{false};

  /// Throw instead of returning NaN on invalid input.
  bool strict{false};

  /// Locale of the number separators ("1,5 GB" with "de-DE"). Without locale, a comma is a decimal point.
  std::optional<std::string> locale;

  /// Custom unit tiers, replacing the unit grammar: any text after the number is looked up in this table.
  std::optional<CustomUnitTable> customUnits;

  ParseSpec &withIec(bool enable) {
    iec = enable;
    return *this;
  }

  ParseSpec &withBits(bool enable = true) {
    bits = enable;
    return *this;
  }

  ParseSpec &withStrict(bool enable = true) {
    strict = enable;
    return *this;
  }

  ParseSpec &withLocale(std::string_view tag) {
    locale = std::string(tag);
    return *this;
  }

  ParseSpec &withCustomUnits(CustomUnitTable table) {
    customUnits = std::move(table);
    return *this;
  }

  /// Copy of this spec where every engaged field of 'overrides' replaces the corresponding field.
  [[nodiscard]] ParseSpec merged(const ParseOptions &overrides) const;

  bool operator==(const ParseSpec &) const = default;
};

/// Per call overrides of a ParseSpec.
struct ParseOptions {
  std::optional<bool> iec;
  std::optional<bool> bits;
  std::optional<bool> strict;
  std::optional<std::string> locale;
  std::optional<CustomUnitTable> customUnits;
};

}  // namespace hsize
