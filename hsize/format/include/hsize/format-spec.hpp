#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/custom-unit-table.hpp"
#include "hsize/rounding-method.hpp"
#include "hsize/unit-system.hpp"
#include "hsize/vector.hpp"

namespace hsize {

enum class OutputKind : std::uint8_t {
  String,    // "1.5 KiB"
  Array,     // {1.5, "KiB"}
  Object,    // {bytes, value, unit, exponent}
  Exponent,  // 1
};

[[nodiscard]] constexpr std::string_view OutputKindName(OutputKind kind) noexcept {
  switch (kind) {
    case OutputKind::String:
      return "string";
    case OutputKind::Array:
      return "array";
    case OutputKind::Object:
      return "object";
    case OutputKind::Exponent:
      return "exponent";
    default:
      return "unknown";
  }
}

struct FormatOptions;

/// Resolved formatting configuration.
/// Unit selection precedence: 'unit' (displayed verbatim), then 'exponent', then the largest tier not
/// greater than the value.
struct FormatSpec {
  /// Unit system of the displayed symbol, and its base (1000 for SI, 1024 otherwise).
  UnitSystem system{UnitSystem::IEC};

  /// Display bits instead of bytes (value multiplied by 8).
  bool bits{false};

  /// Number of fraction digits kept after rounding.
  int decimals{2};

  RoundingMethod roundingMethod{RoundingMethod::Round};

  OutputKind output{OutputKind::String};

  /// Use long names ("kibibytes", "kibibyte" when the value is 1) instead of symbols.
  bool longForm{false};

  /// Long names per exponent, replacing the built-in ones. Empty entries keep the built-in name.
  vector<std::string> longForms;

  /// Separate value and unit by a space.
  bool space{true};

  /// Use a no-break space (U+00A0) as separator.
  bool nonBreakingSpace{false};

  /// Separator between value and unit, overriding 'space' and 'nonBreakingSpace'.
  std::optional<std::string> spacer;

  /// Keep trailing zeros up to 'decimals' fraction digits.
  bool pad{false};

  /// Prefix strictly positive values with '+'.
  bool showSign{false};

  /// Forced unit, displayed as is. Its prefix letter gives the exponent.
  std::optional<std::string> unit;

  /// Forced exponent in [0, 8].
  std::optional<int> exponent;

  /// BCP 47 tag of the locale used to render the value. Unknown locales fall back to the plain renderer.
  std::optional<std::string> locale;

  /// Fraction digits overrides, taking precedence over 'decimals' and 'pad'.
  std::optional<int> minimumFractionDigits;
  std::optional<int> maximumFractionDigits;

  /// Thousands separator of the plain renderer (no grouping by default).
  std::optional<std::string> thousandsSeparator;

  /// Output template with {value}, {unit}, {longUnit}, {bytes} and {exponent} placeholders.
  /// Unknown placeholders are kept as is.
  std::optional<std::string> outputTemplate;

  /// Minimum width in characters of the string output, left padded with spaces. Never truncates.
  std::optional<int> fixedWidth;

  /// Custom unit tiers replacing the unit system. 'bits' is ignored when set.
  std::optional<CustomUnitTable> customUnits;

  FormatSpec &withSystem(UnitSystem unitSystem) {
    system = unitSystem;
    return *this;
  }

  FormatSpec &withBits(bool enable = true) {
    bits = enable;
    return *this;
  }

  FormatSpec &withDecimals(int nbDecimals) {
    decimals = nbDecimals;
    return *this;
  }

  FormatSpec &withRoundingMethod(RoundingMethod method) {
    roundingMethod = method;
    return *this;
  }

  FormatSpec &withOutput(OutputKind kind) {
    output = kind;
    return *this;
  }

  FormatSpec &withLongForm(bool enable = true) {
    longForm = enable;
    return *this;
  }

  FormatSpec &withLongForms(vector<std::string> names) {
    longForms = std::move(names);
    return *this;
  }

  FormatSpec &withSpace(bool enable) {
    space = enable;
    return *this;
  }

  FormatSpec &withNonBreakingSpace(bool enable = true) {
    nonBreakingSpace = enable;
    return *this;
  }

  FormatSpec &withSpacer(std::string_view str) {
    spacer = std::string(str);
    return *this;
  }

  FormatSpec &withPad(bool enable = true) {
    pad = enable;
    return *this;
  }

  FormatSpec &withShowSign(bool enable = true) {
    showSign = enable;
    return *this;
  }

  FormatSpec &withUnit(std::string_view forcedUnit) {
    unit = std::string(forcedUnit);
    return *this;
  }

  FormatSpec &withExponent(int forcedExponent) {
    exponent = forcedExponent;
    return *this;
  }

  FormatSpec &withLocale(std::string_view tag) {
    locale = std::string(tag);
    return *this;
  }

  FormatSpec &withMinimumFractionDigits(int nbDigits) {
    minimumFractionDigits = nbDigits;
    return *this;
  }

  FormatSpec &withMaximumFractionDigits(int nbDigits) {
    maximumFractionDigits = nbDigits;
    return *this;
  }

  FormatSpec &withThousandsSeparator(std::string_view separator) {
    thousandsSeparator = std::string(separator);
    return *this;
  }

  FormatSpec &withTemplate(std::string_view tmpl) {
    outputTemplate = std::string(tmpl);
    return *this;
  }

  FormatSpec &withFixedWidth(int width) {
    fixedWidth = width;
    return *this;
  }

  FormatSpec &withCustomUnits(CustomUnitTable table) {
    customUnits = std::move(table);
    return *this;
  }

  /// Throws invalid_argument for negative or too large decimals and fraction digits, for an exponent
  /// outside [0, 8] and for a negative fixed width.
  void validate() const;

  /// Copy of this spec where every engaged field of 'overrides' replaces the corresponding field.
  [[nodiscard]] FormatSpec merged(const FormatOptions &overrides) const;

  bool operator==(const FormatSpec &) const = default;
};

/// Per call overrides of a FormatSpec. Disengaged fields keep the value of the spec they are merged into.
struct FormatOptions {
  std::optional<UnitSystem> system;
  std::optional<bool> bits;
  std::optional<int> decimals;
  std::optional<RoundingMethod> roundingMethod;
  std::optional<OutputKind> output;
  std::optional<bool> longForm;
  std::optional<vector<std::string>> longForms;
  std::optional<bool> space;
  std::optional<bool> nonBreakingSpace;
  std::optional<std::string> spacer;
  std::optional<bool> pad;
  std::optional<bool> showSign;
  std::optional<std::string> unit;
  std::optional<int> exponent;
  std::optional<std::string> locale;
  std::optional<int> minimumFractionDigits;
  std::optional<int> maximumFractionDigits;
  std::optional<std::string> thousandsSeparator;
  std::optional<std::string> outputTemplate;
  std::optional<int> fixedWidth;
  std::optional<CustomUnitTable> customUnits;
};

}  // namespace hsize
