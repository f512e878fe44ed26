#include "hsize/formatter.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/bigint.hpp"
#include "hsize/custom-unit-table.hpp"
#include "hsize/decimal.hpp"
#include "hsize/format-result.hpp"
#include "hsize/format-spec.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-number-format.hpp"
#include "hsize/log.hpp"
#include "hsize/number-format-cache.hpp"
#include "hsize/number-render.hpp"
#include "hsize/string-trim.hpp"
#include "hsize/stringconv.hpp"
#include "hsize/tolower-str.hpp"
#include "hsize/unit-resolver.hpp"
#include "hsize/unit-system.hpp"
#include "hsize/unit-table.hpp"

namespace hsize {

namespace {

struct ByteInput {
  Decimal bytes;
  double bytesNumber;
  std::string bytesText;
};

ByteInput MakeInput(double bytes) {
  if (!std::isfinite(bytes)) {
    throw invalid_argument("Expected a finite number or big integer, got {}", bytes);
  }
  if (bytes == 0) {
    bytes = 0;  // -0
  }
  return {Decimal(bytes), bytes, DoubleToString(bytes)};
}

ByteInput MakeInput(const BigInt &bytes) {
  Decimal decimalBytes(bytes);
  const double bytesNumber = decimalBytes.toDouble();
  return {std::move(decimalBytes), bytesNumber, bytes.str()};
}

// Display value before rounding, and its tier.
struct Scaled {
  Decimal value;  // signed
  int exponent;
};

Scaled Scale(const Decimal &bytes, const FormatSpec &spec) {
  const CustomUnitTable *customUnits = spec.customUnits ? &*spec.customUnits : nullptr;
  const std::uint32_t base = customUnits != nullptr ? customUnits->base() : BaseOf(spec.system);
  const int maxExponent = customUnits != nullptr ? customUnits->maxExponent() : kMaxExponent;
  const Decimal absBytes = bytes.abs();

  int exponent;
  if (spec.unit) {
    std::optional<int> customExponent;
    if (customUnits != nullptr) {
      customExponent = customUnits->findExponent(*spec.unit);
    }
    exponent = customExponent ? *customExponent : ExponentFromUnitSymbol(*spec.unit);
  } else if (spec.exponent) {
    exponent = *spec.exponent;
  } else {
    exponent = ExponentForMagnitude(absBytes, base, maxExponent);
  }
  exponent = std::clamp(exponent, 0, maxExponent);

  Decimal value = absBytes / DecimalPower(base, exponent);
  if (spec.bits && customUnits == nullptr) {
    value *= Decimal(8);
    // 128 bytes is 1 Kib rather than 1024 b
    const Decimal decimalBase(base);
    if (value >= decimalBase && exponent < maxExponent) {
      value /= decimalBase;
      ++exponent;
    }
  }
  return {bytes.isNegative() ? -value : value, exponent};
}

std::string LongUnitName(const FormatSpec &spec, int exponent, const Decimal &roundedValue) {
  const bool singular = roundedValue.abs() == Decimal(1);
  if (spec.customUnits) {
    const CustomUnit &customUnit = spec.customUnits->unit(exponent);
    if (customUnit.name.empty()) {
      return customUnit.symbol;
    }
    return singular || customUnit.namePlural.empty() ? customUnit.name : customUnit.namePlural;
  }
  std::string_view name = UnitLongName(spec.system, spec.bits, exponent);
  const auto idx = static_cast<std::size_t>(exponent);
  if (idx < spec.longForms.size() && !spec.longForms[idx].empty()) {
    name = spec.longForms[idx];
  }
  std::string ret = ToLowerStr(name);
  if (singular && ret.ends_with('s')) {
    ret.pop_back();
  }
  return ret;
}

std::string UnitName(const FormatSpec &spec, int exponent, const Decimal &roundedValue) {
  if (spec.unit) {
    return *spec.unit;
  }
  if (spec.longForm) {
    return LongUnitName(spec, exponent, roundedValue);
  }
  if (spec.customUnits) {
    return spec.customUnits->unit(exponent).symbol;
  }
  return std::string(UnitSymbol(spec.system, spec.bits, exponent));
}

int MaxFractionDigits(const FormatSpec &spec) { return spec.maximumFractionDigits.value_or(spec.decimals); }

std::string RenderValue(const Decimal &roundedValue, const FormatSpec &spec, NumberFormatCache &cache) {
  const int maxDigits = MaxFractionDigits(spec);
  if (spec.locale) {
    const int minDigits = spec.minimumFractionDigits.value_or(spec.pad ? spec.decimals : 0);
    if (minDigits > maxDigits) {
      log::debug("minimum fraction digits {} > maximum fraction digits {}, rendering with {} decimals", minDigits,
                 maxDigits, spec.decimals);
      return roundedValue.toFixed(spec.decimals);
    }
    const auto format = cache.get(*spec.locale, NumberFormatOptions{minDigits, maxDigits, true});
    if (format) {
      return format->format(roundedValue);
    }
  }
  const int minDigits = spec.minimumFractionDigits.value_or(spec.pad ? maxDigits : 0);
  return RenderPlainNumber(roundedValue, minDigits, maxDigits, spec.pad, spec.thousandsSeparator.value_or(""));
}

std::string_view Spacer(const FormatSpec &spec) {
  if (spec.spacer) {
    return *spec.spacer;
  }
  if (!spec.space) {
    return {};
  }
  return spec.nonBreakingSpace ? kNbsp : std::string_view(" ");
}

struct TemplateValues {
  std::string_view value;
  std::string_view unit;
  std::string_view longUnit;
  std::string_view bytes;
  int exponent;
};

std::string ApplyTemplate(std::string_view tmpl, const TemplateValues &values) {
  std::string ret;
  ret.reserve(tmpl.size() + values.value.size() + values.unit.size());
  while (!tmpl.empty()) {
    const auto openPos = tmpl.find('{');
    const auto closePos = openPos == std::string_view::npos ? openPos : tmpl.find('}', openPos + 1);
    if (closePos == std::string_view::npos) {
      ret.append(tmpl);
      break;
    }
    ret.append(tmpl.substr(0, openPos));
    const std::string_view token = tmpl.substr(openPos + 1, closePos - openPos - 1);
    if (token == "value") {
      ret.append(values.value);
    } else if (token == "unit") {
      ret.append(values.unit);
    } else if (token == "longUnit") {
      ret.append(values.longUnit);
    } else if (token == "bytes") {
      ret.append(values.bytes);
    } else if (token == "exponent") {
      const auto exponentStr = IntegralToCharVector(values.exponent);
      ret.append(exponentStr.data(), exponentStr.size());
    } else {
      ret.append(tmpl.substr(openPos, closePos - openPos + 1));
    }
    tmpl.remove_prefix(closePos + 1);
  }
  return ret;
}

// Number of UTF-8 code points
std::size_t CharCount(std::string_view str) {
  return static_cast<std::size_t>(
      std::ranges::count_if(str, [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U; }));
}

std::string ComposeString(const ByteInput &input, const FormatSpec &spec, NumberFormatCache &cache) {
  const Scaled scaled = Scale(input.bytes, spec);
  const Decimal roundedValue = scaled.value.round(MaxFractionDigits(spec), spec.roundingMethod);

  std::string valueStr = RenderValue(roundedValue, spec, cache);
  if (spec.showSign && !scaled.value.isNegative() && !scaled.value.isZero()) {
    valueStr.insert(valueStr.begin(), '+');
  }
  const std::string unit = UnitName(spec, scaled.exponent, roundedValue);

  std::string ret;
  if (spec.outputTemplate) {
    const std::string longUnit = LongUnitName(spec, scaled.exponent, roundedValue);
    ret = ApplyTemplate(*spec.outputTemplate, TemplateValues{valueStr, unit, longUnit, input.bytesText, scaled.exponent});
  } else {
    const std::string_view spacer = Spacer(spec);
    ret.reserve(valueStr.size() + spacer.size() + unit.size());
    ret.append(valueStr).append(spacer).append(unit);
  }

  if (spec.fixedWidth) {
    const auto width = static_cast<std::size_t>(*spec.fixedWidth);
    const auto nbChars = CharCount(ret);
    if (nbChars < width) {
      ret.insert(0, width - nbChars, ' ');
    }
  }
  return ret;
}

SizeParts ComposeParts(const ByteInput &input, const FormatSpec &spec) {
  const Scaled scaled = Scale(input.bytes, spec);
  const Decimal roundedValue = scaled.value.round(spec.decimals, spec.roundingMethod);
  return {roundedValue.isZero() ? 0.0 : roundedValue.toDouble(), UnitName(spec, scaled.exponent, roundedValue)};
}

SizeObject ComposeObject(const ByteInput &input, const FormatSpec &spec) {
  const Scaled scaled = Scale(input.bytes, spec);
  const Decimal roundedValue = scaled.value.round(spec.decimals, spec.roundingMethod);
  return {input.bytesNumber, roundedValue.isZero() ? 0.0 : roundedValue.toDouble(),
          UnitName(spec, scaled.exponent, roundedValue), scaled.exponent};
}

FormatResult Dispatch(const ByteInput &input, const FormatSpec &spec, NumberFormatCache &cache) {
  switch (spec.output) {
    case OutputKind::Array:
      return ComposeParts(input, spec);
    case OutputKind::Object:
      return ComposeObject(input, spec);
    case OutputKind::Exponent:
      return Scale(input.bytes, spec).exponent;
    default:
      return ComposeString(input, spec, cache);
  }
}

}  // namespace

Formatter::Formatter(FormatSpec spec, NumberFormatCache *cache) : _spec(std::move(spec)), _cache(cache) {
  _spec.validate();
}

FormatSpec Formatter::resolve(const FormatOptions &overrides) const {
  FormatSpec spec = _spec.merged(overrides);
  spec.validate();
  return spec;
}

NumberFormatCache &Formatter::cache() const { return _cache != nullptr ? *_cache : NumberFormatCache::Default(); }

FormatResult Formatter::format(double bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return Dispatch(MakeInput(bytes), spec, cache());
}

FormatResult Formatter::format(const BigInt &bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return Dispatch(MakeInput(bytes), spec, cache());
}

std::string Formatter::formatString(double bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return ComposeString(MakeInput(bytes), spec, cache());
}

std::string Formatter::formatString(const BigInt &bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return ComposeString(MakeInput(bytes), spec, cache());
}

SizeParts Formatter::formatParts(double bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return ComposeParts(MakeInput(bytes), spec);
}

SizeObject Formatter::formatObject(double bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return ComposeObject(MakeInput(bytes), spec);
}

int Formatter::formatExponent(double bytes, const FormatOptions &overrides) const {
  const FormatSpec spec = resolve(overrides);
  return Scale(MakeInput(bytes).bytes, spec).exponent;
}

Formatter Formatter::with(const FormatOptions &overrides) const { return Formatter(_spec.merged(overrides), _cache); }

std::string Format(double bytes, const FormatSpec &spec) { return Formatter(spec).formatString(bytes); }

std::string Format(const BigInt &bytes, const FormatSpec &spec) { return Formatter(spec).formatString(bytes); }

FormatResult FormatAs(double bytes, const FormatSpec &spec) { return Formatter(spec).format(bytes); }

FormatResult FormatAs(const BigInt &bytes, const FormatSpec &spec) { return Formatter(spec).format(bytes); }

SizeParts FormatParts(double bytes, const FormatSpec &spec) { return Formatter(spec).formatParts(bytes); }

SizeObject FormatObject(double bytes, const FormatSpec &spec) { return Formatter(spec).formatObject(bytes); }

int FormatExponent(double bytes, const FormatSpec &spec) { return Formatter(spec).formatExponent(bytes); }

}  // namespace hsize
