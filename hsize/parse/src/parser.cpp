#include "hsize/parser.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/bigint.hpp"
#include "hsize/byte-pattern.hpp"
#include "hsize/custom-unit-table.hpp"
#include "hsize/decimal.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-number-parse.hpp"
#include "hsize/log.hpp"
#include "hsize/number-format-cache.hpp"
#include "hsize/parse-spec.hpp"
#include "hsize/range_error_exception.hpp"
#include "hsize/string-trim.hpp"
#include "hsize/unit-resolver.hpp"

namespace hsize {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

template <typename... Args>
double Invalid(bool strict, std::format_string<Args...> fmt, Args &&...args) {
  invalid_argument error(fmt, std::forward<Args>(args)...);
  if (strict) {
    throw error;
  }
  log::debug("{}", error.what());
  return kNaN;
}

std::optional<Decimal> ReadNumber(std::string_view str, const ParseSpec &spec, NumberFormatCache &cache) {
  if (spec.locale) {
    return ParseLocaleNumber(str, *spec.locale, cache);
  }
  return ParseNumberString(str);
}

double Finalize(const Decimal &bytes, std::string_view input, bool strict) {
  const double ret = bytes.toDouble();
  if (!std::isfinite(ret)) {
    return Invalid(strict, "Value out of range: {}", input);
  }
  return ret;
}

double ParseCustom(std::string_view trimmed, const ParseSpec &spec, NumberFormatCache &cache) {
  const auto match = MatchCustomByteString(trimmed);
  if (!match) {
    return Invalid(spec.strict, "Invalid byte string: {}", trimmed);
  }
  const auto value = ReadNumber(match->number, spec, cache);
  if (!value) {
    return Invalid(spec.strict, "Invalid number in: {}", trimmed);
  }

  const CustomUnitTable &customUnits = *spec.customUnits;
  const std::string_view unit = TrimSpaces(match->unit);
  int exponent = 0;
  if (!unit.empty()) {
    const auto unitExponent = customUnits.findExponent(unit);
    if (!unitExponent) {
      return Invalid(spec.strict, "Unknown unit: {}", unit);
    }
    exponent = *unitExponent;
  }
  return Finalize(*value * DecimalPower(customUnits.base(), exponent), trimmed, spec.strict);
}

}  // namespace

Parser::Parser(ParseSpec spec, NumberFormatCache *cache) : _spec(std::move(spec)), _cache(cache) {}

NumberFormatCache &Parser::cache() const { return _cache != nullptr ? *_cache : NumberFormatCache::Default(); }

double Parser::parse(std::string_view input, const ParseOptions &overrides) const {
  const ParseSpec spec = _spec.merged(overrides);
  const std::string normalized = ReplaceNoBreakSpaces(input);
  const std::string_view trimmed = TrimSpaces(normalized);
  if (trimmed.empty()) {
    return Invalid(spec.strict, "Empty string");
  }

  if (spec.customUnits) {
    return ParseCustom(trimmed, spec, cache());
  }

  const auto match = MatchByteString(trimmed);
  if (!match) {
    return Invalid(spec.strict, "Invalid byte string: {}", trimmed);
  }

  const auto value = ReadNumber(match->number, spec, cache());
  if (!value) {
    return Invalid(spec.strict, "Invalid number in: {}", trimmed);
  }

  // no unit means bytes
  const std::string_view unit = match->unit.empty() ? std::string_view("b") : match->unit;
  const auto tier = ResolveUnit(unit, spec.iec);
  if (!tier) {
    return Invalid(spec.strict, "Unknown unit: {}", unit);
  }

  Decimal bytes = *value * tier->multiplier();
  if (tier->bits || spec.bits) {
    bytes /= Decimal(8);
  }
  return Finalize(bytes, trimmed, spec.strict);
}

double Parser::parseNumber(double input, const ParseOptions &overrides) const {
  if (std::isfinite(input)) {
    return input;
  }
  return Invalid(overrides.strict.value_or(_spec.strict), "Expected a finite number, got {}", input);
}

double Parser::parseBigInt(const BigInt &input, const ParseOptions &overrides) const {
  if (!IsSafeInteger(input)) {
    if (overrides.strict.value_or(_spec.strict)) {
      throw range_error("BigInt value exceeds safe integer range, precision would be lost");
    }
    log::warn("BigInt value {} exceeds safe integer range, precision may be lost", input.str());
  }
  return Decimal(input).toDouble();
}

Parser Parser::with(const ParseOptions &overrides) const { return Parser(_spec.merged(overrides), _cache); }

double Parse(std::string_view input, const ParseSpec &spec) { return Parser(spec).parse(input); }

double ParseNumber(double input, const ParseSpec &spec) { return Parser(spec).parseNumber(input); }

double ParseBigInt(const BigInt &input, const ParseSpec &spec) { return Parser(spec).parseBigInt(input); }

}  // namespace hsize
