#include "hsize/locale-number-format.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "hsize/decimal.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-data.hpp"
#include "hsize/rounding-method.hpp"

namespace hsize {

void NumberFormatOptions::validate() const {
  if (minimumFractionDigits < 0 || maximumFractionDigits < 0) {
    throw invalid_argument("Fraction digits must be non-negative");
  }
  if (minimumFractionDigits > maximumFractionDigits) {
    throw invalid_argument("minimumFractionDigits {} is greater than maximumFractionDigits {}", minimumFractionDigits,
                           maximumFractionDigits);
  }
}

std::string NumberFormatOptions::key() const {
  return std::format("{}-{}-{}", minimumFractionDigits, maximumFractionDigits, useGrouping ? 'g' : 'n');
}

LocaleNumberFormat::LocaleNumberFormat(const LocaleData &locale, NumberFormatOptions options)
    : _locale(&locale), _options(options) {
  _options.validate();
}

std::string LocaleNumberFormat::format(const Decimal &value) const {
  if (!value.isFinite()) {
    return value.toFixed(0);
  }
  const Decimal rounded = value.abs().round(_options.maximumFractionDigits, RoundingMethod::Round);
  std::string fixed = rounded.toFixed(_options.maximumFractionDigits);

  std::string_view integerPart = fixed;
  std::string_view fractionPart;
  const auto dotPos = fixed.find('.');
  if (dotPos != std::string::npos) {
    integerPart = std::string_view(fixed).substr(0, dotPos);
    fractionPart = std::string_view(fixed).substr(dotPos + 1);
  }
  while (fractionPart.size() > static_cast<std::size_t>(_options.minimumFractionDigits) &&
         fractionPart.back() == '0') {
    fractionPart.remove_suffix(1);
  }

  std::string ret;
  ret.reserve(fixed.size() + fixed.size() / 2U + 1U);
  if (value.isNegative() && !rounded.isZero()) {
    ret.push_back('-');
  }
  appendGroupedIntegerPart(integerPart, ret);
  if (!fractionPart.empty()) {
    ret.append(_locale->decimalSeparator);
    ret.append(fractionPart);
  }
  return ret;
}

void LocaleNumberFormat::appendGroupedIntegerPart(std::string_view digits, std::string &out) const {
  const std::size_t primary = _locale->primaryGrouping;
  const std::size_t secondary = _locale->secondaryGrouping;
  if (!_options.useGrouping || primary == 0 || digits.size() < primary + _locale->minimumGroupingDigits) {
    out.append(digits);
    return;
  }

  // split from the right: one primary group, then secondary groups
  std::string_view head = digits.substr(0, digits.size() - primary);
  const std::string_view tail = digits.substr(digits.size() - primary);

  const std::size_t firstGroupSize = head.size() % secondary == 0 ? secondary : head.size() % secondary;
  out.append(head.substr(0, firstGroupSize));
  head.remove_prefix(firstGroupSize);
  while (!head.empty()) {
    out.append(_locale->groupSeparator);
    out.append(head.substr(0, secondary));
    head.remove_prefix(secondary);
  }
  out.append(_locale->groupSeparator);
  out.append(tail);
}

}  // namespace hsize
