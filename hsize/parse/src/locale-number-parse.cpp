#include "hsize/locale-number-parse.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "hsize/decimal.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-number-format.hpp"
#include "hsize/log.hpp"
#include "hsize/number-format-cache.hpp"
#include "hsize/string-trim.hpp"

namespace hsize {

namespace {

std::optional<Decimal> ToDecimal(std::string_view str) {
  try {
    return Decimal::FromString(str);
  } catch (const invalid_argument &ex) {
    log::debug("{}", ex.what());
    return std::nullopt;
  }
}

std::string_view Between(std::string_view str, char first, char last) {
  const auto firstPos = str.find(first);
  const auto lastPos = str.find(last, firstPos == std::string_view::npos ? 0 : firstPos);
  if (firstPos == std::string_view::npos || lastPos == std::string_view::npos) {
    return {};
  }
  return str.substr(firstPos + 1U, lastPos - firstPos - 1U);
}

}  // namespace

std::optional<NumberSeparators> LocaleSeparators(std::string_view locale, NumberFormatCache &cache) {
  static constexpr NumberFormatOptions kSampleOptions{0, 3, true};

  const auto format = cache.get(locale, kSampleOptions);
  if (!format) {
    return std::nullopt;
  }
  const std::string sample = format->format(Decimal(1234.5));

  NumberSeparators ret;
  ret.group = Between(sample, '1', '2');
  const std::string_view decimal = Between(sample, '4', '5');
  if (!decimal.empty()) {
    ret.decimal = decimal;
  }
  return ret;
}

std::optional<Decimal> ParseNumberString(std::string_view str) {
  std::string number(TrimSpaces(str));
  const auto commaPos = number.find(',');
  if (commaPos != std::string::npos) {
    number[commaPos] = '.';
  }
  return ToDecimal(number);
}

std::optional<Decimal> ParseLocaleNumber(std::string_view str, std::string_view locale, NumberFormatCache &cache) {
  const auto separators = LocaleSeparators(locale, cache);
  if (!separators) {
    return ParseNumberString(str);
  }

  std::string number(TrimSpaces(str));
  if (!separators->group.empty()) {
    for (auto pos = number.find(separators->group); pos != std::string::npos;
         pos = number.find(separators->group, pos)) {
      number.erase(pos, separators->group.size());
    }
  }
  const auto decimalPos = number.find(separators->decimal);
  if (decimalPos != std::string::npos) {
    number.replace(decimalPos, separators->decimal.size(), ".");
  }
  return ToDecimal(number);
}

}  // namespace hsize
