#include "hsize/number-render.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "hsize/decimal.hpp"

namespace hsize {

std::string RenderPlainNumber(const Decimal &value, int minFractionDigits, int maxFractionDigits, bool pad,
                              std::string_view thousandsSeparator) {
  std::string ret = value.toFixed(maxFractionDigits);
  if (!pad && minFractionDigits < maxFractionDigits) {
    const auto dotPos = ret.find('.');
    if (dotPos != std::string::npos) {
      auto lastKept = ret.find_last_not_of('0');
      if (lastKept == dotPos) {
        --lastKept;
      }
      ret.resize(lastKept + 1U);
    }
    if (minFractionDigits > 0) {
      const auto newDotPos = ret.find('.');
      const std::size_t nbFractionDigits = newDotPos == std::string::npos ? 0 : ret.size() - newDotPos - 1U;
      if (nbFractionDigits < static_cast<std::size_t>(minFractionDigits)) {
        if (newDotPos == std::string::npos) {
          ret.push_back('.');
        }
        ret.append(static_cast<std::size_t>(minFractionDigits) - nbFractionDigits, '0');
      }
    }
  }
  if (thousandsSeparator.empty()) {
    return ret;
  }
  return AddThousandsSeparator(ret, thousandsSeparator);
}

std::string AddThousandsSeparator(std::string_view number, std::string_view separator) {
  std::string_view sign;
  if (number.starts_with('-') || number.starts_with('+')) {
    sign = number.substr(0, 1);
    number.remove_prefix(1);
  }
  const auto integerSize = number.find('.') == std::string_view::npos ? number.size() : number.find('.');

  std::string ret(sign);
  ret.reserve(sign.size() + number.size() + (integerSize / 3U) * separator.size());
  for (std::size_t pos = 0; pos < integerSize; ++pos) {
    if (pos != 0 && (integerSize - pos) % 3U == 0) {
      ret.append(separator);
    }
    ret.push_back(number[pos]);
  }
  ret.append(number.substr(integerSize));
  return ret;
}

}  // namespace hsize
