#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "hsize/fixedcapacityvector.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/log.hpp"

namespace hsize {

inline auto IntegralToCharVector(std::integral auto val) {
  using Int = decltype(val);

  // +1 for minus, +1 for additional partial ranges coverage
  static constexpr auto kMaxSize = std::numeric_limits<Int>::digits10 + 1 + static_cast<int>(std::is_signed_v<Int>);

  using CharVector = FixedCapacityVector<char, kMaxSize>;

  CharVector ret(static_cast<CharVector::size_type>(kMaxSize));

  // cannot fail as we sized the vector for the largest value
  const auto ptr = std::to_chars(ret.data(), ret.data() + ret.size(), val).ptr;
  ret.resize(static_cast<CharVector::size_type>(ptr - ret.data()));

  return ret;
}

template <std::integral Integral>
Integral StringToIntegral(const char *begPtr, std::size_t len) {
  // No need to value initialize ret, std::from_chars will set it in case no error is returned
  // And in case of error, exception is thrown instead
  Integral ret;

  const char *endPtr = begPtr + len;
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc()) {
    log::error("Unable to decode '{}' into integral", std::string_view(begPtr, len));
    throw invalid_argument("StringToIntegral conversion failed");
  }

  if (ptr != endPtr) {
    log::error("Only '{}' chars from '{}' decoded into integral '{}'", ptr - begPtr, std::string_view(begPtr, len),
               ret);
    throw invalid_argument("StringToIntegral conversion failed");
  }
  return ret;
}

template <std::integral Integral>
Integral StringToIntegral(std::string_view str) {
  return StringToIntegral<Integral>(str.data(), str.size());
}

// Shortest representation of a finite double that parses back to the same value.
// Magnitudes in [1e-7, 1e21) are written in positional notation, others in scientific notation
// ("1e+21", "5e-324"), which is the usual rendering of a number in text protocols.
inline std::string DoubleToString(double val) {
  if (std::isnan(val)) {
    return "NaN";
  }
  if (std::isinf(val)) {
    return val < 0 ? "-Infinity" : "Infinity";
  }
  if (val == 0) {
    return "0";
  }
  const double absVal = std::abs(val);
  const auto fmt = absVal >= 1e-7 && absVal < 1e21 ? std::chars_format::fixed : std::chars_format::scientific;

  char buf[std::numeric_limits<double>::max_exponent10 + std::numeric_limits<double>::max_digits10 + 8];
  const auto ptr = std::to_chars(buf, buf + sizeof(buf), val, fmt).ptr;
  std::string ret(buf, ptr);
  if (fmt == std::chars_format::scientific) {
    // exponent is written on at least two digits by to_chars ("1e-08"), keep the significant ones only
    const auto expPos = ret.find('e') + 2;
    while (ret.size() > expPos + 1 && ret[expPos] == '0') {
      ret.erase(expPos, 1);
    }
  }
  return ret;
}

}  // namespace hsize
