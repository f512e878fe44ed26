#include "hsize/decimal.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <compare>
#include <cstdint>
#include <ios>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "hsize/bigint.hpp"
#include "hsize/cctype.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/rounding-method.hpp"

namespace hsize {

namespace {

constexpr int kMaxCachedExponent = 8;

using PowerTable = std::array<Decimal, kMaxCachedExponent + 1>;

PowerTable ComputePowers(std::uint32_t base) {
  PowerTable powers;
  powers[0] = Decimal(1);
  const Decimal decimalBase(base);
  for (int exponent = 1; exponent <= kMaxCachedExponent; ++exponent) {
    powers[exponent] = powers[exponent - 1] * decimalBase;
  }
  return powers;
}

const Decimal::Value &Half() {
  static const Decimal::Value kHalf("0.5");
  return kHalf;
}

// Decimal magnitudes beyond this bound are infinite, or zero, for every consumer.
// It stays far below the backend exponent limits, which reject exponents that do not fit in an int.
constexpr std::int64_t kMaxMagnitude = 100000;

constexpr std::int64_t kExponentSaturation = 1000000000000000LL;

// Digits kept from a parsed string, above the backend precision.
constexpr std::size_t kMaxSignificantDigits = 100;

// Digits with at most one '.', and at least one digit.
bool IsMantissa(std::string_view mantissa) {
  bool hasDigit = false;
  bool hasDot = false;
  for (char ch : mantissa) {
    if (isdigit(ch)) {
      hasDigit = true;
    } else if (ch == '.' && !hasDot) {
      hasDot = true;
    } else {
      return false;
    }
  }
  return hasDigit;
}

// Optional sign followed by digits. Values above kExponentSaturation are saturated.
std::optional<std::int64_t> SaturatedExponent(std::string_view str) {
  bool negative = false;
  if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
    negative = str.front() == '-';
    str.remove_prefix(1);
  }
  if (str.empty()) {
    return std::nullopt;
  }
  std::int64_t ret = 0;
  for (char ch : str) {
    if (!isdigit(ch)) {
      return std::nullopt;
    }
    ret = std::min(ret * 10 + (ch - '0'), kExponentSaturation);
  }
  return negative ? -ret : ret;
}

}  // namespace

Decimal::Decimal(double val) {
  if (std::isnan(val)) {
    _value = std::numeric_limits<Value>::quiet_NaN();
  } else if (std::isinf(val)) {
    _value = val < 0 ? -std::numeric_limits<Value>::infinity() : std::numeric_limits<Value>::infinity();
  } else {
    // shortest round trip representation is at most 24 chars ("-2.2250738585072014e-308")
    char buf[32];
    char *end = std::to_chars(buf, buf + sizeof(buf) - 1, val).ptr;
    *end = '\0';
    _value = Value(static_cast<const char *>(buf));
  }
}

Decimal::Decimal(const BigInt &val) : _value(val.str().c_str()) {}

Decimal Decimal::FromString(std::string_view str) {
  // validate ourselves: the backend is more permissive (it accepts "inf", "nan" and leading spaces)
  std::string_view rem = str;
  bool negative = false;
  if (!rem.empty() && (rem.front() == '+' || rem.front() == '-')) {
    negative = rem.front() == '-';
    rem.remove_prefix(1);
  }
  const auto exponentPos = rem.find_first_of("eE");
  const std::string_view mantissa = rem.substr(0, exponentPos);
  if (!IsMantissa(mantissa)) {
    throw invalid_argument("Invalid decimal string '{}'", str);
  }
  std::int64_t exponent = 0;
  if (exponentPos != std::string_view::npos) {
    const auto parsedExponent = SaturatedExponent(rem.substr(exponentPos + 1U));
    if (!parsedExponent) {
      throw invalid_argument("Invalid decimal string '{}'", str);
    }
    exponent = *parsedExponent;
  }

  // value is significand * 10^exponent, the significand without leading zeros
  const auto dotPos = mantissa.find('.');
  std::string significand(mantissa.substr(0, dotPos));
  if (dotPos != std::string_view::npos) {
    const std::string_view fraction = mantissa.substr(dotPos + 1U);
    significand.append(fraction);
    exponent -= static_cast<std::int64_t>(fraction.size());
  }
  significand.erase(0, std::min(significand.find_first_not_of('0'), significand.size()));
  if (significand.empty()) {
    return Decimal(Value(negative ? "-0" : "0"));
  }
  if (significand.size() > kMaxSignificantDigits) {
    exponent += static_cast<std::int64_t>(significand.size() - kMaxSignificantDigits);
    significand.resize(kMaxSignificantDigits);
  }

  const std::int64_t magnitude = static_cast<std::int64_t>(significand.size()) + exponent;
  if (magnitude > kMaxMagnitude) {
    return Decimal(negative ? -std::numeric_limits<Value>::infinity() : std::numeric_limits<Value>::infinity());
  }
  if (magnitude < -kMaxMagnitude) {
    return Decimal(Value(negative ? "-0" : "0"));
  }

  std::string normalized;
  if (negative) {
    normalized.push_back('-');
  }
  normalized.append(significand);
  normalized.push_back('e');
  normalized.append(std::to_string(exponent));
  try {
    return Decimal(Value(normalized.c_str()));
  } catch (const std::runtime_error &ex) {
    throw invalid_argument("Invalid decimal string '{}': {}", str, ex.what());
  }
}

Decimal Decimal::NaN() { return Decimal(std::numeric_limits<Value>::quiet_NaN()); }

bool Decimal::isNaN() const { return boost::multiprecision::isnan(_value); }

bool Decimal::isZero() const { return !isNaN() && _value.is_zero(); }

bool Decimal::isNegative() const { return !isNaN() && _value.sign() < 0; }

bool Decimal::isFinite() const { return boost::multiprecision::isfinite(_value); }

Decimal Decimal::abs() const { return Decimal(boost::multiprecision::abs(_value)); }

Decimal Decimal::round(int places, RoundingMethod method) const {
  if (places < 0) {
    throw invalid_argument("Invalid number of decimal places {}", places);
  }
  if (!isFinite()) {
    return *this;
  }
  const Value scale = DecimalPower(10, places)._value;
  Value shifted = _value * scale;
  switch (method) {
    case RoundingMethod::Floor:
      shifted = boost::multiprecision::floor(shifted);
      break;
    case RoundingMethod::Ceil:
      shifted = boost::multiprecision::ceil(shifted);
      break;
    case RoundingMethod::Trunc:
      shifted = boost::multiprecision::trunc(shifted);
      break;
    default:
      shifted = boost::multiprecision::floor(shifted + Half());
      break;
  }
  return Decimal(shifted / scale);
}

double Decimal::toDouble() const {
  if (isNaN()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (!isFinite()) {
    return isNegative() ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
  }
  if (isZero()) {
    return 0.0;
  }
  // from_chars is correctly rounded, which the backend conversion is not guaranteed to be
  const std::string str = _value.str(std::numeric_limits<Value>::digits10, std::ios_base::scientific);
  double ret;
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), ret);
  if (errc == std::errc::result_out_of_range) {
    if (boost::multiprecision::abs(_value) < 1) {
      return isNegative() ? -0.0 : 0.0;
    }
    return isNegative() ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
  }
  if (errc != std::errc()) {
    throw std::logic_error("Unable to convert decimal to double");
  }
  return ret;
}

std::string Decimal::toFixed(int places) const {
  if (isNaN()) {
    return "NaN";
  }
  if (!isFinite()) {
    return isNegative() ? "-Infinity" : "Infinity";
  }
  const Value scale = DecimalPower(10, places)._value;
  const Value scaled = boost::multiprecision::floor(boost::multiprecision::abs(_value) * scale + Half());
  std::string digits = scaled.convert_to<BigInt>().str();
  if (digits.size() <= static_cast<std::size_t>(places)) {
    digits.insert(0, static_cast<std::size_t>(places) + 1 - digits.size(), '0');
  }

  std::string ret;
  ret.reserve(digits.size() + 2);
  if (isNegative() && scaled != 0) {
    ret.push_back('-');
  }
  const auto nbIntegralDigits = digits.size() - static_cast<std::size_t>(places);
  ret.append(digits, 0, nbIntegralDigits);
  if (places > 0) {
    ret.push_back('.');
    ret.append(digits, nbIntegralDigits);
  }
  return ret;
}

std::string Decimal::toString() const {
  if (!isFinite()) {
    return toFixed(0);
  }
  if (isZero()) {
    return "0";
  }
  // mantissa digits and decimal exponent from "d.ddd...e+XX"
  const std::string sci =
      boost::multiprecision::abs(_value).str(static_cast<std::streamsize>(kPrecision) - 1, std::ios_base::scientific);
  const auto expPos = sci.find('e');
  std::string digits;
  digits.reserve(expPos);
  for (std::size_t pos = 0; pos < expPos; ++pos) {
    if (isdigit(sci[pos])) {
      digits.push_back(sci[pos]);
    }
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
  std::string_view expStr(sci.data() + expPos + 1, sci.size() - expPos - 1);
  if (expStr.starts_with('+')) {
    expStr.remove_prefix(1);
  }
  int exp10 = 0;
  std::from_chars(expStr.data(), expStr.data() + expStr.size(), exp10);

  std::string ret;
  if (isNegative()) {
    ret.push_back('-');
  }
  if (exp10 < 0) {
    ret.append("0.");
    ret.append(static_cast<std::size_t>(-exp10 - 1), '0');
    ret.append(digits);
  } else if (digits.size() <= static_cast<std::size_t>(exp10) + 1U) {
    ret.append(digits);
    ret.append(static_cast<std::size_t>(exp10) + 1U - digits.size(), '0');
  } else {
    ret.append(digits, 0, static_cast<std::size_t>(exp10) + 1U);
    ret.push_back('.');
    ret.append(digits, static_cast<std::size_t>(exp10) + 1U);
  }
  return ret;
}

Decimal Decimal::operator-() const { return Decimal(-_value); }

Decimal &Decimal::operator+=(const Decimal &rhs) {
  _value += rhs._value;
  return *this;
}

Decimal &Decimal::operator-=(const Decimal &rhs) {
  _value -= rhs._value;
  return *this;
}

Decimal &Decimal::operator*=(const Decimal &rhs) {
  _value *= rhs._value;
  return *this;
}

Decimal &Decimal::operator/=(const Decimal &rhs) {
  if (rhs.isZero()) {
    _value = std::numeric_limits<Value>::quiet_NaN();
  } else {
    _value /= rhs._value;
  }
  return *this;
}

std::partial_ordering Decimal::operator<=>(const Decimal &rhs) const {
  if (isNaN() || rhs.isNaN()) {
    return std::partial_ordering::unordered;
  }
  const int cmp = _value.compare(rhs._value);
  if (cmp < 0) {
    return std::partial_ordering::less;
  }
  return cmp == 0 ? std::partial_ordering::equivalent : std::partial_ordering::greater;
}

Decimal DecimalPower(std::uint32_t base, int exponent) {
  if (base == 0) {
    throw invalid_argument("Invalid base for decimal power: {}", base);
  }
  if (exponent < 0) {
    throw invalid_argument("Invalid exponent for decimal power: {}", exponent);
  }
  if (exponent <= kMaxCachedExponent) {
    if (base == 1000U) {
      static const PowerTable kPowersOf1000 = ComputePowers(1000U);
      return kPowersOf1000[exponent];
    }
    if (base == 1024U) {
      static const PowerTable kPowersOf1024 = ComputePowers(1024U);
      return kPowersOf1024[exponent];
    }
  }
  Decimal ret(1);
  const Decimal decimalBase(base);
  for (int exp = 0; exp < exponent; ++exp) {
    ret *= decimalBase;
  }
  return ret;
}

}  // namespace hsize
