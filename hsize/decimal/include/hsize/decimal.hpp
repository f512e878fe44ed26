#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <compare>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/bigint.hpp"
#include "hsize/rounding-method.hpp"

namespace hsize {

/// Decimal number with 80 significant digits.
/// All byte arithmetic (tier division, unit multiplication, rounding) goes through this type instead of double
/// so that chained operations do not accumulate binary floating point drift.
/// Division by zero gives NaN instead of throwing.
class Decimal {
 public:
  static constexpr unsigned kPrecision = 80;

  using Value = boost::multiprecision::number<boost::multiprecision::cpp_dec_float<kPrecision>,
                                              boost::multiprecision::et_off>;

  Decimal() noexcept = default;

  template <std::integral Int>
  explicit Decimal(Int val) : _value(val) {}

  /// Exact decimal value of the shortest representation of 'val' (0.1 gives 0.1, not 0.1000000000000000055...).
  /// NaN and infinities are kept as such.
  explicit Decimal(double val);

  explicit Decimal(const BigInt &val);

  /// Parses a plain or scientific decimal string ("-1.5", "2e10").
  /// Magnitudes above 1e100000 give a signed infinity and those below 1e-100000 a signed zero,
  /// whatever the size of the exponent. Throws invalid_argument if 'str' is not a number.
  static Decimal FromString(std::string_view str);

  static Decimal NaN();

  [[nodiscard]] bool isNaN() const;
  [[nodiscard]] bool isZero() const;
  [[nodiscard]] bool isNegative() const;
  [[nodiscard]] bool isFinite() const;

  [[nodiscard]] Decimal abs() const;

  /// Rounds to 'places' decimal places with given method.
  [[nodiscard]] Decimal round(int places, RoundingMethod method = RoundingMethod::Round) const;

  [[nodiscard]] Decimal roundInteger(RoundingMethod method = RoundingMethod::Round) const {
    return round(0, method);
  }

  /// Nearest double (correctly rounded). Overflows to +/- infinity.
  [[nodiscard]] double toDouble() const;

  /// Fixed notation with exactly 'places' fraction digits (value is expected to be already rounded).
  /// Zero is never rendered with a minus sign.
  [[nodiscard]] std::string toFixed(int places) const;

  /// Shortest plain notation without trailing zeros ("1536", "1.5", "-0.25").
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] const Value &value() const noexcept { return _value; }

  Decimal operator-() const;

  Decimal &operator+=(const Decimal &rhs);
  Decimal &operator-=(const Decimal &rhs);
  Decimal &operator*=(const Decimal &rhs);
  Decimal &operator/=(const Decimal &rhs);

  friend Decimal operator+(Decimal lhs, const Decimal &rhs) { return lhs += rhs; }
  friend Decimal operator-(Decimal lhs, const Decimal &rhs) { return lhs -= rhs; }
  friend Decimal operator*(Decimal lhs, const Decimal &rhs) { return lhs *= rhs; }
  friend Decimal operator/(Decimal lhs, const Decimal &rhs) { return lhs /= rhs; }

  std::partial_ordering operator<=>(const Decimal &rhs) const;

  bool operator==(const Decimal &rhs) const { return (*this <=> rhs) == std::partial_ordering::equivalent; }

 private:
  explicit Decimal(Value val) noexcept : _value(std::move(val)) {}

  Value _value;
};

/// Exact base^exponent.
/// Powers of 1000 and 1024 up to exponent 8 are computed once and shared, other bases are computed on demand.
/// Throws invalid_argument if base is 0 or exponent is negative.
[[nodiscard]] Decimal DecimalPower(std::uint32_t base, int exponent);

}  // namespace hsize
