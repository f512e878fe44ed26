#pragma once

#include <compare>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "hsize/bigint.hpp"
#include "hsize/format-result.hpp"
#include "hsize/format-spec.hpp"

namespace hsize {

class ByteSize;

/// Any byte count accepted by ByteSize arithmetic: a number, a big integer, a size string ("1.5 GB") or a ByteSize.
/// String literals convert to both BigInt and std::string: pass size strings as std::string.
using ByteValue = std::variant<double, BigInt, std::string, ByteSize>;

/// Immutable byte count with chainable arithmetic and formatting.
/// Arithmetic is computed by the decimal engine, only the result is narrowed to a double.
/// Every operation producing a non finite byte count throws hsize::invalid_argument.
class ByteSize {
 public:
  ByteSize() noexcept = default;

  explicit ByteSize(double bytes);

  explicit ByteSize(const BigInt &bytes);

  /// Parses 'size' with the default ParseSpec.
  explicit ByteSize(std::string_view size);

  explicit ByteSize(const char *size) : ByteSize(std::string_view(size)) {}

  explicit ByteSize(const std::string &size) : ByteSize(std::string_view(size)) {}

  [[nodiscard]] double bytes() const noexcept { return _bytes; }

  [[nodiscard]] ByteSize add(const ByteValue &value) const;
  [[nodiscard]] ByteSize add(std::span<const ByteValue> values) const;

  [[nodiscard]] ByteSize subtract(const ByteValue &value) const;
  [[nodiscard]] ByteSize subtract(std::span<const ByteValue> values) const;

  [[nodiscard]] ByteSize multiply(double factor) const;
  [[nodiscard]] ByteSize multiply(std::span<const double> factors) const;

  /// Throws invalid_argument if the product of 'factors' is zero.
  [[nodiscard]] ByteSize divide(double factor) const;
  [[nodiscard]] ByteSize divide(std::span<const double> factors) const;

  /// Formats in 'unit' ("MiB", "kB"), the prefix letter of 'unit' giving the tier.
  [[nodiscard]] std::string to(std::string_view unit, const FormatOptions &options = {}) const;

  [[nodiscard]] std::string toSI(const FormatOptions &options = {}) const;
  [[nodiscard]] std::string toIEC(const FormatOptions &options = {}) const;
  [[nodiscard]] std::string toJEDEC(const FormatOptions &options = {}) const;
  [[nodiscard]] std::string toBits(const FormatOptions &options = {}) const;

  [[nodiscard]] std::string toString(const FormatOptions &options = {}) const;

  [[nodiscard]] SizeObject toObject() const;

  std::partial_ordering operator<=>(const ByteSize &) const noexcept = default;

  bool operator==(const ByteSize &) const noexcept = default;

 private:
  double _bytes{};
};

}  // namespace hsize
