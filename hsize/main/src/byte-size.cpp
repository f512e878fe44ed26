#include "hsize/byte-size.hpp"

#include <cmath>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "hsize/bigint.hpp"
#include "hsize/decimal.hpp"
#include "hsize/format-result.hpp"
#include "hsize/format-spec.hpp"
#include "hsize/formatter.hpp"
#include "hsize/invalid_argument_exception.hpp"
#include "hsize/parser.hpp"
#include "hsize/unit-system.hpp"

namespace hsize {

namespace {

double CheckedBytes(double bytes) {
  if (!std::isfinite(bytes)) {
    throw invalid_argument("Invalid byte value: {}", bytes);
  }
  return bytes;
}

Decimal ToDecimal(const ByteValue &value) {
  struct Visitor {
    Decimal operator()(double bytes) const { return Decimal(CheckedBytes(bytes)); }
    Decimal operator()(const BigInt &bytes) const { return Decimal(bytes); }
    Decimal operator()(const std::string &size) const {
      const double bytes = Parse(size);
      if (std::isnan(bytes)) {
        throw invalid_argument("Invalid byte value: {}", size);
      }
      return Decimal(bytes);
    }
    Decimal operator()(const ByteSize &size) const { return Decimal(size.bytes()); }
  };
  return std::visit(Visitor{}, value);
}

Decimal Sum(std::span<const ByteValue> values) {
  Decimal sum(0);
  for (const auto &value : values) {
    sum += ToDecimal(value);
  }
  return sum;
}

Decimal Product(std::span<const double> factors) {
  Decimal product(1);
  for (const double factor : factors) {
    if (!std::isfinite(factor)) {
      throw invalid_argument("Expected a finite number, got {}", factor);
    }
    product *= Decimal(factor);
  }
  return product;
}

std::string FormatWith(double bytes, FormatOptions options) { return Formatter().formatString(bytes, options); }

}  // namespace

ByteSize::ByteSize(double bytes) : _bytes(CheckedBytes(bytes)) {}

ByteSize::ByteSize(const BigInt &bytes) : _bytes(CheckedBytes(ParseBigInt(bytes))) {}

ByteSize::ByteSize(std::string_view size) : _bytes(Parse(size)) {
  if (!std::isfinite(_bytes)) {
    throw invalid_argument("Invalid byte value: {}", size);
  }
}

ByteSize ByteSize::add(const ByteValue &value) const { return add(std::span<const ByteValue>(&value, 1)); }

ByteSize ByteSize::add(std::span<const ByteValue> values) const {
  return ByteSize((Decimal(_bytes) + Sum(values)).toDouble());
}

ByteSize ByteSize::subtract(const ByteValue &value) const { return subtract(std::span<const ByteValue>(&value, 1)); }

ByteSize ByteSize::subtract(std::span<const ByteValue> values) const {
  return ByteSize((Decimal(_bytes) - Sum(values)).toDouble());
}

ByteSize ByteSize::multiply(double factor) const { return multiply(std::span<const double>(&factor, 1)); }

ByteSize ByteSize::multiply(std::span<const double> factors) const {
  return ByteSize((Decimal(_bytes) * Product(factors)).toDouble());
}

ByteSize ByteSize::divide(double factor) const { return divide(std::span<const double>(&factor, 1)); }

ByteSize ByteSize::divide(std::span<const double> factors) const {
  const Decimal product = Product(factors);
  if (product.isZero()) {
    throw invalid_argument("Division by zero");
  }
  return ByteSize((Decimal(_bytes) / product).toDouble());
}

std::string ByteSize::to(std::string_view unit, const FormatOptions &options) const {
  FormatOptions merged = options;
  merged.unit = std::string(unit);
  return FormatWith(_bytes, std::move(merged));
}

std::string ByteSize::toSI(const FormatOptions &options) const {
  FormatOptions merged = options;
  merged.system = UnitSystem::SI;
  return FormatWith(_bytes, std::move(merged));
}

std::string ByteSize::toIEC(const FormatOptions &options) const {
  FormatOptions merged = options;
  merged.system = UnitSystem::IEC;
  return FormatWith(_bytes, std::move(merged));
}

std::string ByteSize::toJEDEC(const FormatOptions &options) const {
  FormatOptions merged = options;
  merged.system = UnitSystem::JEDEC;
  return FormatWith(_bytes, std::move(merged));
}

std::string ByteSize::toBits(const FormatOptions &options) const {
  FormatOptions merged = options;
  merged.bits = true;
  return FormatWith(_bytes, std::move(merged));
}

std::string ByteSize::toString(const FormatOptions &options) const { return FormatWith(_bytes, options); }

SizeObject ByteSize::toObject() const { return FormatObject(_bytes); }

}  // namespace hsize
