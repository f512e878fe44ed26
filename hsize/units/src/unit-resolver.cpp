#include "hsize/unit-resolver.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

#include "hsize/cctype.hpp"
#include "hsize/decimal.hpp"
#include "hsize/string-equal-ignore-case.hpp"
#include "hsize/unit-system.hpp"
#include "hsize/unit-table.hpp"

namespace hsize {

namespace {

bool IsJedecStyle(std::string_view unit) {
  return unit.size() == 2U && isupper(unit[0]) && PrefixExponent(unit[0]) && unit[1] == 'B';
}

enum class Quantity : std::uint8_t { Bytes, Bits };

// Base unit part of the grammar: b, byte(s), bit(s), o, octet(s)
std::optional<Quantity> BaseUnitOf(std::string_view token) {
  for (std::string_view byteUnit : {"b", "byte", "bytes", "o", "octet", "octets"}) {
    if (CaseInsensitiveEqual(token, byteUnit)) {
      return Quantity::Bytes;
    }
  }
  if (CaseInsensitiveEqual(token, "bit") || CaseInsensitiveEqual(token, "bits")) {
    return Quantity::Bits;
  }
  return std::nullopt;
}

}  // namespace

int ExponentForMagnitude(const Decimal &absBytes, std::uint32_t base, int maxExponent) {
  int exponent = 0;
  if (absBytes.isNaN()) {
    return exponent;
  }
  while (exponent < maxExponent && DecimalPower(base, exponent + 1) <= absBytes) {
    ++exponent;
  }
  return exponent;
}

int ExponentFromUnitSymbol(std::string_view unit) noexcept {
  if (unit.empty()) {
    return 0;
  }
  return PrefixExponent(unit.front()).value_or(0);
}

std::optional<UnitTier> ResolveUnit(std::string_view unit, bool iec) {
  if (IsJedecStyle(unit)) {
    return UnitTier{iec ? 1024U : 1000U, *PrefixExponent(unit[0]), false};
  }

  const auto unitInfo = LookupUnit(unit);
  if (unitInfo) {
    return UnitTier{unitInfo->base, unitInfo->exponent, unitInfo->bits};
  }

  if (unit.empty()) {
    return std::nullopt;
  }
  const auto exponent = PrefixExponent(unit.front());
  if (!exponent) {
    return std::nullopt;
  }
  std::string_view rest = unit.substr(1);
  const bool hasIMarker = !rest.empty() && (rest.front() == 'i' || rest.front() == 'I');
  if (hasIMarker) {
    rest.remove_prefix(1);
  }
  const auto quantity = BaseUnitOf(rest);
  if (!quantity) {
    return std::nullopt;
  }
  const bool binary = hasIMarker || (iec && isupper(unit.front()));
  return UnitTier{binary ? 1024U : 1000U, *exponent, *quantity == Quantity::Bits};
}

}  // namespace hsize
