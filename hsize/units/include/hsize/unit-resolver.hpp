#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "hsize/decimal.hpp"
#include "hsize/unit-system.hpp"

namespace hsize {

/// One unit tier: 'base'^'exponent' bytes, or bits when 'bits' is set.
struct UnitTier {
  std::uint32_t base;
  int exponent;
  bool bits;

  /// Number of bytes (or bits) of one unit of this tier.
  [[nodiscard]] Decimal multiplier() const { return DecimalPower(base, exponent); }

  bool operator==(const UnitTier &) const noexcept = default;
};

/// Largest exponent e in [0, maxExponent] such that base^e <= absBytes, 0 for values below one unit.
[[nodiscard]] int ExponentForMagnitude(const Decimal &absBytes, std::uint32_t base, int maxExponent = kMaxExponent);

/// Exponent given by the prefix letter of a display unit ("MiB" -> 2, "kilobytes" -> 1, "B" -> 0).
[[nodiscard]] int ExponentFromUnitSymbol(std::string_view unit) noexcept;

/// Resolves a unit token read from text, in this order:
///  1. upper case prefix, no "i", upper case "B" ("KB", "GB"): ambiguous, 1024 based if 'iec' else 1000 based.
///  2. known token, case insensitively ("KiB", "kB", "Mo", "gibibits", ...). The table is lower case only, so
///     "Kib" is the kibibyte and "Kb" the SI kilobyte.
///  3. other spellings of the unit grammar ("kbyte", "Kio", "mibit"): an "i" marker after the prefix means 1024 based,
///     otherwise an upper case prefix follows 'iec' and a lower case prefix is 1000 based.
/// Returns std::nullopt for tokens outside of the unit grammar.
[[nodiscard]] std::optional<UnitTier> ResolveUnit(std::string_view unit, bool iec);

}  // namespace hsize
