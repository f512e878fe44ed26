#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/vector.hpp"

namespace hsize {

struct CustomUnit {
  std::string symbol;      // "ch"
  std::string name;        // "chunk"
  std::string namePlural;  // "chunks"

  bool operator==(const CustomUnit &) const noexcept = default;
};

/// User defined unit tiers replacing the built-in unit systems.
/// Tier i is worth base^i bytes, there is no extrapolation beyond the last tier.
class CustomUnitTable {
 public:
  /// Throws invalid_argument if 'units' is empty, has more than 9 tiers, if base is 0
  /// or if two tiers share a symbol or a name.
  CustomUnitTable(std::uint32_t base, vector<CustomUnit> units);

  [[nodiscard]] std::uint32_t base() const noexcept { return _base; }

  [[nodiscard]] int maxExponent() const noexcept { return static_cast<int>(_units.size()) - 1; }

  /// Tier 'exponent', clamped to [0, maxExponent()].
  [[nodiscard]] const CustomUnit &unit(int exponent) const noexcept;

  /// Exponent of the tier whose symbol, name or plural name matches 'token' case insensitively.
  [[nodiscard]] std::optional<int> findExponent(std::string_view token) const;

  [[nodiscard]] const vector<CustomUnit> &units() const noexcept { return _units; }

  bool operator==(const CustomUnitTable &) const noexcept = default;

 private:
  using Key = std::pair<std::string, int>;

  vector<CustomUnit> _units;
  vector<Key> _sortedKeys;  // lower cased symbols and names
  std::uint32_t _base;
};

}  // namespace hsize
