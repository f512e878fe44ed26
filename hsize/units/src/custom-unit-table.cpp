#include "hsize/custom-unit-table.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/invalid_argument_exception.hpp"
#include "hsize/tolower-str.hpp"
#include "hsize/unit-system.hpp"
#include "hsize/vector.hpp"

namespace hsize {

CustomUnitTable::CustomUnitTable(std::uint32_t base, vector<CustomUnit> units) : _units(std::move(units)), _base(base) {
  if (_base == 0) {
    throw invalid_argument("Custom unit base must be positive");
  }
  if (_units.empty()) {
    throw invalid_argument("Custom unit table needs at least one unit");
  }
  if (_units.size() > static_cast<std::size_t>(kMaxExponent) + 1U) {
    throw invalid_argument("Custom unit table supports at most {} units, got {}", kMaxExponent + 1, _units.size());
  }

  _sortedKeys.reserve(_units.size() * 3U);
  for (int exponent = 0; exponent <= maxExponent(); ++exponent) {
    const CustomUnit &customUnit = _units[static_cast<std::size_t>(exponent)];
    if (customUnit.symbol.empty()) {
      throw invalid_argument("Custom unit at position {} has an empty symbol", exponent);
    }
    for (std::string_view token : {std::string_view(customUnit.symbol), std::string_view(customUnit.name),
                                    std::string_view(customUnit.namePlural)}) {
      if (!token.empty()) {
        _sortedKeys.emplace_back(ToLowerStr(token), exponent);
      }
    }
  }

  std::ranges::sort(_sortedKeys);
  // the same token may be used twice for a given tier (name == plural name), not across tiers
  const auto [first, last] = std::ranges::unique(_sortedKeys);
  _sortedKeys.erase(first, last);
  const auto dupIt = std::ranges::adjacent_find(_sortedKeys, {}, &Key::first);
  if (dupIt != _sortedKeys.end()) {
    throw invalid_argument("Custom unit '{}' is ambiguous", dupIt->first);
  }
}

const CustomUnit &CustomUnitTable::unit(int exponent) const noexcept {
  return _units[static_cast<std::size_t>(std::clamp(exponent, 0, maxExponent()))];
}

std::optional<int> CustomUnitTable::findExponent(std::string_view token) const {
  const std::string lowerToken = ToLowerStr(token);
  const auto it = std::ranges::lower_bound(_sortedKeys, std::string_view(lowerToken), {},
                                           [](const Key &key) { return std::string_view(key.first); });
  if (it == _sortedKeys.end() || it->first != lowerToken) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace hsize
