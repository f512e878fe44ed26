#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "hsize/string-equal-ignore-case.hpp"

namespace hsize {

enum class UnitSystem : std::uint8_t {
  SI,      // kB, MB, ... (1000 based)
  IEC,     // KiB, MiB, ... (1024 based)
  JEDEC,   // KB, MB, ... (1024 based, SI names)
  French,  // ko, Mo, ... (octets)
};

inline constexpr int kMaxExponent = 8;

/// Multiplier between two consecutive tiers of 'system'.
[[nodiscard]] constexpr std::uint32_t BaseOf(UnitSystem system) noexcept {
  return system == UnitSystem::SI ? 1000U : 1024U;
}

[[nodiscard]] constexpr std::string_view UnitSystemName(UnitSystem system) noexcept {
  switch (system) {
    case UnitSystem::SI:
      return "si";
    case UnitSystem::IEC:
      return "iec";
    case UnitSystem::JEDEC:
      return "jedec";
    case UnitSystem::French:
      return "french";
    default:
      return "unknown";
  }
}

/// Case insensitive.
[[nodiscard]] constexpr std::optional<UnitSystem> UnitSystemFromName(std::string_view name) noexcept {
  for (auto system : {UnitSystem::SI, UnitSystem::IEC, UnitSystem::JEDEC, UnitSystem::French}) {
    if (CaseInsensitiveEqual(UnitSystemName(system), name)) {
      return system;
    }
  }
  return std::nullopt;
}

}  // namespace hsize
