#include "hsize/unit-table.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

#include "hsize/toupperlower.hpp"
#include "hsize/unit-system.hpp"

namespace hsize {

static_assert(std::ranges::is_sorted(kUnitMappings, {}, &UnitMapping::unit), "kUnitMappings must be sorted by unit");

namespace {

using UnitNames = std::array<std::string_view, kMaxExponent + 1>;

constexpr UnitNames kSIBytes = {"B", "kB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};
constexpr UnitNames kSIBits = {"b", "kb", "Mb", "Gb", "Tb", "Pb", "Eb", "Zb", "Yb"};
constexpr UnitNames kIECBytes = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB"};
constexpr UnitNames kIECBits = {"b", "Kib", "Mib", "Gib", "Tib", "Pib", "Eib", "Zib", "Yib"};
constexpr UnitNames kJEDECBytes = {"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};
constexpr UnitNames kJEDECBits = {"b", "Kb", "Mb", "Gb", "Tb", "Pb", "Eb", "Zb", "Yb"};
constexpr UnitNames kFrenchBytes = {"o", "ko", "Mo", "Go", "To", "Po", "Eo", "Zo", "Yo"};

constexpr UnitNames kDecimalLongBytes = {"Bytes",     "Kilobytes", "Megabytes",  "Gigabytes", "Terabytes",
                                         "Petabytes", "Exabytes",  "Zettabytes", "Yottabytes"};
constexpr UnitNames kDecimalLongBits = {"Bits",     "Kilobits", "Megabits",  "Gigabits", "Terabits",
                                        "Petabits", "Exabits",  "Zettabits", "Yottabits"};
constexpr UnitNames kBinaryLongBytes = {"Bytes",     "Kibibytes", "Mebibytes", "Gibibytes", "Tebibytes",
                                        "Pebibytes", "Exbibytes", "Zebibytes", "Yobibytes"};
constexpr UnitNames kBinaryLongBits = {"Bits",     "Kibibits", "Mebibits", "Gibibits", "Tebibits",
                                       "Pebibits", "Exbibits", "Zebibits", "Yobibits"};
constexpr UnitNames kFrenchLongBytes = {"Octets",     "Kilooctets", "Megaoctets",  "Gigaoctets", "Teraoctets",
                                        "Petaoctets", "Exaoctets",  "Zettaoctets", "Yottaoctets"};

constexpr std::size_t ClampedIdx(int exponent) noexcept {
  return static_cast<std::size_t>(std::clamp(exponent, 0, kMaxExponent));
}

constexpr const UnitNames &SymbolsOf(UnitSystem system, bool bits) noexcept {
  switch (system) {
    case UnitSystem::SI:
      return bits ? kSIBits : kSIBytes;
    case UnitSystem::JEDEC:
      return bits ? kJEDECBits : kJEDECBytes;
    case UnitSystem::French:
      return bits ? kJEDECBits : kFrenchBytes;
    default:
      return bits ? kIECBits : kIECBytes;
  }
}

constexpr const UnitNames &LongNamesOf(UnitSystem system, bool bits) noexcept {
  switch (system) {
    case UnitSystem::SI:
      [[fallthrough]];
    case UnitSystem::JEDEC:
      return bits ? kDecimalLongBits : kDecimalLongBytes;
    case UnitSystem::French:
      return bits ? kDecimalLongBits : kFrenchLongBytes;
    default:
      return bits ? kBinaryLongBits : kBinaryLongBytes;
  }
}

}  // namespace

std::optional<UnitInfo> LookupUnit(std::string_view unit) {
  static constexpr std::size_t kMaximumKnownUnitSize =
      std::ranges::max_element(kUnitMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.unit.size() < rhs.unit.size();
      })->unit.size();

  if (unit.empty() || unit.size() > kMaximumKnownUnitSize) {
    return std::nullopt;
  }

  char unitBuf[kMaximumKnownUnitSize];
  const auto endIt = std::ranges::transform(unit, unitBuf, [](char ch) { return tolower(ch); }).out;

  const std::string_view lowerUnit(unitBuf, endIt);
  const auto it = std::ranges::lower_bound(kUnitMappings, lowerUnit, {}, &UnitMapping::unit);
  if (it == std::end(kUnitMappings) || it->unit != lowerUnit) {
    return std::nullopt;
  }
  return UnitInfo{it->base, it->exponent, it->bits};
}

std::optional<int> PrefixExponent(char prefix) noexcept {
  static constexpr std::string_view kPrefixes = "kmgtpezy";
  const auto pos = kPrefixes.find(tolower(prefix));
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<int>(pos) + 1;
}

std::string_view UnitSymbol(UnitSystem system, bool bits, int exponent) noexcept {
  return SymbolsOf(system, bits)[ClampedIdx(exponent)];
}

std::string_view UnitLongName(UnitSystem system, bool bits, int exponent) noexcept {
  return LongNamesOf(system, bits)[ClampedIdx(exponent)];
}

}  // namespace hsize
