#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "hsize/unit-system.hpp"

namespace hsize {

/// Multiplier and tier of a known unit token.
struct UnitInfo {
  std::uint32_t base;  // 1 for unprefixed units
  std::int8_t exponent;
  bool bits;
};

struct UnitMapping {
  std::string_view unit;  // lower case
  std::uint32_t base;
  std::int8_t exponent;
  bool bits;
};

// All lower case unit tokens recognized by the parser, sorted by token.
// Note that "kb" is the SI kilobyte (not the kilobit) and that "kib" is the kibibyte, even when the input was "Kib".
inline constexpr UnitMapping kUnitMappings[] = {
    {"b", 1, 0, false},
    {"bit", 1, 0, true},
    {"bits", 1, 0, true},
    {"byte", 1, 0, false},
    {"bytes", 1, 0, false},
    {"eb", 1000, 6, false},
    {"eib", 1024, 6, false},
    {"eo", 1000, 6, false},
    {"exabit", 1000, 6, true},
    {"exabits", 1000, 6, true},
    {"exabyte", 1000, 6, false},
    {"exabytes", 1000, 6, false},
    {"exbibit", 1024, 6, true},
    {"exbibits", 1024, 6, true},
    {"exbibyte", 1024, 6, false},
    {"exbibytes", 1024, 6, false},
    {"gb", 1000, 3, false},
    {"gib", 1024, 3, false},
    {"gibibit", 1024, 3, true},
    {"gibibits", 1024, 3, true},
    {"gibibyte", 1024, 3, false},
    {"gibibytes", 1024, 3, false},
    {"gigabit", 1000, 3, true},
    {"gigabits", 1000, 3, true},
    {"gigabyte", 1000, 3, false},
    {"gigabytes", 1000, 3, false},
    {"go", 1000, 3, false},
    {"kb", 1000, 1, false},
    {"kib", 1024, 1, false},
    {"kibibit", 1024, 1, true},
    {"kibibits", 1024, 1, true},
    {"kibibyte", 1024, 1, false},
    {"kibibytes", 1024, 1, false},
    {"kilobit", 1000, 1, true},
    {"kilobits", 1000, 1, true},
    {"kilobyte", 1000, 1, false},
    {"kilobytes", 1000, 1, false},
    {"ko", 1000, 1, false},
    {"mb", 1000, 2, false},
    {"mebibit", 1024, 2, true},
    {"mebibits", 1024, 2, true},
    {"mebibyte", 1024, 2, false},
    {"mebibytes", 1024, 2, false},
    {"megabit", 1000, 2, true},
    {"megabits", 1000, 2, true},
    {"megabyte", 1000, 2, false},
    {"megabytes", 1000, 2, false},
    {"mib", 1024, 2, false},
    {"mo", 1000, 2, false},
    {"o", 1, 0, false},
    {"octet", 1, 0, false},
    {"octets", 1, 0, false},
    {"pb", 1000, 5, false},
    {"pebibit", 1024, 5, true},
    {"pebibits", 1024, 5, true},
    {"pebibyte", 1024, 5, false},
    {"pebibytes", 1024, 5, false},
    {"petabit", 1000, 5, true},
    {"petabits", 1000, 5, true},
    {"petabyte", 1000, 5, false},
    {"petabytes", 1000, 5, false},
    {"pib", 1024, 5, false},
    {"po", 1000, 5, false},
    {"tb", 1000, 4, false},
    {"tebibit", 1024, 4, true},
    {"tebibits", 1024, 4, true},
    {"tebibyte", 1024, 4, false},
    {"tebibytes", 1024, 4, false},
    {"terabit", 1000, 4, true},
    {"terabits", 1000, 4, true},
    {"terabyte", 1000, 4, false},
    {"terabytes", 1000, 4, false},
    {"tib", 1024, 4, false},
    {"to", 1000, 4, false},
    {"yb", 1000, 8, false},
    {"yib", 1024, 8, false},
    {"yo", 1000, 8, false},
    {"yobibit", 1024, 8, true},
    {"yobibits", 1024, 8, true},
    {"yobibyte", 1024, 8, false},
    {"yobibytes", 1024, 8, false},
    {"yottabit", 1000, 8, true},
    {"yottabits", 1000, 8, true},
    {"yottabyte", 1000, 8, false},
    {"yottabytes", 1000, 8, false},
    {"zb", 1000, 7, false},
    {"zebibit", 1024, 7, true},
    {"zebibits", 1024, 7, true},
    {"zebibyte", 1024, 7, false},
    {"zebibytes", 1024, 7, false},
    {"zettabit", 1000, 7, true},
    {"zettabits", 1000, 7, true},
    {"zettabyte", 1000, 7, false},
    {"zettabytes", 1000, 7, false},
    {"zib", 1024, 7, false},
    {"zo", 1000, 7, false},
};

/// Looks up a unit token, case insensitively.
[[nodiscard]] std::optional<UnitInfo> LookupUnit(std::string_view unit);

/// Exponent of a SI prefix letter (k -> 1, M -> 2, ..., Y -> 8), case insensitive.
[[nodiscard]] std::optional<int> PrefixExponent(char prefix) noexcept;

/// Short display symbol of the tier 'exponent' (clamped to [0, 8]).
/// French has no bit vocabulary: French bits use the JEDEC symbols.
[[nodiscard]] std::string_view UnitSymbol(UnitSystem system, bool bits, int exponent) noexcept;

/// Long display name, capitalized and plural ("Kibibytes", "Octets").
[[nodiscard]] std::string_view UnitLongName(UnitSystem system, bool bits, int exponent) noexcept;

}  // namespace hsize
