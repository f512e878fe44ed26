#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace hsize {

/// Single size: optional sign, digits with an optional '.' or ',' fraction and an optional exponent,
/// optional spaces and an optional unit ("1.5 GiB", "-2,5e3kb", "12").
/// Group 1 is the number and group 2 the unit. Matched case insensitively.
inline constexpr std::string_view kBytePattern =
    R"(^([+-]?\d+(?:[.,]\d+)?(?:e[+-]?\d+)?)\s*((?:([kmgtpezy])(i?))?(b(?:ytes?|its?)?|o(?:ctets?)?))?$)";

/// Unanchored version of kBytePattern for sizes in free text. The unit is required.
inline constexpr std::string_view kGlobalBytePattern =
    R"(([+-]?\d+(?:[.,]\d+)?(?:e[+-]?\d+)?)\s*((?:([kmgtpezy])(i?))?(b(?:ytes?|its?)?|o(?:ctets?)?)))";

/// Number followed by any unit text, for custom unit tables.
inline constexpr std::string_view kCustomBytePattern = R"(^([+-]?\d+(?:[.,]\d+)?(?:e[+-]?\d+)?)\s*(.*)$)";

/// Compiled, case insensitive versions of the patterns above.
[[nodiscard]] const std::regex &BytePattern();
[[nodiscard]] const std::regex &GlobalBytePattern();
[[nodiscard]] const std::regex &CustomBytePattern();

/// Position of a size in a string, as matched by the grammar of the patterns above.
struct ByteMatch {
  std::size_t start;
  std::size_t end;
  std::string_view number;  // group 1
  std::string_view unit;    // group 2, empty when there is no unit
};

/// Linear time matchers accepting exactly what the compiled patterns accept, with the same groups.
/// They do not recurse, so they are safe on uncontrolled input of any length.
[[nodiscard]] std::optional<ByteMatch> MatchByteString(std::string_view str);
[[nodiscard]] std::optional<ByteMatch> MatchCustomByteString(std::string_view str);

/// Leftmost match of kGlobalBytePattern in 'text' starting at or after 'from'.
[[nodiscard]] std::optional<ByteMatch> SearchByteString(std::string_view text, std::size_t from = 0);

/// Replaces each no-break space (U+00A0) of 'str' by 'replacement' so that it is matched by '\s'.
/// With a two characters replacement, positions in the result are positions in 'str'.
[[nodiscard]] std::string ReplaceNoBreakSpaces(std::string_view str, std::string_view replacement = " ");

}  // namespace hsize
