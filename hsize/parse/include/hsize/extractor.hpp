#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "hsize/vector.hpp"

namespace hsize {

/// A size found in free text.
struct ExtractedMatch {
  double value;       // number as written, "1,5 GB" -> 1.5
  std::string unit;   // unit as written, "GB"
  double bytes;       // Parse(input)
  std::string input;  // matched text, "1,5 GB"
  std::size_t start;  // byte offset of the match in the scanned text
  std::size_t end;    // byte offset one past the match

  bool operator==(const ExtractedMatch &) const = default;
};

/// Finds every "number unit" run of 'text' ("1.5 GB", "100MiB", "2 bits"), left to right, without overlap.
/// A unit is required. Matches whose number or byte count cannot be computed are skipped. Never throws on
/// uncontrolled text.
[[nodiscard]] vector<ExtractedMatch> Extract(std::string_view text);

}  // namespace hsize
