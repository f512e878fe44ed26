#pragma once

#include <string_view>

#include "hsize/cctype.hpp"

namespace hsize {

// UTF-8 encoding of U+00A0 (NO-BREAK SPACE).
inline constexpr std::string_view kNbsp = "\xC2\xA0";

// Trim ASCII white spaces and UTF-8 encoded no-break spaces on both sides.
constexpr std::string_view TrimSpaces(std::string_view sv) noexcept {
  while (!sv.empty()) {
    if (isspace(sv.front())) {
      sv.remove_prefix(1);
    } else if (sv.starts_with(kNbsp)) {
      sv.remove_prefix(kNbsp.size());
    } else {
      break;
    }
  }
  while (!sv.empty()) {
    if (isspace(sv.back())) {
      sv.remove_suffix(1);
    } else if (sv.ends_with(kNbsp)) {
      sv.remove_suffix(kNbsp.size());
    } else {
      break;
    }
  }
  return sv;
}

}  // namespace hsize
