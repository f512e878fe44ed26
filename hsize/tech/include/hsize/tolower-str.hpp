#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "hsize/toupperlower.hpp"

namespace hsize {

// Apply tolower from 'from' to 'to' for len bytes.
// from and to buffers should be at least of size 'len'.
constexpr void tolower_n(const char* from, std::size_t len, char* to) {
  for (std::size_t pos = 0; pos < len; ++pos) {
    to[pos] = tolower(from[pos]);
  }
}

// Returns an ASCII lower-cased copy of 'str'. Non ASCII bytes are kept as is.
inline std::string ToLowerStr(std::string_view str) {
  std::string ret(str.size(), '\0');
  tolower_n(str.data(), str.size(), ret.data());
  return ret;
}

}  // namespace hsize
