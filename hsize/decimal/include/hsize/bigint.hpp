#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>

namespace hsize {

/// Lossless big integer input channel for byte counts.
using BigInt = boost::multiprecision::cpp_int;

/// Largest integer n such that n and n + 1 are both exactly representable as double (2^53 - 1).
inline constexpr std::int64_t kMaxSafeInteger = (std::int64_t{1} << 53) - 1;
inline constexpr std::int64_t kMinSafeInteger = -kMaxSafeInteger;

[[nodiscard]] inline bool IsSafeInteger(const BigInt &value) {
  return value >= kMinSafeInteger && value <= kMaxSafeInteger;
}

}  // namespace hsize
