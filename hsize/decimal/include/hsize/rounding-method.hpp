#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace hsize {

enum class RoundingMethod : std::uint8_t {
  Round,  // ties toward +infinity: 1.5 -> 2, -1.5 -> -1, -2.5 -> -2
  Floor,
  Ceil,
  Trunc,
};

[[nodiscard]] constexpr std::string_view RoundingMethodName(RoundingMethod method) noexcept {
  switch (method) {
    case RoundingMethod::Round:
      return "round";
    case RoundingMethod::Floor:
      return "floor";
    case RoundingMethod::Ceil:
      return "ceil";
    case RoundingMethod::Trunc:
      return "trunc";
    default:
      return "unknown";
  }
}

[[nodiscard]] constexpr std::optional<RoundingMethod> RoundingMethodFromName(std::string_view name) noexcept {
  for (auto method : {RoundingMethod::Round, RoundingMethod::Floor, RoundingMethod::Ceil, RoundingMethod::Trunc}) {
    if (RoundingMethodName(method) == name) {
      return method;
    }
  }
  return std::nullopt;
}

}  // namespace hsize
