#pragma once

#include <string>
#include <variant>

namespace hsize {

/// Rounded value and its unit.
struct SizeParts {
  double value;
  std::string unit;

  bool operator==(const SizeParts &) const = default;
};

struct SizeObject {
  double bytes;  // formatted input
  double value;  // rounded value in 'unit'
  std::string unit;
  int exponent;

  bool operator==(const SizeObject &) const = default;
};

/// Result of a format call, shape selected by FormatSpec::output.
using FormatResult = std::variant<std::string, SizeParts, SizeObject, int>;

}  // namespace hsize
