#pragma once

#include <format>
#include <utility>

#include "hsize/exception.hpp"

namespace hsize {

/// Raised in strict mode when a well-formed magnitude cannot be represented without precision loss.
class range_error : public exception {
 public:
  template <unsigned N>
  explicit range_error(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit range_error(std::format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace hsize
