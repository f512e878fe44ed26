#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

namespace hsize {

/// Base exception of the library.
/// The message is stored inline (no dynamic allocation at throw time). Formatted messages longer than
/// kMsgMaxLen are truncated and terminated by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 119;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::ranges::copy(str, _data);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args &&...args) {
    const auto res = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (static_cast<std::size_t>(res.size) > kMsgMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::ranges::copy(kEllipsis, _data + kMsgMaxLen - kEllipsis.size());
      *(_data + kMsgMaxLen) = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char *what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace hsize
