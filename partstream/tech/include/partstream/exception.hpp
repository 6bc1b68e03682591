#pragma once

#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace partstream {

// Exception with an inline message storage: throwing it never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto ret = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (std::cmp_less(kMsgMaxLen, ret.size)) {
      std::memset(_data + kMsgMaxLen - 3U, '.', 3U);
      _data[kMsgMaxLen] = '\0';
    } else {
      *ret.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace partstream
