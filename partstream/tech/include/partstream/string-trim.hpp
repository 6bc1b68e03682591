#pragma once

#include <string_view>

namespace partstream {

// SP and HTAB, the only whitespace allowed around header values and parameters.
constexpr bool IsOws(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && IsOws(*begin)) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (!IsOws(*end)) {
      ++end;
      break;
    }
  }
  return {begin, end};
}

}  // namespace partstream
