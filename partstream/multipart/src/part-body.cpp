#include "partstream/part-body.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "partstream/raw-chars.hpp"

namespace partstream {

// NOLINTNEXTLINE(bugprone-exception-escape)
std::optional<std::size_t> PartBody::size() const noexcept {
  return std::visit(
      [](const auto& val) -> std::optional<std::size_t> {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::vector<char>> ||
                      std::is_same_v<T, RawChars>) {
          return static_cast<std::size_t>(val.size());
        } else if constexpr (std::is_same_v<T, Generator>) {
          return std::nullopt;
        } else {
          return std::size_t{0};
        }
      },
      _data);
}

// NOLINTNEXTLINE(bugprone-exception-escape)
std::string_view PartBody::view() const noexcept {
  return std::visit(
      [](const auto& val) -> std::string_view {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, RawChars>) {
          return val;
        } else if constexpr (std::is_same_v<T, std::vector<char>>) {
          return std::string_view(val.data(), val.size());
        } else {
          return {};
        }
      },
      _data);
}

std::string_view PartBody::next() {
  if (_exhausted) {
    return {};
  }
  if (auto* generator = std::get_if<Generator>(&_data)) {
    std::string_view chunk;
    if (*generator) {
      chunk = (*generator)();
    }
    _exhausted = chunk.empty();
    return chunk;
  }
  _exhausted = true;
  return view();
}

}  // namespace partstream
