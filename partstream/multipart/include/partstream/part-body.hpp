#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "partstream/raw-chars.hpp"

namespace partstream {

// Body source of a part to encode.
// In-memory data is captured by value (moved or copied) at construction time.
// A Generator is pulled until it returns an empty view, each returned view must stay valid until the next call.
// A body is read once: next() is a single pass.
class PartBody {
 public:
  using Generator = std::function<std::string_view()>;

  PartBody() noexcept = default;

  // Constructs a PartBody by taking ownership of the given std::string.
  explicit PartBody(std::string str) noexcept : _data(std::move(str)) {}

  // Constructs a PartBody by taking ownership of the given std::vector<char>.
  explicit PartBody(std::vector<char> vec) noexcept : _data(std::move(vec)) {}

  explicit PartBody(RawChars rawChars) noexcept : _data(std::move(rawChars)) {}

  // Constructs a lazy PartBody whose size is unknown before it is fully pulled.
  explicit PartBody(Generator generator) noexcept : _data(std::move(generator)) {}

  [[nodiscard]] bool isGenerated() const noexcept { return std::holds_alternative<Generator>(_data); }

  // Size of an in-memory body, std::nullopt for a generated one.
  [[nodiscard]] std::optional<std::size_t> size() const noexcept;

  // In-memory bytes of the body. Empty for a generated body.
  [[nodiscard]] std::string_view view() const noexcept;

  // Returns the next bytes of the body, or an empty view at its end.
  std::string_view next();

 private:
  std::variant<std::monostate, std::string, std::vector<char>, RawChars, Generator> _data;
  bool _exhausted{false};
};

}  // namespace partstream
