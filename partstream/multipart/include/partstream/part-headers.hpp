#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "partstream/vector.hpp"

namespace partstream {

// A single header of a multipart part. The name keeps its received casing.
struct HeaderField {
  [[nodiscard]] std::string lowerName() const;

  bool operator==(const HeaderField&) const noexcept = default;

  std::string name;
  std::string value;
};

// Ordered header block of one part.
// Insertion order and original name casing are preserved so that a decoded block can be re-encoded as received.
// Lookups are case-insensitive and return the first matching header.
class PartHeaders {
 public:
  using const_iterator = const HeaderField*;

  PartHeaders() noexcept = default;

  void append(std::string_view name, std::string_view value);

  // Appends 'continuation' to the value of the last header, separated by a single space (obs-fold).
  // Precondition: !empty()
  void appendToLastValue(std::string_view continuation);

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::span<const HeaderField> fields() const noexcept { return {_fields.data(), _fields.size()}; }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.data() + _fields.size(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  bool operator==(const PartHeaders& rhs) const noexcept;

 private:
  vector<HeaderField> _fields;
};

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
[[nodiscard]] bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value can be emitted on a single line: no CR, LF or NUL.
// Unlike HTTP/1 field values, non-ASCII bytes are allowed (RFC 7578 §5.1 filenames are sent raw).
[[nodiscard]] bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace partstream
