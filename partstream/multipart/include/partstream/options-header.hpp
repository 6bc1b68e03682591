#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "partstream/multipart-error.hpp"
#include "partstream/vector.hpp"

namespace partstream {

struct HeaderParam {
  std::string name;  // lower-cased, without the RFC 2231 '*' / '*N' suffixes
  std::string value;
  bool extended{false};  // value came from an RFC 2231 / RFC 5987 'name*' parameter
};

// A parsed "token *( ';' parameter )" header value, as used by Content-Disposition and Content-Type.
struct OptionsHeader {
  // Returns the value of the parameter with the given lower-case name.
  // An extended parameter ('filename*') takes precedence over its plain counterpart ('filename').
  [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept;

  std::string_view value;  // leading token, trimmed, pointing into the parsed string
  vector<HeaderParam> params;
  HeaderError error{HeaderError::None};
};

// Parses a header value made of a leading token followed by ';'-separated parameters.
// Parameter values are tokens or quoted-strings; inside quoted-strings only \" and \\ are unescaped, other backslashes
// are kept literally (browsers send raw Windows paths).
// RFC 2231 continuations (name*0, name*1, ...) are concatenated in order of appearance and extended values
// (charset'language'percent-encoded) are percent-decoded, their bytes being kept as is (no charset conversion).
// Empty parameters, parameters without '=' and unterminated quoted-strings make the header Malformed.
[[nodiscard]] OptionsHeader ParseOptionsHeader(std::string_view headerValue);

// Returns the 'boundary' parameter of a multipart/form-data Content-Type header value, or an empty string if the media
// type is not multipart/form-data or has no boundary.
[[nodiscard]] std::string ExtractBoundary(std::string_view contentTypeHeader);

}  // namespace partstream
