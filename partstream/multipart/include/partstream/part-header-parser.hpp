#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "partstream/multipart-error.hpp"
#include "partstream/part-headers.hpp"

namespace partstream {

struct PartHeadersParseResult {
  PartHeaders headers;
  HeaderError error{HeaderError::None};
};

// Parses the header block of a part: the bytes between the boundary line and the blank line, without the terminating
// CRLF CRLF. Lines are CRLF separated, split on their first ':' with OWS trimmed around name and value.
// A line starting with SP or HTAB continues the previous header (obs-fold) and is joined with a single space.
// Malformed: a line without ':', an empty header name, or a continuation line before any header.
[[nodiscard]] PartHeadersParseResult ParsePartHeaders(std::string_view headerBlock);

struct ContentDispositionParseResult {
  std::string name;
  std::optional<std::string> filename;
  HeaderError error{HeaderError::None};
};

// Extracts 'name' and 'filename' from a Content-Disposition header value.
// The disposition type must be 'form-data' (Malformed otherwise), and 'name' must be present and non-empty
// (MissingFieldName otherwise). 'filename*' takes precedence over 'filename'.
[[nodiscard]] ContentDispositionParseResult ParseContentDisposition(std::string_view headerValue);

// Header block of a part, with its form-data field name and filename resolved.
struct PartHead {
  PartHeaders headers;
  std::string name;
  std::optional<std::string> filename;
  HeaderError error{HeaderError::None};
};

// ParsePartHeaders followed by ParseContentDisposition of its Content-Disposition header.
// A header block without Content-Disposition is MissingFieldName.
[[nodiscard]] PartHead ParsePartHead(std::string_view headerBlock);

}  // namespace partstream
