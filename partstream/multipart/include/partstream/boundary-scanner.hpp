#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "partstream/multipart-error.hpp"

namespace partstream {

// Checks that 'boundary' is non-empty and at most 70 bytes long. The boundary is otherwise used verbatim.
[[nodiscard]] DecodeError ValidateBoundary(std::string_view boundary) noexcept;

struct BoundaryMatch {
  enum class Status : std::uint8_t {
    NotFound,  // no delimiter, and no byte of the buffer can start one: everything can be released
    Partial,   // a delimiter may start at 'start' but needs more bytes to be confirmed: retain from 'start'
    Found,     // complete delimiter in [start, end)
  };

  Status status{Status::NotFound};
  std::size_t start{0};
  std::size_t end{0};
  bool isFinal{false};  // terminal delimiter ("--" after the boundary)
};

// Locates delimiter lines of a multipart body inside a byte buffer.
// The marker is CRLF "--" boundary, matched byte-exactly. A marker only delimits a part when it is followed either
// by "--" (terminal delimiter, 'end' just after the dashes) or by optional transport padding (SP / HTAB) and CRLF
// ('end' after the CRLF). Any other continuation means the boundary string was a prefix of body data.
class BoundaryScanner {
 public:
  // The boundary is expected to be validated by the caller.
  explicit BoundaryScanner(std::string_view boundary);

  // Searches the first delimiter in 'buffer'.
  // When 'atStreamStart' is true, 'buffer' starts at the first byte of the body and the opening delimiter may omit
  // its leading CRLF.
  [[nodiscard]] BoundaryMatch find(std::string_view buffer, bool atStreamStart) const noexcept;

  // CRLF "--" boundary
  [[nodiscard]] std::string_view marker() const noexcept { return _marker; }

  // "--" boundary
  [[nodiscard]] std::string_view dashBoundary() const noexcept { return std::string_view(_marker).substr(2); }

 private:
  [[nodiscard]] BoundaryMatch classify(std::string_view buffer, std::size_t start,
                                       std::size_t afterBoundary) const noexcept;

  std::string _marker;
};

}  // namespace partstream
