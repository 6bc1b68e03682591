#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "partstream/part-body.hpp"
#include "partstream/part-headers.hpp"
#include "partstream/raw-chars.hpp"
#include "partstream/vector.hpp"

namespace partstream {

// Description of one part to encode.
struct PartDescriptor {
  std::string name;
  std::optional<std::string> filename;
  std::optional<std::string> contentType;
  // Additional headers, emitted in order after Content-Disposition and Content-Type.
  // A Content-Disposition header is never emitted from here, nor a Content-Type when 'contentType' is set.
  PartHeaders headers;
  PartBody body;
};

// Pull based multipart/form-data encoder.
// Output layout, for each part: CRLF "--" boundary CRLF, header lines, CRLF, body bytes.
// Then the terminal delimiter: CRLF "--" boundary "--" CRLF. An empty list of parts yields only the terminal
// delimiter. The boundary must not occur in any body, this is not checked.
// Encoding is single pass since body generators may be single pass.
class MultipartEncoder {
 public:
  // Throws multipart_exception for an invalid boundary, invalid_argument for an invalid part descriptor.
  MultipartEncoder(std::string_view boundary, vector<PartDescriptor> parts);

  // Returns the next chunk of the encoded body, or an empty view once the body is complete.
  // The returned view is valid until the next call.
  [[nodiscard]] std::string_view nextChunk();

  [[nodiscard]] bool done() const noexcept { return _stage == Stage::Done; }

  // Appends all the remaining chunks to 'out'.
  void encodeAll(RawChars &out);

  // Total encoded size, or std::nullopt if any part body is generated.
  [[nodiscard]] std::optional<std::size_t> contentLength() const;

  [[nodiscard]] std::string_view boundary() const noexcept { return _boundary; }

  // 'multipart/form-data; boundary=<boundary>', the boundary being quoted when it is not a token.
  [[nodiscard]] std::string contentTypeHeader() const;

 private:
  enum class Stage : std::uint8_t { PartHead, PartBody, Terminal, Done };

  std::string _boundary;
  vector<PartDescriptor> _parts;
  RawChars _scratch;
  std::size_t _partPos{0};
  Stage _stage{Stage::PartHead};
};

// Appends 'value' to 'out' as a quoted-string, backslash-escaping '"' and '\'.
void AppendQuoted(RawChars &out, std::string_view value);

}  // namespace partstream
