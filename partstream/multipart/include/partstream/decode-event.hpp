#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "partstream/multipart-constants.hpp"
#include "partstream/part-headers.hpp"

namespace partstream {

// Opening of a part: its header block is complete, its body not yet available.
struct PartStarted {
  [[nodiscard]] std::optional<std::string_view> contentType() const noexcept {
    return headers.get(mime::ContentType);
  }

  [[nodiscard]] bool isFile() const noexcept { return filename.has_value(); }

  PartHeaders headers;
  std::string name;
  std::optional<std::string> filename;
};

// Next slice of the current part body. Never contains the CRLF preceding a delimiter.
struct BodyChunk {
  std::string data;
};

// The current part body is complete.
struct PartEnded {};

// For a given part, events are always emitted in the order PartStarted, BodyChunk*, PartEnded.
// Events own their bytes and stay valid independently of the decoder.
using DecodeEvent = std::variant<PartStarted, BodyChunk, PartEnded>;

}  // namespace partstream
