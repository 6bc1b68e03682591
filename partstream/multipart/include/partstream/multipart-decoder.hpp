#pragma once

#include <cstddef>
#include <string_view>

#include "partstream/decode-event.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/part-state-machine.hpp"
#include "partstream/raw-chars.hpp"
#include "partstream/vector.hpp"

namespace partstream {

// Streaming decoder of a multipart/form-data body (RFC 7578 over RFC 2046 framing).
// The body may be split into chunks at arbitrary byte positions: the produced events, once adjacent BodyChunk
// events are merged, do not depend on the split.
// Memory usage is bounded: apart from a header block (limited by maxHeaderBytes), only the bytes that may be the
// beginning of a delimiter are retained between two feeds.
// Errors are sticky: once an error is reported, every subsequent call reports it again.
class MultipartDecoder {
 public:
  using State = PartStateMachine::State;

  struct FeedResult {
    [[nodiscard]] bool ok() const noexcept { return error == DecodeError::None; }

    // Events resolved by this feed. When 'error' is set, events produced before the error are still present.
    vector<DecodeEvent> events;
    DecodeError error{DecodeError::None};
  };

  // Throws multipart_exception if 'boundary' is invalid, invalid_argument if 'config' is invalid.
  explicit MultipartDecoder(std::string_view boundary, MultipartDecoderConfig config = {});

  [[nodiscard]] FeedResult feed(std::string_view chunk);

  // Appends the resolved events to 'events' instead of allocating a new vector.
  DecodeError feed(std::string_view chunk, vector<DecodeEvent> &events);

  // Signals the end of the body. Returns DecodeError::UnexpectedEof (and fails the decoder) if the terminal
  // delimiter has not been seen, otherwise the decoder is done.
  [[nodiscard]] DecodeError finish();

  [[nodiscard]] State state() const noexcept { return _machine.state(); }

  [[nodiscard]] DecodeError error() const noexcept { return _machine.error(); }

  // True once finish has succeeded. Feeding a done decoder is a StateViolation.
  [[nodiscard]] bool done() const noexcept { return _machine.state() == State::Done; }

  // True once the terminal delimiter has been seen. Later bytes are epilogue and are discarded.
  [[nodiscard]] bool terminated() const noexcept { return _machine.terminated(); }

  [[nodiscard]] std::size_t partCount() const noexcept { return _machine.partCount(); }

  // Total number of bytes accepted by feed.
  [[nodiscard]] std::size_t bytesFed() const noexcept { return _bytesFed; }

  // Number of bytes currently retained, waiting for more data.
  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _buffer.size(); }

 private:
  MultipartDecoderConfig _config;
  PartStateMachine _machine;
  RawChars _buffer;
  std::size_t _bytesFed{0};
};

}  // namespace partstream
