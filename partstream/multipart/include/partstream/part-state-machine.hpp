#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "partstream/boundary-scanner.hpp"
#include "partstream/decode-event.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/vector.hpp"

namespace partstream {

// Incremental multipart grammar, independent of how the input is buffered.
// Each call to advance receives all the bytes not consumed so far (retained bytes first), emits events for what it
// can resolve, and reports how many leading bytes the caller may release. Unconsumed bytes are bytes that may belong
// to a delimiter or to an incomplete header block: they must be presented again, followed by new data.
class PartStateMachine {
 public:
  enum class State : std::uint8_t {
    PreBoundary,  // preamble, before the first delimiter
    InHeaders,    // accumulating the header block of a part
    InBody,       // streaming the body of a part
    Closing,      // terminal delimiter seen, waiting for the end of its line
    Epilogue,     // terminal line complete, discarding everything until finish
    Done,         // finish called after the terminal delimiter
    Failed,
  };

  PartStateMachine(std::string_view boundary, const MultipartDecoderConfig &config);

  // Returns the number of leading bytes of 'buffer' that have been consumed.
  std::size_t advance(std::string_view buffer, vector<DecodeEvent> &events);

  // Signals the end of the input. Returns DecodeError::None only when the terminal delimiter has been seen.
  DecodeError finish();

  // Enters the sticky Failed state. First error wins.
  void fail(DecodeError error);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] DecodeError error() const noexcept { return _error; }

  [[nodiscard]] std::size_t partCount() const noexcept { return _partCount; }

  // True once the terminal delimiter has been seen.
  [[nodiscard]] bool terminated() const noexcept {
    return _state == State::Closing || _state == State::Epilogue || _state == State::Done;
  }

 private:
  std::size_t advancePreBoundary(std::string_view data);
  std::size_t advanceHeaders(std::string_view data, vector<DecodeEvent> &events);
  std::size_t advanceBody(std::string_view data, vector<DecodeEvent> &events);
  std::size_t advanceClosing(std::string_view data);
  static std::size_t advanceEpilogue(std::string_view data);

  bool startPart(std::string_view headerBlock, vector<DecodeEvent> &events);
  bool emitBody(std::string_view data, vector<DecodeEvent> &events);

  BoundaryScanner _scanner;
  MultipartDecoderConfig _config;
  std::size_t _partCount{0};
  std::size_t _partBytes{0};
  std::size_t _headerScanFrom{0};
  std::size_t _closingPadding{0};
  State _state{State::PreBoundary};
  DecodeError _error{DecodeError::None};
  bool _atStreamStart{true};
};

[[nodiscard]] std::string_view StateName(PartStateMachine::State state) noexcept;

}  // namespace partstream
