#include "partstream/part-state-machine.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "partstream/boundary-scanner.hpp"
#include "partstream/decode-event.hpp"
#include "partstream/log.hpp"
#include "partstream/multipart-constants.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/part-header-parser.hpp"
#include "partstream/string-trim.hpp"
#include "partstream/vector.hpp"

namespace partstream {

PartStateMachine::PartStateMachine(std::string_view boundary, const MultipartDecoderConfig &config)
    : _scanner(boundary), _config(config) {}

std::size_t PartStateMachine::advance(std::string_view buffer, vector<DecodeEvent> &events) {
  std::size_t consumed = 0;
  while (true) {
    const std::string_view data = buffer.substr(consumed);
    const State stateBefore = _state;
    std::size_t nbConsumed = 0;
    switch (_state) {
      case State::PreBoundary:
        nbConsumed = advancePreBoundary(data);
        break;
      case State::InHeaders:
        nbConsumed = advanceHeaders(data, events);
        break;
      case State::InBody:
        nbConsumed = advanceBody(data, events);
        break;
      case State::Closing:
        nbConsumed = advanceClosing(data);
        break;
      case State::Epilogue:
        nbConsumed = advanceEpilogue(data);
        break;
      case State::Done:
        [[fallthrough]];
      case State::Failed:
        return consumed;
    }
    consumed += nbConsumed;
    if (_state == stateBefore) {
      // no transition: the remaining bytes are either consumed or need more data
      return consumed;
    }
    log::trace("multipart state {} -> {} at offset {}", StateName(stateBefore), StateName(_state), consumed);
  }
}

std::size_t PartStateMachine::advancePreBoundary(std::string_view data) {
  const BoundaryMatch match = _scanner.find(data, _atStreamStart);
  std::size_t discarded = data.size();
  if (match.status != BoundaryMatch::Status::NotFound) {
    discarded = match.start;
  }
  if (discarded != 0) {
    log::trace("multipart preamble: discarding {} bytes", discarded);
    _atStreamStart = false;
  }
  if (match.status != BoundaryMatch::Status::Found) {
    return discarded;
  }
  _atStreamStart = false;
  _state = match.isFinal ? State::Closing : State::InHeaders;
  return match.end;
}

std::size_t PartStateMachine::advanceHeaders(std::string_view data, vector<DecodeEvent> &events) {
  std::size_t blockEnd;
  std::size_t terminatorLen;
  if (data.starts_with(mime::CRLF)) {
    // blank line right after the delimiter: no header at all
    blockEnd = 0;
    terminatorLen = mime::CRLF.size();
  } else {
    blockEnd = data.find(mime::DoubleCRLF, _headerScanFrom);
    terminatorLen = mime::DoubleCRLF.size();
  }

  if (blockEnd == std::string_view::npos) {
    if (data.size() >= _config.maxHeaderBytes + mime::DoubleCRLF.size()) {
      fail(DecodeError::HeaderTooLarge);
      return 0;
    }
    // resume the search where a terminator could still start
    _headerScanFrom = data.size() < mime::DoubleCRLF.size() ? 0 : data.size() - (mime::DoubleCRLF.size() - 1U);
    return 0;
  }
  if (blockEnd > _config.maxHeaderBytes) {
    fail(DecodeError::HeaderTooLarge);
    return 0;
  }

  _headerScanFrom = 0;
  if (!startPart(data.substr(0, blockEnd), events)) {
    return 0;
  }
  return blockEnd + terminatorLen;
}

bool PartStateMachine::startPart(std::string_view headerBlock, vector<DecodeEvent> &events) {
  PartHead head = ParsePartHead(headerBlock);
  if (head.error != HeaderError::None) {
    fail(ToDecodeError(head.error));
    return false;
  }
  if (_config.maxHeadersPerPart != 0 && head.headers.size() > _config.maxHeadersPerPart) {
    fail(DecodeError::TooManyHeaders);
    return false;
  }
  if (_config.maxParts != 0 && _partCount >= _config.maxParts) {
    fail(DecodeError::TooManyParts);
    return false;
  }

  ++_partCount;
  _partBytes = 0;
  log::debug("multipart part #{} '{}' started", _partCount, head.name);
  events.emplace_back(PartStarted{std::move(head.headers), std::move(head.name), std::move(head.filename)});
  _state = State::InBody;
  return true;
}

std::size_t PartStateMachine::advanceBody(std::string_view data, vector<DecodeEvent> &events) {
  const BoundaryMatch match = _scanner.find(data, false);
  const std::size_t bodyEnd = match.status == BoundaryMatch::Status::NotFound ? data.size() : match.start;
  if (!emitBody(data.substr(0, bodyEnd), events)) {
    return 0;
  }
  if (match.status != BoundaryMatch::Status::Found) {
    return bodyEnd;
  }

  log::debug("multipart part #{} ended after {} bytes", _partCount, _partBytes);
  events.emplace_back(PartEnded{});
  _state = match.isFinal ? State::Closing : State::InHeaders;
  return match.end;
}

bool PartStateMachine::emitBody(std::string_view data, vector<DecodeEvent> &events) {
  if (data.empty()) {
    return true;
  }
  _partBytes += data.size();
  if (_config.maxPartBytes != 0 && _partBytes > _config.maxPartBytes) {
    fail(DecodeError::PartTooLarge);
    return false;
  }
  events.emplace_back(BodyChunk{std::string(data)});
  return true;
}

std::size_t PartStateMachine::advanceClosing(std::string_view data) {
  std::size_t pos = 0;
  while (pos < data.size() && IsOws(data[pos]) && _closingPadding < mime::kMaxTransportPadding) {
    ++pos;
    ++_closingPadding;
  }
  if (pos == data.size()) {
    return pos;
  }
  if (data[pos] == '\r') {
    if (pos + 1U == data.size()) {
      // a lone CR may be the start of the CRLF ending the terminal line
      return pos;
    }
    if (data[pos + 1U] == '\n') {
      pos += mime::CRLF.size();
    }
  }
  _state = State::Epilogue;
  return pos;
}

std::size_t PartStateMachine::advanceEpilogue(std::string_view data) {
  if (!data.empty()) {
    log::trace("multipart epilogue: discarding {} bytes", data.size());
  }
  return data.size();
}

DecodeError PartStateMachine::finish() {
  switch (_state) {
    case State::Closing:
      [[fallthrough]];
    case State::Epilogue:
      _state = State::Done;
      [[fallthrough]];
    case State::Done:
      return DecodeError::None;
    case State::Failed:
      return _error;
    default:
      fail(DecodeError::UnexpectedEof);
      return _error;
  }
}

void PartStateMachine::fail(DecodeError error) {
  if (_state == State::Failed) {
    return;
  }
  log::debug("multipart decoding failed in state {}: {}", StateName(_state), ErrorMessage(error));
  _state = State::Failed;
  _error = error;
}

std::string_view StateName(PartStateMachine::State state) noexcept {
  switch (state) {
    case PartStateMachine::State::PreBoundary:
      return "PreBoundary";
    case PartStateMachine::State::InHeaders:
      return "InHeaders";
    case PartStateMachine::State::InBody:
      return "InBody";
    case PartStateMachine::State::Closing:
      return "Closing";
    case PartStateMachine::State::Epilogue:
      return "Epilogue";
    case PartStateMachine::State::Done:
      return "Done";
    case PartStateMachine::State::Failed:
      return "Failed";
  }
  return "Unknown";
}

}  // namespace partstream
