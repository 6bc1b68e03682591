#include "partstream/multipart-decoder.hpp"

#include <cstddef>
#include <string_view>

#include "partstream/boundary-scanner.hpp"
#include "partstream/decode-event.hpp"
#include "partstream/log.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/vector.hpp"

namespace partstream {

namespace {

std::string_view CheckedBoundary(std::string_view boundary) {
  const DecodeError error = ValidateBoundary(boundary);
  if (error != DecodeError::None) {
    throw multipart_exception(error);
  }
  return boundary;
}

const MultipartDecoderConfig &CheckedConfig(const MultipartDecoderConfig &config) {
  config.validate();
  return config;
}

}  // namespace

MultipartDecoder::MultipartDecoder(std::string_view boundary, MultipartDecoderConfig config)
    : _config(CheckedConfig(config)), _machine(CheckedBoundary(boundary), _config) {}

MultipartDecoder::FeedResult MultipartDecoder::feed(std::string_view chunk) {
  FeedResult result;
  result.error = feed(chunk, result.events);
  return result;
}

DecodeError MultipartDecoder::feed(std::string_view chunk, vector<DecodeEvent> &events) {
  switch (_machine.state()) {
    case State::Failed:
      return _machine.error();
    case State::Done:
      if (chunk.empty()) {
        return DecodeError::None;
      }
      log::warn("multipart decoder received {} bytes after finish", chunk.size());
      return DecodeError::StateViolation;
    default:
      break;
  }
  if (chunk.empty()) {
    return DecodeError::None;
  }

  _bytesFed += chunk.size();
  if (_config.maxBodyBytes != 0 && _bytesFed > _config.maxBodyBytes) {
    _machine.fail(DecodeError::BodyTooLarge);
    _buffer.clear();
    return _machine.error();
  }

  if (_buffer.empty()) {
    // fast path: parse directly from the caller's chunk, only keep what cannot be resolved yet
    const std::size_t consumed = _machine.advance(chunk, events);
    _buffer.append(chunk.substr(consumed));
  } else {
    _buffer.append(chunk);
    const std::size_t consumed = _machine.advance(std::string_view(_buffer), events);
    _buffer.erase_front(static_cast<RawChars::size_type>(consumed));
  }

  if (_machine.state() == State::Done || _machine.state() == State::Failed) {
    _buffer.clear();
  }
  return _machine.error();
}

DecodeError MultipartDecoder::finish() {
  const DecodeError error = _machine.finish();
  if (error == DecodeError::None) {
    log::debug("multipart decoding finished: {} part(s) in {} bytes", _machine.partCount(), _bytesFed);
  }
  _buffer.clear();
  return error;
}

}  // namespace partstream
