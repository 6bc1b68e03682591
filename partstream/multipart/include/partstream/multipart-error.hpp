#pragma once

#include <cstdint>
#include <string_view>

#include "partstream/exception.hpp"

namespace partstream {

// Errors reported by the part header parser.
enum class HeaderError : std::uint8_t {
  None,
  Malformed,         // header line without ':', empty name, bad Content-Disposition syntax
  MissingFieldName,  // no Content-Disposition header or no (non-empty) name parameter
};

// Errors reported by the streaming decoder.
enum class DecodeError : std::uint8_t {
  None,
  MalformedHeader,
  MissingFieldName,
  UnexpectedEof,    // stream ended before the terminal boundary
  EmptyBoundary,    // construction-time validation
  BoundaryTooLong,  // construction-time validation
  StateViolation,   // feed called after a successful finish
  BodyTooLarge,     // MultipartDecoderConfig::maxBodyBytes exceeded
  HeaderTooLarge,   // MultipartDecoderConfig::maxHeaderBytes exceeded
  TooManyHeaders,   // MultipartDecoderConfig::maxHeadersPerPart exceeded
  TooManyParts,     // MultipartDecoderConfig::maxParts exceeded
  PartTooLarge,     // MultipartDecoderConfig::maxPartBytes exceeded
};

[[nodiscard]] DecodeError ToDecodeError(HeaderError error) noexcept;

[[nodiscard]] std::string_view ErrorMessage(HeaderError error) noexcept;

[[nodiscard]] std::string_view ErrorMessage(DecodeError error) noexcept;

// Thrown on invalid construction arguments (boundary validation) of the decoder and encoder.
class multipart_exception : public exception {
 public:
  explicit multipart_exception(DecodeError code) : exception("{}", ErrorMessage(code)), _code(code) {}

  [[nodiscard]] DecodeError code() const noexcept { return _code; }

 private:
  DecodeError _code;
};

}  // namespace partstream
