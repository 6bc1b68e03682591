#include "partstream/multipart-error.hpp"

#include <string_view>

namespace partstream {

DecodeError ToDecodeError(HeaderError error) noexcept {
  switch (error) {
    case HeaderError::None:
      return DecodeError::None;
    case HeaderError::Malformed:
      return DecodeError::MalformedHeader;
    case HeaderError::MissingFieldName:
      return DecodeError::MissingFieldName;
  }
  return DecodeError::MalformedHeader;
}

std::string_view ErrorMessage(HeaderError error) noexcept { return ErrorMessage(ToDecodeError(error)); }

std::string_view ErrorMessage(DecodeError error) noexcept {
  switch (error) {
    case DecodeError::None:
      return {};
    case DecodeError::MalformedHeader:
      return "multipart part header is malformed";
    case DecodeError::MissingFieldName:
      return "multipart part missing form-data field name";
    case DecodeError::UnexpectedEof:
      return "multipart body ended before the terminal boundary";
    case DecodeError::EmptyBoundary:
      return "multipart boundary is empty";
    case DecodeError::BoundaryTooLong:
      return "multipart boundary exceeds 70 bytes";
    case DecodeError::StateViolation:
      return "multipart data fed after the end of the body";
    case DecodeError::BodyTooLarge:
      return "multipart body exceeds size limit";
    case DecodeError::HeaderTooLarge:
      return "multipart part header block exceeds size limit";
    case DecodeError::TooManyHeaders:
      return "multipart part exceeds header limit";
    case DecodeError::TooManyParts:
      return "multipart exceeds part limit";
    case DecodeError::PartTooLarge:
      return "multipart part exceeds size limit";
  }
  return "multipart unknown error";
}

}  // namespace partstream
