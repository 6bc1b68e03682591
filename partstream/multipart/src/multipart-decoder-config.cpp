#include "partstream/multipart-decoder-config.hpp"

#include <cstddef>

#include "partstream/invalid_argument_exception.hpp"

namespace partstream {

void MultipartDecoderConfig::validate() const {
  if (maxHeaderBytes == 0) {
    throw invalid_argument("maxHeaderBytes must be > 0");
  }
  if (maxBodyBytes != 0 && maxPartBytes > maxBodyBytes) {
    throw invalid_argument("maxPartBytes must be <= maxBodyBytes");
  }
  if (maxBodyBytes != 0 && maxHeaderBytes > maxBodyBytes) {
    throw invalid_argument("maxHeaderBytes must be <= maxBodyBytes");
  }
}

MultipartDecoderConfig& MultipartDecoderConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

MultipartDecoderConfig& MultipartDecoderConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

MultipartDecoderConfig& MultipartDecoderConfig::withMaxHeadersPerPart(std::size_t maxHeadersPerPart) {
  this->maxHeadersPerPart = maxHeadersPerPart;
  return *this;
}

MultipartDecoderConfig& MultipartDecoderConfig::withMaxParts(std::size_t maxParts) {
  this->maxParts = maxParts;
  return *this;
}

MultipartDecoderConfig& MultipartDecoderConfig::withMaxPartBytes(std::size_t maxPartBytes) {
  this->maxPartBytes = maxPartBytes;
  return *this;
}

}  // namespace partstream
