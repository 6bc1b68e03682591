#pragma once

#include <cstddef>

namespace partstream {

// Limits applied by the multipart decoder. A value of 0 disables the corresponding limit, except for maxHeaderBytes.
struct MultipartDecoderConfig {
  // Throws invalid_argument if the configuration is inconsistent.
  void validate() const;

  MultipartDecoderConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  MultipartDecoderConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  MultipartDecoderConfig& withMaxHeadersPerPart(std::size_t maxHeadersPerPart);

  MultipartDecoderConfig& withMaxParts(std::size_t maxParts);

  MultipartDecoderConfig& withMaxPartBytes(std::size_t maxPartBytes);

  // Maximum number of bytes fed to one decoder, preamble and epilogue included.
  std::size_t maxBodyBytes{0};

  // Maximum size of the header block of one part. Header blocks are the only data the decoder needs to retain in
  // full before emitting anything, so this also bounds its memory usage. Must be > 0.
  std::size_t maxHeaderBytes{16UL * 1024UL};

  // Maximum number of header lines in one part (folded continuation lines not counted).
  std::size_t maxHeadersPerPart{0};

  // Maximum number of parts in one body.
  std::size_t maxParts{0};

  // Maximum body size of a single part.
  std::size_t maxPartBytes{0};
};

}  // namespace partstream
