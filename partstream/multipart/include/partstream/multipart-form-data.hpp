#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "partstream/decode-event.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/part-headers.hpp"
#include "partstream/vector.hpp"

namespace partstream {

// A fully materialized multipart/form-data field.
struct FormField {
  [[nodiscard]] bool isFile() const noexcept { return filename.has_value(); }

  // Get the value of the specified header, or an empty string_view if not present
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headers.valueOrEmpty(key);
  }

  std::string name;
  std::optional<std::string> filename;
  std::optional<std::string> contentType;
  PartHeaders headers;
  std::string value;
};

// Aggregates multipart/form-data parts in memory, for bodies small enough to be materialized.
// Large uploads should consume MultipartDecoder events directly instead.
class MultipartFormData {
 public:
  // Default constructor creates an empty MultipartFormData, that can be filled with consume().
  MultipartFormData() noexcept = default;

  // Parse multipart/form-data from the given content-type header and body without throwing on malformed input.
  // Throws invalid_argument if 'config' is invalid.
  MultipartFormData(std::string_view contentTypeHeader, std::string_view body,
                    const MultipartDecoderConfig &config = {});

  // Adds a decoder event to the form being built.
  void consume(DecodeEvent &&event);

  // Marks the form as invalid, dropping the parts aggregated so far.
  void fail(DecodeError error);

  // Get all parsed parts
  [[nodiscard]] std::span<const FormField> parts() const noexcept { return {_parts.data(), _parts.size()}; }

  // Check if any parts were parsed
  [[nodiscard]] bool empty() const noexcept { return _parts.empty(); }

  // Get the first part with the given name, or nullptr if not found
  [[nodiscard]] const FormField *part(std::string_view name) const noexcept;

  // Get all parts with the given name
  [[nodiscard]] vector<std::reference_wrapper<const FormField>> parts(std::string_view name) const;

  // Check if the MultipartFormData was successfully parsed
  [[nodiscard]] bool valid() const noexcept { return _invalidReason.empty(); }

  // If not valid(), get the reason for invalidity
  [[nodiscard]] std::string_view invalidReason() const noexcept { return _invalidReason; }

  [[nodiscard]] DecodeError error() const noexcept { return _error; }

 private:
  vector<FormField> _parts;
  std::string_view _invalidReason;  // empty if valid
  DecodeError _error{DecodeError::None};
};

}  // namespace partstream
