#include "partstream/multipart-form-data.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "partstream/boundary-scanner.hpp"
#include "partstream/decode-event.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-decoder.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/options-header.hpp"
#include "partstream/vector.hpp"

namespace partstream {

MultipartFormData::MultipartFormData(std::string_view contentTypeHeader, std::string_view body,
                                     const MultipartDecoderConfig &config) {
  config.validate();

  const std::string boundary = ExtractBoundary(contentTypeHeader);
  if (boundary.empty()) {
    _invalidReason = "multipart/form-data boundary missing";
    _error = DecodeError::EmptyBoundary;
    return;
  }
  const DecodeError boundaryError = ValidateBoundary(boundary);
  if (boundaryError != DecodeError::None) {
    fail(boundaryError);
    return;
  }

  MultipartDecoder decoder(boundary, config);
  vector<DecodeEvent> events;
  DecodeError error = decoder.feed(body, events);
  for (DecodeEvent &event : events) {
    consume(std::move(event));
  }
  if (error == DecodeError::None) {
    error = decoder.finish();
  }
  if (error != DecodeError::None) {
    fail(error);
  }
}

void MultipartFormData::consume(DecodeEvent &&event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PartStarted>) {
          auto &field = _parts.emplace_back();
          if (const auto contentType = evt.contentType()) {
            field.contentType.emplace(*contentType);
          }
          field.name = std::move(evt.name);
          field.filename = std::move(evt.filename);
          field.headers = std::move(evt.headers);
        } else if constexpr (std::is_same_v<T, BodyChunk>) {
          if (!_parts.empty()) {
            _parts.back().value.append(evt.data);
          }
        }
      },
      std::move(event));
}

void MultipartFormData::fail(DecodeError error) {
  _parts.clear();
  _error = error;
  _invalidReason = ErrorMessage(error);
}

const FormField *MultipartFormData::part(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_parts, [name](const FormField &field) { return field.name == name; });
  return it == _parts.end() ? nullptr : &*it;
}

vector<std::reference_wrapper<const FormField>> MultipartFormData::parts(std::string_view name) const {
  vector<std::reference_wrapper<const FormField>> matches;
  std::ranges::copy_if(_parts, std::back_inserter(matches), [&](const FormField &field) { return field.name == name; });
  return matches;
}

}  // namespace partstream
