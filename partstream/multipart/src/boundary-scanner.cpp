#include "partstream/boundary-scanner.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "partstream/multipart-constants.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/string-trim.hpp"

namespace partstream {

DecodeError ValidateBoundary(std::string_view boundary) noexcept {
  if (boundary.empty()) {
    return DecodeError::EmptyBoundary;
  }
  if (boundary.size() > mime::kMaxBoundaryLength) {
    return DecodeError::BoundaryTooLong;
  }
  return DecodeError::None;
}

BoundaryScanner::BoundaryScanner(std::string_view boundary) {
  _marker.reserve(mime::CRLF.size() + mime::DoubleDash.size() + boundary.size());
  _marker.append(mime::CRLF);
  _marker.append(mime::DoubleDash);
  _marker.append(boundary);
}

BoundaryMatch BoundaryScanner::classify(std::string_view buffer, std::size_t start,
                                        std::size_t afterBoundary) const noexcept {
  const BoundaryMatch partial{BoundaryMatch::Status::Partial, start, 0, false};
  const BoundaryMatch notFound{};

  std::size_t pos = afterBoundary;
  if (pos == buffer.size()) {
    return partial;
  }
  if (buffer[pos] == '-') {
    if (pos + 1 == buffer.size()) {
      return partial;
    }
    if (buffer[pos + 1] == '-') {
      return {BoundaryMatch::Status::Found, start, pos + 2, true};
    }
    return notFound;
  }

  const std::size_t paddingEnd = std::min(buffer.size(), afterBoundary + mime::kMaxTransportPadding);
  while (pos < paddingEnd && IsOws(buffer[pos])) {
    ++pos;
  }
  if (pos == buffer.size()) {
    return partial;
  }
  if (buffer[pos] != '\r') {
    return notFound;
  }
  if (pos + 1 == buffer.size()) {
    return partial;
  }
  if (buffer[pos + 1] != '\n') {
    return notFound;
  }
  return {BoundaryMatch::Status::Found, start, pos + 2, false};
}

BoundaryMatch BoundaryScanner::find(std::string_view buffer, bool atStreamStart) const noexcept {
  if (atStreamStart) {
    const std::string_view dashBoundary = this->dashBoundary();
    if (buffer.size() < dashBoundary.size()) {
      if (dashBoundary.starts_with(buffer) && !buffer.empty()) {
        return {BoundaryMatch::Status::Partial, 0, 0, false};
      }
    } else if (buffer.starts_with(dashBoundary)) {
      const BoundaryMatch match = classify(buffer, 0, dashBoundary.size());
      if (match.status != BoundaryMatch::Status::NotFound) {
        return match;
      }
    }
  }

  std::size_t searchPos = 0;
  for (auto pos = buffer.find(_marker); pos != std::string_view::npos; pos = buffer.find(_marker, searchPos)) {
    const BoundaryMatch match = classify(buffer, pos, pos + _marker.size());
    if (match.status != BoundaryMatch::Status::NotFound) {
      return match;
    }
    searchPos = pos + 1;
  }

  // The tail of the buffer may be the beginning of a marker completed by the next input.
  const std::size_t tailSize = std::min(buffer.size(), _marker.size() - 1);
  for (std::size_t pos = buffer.size() - tailSize; pos < buffer.size(); ++pos) {
    if (std::string_view(_marker).starts_with(buffer.substr(pos))) {
      return {BoundaryMatch::Status::Partial, pos, 0, false};
    }
  }
  return {};
}

}  // namespace partstream
