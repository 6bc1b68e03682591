#include "partstream/multipart-encoder.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "partstream/boundary-scanner.hpp"
#include "partstream/invalid_argument_exception.hpp"
#include "partstream/log.hpp"
#include "partstream/multipart-constants.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/part-headers.hpp"
#include "partstream/raw-chars.hpp"
#include "partstream/string-equal-ignore-case.hpp"
#include "partstream/tchars.hpp"
#include "partstream/vector.hpp"

namespace partstream {

namespace {

void CheckPart(const PartDescriptor &part) {
  if (part.name.empty()) {
    throw invalid_argument("multipart part name must not be empty");
  }
  if (!IsValidHeaderValue(part.name)) {
    throw invalid_argument("multipart part name contains CR, LF or NUL");
  }
  if (part.filename && !IsValidHeaderValue(*part.filename)) {
    throw invalid_argument("multipart part '{}' filename contains CR, LF or NUL", part.name);
  }
  if (part.contentType && !IsValidHeaderValue(*part.contentType)) {
    throw invalid_argument("multipart part '{}' content type contains CR, LF or NUL", part.name);
  }
  for (const HeaderField &field : part.headers) {
    if (!IsValidHeaderName(field.name)) {
      throw invalid_argument("multipart part '{}' has an invalid header name '{}'", part.name, field.name);
    }
    if (!IsValidHeaderValue(field.value)) {
      throw invalid_argument("multipart part '{}' header '{}' has an invalid value", part.name, field.name);
    }
  }
}

bool IsEmittedExtraHeader(const PartDescriptor &part, std::string_view headerName) {
  if (CaseInsensitiveEqual(headerName, mime::ContentDisposition)) {
    return false;
  }
  return !part.contentType || !CaseInsensitiveEqual(headerName, mime::ContentType);
}

void AppendHeaderLine(RawChars &out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(std::string_view(": "));
  out.append(value);
  out.append(mime::CRLF);
}

void AppendDelimiter(RawChars &out, std::string_view boundary) {
  out.append(mime::CRLF);
  out.append(mime::DoubleDash);
  out.append(boundary);
}

// Delimiter line and header block of 'part', blank line included.
void AppendPartHead(RawChars &out, std::string_view boundary, const PartDescriptor &part) {
  AppendDelimiter(out, boundary);
  out.append(mime::CRLF);

  out.append(mime::ContentDisposition);
  out.append(std::string_view(": "));
  out.append(mime::FormData);
  out.append(std::string_view("; "));
  out.append(mime::NameParam);
  out.push_back('=');
  AppendQuoted(out, part.name);
  if (part.filename) {
    out.append(std::string_view("; "));
    out.append(mime::FilenameParam);
    out.push_back('=');
    AppendQuoted(out, *part.filename);
  }
  out.append(mime::CRLF);

  if (part.contentType) {
    AppendHeaderLine(out, mime::ContentType, *part.contentType);
  }
  for (const HeaderField &field : part.headers) {
    if (IsEmittedExtraHeader(part, field.name)) {
      AppendHeaderLine(out, field.name, field.value);
    }
  }
  out.append(mime::CRLF);
}

void AppendTerminal(RawChars &out, std::string_view boundary) {
  AppendDelimiter(out, boundary);
  out.append(mime::DoubleDash);
  out.append(mime::CRLF);
}

}  // namespace

void AppendQuoted(RawChars &out, std::string_view value) {
  out.push_back('"');
  for (char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('"');
}

MultipartEncoder::MultipartEncoder(std::string_view boundary, vector<PartDescriptor> parts)
    : _boundary(boundary), _parts(std::move(parts)) {
  const DecodeError error = ValidateBoundary(_boundary);
  if (error != DecodeError::None) {
    throw multipart_exception(error);
  }
  for (const PartDescriptor &part : _parts) {
    CheckPart(part);
  }
}

std::string_view MultipartEncoder::nextChunk() {
  while (true) {
    switch (_stage) {
      case Stage::PartHead:
        if (_partPos == _parts.size()) {
          _stage = Stage::Terminal;
          break;
        }
        _scratch.clear();
        AppendPartHead(_scratch, _boundary, _parts[_partPos]);
        _stage = Stage::PartBody;
        return _scratch;
      case Stage::PartBody: {
        const std::string_view data = _parts[_partPos].body.next();
        if (!data.empty()) {
          return data;
        }
        ++_partPos;
        _stage = Stage::PartHead;
        break;
      }
      case Stage::Terminal:
        _scratch.clear();
        AppendTerminal(_scratch, _boundary);
        _stage = Stage::Done;
        log::debug("multipart encoding finished: {} part(s)", _parts.size());
        return _scratch;
      case Stage::Done:
        return {};
    }
  }
}

void MultipartEncoder::encodeAll(RawChars &out) {
  for (std::string_view chunk = nextChunk(); !chunk.empty(); chunk = nextChunk()) {
    out.append(chunk);
  }
}

std::optional<std::size_t> MultipartEncoder::contentLength() const {
  std::size_t total = 0;
  RawChars head;
  for (const PartDescriptor &part : _parts) {
    const auto bodySize = part.body.size();
    if (!bodySize) {
      return std::nullopt;
    }
    head.clear();
    AppendPartHead(head, _boundary, part);
    total += head.size() + *bodySize;
  }
  head.clear();
  AppendTerminal(head, _boundary);
  return total + head.size();
}

std::string MultipartEncoder::contentTypeHeader() const {
  std::string ret(mime::MultipartFormData);
  ret.append("; ");
  ret.append(mime::BoundaryParam);
  ret.push_back('=');
  if (!_boundary.empty() && std::ranges::all_of(_boundary, [](char ch) { return is_tchar(ch); })) {
    ret.append(_boundary);
  } else {
    RawChars quoted;
    AppendQuoted(quoted, _boundary);
    ret.append(std::string_view(quoted));
  }
  return ret;
}

}  // namespace partstream
