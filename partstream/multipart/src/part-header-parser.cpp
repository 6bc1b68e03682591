#include "partstream/part-header-parser.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "partstream/multipart-constants.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/options-header.hpp"
#include "partstream/part-headers.hpp"
#include "partstream/string-equal-ignore-case.hpp"
#include "partstream/string-trim.hpp"

namespace partstream {

PartHeadersParseResult ParsePartHeaders(std::string_view headerBlock) {
  PartHeadersParseResult ret;
  while (!headerBlock.empty()) {
    std::string_view line;
    const auto lineEnd = headerBlock.find(mime::CRLF);
    if (lineEnd == std::string_view::npos) {
      line = headerBlock;
      headerBlock = {};
    } else {
      line = headerBlock.substr(0, lineEnd);
      headerBlock.remove_prefix(lineEnd + mime::CRLF.size());
    }
    if (line.empty()) {
      continue;
    }

    if (IsOws(line.front())) {
      if (ret.headers.empty()) {
        ret.error = HeaderError::Malformed;
        return ret;
      }
      ret.headers.appendToLastValue(TrimOws(line));
      continue;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      ret.error = HeaderError::Malformed;
      return ret;
    }
    const auto name = TrimOws(line.substr(0, colon));
    if (name.empty()) {
      ret.error = HeaderError::Malformed;
      return ret;
    }
    ret.headers.append(name, TrimOws(line.substr(colon + 1)));
  }
  return ret;
}

ContentDispositionParseResult ParseContentDisposition(std::string_view headerValue) {
  ContentDispositionParseResult ret;

  OptionsHeader options = ParseOptionsHeader(headerValue);
  if (options.error != HeaderError::None || !CaseInsensitiveEqual(options.value, mime::FormData)) {
    ret.error = HeaderError::Malformed;
    return ret;
  }

  const auto name = options.param(mime::NameParam);
  if (!name || name->empty()) {
    ret.error = HeaderError::MissingFieldName;
    return ret;
  }
  ret.name = *name;
  if (const auto filename = options.param(mime::FilenameParam)) {
    ret.filename.emplace(*filename);
  }
  return ret;
}

PartHead ParsePartHead(std::string_view headerBlock) {
  PartHead ret;

  PartHeadersParseResult parsedHeaders = ParsePartHeaders(headerBlock);
  if (parsedHeaders.error != HeaderError::None) {
    ret.error = parsedHeaders.error;
    return ret;
  }
  ret.headers = std::move(parsedHeaders.headers);

  const auto contentDisposition = ret.headers.get(mime::ContentDisposition);
  if (!contentDisposition) {
    ret.error = HeaderError::MissingFieldName;
    return ret;
  }

  ContentDispositionParseResult disposition = ParseContentDisposition(*contentDisposition);
  if (disposition.error != HeaderError::None) {
    ret.error = disposition.error;
    return ret;
  }
  ret.name = std::move(disposition.name);
  ret.filename = std::move(disposition.filename);
  return ret;
}

}  // namespace partstream
