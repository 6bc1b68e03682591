#include "partstream/options-header.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "partstream/multipart-constants.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/percent-decode.hpp"
#include "partstream/string-equal-ignore-case.hpp"
#include "partstream/string-trim.hpp"
#include "partstream/toupperlower.hpp"

namespace partstream {
namespace {

std::size_t SkipOws(std::string_view str, std::size_t pos) {
  while (pos < str.size() && IsOws(str[pos])) {
    ++pos;
  }
  return pos;
}

// Reads the quoted-string starting just after its opening quote at 'pos' into 'out'.
// Returns the position following the closing quote, or npos if the string is not terminated.
std::size_t ReadQuotedString(std::string_view str, std::size_t pos, std::string& out) {
  for (; pos < str.size(); ++pos) {
    const char ch = str[pos];
    if (ch == '"') {
      return pos + 1;
    }
    if (ch == '\\' && pos + 1 < str.size() && (str[pos + 1] == '"' || str[pos + 1] == '\\')) {
      ++pos;
    }
    out.push_back(str[pos]);
  }
  return std::string_view::npos;
}

// Strips an RFC 2231 continuation suffix ("*<digits>") from 'name', returning its index.
std::optional<unsigned> StripContinuationIndex(std::string& name) {
  const auto star = name.rfind('*');
  if (star == std::string::npos || star + 1 == name.size()) {
    return std::nullopt;
  }
  unsigned index = 0;
  const char* first = name.data() + star + 1;
  const char* last = name.data() + name.size();
  const auto [ptr, errc] = std::from_chars(first, last, index);
  if (errc != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  name.resize(star);
  return index;
}

bool AddParam(vector<HeaderParam>& params, std::string_view rawName, std::string value) {
  std::string name(rawName);
  std::ranges::transform(name, name.begin(), [](char ch) { return tolower(ch); });

  bool extended = false;
  if (name.ends_with('*')) {
    extended = true;
    name.pop_back();
  }
  const auto index = StripContinuationIndex(name);
  if (name.empty()) {
    return false;
  }

  if (extended) {
    if (!index || *index == 0) {
      // charset'language'value, only the first piece of a continuation carries the prefix
      const auto firstTick = value.find('\'');
      if (firstTick == std::string::npos) {
        return false;
      }
      const auto secondTick = value.find('\'', firstTick + 1);
      if (secondTick == std::string::npos) {
        return false;
      }
      value.erase(0, secondTick + 1);
    }
    char* newEnd = PercentDecodeInPlace(value.data(), value.data() + value.size());
    value.resize(static_cast<std::size_t>(newEnd - value.data()));
  }

  if (index && *index != 0) {
    for (auto pos = params.size(); pos != 0; --pos) {
      HeaderParam& previous = params[pos - 1];
      if (previous.name == name) {
        previous.value.append(value);
        previous.extended = previous.extended || extended;
        return true;
      }
    }
  }

  params.emplace_back(std::move(name), std::move(value), extended);
  return true;
}

}  // namespace

std::optional<std::string_view> OptionsHeader::param(std::string_view name) const noexcept {
  const HeaderParam* plain = nullptr;
  for (const HeaderParam& param : params) {
    if (param.name != name) {
      continue;
    }
    if (param.extended) {
      return std::string_view(param.value);
    }
    if (plain == nullptr) {
      plain = &param;
    }
  }
  if (plain == nullptr) {
    return std::nullopt;
  }
  return std::string_view(plain->value);
}

OptionsHeader ParseOptionsHeader(std::string_view headerValue) {
  OptionsHeader ret;

  auto pos = headerValue.find(';');
  ret.value = TrimOws(headerValue.substr(0, pos));

  const auto size = headerValue.size();
  while (pos < size) {
    pos = SkipOws(headerValue, pos + 1);  // skip ';'
    if (pos == size || headerValue[pos] == ';') {
      ret.error = HeaderError::Malformed;  // empty parameter
      return ret;
    }

    const auto nameEnd = headerValue.find_first_of("=;", pos);
    if (nameEnd == std::string_view::npos || headerValue[nameEnd] == ';') {
      ret.error = HeaderError::Malformed;  // parameter without value
      return ret;
    }
    const std::string_view rawName = TrimOws(headerValue.substr(pos, nameEnd - pos));

    std::string value;
    pos = SkipOws(headerValue, nameEnd + 1);
    if (pos < size && headerValue[pos] == '"') {
      pos = ReadQuotedString(headerValue, pos + 1, value);
      if (pos == std::string_view::npos) {
        ret.error = HeaderError::Malformed;
        return ret;
      }
      pos = SkipOws(headerValue, pos);
      if (pos < size && headerValue[pos] != ';') {
        ret.error = HeaderError::Malformed;  // garbage after the closing quote
        return ret;
      }
    } else {
      const auto valueEnd = std::min(headerValue.find(';', pos), size);
      value = TrimOws(headerValue.substr(pos, valueEnd - pos));
      pos = valueEnd;
    }

    if (!AddParam(ret.params, rawName, std::move(value))) {
      ret.error = HeaderError::Malformed;
      return ret;
    }
  }
  return ret;
}

std::string ExtractBoundary(std::string_view contentTypeHeader) {
  const OptionsHeader header = ParseOptionsHeader(contentTypeHeader);
  if (header.error != HeaderError::None || !CaseInsensitiveEqual(header.value, mime::MultipartFormData)) {
    return {};
  }
  return std::string(header.param(mime::BoundaryParam).value_or(std::string_view{}));
}

}  // namespace partstream
