#include "partstream/part-headers.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <string_view>

#include "partstream/string-equal-ignore-case.hpp"
#include "partstream/tchars.hpp"
#include "partstream/toupperlower.hpp"

namespace partstream {

std::string HeaderField::lowerName() const {
  std::string ret(name);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return tolower(ch); });
  return ret;
}

void PartHeaders::append(std::string_view name, std::string_view value) {
  _fields.emplace_back(std::string(name), std::string(value));
}

void PartHeaders::appendToLastValue(std::string_view continuation) {
  assert(!_fields.empty());
  std::string& value = _fields.back().value;
  if (!value.empty() && !continuation.empty()) {
    value.push_back(' ');
  }
  value.append(continuation);
}

std::optional<std::string_view> PartHeaders::get(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_fields, [name](const HeaderField& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

bool PartHeaders::operator==(const PartHeaders& rhs) const noexcept {
  return std::ranges::equal(_fields, rhs._fields);
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return is_tchar(ch); });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::none_of(value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; });
}

}  // namespace partstream
