#pragma once

#include <cstdint>
#include <string_view>

#include "partstream/internal/raw-bytes-base.hpp"

namespace partstream {

// A byte buffer specialized for character data.
using RawChars = RawBytesBase<char, std::string_view, std::uint64_t>;

}  // namespace partstream
