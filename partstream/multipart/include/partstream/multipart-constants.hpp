#pragma once

#include <cstddef>
#include <string_view>

namespace partstream::mime {

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";
inline constexpr std::string_view DoubleDash = "--";

// Header field names, in their canonical form for emission. Lookups are case-insensitive.
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentType = "Content-Type";

inline constexpr std::string_view FormData = "form-data";
inline constexpr std::string_view MultipartFormData = "multipart/form-data";

// Content-Disposition and Content-Type parameters
inline constexpr std::string_view NameParam = "name";
inline constexpr std::string_view FilenameParam = "filename";
inline constexpr std::string_view BoundaryParam = "boundary";

// RFC 2046 §5.1.1: boundary := 0*69<bchars> bcharsnospace
inline constexpr std::size_t kMaxBoundaryLength = 70;

// Upper bound of SP / HTAB accepted between a boundary and the CRLF ending its delimiter line.
inline constexpr std::size_t kMaxTransportPadding = 64;

}  // namespace partstream::mime
