#include "partstream/percent-decode.hpp"

#include "partstream/char-hexadecimal-converter.hpp"

namespace partstream {

char* PercentDecodeInPlace(char* first, char* last) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%' || first + 2 >= last) {
      *out++ = ch;
      continue;
    }
    const int v1 = from_hex_digit(first[1]);
    const int v2 = from_hex_digit(first[2]);
    if (v1 < 0 || v2 < 0) {
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

}  // namespace partstream
