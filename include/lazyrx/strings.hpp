#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <lazyrx/main.h>

namespace lrx {

// Case-insensitive string comparison, both of which must be the same length.

[[nodiscard]] inline bool iequals(const std::string_view lhs, const std::string_view rhs) noexcept
{
   if (lhs.size() != rhs.size()) return false;
   return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
       return std::tolower((uint8_t)(a)) IS std::tolower((uint8_t)(b));
   });
}

// Returns the number of bytes used by the UTF-8 character at the start of String.  The length is taken from the lead
// byte; a stray continuation byte, an invalid lead byte or a truncated sequence counts as a single byte.

[[nodiscard]] inline size_t utf8_char_length(const std::string_view String) noexcept
{
   if (String.empty()) return 0;

   const auto lead = uint8_t(String[0]);
   size_t len;
   if (lead < 0x80) return 1;
   else if ((lead & 0xe0) IS 0xc0) len = 2;
   else if ((lead & 0xf0) IS 0xe0) len = 3;
   else if ((lead & 0xf8) IS 0xf0) len = 4;
   else return 1;

   if (len > String.size()) return 1;
   for (size_t i=1; i < len; i++) {
      if ((uint8_t(String[i]) & 0xc0) != 0x80) return 1;
   }
   return len;
}

} // namespace lrx
