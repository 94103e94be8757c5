/**
 * @file
 * @brief Strict/lossy text checks over raw bytes using ICU's UTF-8 macros.
 */
#include "stackbridge/buffer/Utf8.h"

#include <unicode/utf8.h>

#include <cstdint>

namespace stackbridge::buffer::detail {

static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

std::optional<std::size_t> first_invalid_text_offset(std::string_view bytes) {
  const auto* s = reinterpret_cast<const uint8_t*>(bytes.data());
  const std::size_t length = bytes.size();
  std::size_t i = 0;
  while (i < length) {
    const std::size_t start = i;
    UChar32 c = 0;
    U8_NEXT(s, i, length, c);
    if (c <= 0) { return start; } // ill-formed (U_SENTINEL) or NUL
  }
  return std::nullopt;
}

std::string replace_invalid_text(std::string_view bytes) {
  const auto* s = reinterpret_cast<const uint8_t*>(bytes.data());
  const std::size_t length = bytes.size();
  std::string out;
  out.reserve(length + 2);
  std::size_t i = 0;
  while (i < length) {
    const std::size_t start = i;
    UChar32 c = 0;
    // U8_NEXT consumes exactly one maximal subpart of an ill-formed sequence.
    U8_NEXT(s, i, length, c);
    if (c <= 0) {
      out.append(kReplacement, 3);
    } else {
      out.append(bytes.data() + start, i - start);
    }
  }
  return out;
}

bool append_code_point(std::string& out, char32_t cp) {
  uint8_t buf[U8_MAX_LENGTH];
  std::size_t n = 0;
  bool isError = false;
  U8_APPEND(buf, n, U8_MAX_LENGTH, static_cast<UChar32>(cp), isError);
  if (isError) { return false; }
  out.append(reinterpret_cast<const char*>(buf), n);
  return true;
}

} // namespace stackbridge::buffer::detail
