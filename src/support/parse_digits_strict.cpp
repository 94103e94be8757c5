/***
 * Name: stackbridge::support::ParseDigitsStrict
 * Purpose: Parse contiguous base-10 digits; stop at whitespace; report errors.
 * Inputs: text view, inclusive maximum, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "stackbridge/support/parse_util.h"

#include <cctype>
#include <string>
#include <string_view>

namespace stackbridge {
namespace support {

auto ParseDigitsStrict(std::string_view text, unsigned long long max, unsigned long long& value,
                       std::string* err) -> bool {
  value = 0;
  constexpr unsigned kBase10 = 10;
  constexpr char kZeroChar = '0';
  bool is_success = true;
  bool trailing = false;
  std::string local_err;
  for (const char digit_char : text) {
    if (std::isspace(static_cast<unsigned char>(digit_char)) != 0) {
      trailing = true;
      continue;
    }
    if (trailing || std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in integer literal";
      is_success = false;
      break;
    }
    const auto digit = static_cast<unsigned long long>(digit_char - kZeroChar);
    if (value > (max - digit) / kBase10) {
      local_err = "integer overflow";
      is_success = false;
      break;
    }
    value = (value * kBase10) + digit;
  }
  if (!is_success) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace stackbridge
