/***
 * Name: stackbridge::support::ParseSizeStrict
 * Purpose: Parse a base-10 size without throwing; fail on signs, junk and overflow.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed value on success
 *   - err: optional error message on failure
 * Theory of Operation: Skip leading whitespace and an optional '+', reject '-',
 *   then hand the digits to ParseDigitsStrict bounded by SIZE_MAX.
 */
#include "stackbridge/support/parse.h"
#include "stackbridge/support/parse_util.h"

#include <cctype>
#include <limits>

namespace stackbridge::support {

static bool fail_with(std::string* err, const char* msg) {
  if (err != nullptr) { *err = msg; }
  return false;
}

auto ParseSizeStrict(std::string_view text, std::size_t& out_val, std::string* err) -> bool {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) { text.remove_prefix(1); }
  if (!text.empty() && text.front() == '-') { return fail_with(err, "negative value"); }
  if (!text.empty() && text.front() == '+') { text.remove_prefix(1); }
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) == 0) {
    return fail_with(err, "invalid integer literal");
  }
  unsigned long long value = 0;
  if (!ParseDigitsStrict(text, std::numeric_limits<std::size_t>::max(), value, err)) { return false; }
  out_val = static_cast<std::size_t>(value);
  return true;
}

}  // namespace stackbridge::support
