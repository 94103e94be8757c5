/***
 * Name: stackbridge::support (parse_util)
 * Purpose: Bounded digit-run parsing behind ParseSizeStrict.
 * Inputs: Digits (trailing whitespace allowed) and an upper bound
 * Outputs: Parsed value and status; message through err on failure
 */
#pragma once

#include <string>
#include <string_view>

namespace stackbridge {
namespace support {

/*** ParseDigitsStrict: Parse contiguous base-10 digits up to max; stop at whitespace; set err on failure. */
bool ParseDigitsStrict(std::string_view text, unsigned long long max, unsigned long long& value, std::string* err);

}  // namespace support
}  // namespace stackbridge
