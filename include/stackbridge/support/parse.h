/***
 * Name: stackbridge::support::ParseSizeStrict
 * Purpose: Parse a non-negative base-10 size from a string view without throwing.
 * Inputs: Text containing optional leading spaces, an optional '+', and digits; optional error out
 * Outputs: Parsed value via out_val; returns true on success
 * Theory of Operation: Validates characters and range; ignores trailing whitespace.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace stackbridge {
namespace support {

bool ParseSizeStrict(std::string_view text, std::size_t& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace stackbridge
