/**
 * @file
 * @brief Strict and lossy text helpers for buffer contents.
 *
 * "Text" is well-formed UTF-8 that contains no NUL byte, i.e. something a C
 * consumer can read up to its terminator without losing content.
 *
 * The lossy conversion follows the same rule, so it differs from plain UTF-8
 * lossy decoding: a NUL byte is valid UTF-8 but is still replaced by U+FFFD.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace stackbridge::buffer::detail {

// Offset of the first byte that breaks the text rules; nullopt when bytes are text.
std::optional<std::size_t> first_invalid_text_offset(std::string_view bytes);

// Copy of bytes with every NUL and every maximal ill-formed subsequence replaced by U+FFFD.
std::string replace_invalid_text(std::string_view bytes);

// Append the UTF-8 encoding of cp; false for surrogates and values above U+10FFFF.
bool append_code_point(std::string& out, char32_t cp);

} // namespace stackbridge::buffer::detail
