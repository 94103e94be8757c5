/***
 * Name: stackbridge::marshal::detail (scalar helpers)
 * Purpose: Out-of-line checks for integer and text conversions.
 * Theory of Operation:
 *   - A Number converts to an integer only when it is finite, integral and inside
 *     the signed 64-bit range; -2^63 is exact in a double, 2^63 is the first
 *     value past the top.
 */
#include "stackbridge/marshal/Primitives.h"
#include "stackbridge/buffer/Utf8.h"
#include "stackbridge/exceptions/decode_error.h"
#include "stackbridge/exceptions/encode_error.h"

#include <cmath>
#include <optional>
#include <string>

namespace stackbridge::marshal::detail {

static constexpr double kTwoPow63 = 9223372036854775808.0;

int64_t integer_of(const vm::Value& slot) {
  if (slot.tag() == vm::TypeTag::Integer) { return slot.as_integer(); }
  if (slot.tag() != vm::TypeTag::Number) { mismatch("integer", slot); }
  const double d = slot.as_number();
  if (!std::isfinite(d) || std::trunc(d) != d || d < -kTwoPow63 || d >= kTwoPow63) {
    throw exceptions::DecodeError("number " + std::to_string(d) + " has no integer representation");
  }
  return static_cast<int64_t>(d);
}

void throw_integer_range(int64_t value) {
  throw exceptions::DecodeError("integer " + std::to_string(value) + " out of range for the target type");
}

void throw_unsigned_range(unsigned long long value) {
  throw exceptions::EncodeError("integer " + std::to_string(value) + " exceeds the signed 64-bit range");
}

void require_text(std::string_view bytes) {
  const std::optional<std::size_t> bad = buffer::detail::first_invalid_text_offset(bytes);
  if (bad) {
    throw exceptions::DecodeError("invalid UTF-8 text at byte offset " + std::to_string(*bad));
  }
}

} // namespace stackbridge::marshal::detail
