/***
 * Name: stackbridge::exceptions::InvalidEncodingError
 * Purpose: Bytes are not text where strict decoding was requested.
 * Inputs: Byte offset of the first violation
 * Outputs: Exception object exposing offset()
 * Theory of Operation: Text means well-formed UTF-8 without NUL bytes; the offset
 *   points at the first byte of the offending sequence.
 */
#pragma once

#include <cstddef>

#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge {
namespace exceptions {

class InvalidEncodingError : public MarshalError {
 public:
  explicit InvalidEncodingError(std::size_t offset);

  std::size_t offset() const noexcept { return offset_; }

 private:
  std::size_t offset_;
};

}  // namespace exceptions
}  // namespace stackbridge
