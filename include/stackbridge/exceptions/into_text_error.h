/***
 * Name: stackbridge::exceptions::IntoTextError
 * Purpose: Failure of the consuming text conversion; hands the bytes back.
 * Inputs: Offset of the first violation and the buffer that failed to convert
 * Outputs: Exception object exposing offset(), buffer() and take_buffer()
 * Theory of Operation: OwnedBuffer::into_text consumes its receiver; on failure
 *   the buffer is moved into the exception so callers can recover the raw data.
 *   The bytes are held through a shared_ptr: copies of the exception share them,
 *   so copying never allocates. take_buffer() empties the shared buffer for all copies.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/exceptions/invalid_encoding_error.h"

namespace stackbridge {
namespace exceptions {

class IntoTextError : public InvalidEncodingError {
 public:
  IntoTextError(std::size_t offset, buffer::OwnedBuffer bytes)
      : InvalidEncodingError(offset),
        bytes_(std::make_shared<buffer::OwnedBuffer>(std::move(bytes))) {}

  const buffer::OwnedBuffer& buffer() const noexcept { return *bytes_; }
  buffer::OwnedBuffer take_buffer() noexcept { return std::move(*bytes_); }

 private:
  std::shared_ptr<buffer::OwnedBuffer> bytes_;
};

}  // namespace exceptions
}  // namespace stackbridge
