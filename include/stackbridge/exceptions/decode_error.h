/***
 * Name: stackbridge::exceptions::DecodeError
 * Purpose: A slot had the right tag but its content does not fit the native shape.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Raised for out-of-range integers, non-integral numbers and
 *   invalid text popped into strict text types.
 */
#pragma once

#include <string>
#include <utility>

#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge {
namespace exceptions {

class DecodeError : public MarshalError {
 public:
  explicit DecodeError(std::string msg) noexcept : MarshalError(ErrorKind::Decode, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackbridge
