/***
 * Name: stackbridge::exceptions::EncodeError
 * Purpose: A native value has no representation on the interpreter stack.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Raised for unsigned values above INT64_MAX, nil or NaN table
 *   keys, and table elements that do not produce exactly one slot.
 */
#pragma once

#include <string>
#include <utility>

#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge {
namespace exceptions {

class EncodeError : public MarshalError {
 public:
  explicit EncodeError(std::string msg) noexcept : MarshalError(ErrorKind::Encode, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackbridge
