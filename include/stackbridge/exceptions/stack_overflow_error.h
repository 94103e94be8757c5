/***
 * Name: stackbridge::exceptions::StackOverflowError
 * Purpose: The stack slot limit or the nested call limit was exceeded.
 * Inputs: Error message
 * Outputs: Exception object
 */
#pragma once

#include <string>
#include <utility>

#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge {
namespace exceptions {

class StackOverflowError : public MarshalError {
 public:
  explicit StackOverflowError(std::string msg) noexcept
      : MarshalError(ErrorKind::StackOverflow, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackbridge
