/***
 * Name: stackbridge::exceptions::RuntimeError
 * Purpose: Interpreter-side error whose kind tag is not one of the marshal kinds.
 * Inputs: Error message
 * Outputs: Exception object
 */
#pragma once

#include <string>
#include <utility>

#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge {
namespace exceptions {

class RuntimeError : public MarshalError {
 public:
  explicit RuntimeError(std::string msg) noexcept : MarshalError(ErrorKind::Runtime, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackbridge
