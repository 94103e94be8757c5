/***
 * Name: stackbridge::exceptions::TypeMismatchError
 * Purpose: The inspected stack slot does not carry the tag the native type expects.
 * Inputs: Expected type description and the actual slot tag
 * Outputs: Exception object exposing expected() and actual()
 */
#pragma once

#include <string>

#include "stackbridge/exceptions/marshal_error.h"
#include "stackbridge/vm/TypeTag.h"

namespace stackbridge {
namespace exceptions {

class TypeMismatchError : public MarshalError {
 public:
  TypeMismatchError(std::string expected, vm::TypeTag actual);

  // Rebuilt from an interpreter error object: message kept verbatim, actual unknown.
  explicit TypeMismatchError(std::string message);

  const std::string& expected() const noexcept { return expected_; }
  vm::TypeTag actual() const noexcept { return actual_; }

 private:
  std::string expected_;
  vm::TypeTag actual_;
};

}  // namespace exceptions
}  // namespace stackbridge
