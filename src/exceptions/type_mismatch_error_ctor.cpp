/***
 * Name: stackbridge::exceptions::TypeMismatchError::TypeMismatchError
 * Purpose: Build the message "expected <type>, got <tag>".
 */
#include "stackbridge/exceptions/type_mismatch_error.h"

#include <utility>

namespace stackbridge::exceptions {

TypeMismatchError::TypeMismatchError(std::string expected, vm::TypeTag actual)
    : MarshalError(ErrorKind::TypeMismatch, "expected " + expected + ", got " + vm::TypeTagName(actual)),
      expected_(std::move(expected)),
      actual_(actual) {}

TypeMismatchError::TypeMismatchError(std::string message)
    : MarshalError(ErrorKind::TypeMismatch, std::move(message)), actual_(vm::TypeTag::None) {}

}  // namespace stackbridge::exceptions
