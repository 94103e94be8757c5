/***
 * Name: stackbridge::exceptions::StackbridgeException
 * Purpose: Root of the library's exceptions; owns the message returned by what().
 */
#include "stackbridge/exceptions/stackbridge_exception.h"

#include <utility>

namespace stackbridge::exceptions {

StackbridgeException::StackbridgeException(std::string msg) noexcept : message_(std::move(msg)) {}

const char* StackbridgeException::what() const noexcept { return message_.c_str(); }

}  // namespace stackbridge::exceptions
