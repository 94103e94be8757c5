/***
 * Name: stackbridge::exceptions::RaisedError::RaisedError
 * Purpose: Wrap an interpreter error object; what() is "<kind>: <message>".
 */
#include "stackbridge/exceptions/raised_error.h"

#include <utility>

namespace stackbridge::exceptions {

RaisedError::RaisedError(vm::ErrorObject obj)
    : StackbridgeException(obj.kind + ": " + obj.message), object_(std::move(obj)) {}

}  // namespace stackbridge::exceptions
