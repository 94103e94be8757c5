/***
 * Name: stackbridge::exceptions::MarshalError::MarshalError
 * Purpose: Construct a marshal error of a given kind.
 */
#include "stackbridge/exceptions/marshal_error.h"

#include <utility>

namespace stackbridge::exceptions {

MarshalError::MarshalError(ErrorKind kind, std::string msg) noexcept
    : StackbridgeException(std::move(msg)), kind_(kind) {}

}  // namespace stackbridge::exceptions
