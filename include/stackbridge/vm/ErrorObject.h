/***
 * Name: stackbridge::vm::ErrorObject
 * Purpose: Interpreter-visible error value: a stable kind tag plus a readable message.
 */
#pragma once

#include <string>

namespace stackbridge::exceptions {
    class MarshalError;
} // namespace stackbridge::exceptions

namespace stackbridge::vm {
    struct ErrorObject {
        std::string kind;
        std::string message;
    };

    inline bool operator==(const ErrorObject &a, const ErrorObject &b) {
        return a.kind == b.kind && a.message == b.message;
    }

    inline bool operator!=(const ErrorObject &a, const ErrorObject &b) { return !(a == b); }

    // Kind tag from ErrorKindName, message from what().
    ErrorObject to_error_object(const exceptions::MarshalError &err);
} // namespace stackbridge::vm
