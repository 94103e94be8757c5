/***
 * Name: stackbridge::marshal (error bridge)
 * Purpose: Move errors across the native/interpreter boundary in both directions.
 * Inputs: MarshalError (native side) or vm::ErrorObject (interpreter side)
 * Outputs: Error objects the interpreter can inspect, or typed native exceptions
 * Theory of Operation:
 *   - An error object carries the stable kind tag of ErrorKindName plus the
 *     message, so interpreter code can branch on the kind.
 *   - raise_error is the native way to abort the running callback with an
 *     interpreter error; State::pcall turns it into an Error slot.
 *   - throw_native_error maps a kind tag back to its MarshalError subclass.
 *     Unknown tags become RuntimeError.
 */
#pragma once

#include "stackbridge/exceptions/marshal_error.h"
#include "stackbridge/vm/ErrorObject.h"

namespace stackbridge::marshal {
    vm::ErrorObject to_error_object(const exceptions::MarshalError &err);

    // Throws exceptions::RaisedError carrying obj.
    void raise_error(vm::ErrorObject obj);

    // Throws the MarshalError subclass matching obj.kind.
    void throw_native_error(const vm::ErrorObject &obj);
} // namespace stackbridge::marshal
