/***
 * Name: stackbridge::exceptions::RaisedError
 * Purpose: An interpreter error object in flight toward the nearest protected call.
 * Inputs: The error object to deliver
 * Outputs: Exception object exposing object()
 * Theory of Operation: Thrown by marshal::raise_error and caught by vm::State::pcall,
 *   which places object() on the stack as an Error slot.
 */
#pragma once

#include "stackbridge/exceptions/stackbridge_exception.h"
#include "stackbridge/vm/ErrorObject.h"

namespace stackbridge {
namespace exceptions {

class RaisedError : public StackbridgeException {
 public:
  explicit RaisedError(vm::ErrorObject obj);

  const vm::ErrorObject& object() const noexcept { return object_; }

 private:
  vm::ErrorObject object_;
};

}  // namespace exceptions
}  // namespace stackbridge
