/***
 * Name: stackbridge::vm::to_error_object
 * Purpose: Convert a native marshal error into the interpreter-visible error value.
 */
#include "stackbridge/vm/ErrorObject.h"
#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge::vm {

ErrorObject to_error_object(const exceptions::MarshalError& err) {
  return ErrorObject{exceptions::ErrorKindName(err.kind()), err.what()};
}

} // namespace stackbridge::vm
