/***
 * Name: stackbridge::marshal (error bridge impl)
 * Purpose: to_error_object, raise_error and throw_native_error.
 * Theory of Operation: throw_native_error parses the trailing offset of
 *   invalid_encoding messages ("... byte offset N"); 0 when absent.
 */
#include "stackbridge/marshal/ErrorBridge.h"
#include "stackbridge/exceptions/decode_error.h"
#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/exceptions/invalid_encoding_error.h"
#include "stackbridge/exceptions/raised_error.h"
#include "stackbridge/exceptions/runtime_error.h"
#include "stackbridge/exceptions/stack_overflow_error.h"
#include "stackbridge/exceptions/type_mismatch_error.h"
#include "stackbridge/support/parse.h"

#include <optional>
#include <string_view>
#include <utility>

namespace stackbridge::marshal {

static std::size_t trailing_offset(std::string_view message) {
  const std::size_t pos = message.find_last_of(' ');
  std::size_t offset = 0;
  if (pos == std::string_view::npos || !support::ParseSizeStrict(message.substr(pos + 1), offset)) { return 0; }
  return offset;
}

vm::ErrorObject to_error_object(const exceptions::MarshalError& err) { return vm::to_error_object(err); }

void raise_error(vm::ErrorObject obj) { throw exceptions::RaisedError(std::move(obj)); }

void throw_native_error(const vm::ErrorObject& obj) {
  const std::optional<exceptions::ErrorKind> kind = exceptions::ParseErrorKind(obj.kind);
  if (!kind) { throw exceptions::RuntimeError(obj.kind + ": " + obj.message); }
  switch (*kind) {
    case exceptions::ErrorKind::InvalidEncoding:
      throw exceptions::InvalidEncodingError(trailing_offset(obj.message));
    case exceptions::ErrorKind::TypeMismatch:
      throw exceptions::TypeMismatchError(obj.message);
    case exceptions::ErrorKind::Decode:
      throw exceptions::DecodeError(obj.message);
    case exceptions::ErrorKind::Encode:
      throw exceptions::EncodeError(obj.message);
    case exceptions::ErrorKind::StackOverflow:
      throw exceptions::StackOverflowError(obj.message);
    case exceptions::ErrorKind::Runtime:
      break;
  }
  throw exceptions::RuntimeError(obj.message);
}

} // namespace stackbridge::marshal
