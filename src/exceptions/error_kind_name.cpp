/***
 * Name: stackbridge::exceptions::ErrorKindName / ParseErrorKind
 * Purpose: Map error kinds to the stable tags carried by interpreter error objects.
 * Inputs: ErrorKind, or a tag string
 * Outputs: Tag string, or the matching kind
 * Theory of Operation: The tags are part of the interpreter-visible contract and
 *   must not change once published.
 */
#include "stackbridge/exceptions/marshal_error.h"

namespace stackbridge::exceptions {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidEncoding: return "invalid_encoding";
    case ErrorKind::TypeMismatch: return "type_mismatch";
    case ErrorKind::Decode: return "decode";
    case ErrorKind::Encode: return "encode";
    case ErrorKind::StackOverflow: return "stack_overflow";
    case ErrorKind::Runtime: return "runtime";
  }
  return "runtime";
}

std::optional<ErrorKind> ParseErrorKind(std::string_view tag) {
  for (const ErrorKind kind : {ErrorKind::InvalidEncoding, ErrorKind::TypeMismatch, ErrorKind::Decode,
                               ErrorKind::Encode, ErrorKind::StackOverflow, ErrorKind::Runtime}) {
    if (tag == ErrorKindName(kind)) { return kind; }
  }
  return std::nullopt;
}

}  // namespace stackbridge::exceptions
