/***
 * Name: stackbridge::exceptions::MarshalError
 * Purpose: Umbrella exception for every failure of the push/pop protocol and of
 *          strict text decoding.
 * Inputs: Error kind and message
 * Outputs: Exception object exposing kind() and what()
 * Theory of Operation: The kind is a closed enumeration with a stable string tag
 *   per value. The tag is what crosses into the interpreter (see
 *   marshal::to_error_object) so interpreter-side code can branch on it.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "stackbridge/exceptions/stackbridge_exception.h"

namespace stackbridge {
namespace exceptions {

enum class ErrorKind : uint32_t {
  InvalidEncoding = 1,
  TypeMismatch = 2,
  Decode = 3,
  Encode = 4,
  StackOverflow = 5,
  Runtime = 6
};

/*** ErrorKindName: Stable tag for an error kind ("type_mismatch", ...). */
const char* ErrorKindName(ErrorKind kind);

/*** ParseErrorKind: Inverse of ErrorKindName; nullopt for unknown tags. */
std::optional<ErrorKind> ParseErrorKind(std::string_view tag);

class MarshalError : public StackbridgeException {
 public:
  ErrorKind kind() const noexcept { return kind_; }

 protected:
  MarshalError(ErrorKind kind, std::string msg) noexcept;

 private:
  ErrorKind kind_;
};

}  // namespace exceptions
}  // namespace stackbridge
