/***
 * Name: stackbridge::exceptions::StackbridgeException
 * Purpose: Base class for all stackbridge exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but every throw in stackbridge uses a custom type derived from this base. The
 *   only exception is std::bad_alloc, which is fatal at this layer.
 */
#pragma once

#include <exception>
#include <string>

namespace stackbridge {
namespace exceptions {

class StackbridgeException : public std::exception {
 public:
  ~StackbridgeException() noexcept override = default;
  const char* what() const noexcept override;

 protected:
  explicit StackbridgeException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace stackbridge
