/***
 * Name: stackbridge::exceptions::ConfigError
 * Purpose: Exception for malformed configuration values.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from StackbridgeException.
 */
#pragma once

#include <string>
#include <utility>

#include "stackbridge/exceptions/stackbridge_exception.h"

namespace stackbridge {
namespace exceptions {

class ConfigError : public StackbridgeException {
 public:
  explicit ConfigError(std::string msg) noexcept : StackbridgeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackbridge
