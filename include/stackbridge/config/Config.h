/***
 * Name: stackbridge::config
 * Purpose: Runtime configuration for stack handles and diagnostics.
 * Inputs: Environment variables STACKBRIDGE_DEBUG, STACKBRIDGE_STACK_LIMIT,
 *         STACKBRIDGE_MAX_CALL_DEPTH
 * Outputs: Config values consumed by vm::State and the debug logger
 * Theory of Operation: Values are parsed strictly; malformed numbers raise
 *   exceptions::ConfigError instead of silently falling back to defaults.
 */
#pragma once

#include <cstddef>

namespace stackbridge::config {

inline constexpr std::size_t kDefaultStackLimit = 8000;
inline constexpr std::size_t kDefaultMaxCallDepth = 200;

struct Config {
  bool debug{false};                              // STACKBRIDGE_DEBUG
  std::size_t stackLimit{kDefaultStackLimit};     // STACKBRIDGE_STACK_LIMIT
  std::size_t maxCallDepth{kDefaultMaxCallDepth}; // STACKBRIDGE_MAX_CALL_DEPTH
};

/*** LoadConfigFromEnv: Build a Config from the process environment. */
Config LoadConfigFromEnv();

/*** LoadConfig: Build a Config from an environment lookup (name -> value or nullptr). */
Config LoadConfig(const char* (*lookup)(const char* name));

}  // namespace stackbridge::config
