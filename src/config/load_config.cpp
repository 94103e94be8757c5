/***
 * Name: stackbridge::config::LoadConfig / LoadConfigFromEnv
 * Purpose: Populate Config from environment variables.
 * Inputs: lookup function (std::getenv for LoadConfigFromEnv)
 * Outputs: Config with defaults for unset variables
 * Theory of Operation: Sizes go through support::ParseSizeStrict; zero and malformed
 *   values raise ConfigError naming the variable.
 */
#include "stackbridge/config/Config.h"
#include "stackbridge/exceptions/config_error.h"
#include "stackbridge/support/parse.h"

#include <cstdlib>
#include <string>

namespace stackbridge::config {

static std::size_t parse_positive(const char* name, const char* text) {
  std::size_t value = 0;
  std::string err;
  if (!support::ParseSizeStrict(text, value, &err)) {
    throw exceptions::ConfigError(std::string(name) + ": " + err);
  }
  if (value == 0) {
    throw exceptions::ConfigError(std::string(name) + ": must be positive");
  }
  return value;
}

Config LoadConfig(const char* (*lookup)(const char* name)) {
  Config cfg;
  cfg.debug = lookup("STACKBRIDGE_DEBUG") != nullptr;
  if (const char* v = lookup("STACKBRIDGE_STACK_LIMIT")) {
    cfg.stackLimit = parse_positive("STACKBRIDGE_STACK_LIMIT", v);
  }
  if (const char* v = lookup("STACKBRIDGE_MAX_CALL_DEPTH")) {
    cfg.maxCallDepth = parse_positive("STACKBRIDGE_MAX_CALL_DEPTH", v);
  }
  return cfg;
}

Config LoadConfigFromEnv() {
  return LoadConfig([](const char* name) -> const char* { return std::getenv(name); });
}

}  // namespace stackbridge::config
