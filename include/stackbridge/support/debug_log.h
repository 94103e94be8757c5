/***
 * Name: stackbridge::support (debug_log)
 * Purpose: Opt-in stderr tracing for the buffer and stack layers.
 * Inputs: STACKBRIDGE_DEBUG (read once), or SetDebugEnabled from tests/hosts
 * Outputs: Lines of the form "[stackbridge] ..." on stderr
 */
#pragma once

#include <cstdio>

namespace stackbridge {
namespace support {

bool DebugEnabled();

void SetDebugEnabled(bool on);

}  // namespace support
}  // namespace stackbridge

#define STACKBRIDGE_DEBUG_LOG(fmt, ...) \
  do { \
    if (::stackbridge::support::DebugEnabled()) { \
      std::fprintf(stderr, "[stackbridge] " fmt "\n" __VA_OPT__(,) __VA_ARGS__); \
    } \
  } while (0)
