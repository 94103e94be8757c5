/***
 * Name: stackbridge::support::DebugEnabled / SetDebugEnabled
 * Purpose: Process-wide switch for STACKBRIDGE_DEBUG_LOG.
 * Theory of Operation: Initialized from STACKBRIDGE_DEBUG on first use; the flag is
 *   atomic so tracing may be toggled while buffers are used on other threads.
 */
#include "stackbridge/support/debug_log.h"

#include <atomic>
#include <cstdlib>

namespace stackbridge::support {

static std::atomic<bool>& debug_flag() {
  static std::atomic<bool> flag{std::getenv("STACKBRIDGE_DEBUG") != nullptr};
  return flag;
}

bool DebugEnabled() { return debug_flag().load(std::memory_order_relaxed); }

void SetDebugEnabled(bool on) { debug_flag().store(on, std::memory_order_relaxed); }

}  // namespace stackbridge::support
