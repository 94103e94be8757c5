/***
 * Name: stackbridge::buffer (host allocator family impl)
 * Purpose: Route buffer storage through the installed host allocator and keep
 *          allocation counters.
 */
#include "stackbridge/buffer/HostAlloc.h"
#include "stackbridge/support/debug_log.h"

#include <atomic>
#include <cstdlib>
#include <new>

namespace stackbridge::buffer {

static void* malloc_alloc(std::size_t size) { return std::malloc(size); }

static void malloc_free(void* ptr, std::size_t /*size*/) { std::free(ptr); }

static HostAllocator g_allocator{&malloc_alloc, &malloc_free}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static std::atomic<uint64_t> g_num_allocated{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_num_freed{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_bytes_allocated{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_bytes_live{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

HostAllocator default_host_allocator() { return HostAllocator{&malloc_alloc, &malloc_free}; }

HostAllocator set_host_allocator(HostAllocator allocator) {
  const HostAllocator prev = g_allocator;
  g_allocator = allocator;
  STACKBRIDGE_DEBUG_LOG("host allocator replaced");
  return prev;
}

void* host_alloc(std::size_t size) {
  void* ptr = g_allocator.alloc(size);
  if (ptr == nullptr) {
    STACKBRIDGE_DEBUG_LOG("host allocation of %zu bytes failed", size);
    throw std::bad_alloc();
  }
  g_num_allocated.fetch_add(1, std::memory_order_relaxed);
  g_bytes_allocated.fetch_add(size, std::memory_order_relaxed);
  g_bytes_live.fetch_add(size, std::memory_order_relaxed);
  return ptr;
}

void host_free(void* ptr, std::size_t size) noexcept {
  if (ptr == nullptr) { return; }
  g_allocator.free(ptr, size);
  g_num_freed.fetch_add(1, std::memory_order_relaxed);
  g_bytes_live.fetch_sub(size, std::memory_order_relaxed);
}

BufferStats buffer_stats() {
  BufferStats st;
  st.numAllocated = g_num_allocated.load(std::memory_order_relaxed);
  st.numFreed = g_num_freed.load(std::memory_order_relaxed);
  st.bytesAllocated = g_bytes_allocated.load(std::memory_order_relaxed);
  st.bytesLive = g_bytes_live.load(std::memory_order_relaxed);
  return st;
}

void buffer_stats_reset_for_tests() {
  g_num_allocated.store(0, std::memory_order_relaxed);
  g_num_freed.store(0, std::memory_order_relaxed);
  g_bytes_allocated.store(0, std::memory_order_relaxed);
  g_bytes_live.store(0, std::memory_order_relaxed);
}

} // namespace stackbridge::buffer
