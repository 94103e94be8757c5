/***
 * Name: stackbridge::buffer (host allocator family)
 * Purpose: Allocate and free buffer storage with the allocator the host uses for
 *          its own strings, and count what goes through it.
 * Theory of Operation:
 *   - The default family is std::malloc/std::free, matching hosts whose strings
 *     are released with free(). Hosts with another allocator install theirs with
 *     set_host_allocator before any buffer is created; buffers must be freed by
 *     the family that allocated them.
 *   - free receives the exact size passed to alloc, so sized allocators work.
 *   - Allocation failure throws std::bad_alloc; it is never reported as a
 *     MarshalError.
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace stackbridge::buffer {
    struct HostAllocator {
        void *(*alloc)(std::size_t size);
        void (*free)(void *ptr, std::size_t size);
    };

    HostAllocator default_host_allocator();

    // Installs a new family and returns the previous one. Not synchronized.
    HostAllocator set_host_allocator(HostAllocator allocator);

    void *host_alloc(std::size_t size);

    void host_free(void *ptr, std::size_t size) noexcept;

    struct BufferStats {
        uint64_t numAllocated{0};
        uint64_t numFreed{0};
        uint64_t bytesAllocated{0};
        uint64_t bytesLive{0};
    };

    BufferStats buffer_stats();

    void buffer_stats_reset_for_tests();
} // namespace stackbridge::buffer
