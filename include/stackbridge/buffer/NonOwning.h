/***
 * Name: stackbridge::buffer::NonOwning
 * Purpose: Read-only alias of a value that carries none of the value's ownership.
 * Inputs: A bitwise copy of T's C representation (T::raw_type)
 * Outputs: The raw representation for hand-off to host C code
 * Theory of Operation:
 *   - Only T can create a NonOwning<T> (private constructor, friend T), so views
 *     exist only where T vouches for the aliasing.
 *   - A view never frees anything. It is valid while the source is alive and
 *     unmodified; outliving the source is a caller contract violation and is not
 *     detected at runtime.
 */
#pragma once

#include <string_view>

namespace stackbridge::buffer {
    template<typename T>
    class NonOwning {
    public:
        using raw_type = typename T::raw_type;

        const raw_type &raw() const noexcept { return raw_; }

        // Reads the aliased bytes (instantiated only for byte-carrying T).
        std::string_view as_bytes() const { return T::bytes_of(raw_); }

    private:
        friend T;

        explicit NonOwning(raw_type raw) noexcept : raw_(raw) {}

        raw_type raw_;
    };
} // namespace stackbridge::buffer
