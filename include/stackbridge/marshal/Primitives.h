/***
 * Name: stackbridge::marshal (scalar and byte-string types)
 * Purpose: Marshal<T> for booleans, integers, floating point, byte strings,
 *          OwnedBuffer and its views, nil, error objects and native functions.
 * Theory of Operation:
 *   - Integers travel as 64-bit Integer slots. Unsigned values above INT64_MAX
 *     cannot be represented and fail to push (EncodeError). Popping accepts an
 *     integral Number too and range-checks against T (DecodeError).
 *   - Byte strings are copied into the slot; OwnedBuffer is consumed by push.
 *   - std::u8string is the strict text type: popping non-text bytes is a
 *     DecodeError. std::string and OwnedBuffer carry arbitrary bytes.
 */
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "stackbridge/buffer/NonOwning.h"
#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/marshal/Marshal.h"
#include "stackbridge/vm/ErrorObject.h"
#include "stackbridge/vm/Value.h"

namespace stackbridge::marshal {
    namespace detail {
        // Integer value of an Integer slot or an integral Number slot (DecodeError otherwise).
        int64_t integer_of(const vm::Value &slot);

        void throw_integer_range(int64_t value);

        void throw_unsigned_range(unsigned long long value);

        template<typename T>
        bool integer_fits(int64_t i) {
            if constexpr (std::is_signed_v<T>) {
                return i >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                       i <= static_cast<int64_t>(std::numeric_limits<T>::max());
            } else {
                return i >= 0 && static_cast<uint64_t>(i) <= std::numeric_limits<T>::max();
            }
        }

        // Strict text check for std::u8string pops (DecodeError).
        void require_text(std::string_view bytes);

        template<>
        struct ExactTag<bool> : TagIs<vm::TypeTag::Boolean> {};

        template<typename T>
        struct ExactTag<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> > >
            : TagIs<vm::TypeTag::Integer> {};

        template<typename T>
        struct ExactTag<T, std::enable_if_t<std::is_floating_point_v<T> > > : TagIs<vm::TypeTag::Number> {};

        template<>
        struct ExactTag<std::string> : TagIs<vm::TypeTag::String> {};

        template<>
        struct ExactTag<std::u8string> : TagIs<vm::TypeTag::String> {};

        template<>
        struct ExactTag<buffer::OwnedBuffer> : TagIs<vm::TypeTag::String> {};

        template<>
        struct ExactTag<vm::Nil> : TagIs<vm::TypeTag::Nil> {};

        template<>
        struct ExactTag<vm::ErrorObject> : TagIs<vm::TypeTag::Error> {};
    } // namespace detail

    template<>
    struct Marshal<bool> {
        static int push(bool value, vm::State &st) {
            st.push_boolean(value);
            return 1;
        }

        static bool pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "boolean");
            if (slot.tag() != vm::TypeTag::Boolean) { detail::mismatch("boolean", slot); }
            return slot.as_boolean();
        }
    };

    template<typename T>
    struct Marshal<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> > > {
        static int push(T value, vm::State &st) {
            if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
                if (value > static_cast<T>(INT64_MAX)) { detail::throw_unsigned_range(value); }
            }
            st.push_integer(static_cast<int64_t>(value));
            return 1;
        }

        static T pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "integer");
            const int64_t i = detail::integer_of(slot);
            if (!detail::integer_fits<T>(i)) { detail::throw_integer_range(i); }
            return static_cast<T>(i);
        }
    };

    template<typename T>
    struct Marshal<T, std::enable_if_t<std::is_floating_point_v<T> > > {
        static int push(T value, vm::State &st) {
            st.push_number(static_cast<double>(value));
            return 1;
        }

        static T pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "number");
            if (slot.tag() == vm::TypeTag::Number) { return static_cast<T>(slot.as_number()); }
            if (slot.tag() == vm::TypeTag::Integer) { return static_cast<T>(slot.as_integer()); }
            detail::mismatch("number", slot);
            return T();
        }
    };

    template<>
    struct Marshal<std::string> {
        static int push(std::string value, vm::State &st) {
            st.push_string(value);
            return 1;
        }

        static std::string pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "string");
            if (slot.tag() != vm::TypeTag::String) { detail::mismatch("string", slot); }
            return std::string(slot.as_string());
        }
    };

    template<>
    struct Marshal<std::string_view> {
        static int push(std::string_view value, vm::State &st) {
            st.push_string(value);
            return 1;
        }
    };

    template<>
    struct Marshal<const char *> {
        static int push(const char *value, vm::State &st) {
            if (value == nullptr) { throw exceptions::EncodeError("null C string"); }
            st.push_string(value);
            return 1;
        }
    };

    template<>
    struct Marshal<std::u8string> {
        static int push(std::u8string value, vm::State &st) {
            st.push_lstring(reinterpret_cast<const char *>(value.data()), value.size());
            return 1;
        }

        static std::u8string pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "string");
            if (slot.tag() != vm::TypeTag::String) { detail::mismatch("string", slot); }
            const std::string_view bytes = slot.as_string();
            detail::require_text(bytes);
            return std::u8string(reinterpret_cast<const char8_t *>(bytes.data()), bytes.size());
        }
    };

    template<>
    struct Marshal<buffer::OwnedBuffer> {
        static int push(buffer::OwnedBuffer value, vm::State &st) {
            st.push_lstring(value.data(), value.size());
            return 1;
        }

        static buffer::OwnedBuffer pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "string");
            if (slot.tag() != vm::TypeTag::String) { detail::mismatch("string", slot); }
            return buffer::OwnedBuffer::from_bytes(slot.as_string());
        }
    };

    // A view is copied into the slot; the aliased buffer keeps its bytes.
    template<>
    struct Marshal<buffer::NonOwning<buffer::OwnedBuffer> > {
        static int push(buffer::NonOwning<buffer::OwnedBuffer> value, vm::State &st) {
            st.push_string(value.as_bytes());
            return 1;
        }
    };

    template<>
    struct Marshal<vm::Nil> {
        static int push(vm::Nil, vm::State &st) {
            st.push_nil();
            return 1;
        }

        // Accepts a nil slot or an empty stack.
        static vm::Nil pop(vm::State &st) {
            if (st.get_top() == 0) { return vm::Nil{}; }
            const vm::Value slot = detail::take_top(st, "nil");
            if (slot.tag() != vm::TypeTag::Nil) { detail::mismatch("nil", slot); }
            return vm::Nil{};
        }
    };

    template<>
    struct Marshal<vm::ErrorObject> {
        static int push(vm::ErrorObject value, vm::State &st) {
            st.push_error(std::move(value));
            return 1;
        }

        static vm::ErrorObject pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "error");
            if (slot.tag() != vm::TypeTag::Error) { detail::mismatch("error", slot); }
            return slot.as_error();
        }
    };

    // Native callbacks; see Invoke.h for wrapping typed callables.
    template<>
    struct Marshal<vm::NativeFunction> {
        static int push(vm::NativeFunction value, vm::State &st) {
            if (!value) { throw exceptions::EncodeError("empty native function"); }
            st.push_function(std::move(value));
            return 1;
        }
    };
} // namespace stackbridge::marshal
