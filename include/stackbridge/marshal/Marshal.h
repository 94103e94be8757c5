/***
 * Name: stackbridge::marshal (protocol)
 * Purpose: Two-way conversion between native values and evaluation-stack slots.
 * Inputs: Native values (push) or the top slots of a vm::State (pop)
 * Outputs: Slot counts (push) or native values (pop)
 * Theory of Operation:
 *   - Marshal<T> is specialized per supported native type and provides
 *       static int push(T value, vm::State &st);   // consumes value, returns slots written
 *       static T pop(vm::State &st);               // converts and removes the top slot(s)
 *     Push-only types (views, C strings, native functions) omit pop.
 *   - push leaves the stack depth as it was on failure. pop always removes the
 *     slots of its type when they exist, whether the conversion succeeds or not;
 *     popping from an empty stack throws TypeMismatchError (actual None) and
 *     leaves the stack untouched.
 *   - Specializations live in Primitives.h and Containers.h; include All.h for
 *     the full set.
 */
#pragma once

#include <type_traits>
#include <utility>

#include "stackbridge/vm/State.h"

namespace stackbridge::marshal {
    template<typename T, typename Enable = void>
    struct Marshal;

    template<typename T>
    int push(T &&value, vm::State &st) {
        return Marshal<std::decay_t<T> >::push(std::forward<T>(value), st);
    }

    template<typename T>
    T pop(vm::State &st) {
        return Marshal<T>::pop(st);
    }

    // Restores the stack depth when the scope ends unless dismissed.
    class StackGuard {
    public:
        explicit StackGuard(vm::State &st) noexcept : st_(st), depth_(st.get_top()) {}

        StackGuard(vm::State &st, int depth) noexcept : st_(st), depth_(depth) {}

        ~StackGuard() {
            if (active_) { st_.truncate(depth_); }
        }

        StackGuard(const StackGuard &) = delete;

        StackGuard &operator=(const StackGuard &) = delete;

        void dismiss() noexcept { active_ = false; }

        int depth() const noexcept { return depth_; }

    private:
        vm::State &st_;
        int depth_;
        bool active_{true};
    };

    namespace detail {
        // Whether a slot tag is the one T itself pushes, before any widening
        // conversion (an integral Number read as an integer). Types without a
        // fixed tag match nothing.
        template<typename T, typename Enable = void>
        struct ExactTag {
            static bool matches(vm::TypeTag) { return false; }
        };

        template<vm::TypeTag Tag>
        struct TagIs {
            static bool matches(vm::TypeTag tag) { return tag == Tag; }
        };

        // Copies the top slot out and removes it. Throws TypeMismatchError(expected, None)
        // without touching the stack when it is empty.
        vm::Value take_top(vm::State &st, const char *expected);

        // Throws TypeMismatchError for a slot of the wrong tag.
        void mismatch(const char *expected, const vm::Value &slot);

        // Table pops: on success the table slot is still on top. A non-table top slot
        // is removed before the TypeMismatchError is thrown.
        void expect_table(vm::State &st);

        void throw_bad_element_width(int n);

        void throw_nil_element();

        // Pushes one table element; EncodeError unless it occupies exactly one
        // non-nil slot (a nil value would erase the entry).
        template<typename T>
        void push_element(T value, vm::State &st) {
            const int n = Marshal<T>::push(std::move(value), st);
            if (n != 1) { throw_bad_element_width(n); }
            if (st.type_at(-1) == vm::TypeTag::Nil) { throw_nil_element(); }
        }
    } // namespace detail
} // namespace stackbridge::marshal
