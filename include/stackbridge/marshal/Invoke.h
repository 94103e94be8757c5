/***
 * Name: stackbridge::marshal::make_function
 * Purpose: Expose a typed native callable to the interpreter as a NativeFunction.
 * Inputs: Function pointer, non-generic lambda, or std::function R(Args...)
 * Outputs: vm::NativeFunction suitable for State::push_function or marshal::push
 * Theory of Operation:
 *   - The trampoline fixes the frame to exactly sizeof...(Args) slots (extra
 *     arguments dropped, missing ones read as nil), pops them as a tuple, calls
 *     the callable and pushes its result (nothing for void).
 *   - Library errors propagate to State::pcall unchanged. Other std::exceptions
 *     raised by the callable are reported as RuntimeError; std::bad_alloc is not
 *     converted.
 */
#pragma once

#include <exception>
#include <functional>
#include <new>
#include <tuple>
#include <type_traits>
#include <utility>

#include "stackbridge/exceptions/runtime_error.h"
#include "stackbridge/marshal/Containers.h"
#include "stackbridge/marshal/Marshal.h"
#include "stackbridge/marshal/Primitives.h"

namespace stackbridge::marshal {
    template<typename R, typename... Args>
    vm::NativeFunction make_function(std::function<R(Args...)> fn) {
        return [fn = std::move(fn)](vm::State &st) -> int {
            st.set_top(static_cast<int>(sizeof...(Args)));
            auto args = marshal::pop<std::tuple<std::decay_t<Args>...> >(st);
            try {
                if constexpr (std::is_void_v<R>) {
                    std::apply(fn, std::move(args));
                    return 0;
                } else {
                    return marshal::push(std::apply(fn, std::move(args)), st);
                }
            } catch (const exceptions::StackbridgeException &) {
                throw;
            } catch (const std::bad_alloc &) {
                throw;
            } catch (const std::exception &e) {
                throw exceptions::RuntimeError(e.what());
            }
        };
    }

    template<typename F>
    vm::NativeFunction make_function(F f) {
        return make_function(std::function(std::move(f)));
    }
} // namespace stackbridge::marshal
