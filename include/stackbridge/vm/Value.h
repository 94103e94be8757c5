/***
 * Name: stackbridge::vm::Value
 * Purpose: Tagged value stored in one evaluation-stack slot or table entry.
 * Theory of Operation:
 *   - Scalars (nil, boolean, integer, number) are stored inline.
 *   - Strings, tables, functions and error objects are heap objects shared on copy,
 *     mirroring the interpreter's reference semantics. Strings are immutable byte
 *     sequences and may contain NUL bytes.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "stackbridge/vm/ErrorObject.h"
#include "stackbridge/vm/TypeTag.h"

namespace stackbridge::vm {
    class State;
    class Table;

    // Unit value for "nil" on the native side.
    struct Nil {};

    inline bool operator==(Nil, Nil) { return true; }
    inline bool operator!=(Nil, Nil) { return false; }

    // Native callback: receives its arguments as frame slots 1..n and returns the
    // number of results it left on top of the stack.
    using NativeFunction = std::function<int(State &)>;

    class Value {
    public:
        Value() = default;

        static Value boolean(bool b);
        static Value integer(int64_t i);
        static Value number(double n);
        static Value string(std::string_view bytes);
        static Value table(std::shared_ptr<Table> t);
        static Value function(NativeFunction fn);
        static Value error(ErrorObject obj);

        TypeTag tag() const;

        bool is_nil() const { return tag() == TypeTag::Nil; }

        // Accessors require the matching tag (std::bad_variant_access otherwise).
        bool as_boolean() const;
        int64_t as_integer() const;
        double as_number() const;
        std::string_view as_string() const;
        const std::shared_ptr<Table> &as_table() const;
        const NativeFunction &as_function() const;
        const ErrorObject &as_error() const;

        // Raw equality: scalars and strings by value, heap objects by identity.
        friend bool operator==(const Value &a, const Value &b);
        friend bool operator!=(const Value &a, const Value &b) { return !(a == b); }

    private:
        using Storage = std::variant<Nil, bool, int64_t, double,
            std::shared_ptr<const std::string>, std::shared_ptr<Table>,
            std::shared_ptr<const NativeFunction>, std::shared_ptr<const ErrorObject> >;

        explicit Value(Storage s) : v_(std::move(s)) {}

        friend struct KeyLess;

        Storage v_{};
    };

    // Strict weak ordering over table keys: by tag, then by value (strings byte-wise,
    // heap objects by address).
    struct KeyLess {
        bool operator()(const Value &a, const Value &b) const;
    };
} // namespace stackbridge::vm
