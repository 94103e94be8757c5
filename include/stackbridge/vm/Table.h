/***
 * Name: stackbridge::vm::Table
 * Purpose: Associative storage behind Table slots (sequences and mappings).
 * Theory of Operation:
 *   - Entries live in an ordered map; iteration visits keys by tag then value, so
 *     integer keys come out ascending before string keys.
 *   - Number keys with an integral value are normalized to Integer keys.
 *   - Nil and NaN keys are rejected with EncodeError; assigning nil erases.
 */
#pragma once

#include <cstdint>
#include <map>

#include "stackbridge/vm/Value.h"

namespace stackbridge::vm {
    class Table {
    public:
        // Returns nil for missing keys.
        Value get(const Value &key) const;

        void set(const Value &key, Value value);

        // Border: n such that 1..n are present and n+1 is absent (0 when 1 is absent).
        int64_t length() const;

        // Entry following key in iteration order (first entry when key is nil).
        // Returns false when key was the last one.
        bool next(const Value &key, Value &outKey, Value &outValue) const;

        std::size_t size() const { return entries_.size(); }

    private:
        static Value normalize_key(const Value &key);

        std::map<Value, Value, KeyLess> entries_;
    };
} // namespace stackbridge::vm
