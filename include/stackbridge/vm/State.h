/***
 * Name: stackbridge::vm::State
 * Purpose: Stack handle: the evaluation stack of one embedded interpreter context.
 * Inputs: Configuration (slot limit, nested call limit)
 * Outputs: Slot-level API used by the marshalling protocol and native callbacks
 * Theory of Operation:
 *   - Slots are addressed Lua-style: positive indices count from the bottom of the
 *     current frame (1-based), negative indices count from the top (-1 is the top).
 *   - There is no hidden global state; every State is independent, so tests and
 *     hosts may run several side by side. A State is used by one call chain at a
 *     time and is not synchronized.
 *   - pcall runs a native function in a fresh frame. Callbacks may re-enter pcall.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "stackbridge/config/Config.h"
#include "stackbridge/vm/Table.h"
#include "stackbridge/vm/TypeTag.h"
#include "stackbridge/vm/Value.h"

namespace stackbridge::vm {
    enum class CallStatus : int {
        Ok = 0,
        RuntimeError = 2
    };

    class State {
    public:
        State();

        explicit State(const config::Config &cfg);

        State(const State &) = delete;

        State &operator=(const State &) = delete;

        // Number of slots in the current frame.
        int get_top() const;

        // Grow with nils (may throw StackOverflowError) or shrink to idx slots.
        void set_top(int idx);

        // Shrink to at most idx slots; never throws.
        void truncate(int idx) noexcept;

        void pop(int n) noexcept;

        // True when n more slots fit under the configured limit.
        bool check_stack(int n) const;

        // TypeTag::None for indices outside the current frame.
        TypeTag type_at(int idx) const;

        // Slot value; a shared nil for indices outside the current frame.
        const Value &at(int idx) const;

        void push_nil();
        void push_boolean(bool b);
        void push_integer(int64_t i);
        void push_number(double n);
        void push_lstring(const char *data, std::size_t len);
        void push_string(std::string_view bytes);
        void push_value(Value v);
        void push_error(ErrorObject obj);
        void push_function(NativeFunction fn);

        // Push a new empty table.
        void new_table();

        // t[k] = v where v is the top slot and k the one below; pops both.
        void raw_set(int tableIdx);

        // t[n] = v where v is the top slot; pops it.
        void raw_seti(int tableIdx, int64_t n);

        // Push t[n].
        void raw_geti(int tableIdx, int64_t n);

        // Border length of a table slot, byte length of a string slot, 0 otherwise.
        int64_t raw_len(int idx) const;

        // Pops a key and pushes the next key/value pair of the table; pushes nothing
        // and returns false after the last entry.
        bool next(int tableIdx);

        // Calls the function below the top nargs slots. See the file header.
        CallStatus pcall(int nargs);

        std::size_t stack_limit() const { return limit_; }
        std::size_t max_call_depth() const { return maxDepth_; }
        std::size_t call_depth() const { return depth_; }

    private:
        // Absolute slot position for idx, or -1 when idx is outside the frame.
        long abs_index(int idx) const;

        // Throws TypeMismatchError when idx is not a table slot.
        std::shared_ptr<Table> table_at(int idx) const;

        void ensure_slot() const;

        std::vector<Value> slots_;
        std::size_t base_{0};
        std::size_t limit_;
        std::size_t maxDepth_;
        std::size_t depth_{0};
    };
} // namespace stackbridge::vm
