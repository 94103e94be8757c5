/***
 * Name: stackbridge::vm::TypeTag
 * Purpose: Tags identifying the kind of value held by an evaluation-stack slot.
 */
#pragma once

#include <cstdint>

namespace stackbridge::vm {
    enum class TypeTag : uint32_t {
        None = 0, // no slot at the inspected index
        Nil = 1,
        Boolean = 2,
        Integer = 3,
        Number = 4,
        String = 5,
        Table = 6,
        Function = 7,
        Error = 8
    };

    // Lower-case name used in diagnostics ("string", "integer", ...)
    const char *TypeTagName(TypeTag tag);
} // namespace stackbridge::vm
