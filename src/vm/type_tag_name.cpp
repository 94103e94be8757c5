/***
 * Name: stackbridge::vm::TypeTagName
 * Purpose: Diagnostic names for slot tags.
 */
#include "stackbridge/vm/TypeTag.h"

namespace stackbridge::vm {

const char* TypeTagName(TypeTag tag) {
  switch (tag) {
    case TypeTag::None: return "none";
    case TypeTag::Nil: return "nil";
    case TypeTag::Boolean: return "boolean";
    case TypeTag::Integer: return "integer";
    case TypeTag::Number: return "number";
    case TypeTag::String: return "string";
    case TypeTag::Table: return "table";
    case TypeTag::Function: return "function";
    case TypeTag::Error: return "error";
  }
  return "none";
}

} // namespace stackbridge::vm
