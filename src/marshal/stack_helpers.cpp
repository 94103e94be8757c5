/***
 * Name: stackbridge::marshal::detail (stack helpers)
 * Purpose: Slot access shared by every Marshal<T> specialization.
 */
#include "stackbridge/marshal/Marshal.h"
#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/exceptions/type_mismatch_error.h"

#include <string>

namespace stackbridge::marshal::detail {

vm::Value take_top(vm::State& st, const char* expected) {
  if (st.get_top() == 0) { throw exceptions::TypeMismatchError(expected, vm::TypeTag::None); }
  vm::Value slot = st.at(-1);
  st.pop(1);
  return slot;
}

void mismatch(const char* expected, const vm::Value& slot) {
  throw exceptions::TypeMismatchError(expected, slot.tag());
}

void expect_table(vm::State& st) {
  const vm::TypeTag tag = st.type_at(-1);
  if (tag == vm::TypeTag::Table) { return; }
  if (tag != vm::TypeTag::None) { st.pop(1); }
  throw exceptions::TypeMismatchError("table", tag);
}

void throw_bad_element_width(int n) {
  throw exceptions::EncodeError("table element must occupy exactly one slot, got " + std::to_string(n));
}

void throw_nil_element() {
  throw exceptions::EncodeError("table element is nil");
}

} // namespace stackbridge::marshal::detail
