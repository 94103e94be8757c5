/***
 * Name: stackbridge::vm::Value (impl)
 * Purpose: Construction, tagging, equality and key ordering of slot values.
 */
#include "stackbridge/vm/Value.h"
#include "stackbridge/vm/Table.h"

#include <cstring>
#include <functional>

namespace stackbridge::vm {

Value Value::boolean(bool b) { return Value(Storage(std::in_place_type<bool>, b)); }

Value Value::integer(int64_t i) { return Value(Storage(std::in_place_type<int64_t>, i)); }

Value Value::number(double n) { return Value(Storage(std::in_place_type<double>, n)); }

Value Value::string(std::string_view bytes) {
  return Value(Storage(std::make_shared<const std::string>(bytes)));
}

Value Value::table(std::shared_ptr<Table> t) { return Value(Storage(std::move(t))); }

Value Value::function(NativeFunction fn) {
  return Value(Storage(std::make_shared<const NativeFunction>(std::move(fn))));
}

Value Value::error(ErrorObject obj) { return Value(Storage(std::make_shared<const ErrorObject>(std::move(obj)))); }

TypeTag Value::tag() const {
  switch (v_.index()) {
    case 0: return TypeTag::Nil;
    case 1: return TypeTag::Boolean;
    case 2: return TypeTag::Integer;
    case 3: return TypeTag::Number;
    case 4: return TypeTag::String;
    case 5: return TypeTag::Table;
    case 6: return TypeTag::Function;
    case 7: return TypeTag::Error;
    default: return TypeTag::Nil;
  }
}

bool Value::as_boolean() const { return std::get<bool>(v_); }

int64_t Value::as_integer() const { return std::get<int64_t>(v_); }

double Value::as_number() const { return std::get<double>(v_); }

std::string_view Value::as_string() const { return *std::get<std::shared_ptr<const std::string> >(v_); }

const std::shared_ptr<Table>& Value::as_table() const { return std::get<std::shared_ptr<Table> >(v_); }

const NativeFunction& Value::as_function() const { return *std::get<std::shared_ptr<const NativeFunction> >(v_); }

const ErrorObject& Value::as_error() const { return *std::get<std::shared_ptr<const ErrorObject> >(v_); }

bool operator==(const Value& a, const Value& b) {
  if (a.tag() != b.tag()) { return false; }
  switch (a.tag()) {
    case TypeTag::Nil: return true;
    case TypeTag::Boolean: return a.as_boolean() == b.as_boolean();
    case TypeTag::Integer: return a.as_integer() == b.as_integer();
    case TypeTag::Number: return a.as_number() == b.as_number();
    case TypeTag::String: return a.as_string() == b.as_string();
    case TypeTag::Table: return a.as_table() == b.as_table();
    case TypeTag::Function:
      return std::get<std::shared_ptr<const NativeFunction> >(a.v_) == std::get<std::shared_ptr<const NativeFunction> >(b.v_);
    case TypeTag::Error:
      return std::get<std::shared_ptr<const ErrorObject> >(a.v_) == std::get<std::shared_ptr<const ErrorObject> >(b.v_);
    case TypeTag::None: return true;
  }
  return false;
}

template<typename P>
static bool ptr_less(const P& a, const P& b) {
  return std::less<const void*>{}(static_cast<const void*>(a.get()), static_cast<const void*>(b.get()));
}

bool KeyLess::operator()(const Value& a, const Value& b) const {
  const auto ta = static_cast<uint32_t>(a.tag());
  const auto tb = static_cast<uint32_t>(b.tag());
  if (ta != tb) { return ta < tb; }
  switch (a.tag()) {
    case TypeTag::Boolean: return a.as_boolean() < b.as_boolean();
    case TypeTag::Integer: return a.as_integer() < b.as_integer();
    case TypeTag::Number: return a.as_number() < b.as_number();
    case TypeTag::String: return a.as_string() < b.as_string();
    case TypeTag::Table: return ptr_less(a.as_table(), b.as_table());
    case TypeTag::Function:
      return ptr_less(std::get<std::shared_ptr<const NativeFunction> >(a.v_),
                      std::get<std::shared_ptr<const NativeFunction> >(b.v_));
    case TypeTag::Error:
      return ptr_less(std::get<std::shared_ptr<const ErrorObject> >(a.v_),
                      std::get<std::shared_ptr<const ErrorObject> >(b.v_));
    case TypeTag::Nil:
    case TypeTag::None:
      return false;
  }
  return false;
}

} // namespace stackbridge::vm
