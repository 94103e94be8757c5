/***
 * Name: stackbridge::vm::Table (impl)
 * Purpose: Ordered key/value storage with interpreter key rules.
 */
#include "stackbridge/vm/Table.h"
#include "stackbridge/exceptions/encode_error.h"

#include <cmath>
#include <limits>

namespace stackbridge::vm {

Value Table::normalize_key(const Value& key) {
  switch (key.tag()) {
    case TypeTag::Nil:
      throw exceptions::EncodeError("table index is nil");
    case TypeTag::Number: {
      const double n = key.as_number();
      if (std::isnan(n)) { throw exceptions::EncodeError("table index is NaN"); }
      // 2^63 is exact as a double; the range check must exclude it.
      if (n == std::floor(n) && n >= -9223372036854775808.0 && n < 9223372036854775808.0) {
        return Value::integer(static_cast<int64_t>(n));
      }
      return key;
    }
    default:
      return key;
  }
}

Value Table::get(const Value& key) const {
  if (key.is_nil()) { return Value(); }
  if (key.tag() == TypeTag::Number && std::isnan(key.as_number())) { return Value(); }
  const auto it = entries_.find(normalize_key(key));
  return it == entries_.end() ? Value() : it->second;
}

void Table::set(const Value& key, Value value) {
  Value k = normalize_key(key);
  if (value.is_nil()) {
    entries_.erase(k);
    return;
  }
  entries_.insert_or_assign(std::move(k), std::move(value));
}

int64_t Table::length() const {
  int64_t n = 0;
  while (n < std::numeric_limits<int64_t>::max() && entries_.count(Value::integer(n + 1)) != 0U) { ++n; }
  return n;
}

bool Table::next(const Value& key, Value& outKey, Value& outValue) const {
  auto it = entries_.begin();
  if (!key.is_nil()) {
    it = entries_.upper_bound(normalize_key(key));
  }
  if (it == entries_.end()) { return false; }
  outKey = it->first;
  outValue = it->second;
  return true;
}

} // namespace stackbridge::vm
