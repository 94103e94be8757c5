/***
 * Name: stackbridge::vm::State (impl)
 * Purpose: Slot storage, frame-relative indexing, table access and protected calls.
 */
#include "stackbridge/vm/State.h"
#include "stackbridge/exceptions/marshal_error.h"
#include "stackbridge/exceptions/raised_error.h"
#include "stackbridge/exceptions/stack_overflow_error.h"
#include "stackbridge/exceptions/type_mismatch_error.h"
#include "stackbridge/support/debug_log.h"

#include <algorithm>
#include <string>
#include <utility>

namespace stackbridge::vm {

static constexpr std::size_t kInitialReserve = 64;

static const Value& none_value() {
  static const Value kNone;
  return kNone;
}

State::State() : State(config::LoadConfigFromEnv()) {}

State::State(const config::Config& cfg) : limit_(cfg.stackLimit), maxDepth_(cfg.maxCallDepth) {
  slots_.reserve(std::min(limit_, kInitialReserve));
  if (cfg.debug) { support::SetDebugEnabled(true); }
}

int State::get_top() const { return static_cast<int>(slots_.size() - base_); }

long State::abs_index(int idx) const {
  const long top = get_top();
  if (idx > 0) {
    if (idx > top) { return -1; }
    return static_cast<long>(base_) + idx - 1;
  }
  if (idx < 0) {
    if (-static_cast<long>(idx) > top) { return -1; }
    return static_cast<long>(slots_.size()) + idx;
  }
  return -1;
}

void State::set_top(int idx) {
  int target = idx;
  if (idx < 0) { target = std::max(0, get_top() + idx + 1); }
  if (target <= get_top()) {
    truncate(target);
    return;
  }
  while (get_top() < target) { push_nil(); }
}

void State::truncate(int idx) noexcept {
  if (idx < 0 || idx >= get_top()) { return; }
  slots_.erase(slots_.begin() + static_cast<long>(base_) + idx, slots_.end());
}

void State::pop(int n) noexcept {
  if (n <= 0) { return; }
  truncate(std::max(0, get_top() - n));
}

bool State::check_stack(int n) const {
  if (n <= 0) { return true; }
  return slots_.size() + static_cast<std::size_t>(n) <= limit_;
}

TypeTag State::type_at(int idx) const {
  const long pos = abs_index(idx);
  if (pos < 0) { return TypeTag::None; }
  return slots_[static_cast<std::size_t>(pos)].tag();
}

const Value& State::at(int idx) const {
  const long pos = abs_index(idx);
  if (pos < 0) { return none_value(); }
  return slots_[static_cast<std::size_t>(pos)];
}

void State::ensure_slot() const {
  if (slots_.size() >= limit_) {
    STACKBRIDGE_DEBUG_LOG("stack overflow at %zu slots", slots_.size());
    throw exceptions::StackOverflowError("stack overflow (limit " + std::to_string(limit_) + " slots)");
  }
}

void State::push_nil() { push_value(Value()); }

void State::push_boolean(bool b) { push_value(Value::boolean(b)); }

void State::push_integer(int64_t i) { push_value(Value::integer(i)); }

void State::push_number(double n) { push_value(Value::number(n)); }

void State::push_lstring(const char* data, std::size_t len) {
  push_value(Value::string(len == 0 ? std::string_view() : std::string_view(data, len)));
}

void State::push_string(std::string_view bytes) { push_value(Value::string(bytes)); }

void State::push_value(Value v) {
  ensure_slot();
  slots_.push_back(std::move(v));
}

void State::push_error(ErrorObject obj) { push_value(Value::error(std::move(obj))); }

void State::push_function(NativeFunction fn) { push_value(Value::function(std::move(fn))); }

void State::new_table() {
  ensure_slot();
  slots_.push_back(Value::table(std::make_shared<Table>()));
}

std::shared_ptr<Table> State::table_at(int idx) const {
  const Value& v = at(idx);
  if (v.tag() != TypeTag::Table) { throw exceptions::TypeMismatchError("table", type_at(idx)); }
  return v.as_table();
}

void State::raw_set(int tableIdx) {
  const std::shared_ptr<Table> t = table_at(tableIdx);
  Value key = at(-2);
  Value value = at(-1);
  pop(2);
  t->set(key, std::move(value));
}

void State::raw_seti(int tableIdx, int64_t n) {
  const std::shared_ptr<Table> t = table_at(tableIdx);
  Value value = at(-1);
  pop(1);
  t->set(Value::integer(n), std::move(value));
}

void State::raw_geti(int tableIdx, int64_t n) {
  const std::shared_ptr<Table> t = table_at(tableIdx);
  push_value(t->get(Value::integer(n)));
}

int64_t State::raw_len(int idx) const {
  const Value& v = at(idx);
  switch (v.tag()) {
    case TypeTag::Table: return v.as_table()->length();
    case TypeTag::String: return static_cast<int64_t>(v.as_string().size());
    default: return 0;
  }
}

bool State::next(int tableIdx) {
  const std::shared_ptr<Table> t = table_at(tableIdx);
  const Value key = at(-1);
  pop(1);
  Value k;
  Value v;
  if (!t->next(key, k, v)) { return false; }
  push_value(std::move(k));
  push_value(std::move(v));
  return true;
}

CallStatus State::pcall(int nargs) {
  const long funcPos = abs_index(-(std::max(nargs, 0) + 1));
  auto fail = [this](std::size_t from, ErrorObject err) {
    STACKBRIDGE_DEBUG_LOG("pcall failed: %s: %s", err.kind.c_str(), err.message.c_str());
    slots_.erase(slots_.begin() + static_cast<long>(from), slots_.end());
    // The error slot replaces the callee, so it is allowed one slot past the limit.
    slots_.push_back(Value::error(std::move(err)));
    return CallStatus::RuntimeError;
  };
  if (funcPos < 0) {
    const auto present = static_cast<std::size_t>(std::min(std::max(nargs, 0), get_top()));
    return fail(slots_.size() - present, ErrorObject{"type_mismatch", "attempt to call a none value"});
  }
  const auto funcAbs = static_cast<std::size_t>(funcPos);
  const Value callee = slots_[funcAbs];
  if (callee.tag() != TypeTag::Function) {
    return fail(funcAbs, ErrorObject{"type_mismatch",
                                     std::string("attempt to call a ") + TypeTagName(callee.tag()) + " value"});
  }
  if (depth_ >= maxDepth_) {
    return fail(funcAbs, ErrorObject{"stack_overflow",
                                     "call depth limit (" + std::to_string(maxDepth_) + ") exceeded"});
  }

  // Restores the caller's frame on every exit path.
  struct FrameScope {
    State& st;
    std::size_t savedBase;
    ~FrameScope() {
      st.base_ = savedBase;
      --st.depth_;
    }
  };

  try {
    FrameScope scope{*this, base_};
    base_ = funcAbs + 1;
    ++depth_;
    int nres = callee.as_function()(*this);
    nres = std::clamp(nres, 0, get_top());
    const std::size_t first = slots_.size() - static_cast<std::size_t>(nres);
    std::move(slots_.begin() + static_cast<long>(first), slots_.end(), slots_.begin() + static_cast<long>(funcAbs));
    slots_.erase(slots_.begin() + static_cast<long>(funcAbs) + nres, slots_.end());
    return CallStatus::Ok;
  } catch (const exceptions::RaisedError& e) {
    return fail(funcAbs, e.object());
  } catch (const exceptions::MarshalError& e) {
    return fail(funcAbs, to_error_object(e));
  }
}

} // namespace stackbridge::vm
