/***
 * Name: stackbridge C API (impl)
 * Purpose: C entry points over OwnedBuffer, vm::State and the marshal protocol.
 * Theory of Operation:
 *   - Exceptions never leave these functions: MarshalError becomes the sb_status
 *     of its kind. The functions are noexcept, so an escaping std::bad_alloc
 *     terminates, which is the library's out-of-memory policy.
 */
#include "stackbridge/c_api.h"
#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/config/Config.h"
#include "stackbridge/exceptions/config_error.h"
#include "stackbridge/exceptions/marshal_error.h"
#include "stackbridge/marshal/Marshal.h"
#include "stackbridge/marshal/Primitives.h"
#include "stackbridge/support/debug_log.h"
#include "stackbridge/vm/State.h"

#include <string_view>
#include <utility>

struct sb_state {
  explicit sb_state(const stackbridge::config::Config& cfg) : vm(cfg) {}
  stackbridge::vm::State vm;
};

using stackbridge::buffer::OwnedBuffer;

static sb_status status_of(const stackbridge::exceptions::MarshalError& err) {
  return static_cast<sb_status>(static_cast<int>(err.kind()));
}

extern "C" sb_buffer sb_buffer_from_bytes(const char* data, size_t len) noexcept {
  if (data == nullptr) { len = 0; }
  return OwnedBuffer::from_bytes(data, len).release();
}

extern "C" void sb_buffer_free(sb_buffer* buf) noexcept {
  if (buf == nullptr) { return; }
  { OwnedBuffer dropped = OwnedBuffer::adopt(*buf); }
  *buf = sb_buffer{nullptr, 0};
}

extern "C" sb_state* sb_state_new(size_t stack_limit) noexcept {
  try {
    stackbridge::config::Config cfg = stackbridge::config::LoadConfigFromEnv();
    if (stack_limit != 0) { cfg.stackLimit = stack_limit; }
    return new sb_state(cfg);
  } catch (const stackbridge::exceptions::ConfigError& e) {
    STACKBRIDGE_DEBUG_LOG("sb_state_new: %s", e.what());
    return nullptr;
  }
}

extern "C" void sb_state_close(sb_state* st) noexcept { delete st; }

extern "C" int sb_gettop(sb_state* st) noexcept { return st->vm.get_top(); }

extern "C" sb_status sb_settop(sb_state* st, int idx) noexcept {
  try {
    st->vm.set_top(idx);
    return SB_OK;
  } catch (const stackbridge::exceptions::MarshalError& e) {
    return status_of(e);
  }
}

extern "C" int sb_type(sb_state* st, int idx) noexcept { return static_cast<int>(st->vm.type_at(idx)); }

extern "C" sb_status sb_pushlstring(sb_state* st, const char* data, size_t len) noexcept {
  try {
    st->vm.push_lstring(data, data == nullptr ? 0 : len);
    return SB_OK;
  } catch (const stackbridge::exceptions::MarshalError& e) {
    return status_of(e);
  }
}

extern "C" const char* sb_tolstring(sb_state* st, int idx, size_t* len) noexcept {
  const stackbridge::vm::Value& slot = st->vm.at(idx);
  if (st->vm.type_at(idx) != stackbridge::vm::TypeTag::String) { return nullptr; }
  const std::string_view bytes = slot.as_string();
  if (len != nullptr) { *len = bytes.size(); }
  return bytes.data() == nullptr ? "" : bytes.data();
}

extern "C" sb_status sb_push_buffer(sb_state* st, sb_buffer* buf) noexcept {
  OwnedBuffer owned = OwnedBuffer::adopt(*buf);
  *buf = sb_buffer{nullptr, 0};
  try {
    stackbridge::marshal::push(std::move(owned), st->vm);
    return SB_OK;
  } catch (const stackbridge::exceptions::MarshalError& e) {
    return status_of(e);
  }
}

extern "C" sb_status sb_pop_buffer(sb_state* st, sb_buffer* out) noexcept {
  try {
    *out = stackbridge::marshal::pop<OwnedBuffer>(st->vm).release();
    return SB_OK;
  } catch (const stackbridge::exceptions::MarshalError& e) {
    return status_of(e);
  }
}
