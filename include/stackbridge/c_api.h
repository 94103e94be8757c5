// stackbridge C API for host embedders (C-compatible)
#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
#define SB_NOEXCEPT noexcept
extern "C" {
#else
#define SB_NOEXCEPT
#endif

// Host string layout: data is NULL iff size == 0; otherwise data points at
// size + 1 bytes from the host allocator and data[size] == '\0'.
typedef struct sb_buffer {
  char* data;
  size_t size;
} sb_buffer;

// Status codes; nonzero values match the error kinds of the C++ API.
typedef enum sb_status {
  SB_OK = 0,
  SB_ERR_INVALID_ENCODING = 1,
  SB_ERR_TYPE_MISMATCH = 2,
  SB_ERR_DECODE = 3,
  SB_ERR_ENCODE = 4,
  SB_ERR_STACK_OVERFLOW = 5,
  SB_ERR_RUNTIME = 6
} sb_status;

// Slot tags (same values as stackbridge::vm::TypeTag)
enum {
  SB_TNONE = 0,
  SB_TNIL = 1,
  SB_TBOOLEAN = 2,
  SB_TINTEGER = 3,
  SB_TNUMBER = 4,
  SB_TSTRING = 5,
  SB_TTABLE = 6,
  SB_TFUNCTION = 7,
  SB_TERROR = 8
};

// Buffers
sb_buffer sb_buffer_from_bytes(const char* data, size_t len) SB_NOEXCEPT;
void sb_buffer_free(sb_buffer* buf) SB_NOEXCEPT; // frees and resets to {NULL, 0}

// Stack handles. Out-of-memory inside these calls terminates the process.
typedef struct sb_state sb_state;
sb_state* sb_state_new(size_t stack_limit) SB_NOEXCEPT; // 0 selects the configured default
void sb_state_close(sb_state* st) SB_NOEXCEPT;
int sb_gettop(sb_state* st) SB_NOEXCEPT;
sb_status sb_settop(sb_state* st, int idx) SB_NOEXCEPT; // slots pushed before an overflow stay
int sb_type(sb_state* st, int idx) SB_NOEXCEPT;
sb_status sb_pushlstring(sb_state* st, const char* data, size_t len) SB_NOEXCEPT;
const char* sb_tolstring(sb_state* st, int idx, size_t* len) SB_NOEXCEPT; // NULL unless a string slot

// Marshalling: push consumes *buf (reset to {NULL, 0}) on success and failure;
// pop writes an owned buffer to *out on success.
sb_status sb_push_buffer(sb_state* st, sb_buffer* buf) SB_NOEXCEPT;
sb_status sb_pop_buffer(sb_state* st, sb_buffer* out) SB_NOEXCEPT;

#ifdef __cplusplus
}
#endif
