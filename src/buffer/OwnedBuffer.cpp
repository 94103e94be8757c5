/***
 * Name: stackbridge::buffer::OwnedBuffer (impl)
 * Purpose: Construction, conversion and destruction of host-layout byte strings.
 */
#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/buffer/HostAlloc.h"
#include "stackbridge/buffer/Utf8.h"
#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/exceptions/into_text_error.h"
#include "stackbridge/exceptions/invalid_encoding_error.h"
#include "stackbridge/support/debug_log.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <type_traits>

namespace stackbridge::buffer {

namespace detail {
// The host reads OwnedBuffer values as sb_buffer; pin the layout.
struct BufferLayout {
  static_assert(std::is_standard_layout_v<OwnedBuffer>);
  static_assert(sizeof(sb_buffer) == 2 * sizeof(void*));
  static_assert(sizeof(OwnedBuffer) == sizeof(sb_buffer));
  static_assert(alignof(OwnedBuffer) == alignof(sb_buffer));
  static_assert(offsetof(OwnedBuffer, data_) == offsetof(sb_buffer, data));
  static_assert(offsetof(OwnedBuffer, size_) == offsetof(sb_buffer, size));
};
} // namespace detail

void HostDeleter::operator()(unsigned char* ptr) const noexcept { host_free(ptr, allocSize); }

std::string_view HostBytes::view() const {
  if (!data_) { return {}; }
  return {reinterpret_cast<const char*>(data_.get()), size_};
}

std::vector<unsigned char> HostBytes::to_vector() const {
  if (!data_) { return {}; }
  return std::vector<unsigned char>(data_.get(), data_.get() + size_);
}

OwnedBuffer::OwnedBuffer(const char* cstr) : OwnedBuffer(from_bytes(cstr, cstr ? std::strlen(cstr) : 0)) {}

OwnedBuffer::OwnedBuffer(std::string_view bytes) : OwnedBuffer(from_bytes(bytes)) {}

OwnedBuffer::OwnedBuffer(const std::string& bytes) : OwnedBuffer(from_bytes(bytes.data(), bytes.size())) {}

OwnedBuffer::OwnedBuffer(char ch) : OwnedBuffer(from_bytes(&ch, 1)) {}

OwnedBuffer::~OwnedBuffer() { reset(); }

OwnedBuffer::OwnedBuffer(const OwnedBuffer& other) : OwnedBuffer(other.clone()) {}

OwnedBuffer& OwnedBuffer::operator=(const OwnedBuffer& other) {
  if (this != &other) {
    OwnedBuffer tmp(other.clone());
    *this = std::move(tmp);
  }
  return *this;
}

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)) {}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
  if (this != &other) {
    reset();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
  }
  return *this;
}

void OwnedBuffer::reset() noexcept {
  // One extra byte for the terminator.
  if (data_ != nullptr) { host_free(data_, size_ + 1); }
  data_ = nullptr;
  size_ = 0;
}

OwnedBuffer OwnedBuffer::from_bytes(const void* data, std::size_t len) {
  if (len == 0) { return OwnedBuffer(); }
  auto* mem = static_cast<char*>(host_alloc(len + 1));
  std::memcpy(mem, data, len);
  mem[len] = '\0';
  return OwnedBuffer(mem, len);
}

OwnedBuffer OwnedBuffer::from_bytes(std::string_view bytes) { return from_bytes(bytes.data(), bytes.size()); }

OwnedBuffer OwnedBuffer::from_bytes(const std::vector<unsigned char>& bytes) {
  return from_bytes(bytes.data(), bytes.size());
}

OwnedBuffer OwnedBuffer::from_char(char32_t cp) {
  std::string utf8;
  if (!detail::append_code_point(utf8, cp)) {
    throw exceptions::EncodeError("invalid code point " + std::to_string(static_cast<uint32_t>(cp)));
  }
  return from_bytes(utf8);
}

OwnedBuffer OwnedBuffer::from_path(const std::filesystem::path& path) {
#ifdef _WIN32
  const std::u8string utf8 = path.u8string();
  return from_bytes(utf8.data(), utf8.size());
#else
  return from_bytes(path.native());
#endif
}

OwnedBuffer OwnedBuffer::adopt(sb_buffer raw) noexcept {
  if (raw.data == nullptr) { return OwnedBuffer(); }
  if (raw.size == 0) {
    STACKBRIDGE_DEBUG_LOG("adopt: normalizing empty host allocation to null");
    host_free(raw.data, 1);
    return OwnedBuffer();
  }
  return OwnedBuffer(raw.data, raw.size);
}

const char* OwnedBuffer::c_str() const noexcept { return data_ != nullptr ? data_ : ""; }

std::string_view OwnedBuffer::as_bytes() const noexcept { return bytes_of(sb_buffer{data_, size_}); }

std::string_view OwnedBuffer::as_text() const {
  const std::string_view bytes = as_bytes();
  if (const auto offset = detail::first_invalid_text_offset(bytes)) {
    throw exceptions::InvalidEncodingError(*offset);
  }
  return bytes;
}

LossyText OwnedBuffer::to_text_lossy() const {
  const std::string_view bytes = as_bytes();
  if (!detail::first_invalid_text_offset(bytes)) { return LossyText(bytes); }
  return LossyText(detail::replace_invalid_text(bytes));
}

std::string OwnedBuffer::to_string() const { return std::string(as_bytes()); }

std::filesystem::path OwnedBuffer::to_path() const {
#ifdef _WIN32
  const std::string text = to_text_lossy().str();
  return std::filesystem::path(std::u8string(text.begin(), text.end()));
#else
  return std::filesystem::path(to_string());
#endif
}

HostBytes OwnedBuffer::into_bytes() && {
  if (data_ == nullptr) { return HostBytes(); }
  HostBytes out(reinterpret_cast<unsigned char*>(data_), size_);
  data_ = nullptr;
  size_ = 0;
  return out;
}

std::string OwnedBuffer::into_text() && {
  if (const auto offset = detail::first_invalid_text_offset(as_bytes())) {
    throw exceptions::IntoTextError(*offset, std::move(*this));
  }
  std::string out(as_bytes());
  reset();
  return out;
}

sb_buffer OwnedBuffer::release() && noexcept {
  const sb_buffer raw{data_, size_};
  data_ = nullptr;
  size_ = 0;
  return raw;
}

OwnedBuffer OwnedBuffer::clone() const { return from_bytes(as_bytes()); }

NonOwning<OwnedBuffer> OwnedBuffer::non_owning() const noexcept {
  return NonOwning<OwnedBuffer>(sb_buffer{data_, size_});
}

std::string_view OwnedBuffer::bytes_of(const sb_buffer& raw) noexcept {
  if (raw.data == nullptr) { return {}; }
  return {raw.data, raw.size};
}

std::size_t OwnedBuffer::hash() const noexcept { return std::hash<std::string_view>{}(as_bytes()); }

std::ostream& operator<<(std::ostream& os, const OwnedBuffer& buf) { return os << buf.to_text_lossy().view(); }

} // namespace stackbridge::buffer
