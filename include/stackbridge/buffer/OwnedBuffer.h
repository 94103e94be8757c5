/***
 * Name: stackbridge::buffer::OwnedBuffer
 * Purpose: Owned byte string laid out exactly like the host's string (sb_buffer),
 *          so host C code can read it in place.
 * Inputs: Byte sequences, text, paths, characters
 * Outputs: Byte/text views, consuming conversions, host hand-off
 * Theory of Operation:
 *   - Two private fields: data (null for the empty buffer) and size (terminator not
 *     counted). Non-null data always points at size + 1 bytes from the host
 *     allocator with data[size] == '\0'. Bytes may contain NUL and need not be text.
 *   - The factories are the only producers of that pair and the destructor the only
 *     consumer; into_bytes and release transfer it instead, leaving the buffer empty.
 *   - Copies are deep. Moves leave the source empty, so nothing is freed twice.
 *   - Equality, ordering and hashing are byte-wise over as_bytes().
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stackbridge/buffer/NonOwning.h"
#include "stackbridge/c_api.h"

namespace stackbridge::buffer {
    namespace detail {
        struct BufferLayout;
    }

    // Sized deleter returning storage to the host allocator family.
    struct HostDeleter {
        std::size_t allocSize{0};

        void operator()(unsigned char *ptr) const noexcept;
    };

    // Bytes released by OwnedBuffer::into_bytes: the buffer's own allocation
    // (terminator included, not counted in size) under unique ownership.
    class HostBytes {
    public:
        HostBytes() = default;

        const unsigned char *data() const { return data_.get(); }
        std::size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        std::string_view view() const;

        std::vector<unsigned char> to_vector() const;

    private:
        friend class OwnedBuffer;

        HostBytes(unsigned char *ptr, std::size_t size) : data_(ptr, HostDeleter{size + 1}), size_(size) {}

        std::unique_ptr<unsigned char[], HostDeleter> data_;
        std::size_t size_{0};
    };

    // Result of to_text_lossy: aliases the buffer when no replacement was needed,
    // owns the repaired copy otherwise.
    class LossyText {
    public:
        std::string_view view() const { return replaced_ ? std::string_view(owned_) : borrowed_; }
        bool replaced() const { return replaced_; }
        std::string str() const { return std::string(view()); }

    private:
        friend class OwnedBuffer;

        explicit LossyText(std::string_view borrowed) : borrowed_(borrowed) {}
        explicit LossyText(std::string owned) : owned_(std::move(owned)), replaced_(true) {}

        std::string_view borrowed_{};
        std::string owned_{};
        bool replaced_{false};
    };

    class OwnedBuffer {
    public:
        using raw_type = sb_buffer;

        // Empty buffer; never allocates.
        OwnedBuffer() noexcept = default;

        // Bytes up to the first NUL.
        explicit OwnedBuffer(const char *cstr);
        explicit OwnedBuffer(std::string_view bytes);
        explicit OwnedBuffer(const std::string &bytes);
        explicit OwnedBuffer(char ch);

        ~OwnedBuffer();

        OwnedBuffer(const OwnedBuffer &other);
        OwnedBuffer &operator=(const OwnedBuffer &other);
        OwnedBuffer(OwnedBuffer &&other) noexcept;
        OwnedBuffer &operator=(OwnedBuffer &&other) noexcept;

        static OwnedBuffer empty() noexcept { return OwnedBuffer(); }

        static OwnedBuffer from_bytes(const void *data, std::size_t len);
        static OwnedBuffer from_bytes(std::string_view bytes);
        static OwnedBuffer from_bytes(const std::vector<unsigned char> &bytes);

        // UTF-8 encoding of a code point; EncodeError for surrogates and values above U+10FFFF.
        static OwnedBuffer from_char(char32_t cp);

        // Byte-preserving on POSIX; UTF-8 of the path on Windows.
        static OwnedBuffer from_path(const std::filesystem::path &path);

        // Takes ownership of a host-allocated buffer. A non-null zero-length host
        // allocation is freed and replaced by the null sentinel.
        static OwnedBuffer adopt(sb_buffer raw) noexcept;

        bool is_empty() const noexcept { return size_ == 0; }
        std::size_t size() const noexcept { return size_; }
        const char *data() const noexcept { return data_; }

        // Always NUL-terminated; "" for the empty buffer. Stops at embedded NULs for C readers.
        const char *c_str() const noexcept;

        std::string_view as_bytes() const noexcept;

        // Strict: InvalidEncodingError with the offset of the first NUL or ill-formed sequence.
        std::string_view as_text() const;

        // Every NUL and ill-formed sequence becomes U+FFFD (unlike plain UTF-8 lossy decoding,
        // which keeps NUL).
        LossyText to_text_lossy() const;

        // Byte copy into a std::string (no validation).
        std::string to_string() const;

        std::filesystem::path to_path() const;

        HostBytes into_bytes() &&;

        // Strict; IntoTextError (carrying these bytes) on failure.
        std::string into_text() &&;

        // Hands the representation to the host; the host must free it with the same family.
        sb_buffer release() && noexcept;

        OwnedBuffer clone() const;

        // Alias for host hand-off without ownership transfer. Valid while *this is
        // alive and unmodified.
        NonOwning<OwnedBuffer> non_owning() const noexcept;

        static std::string_view bytes_of(const sb_buffer &raw) noexcept;

        std::size_t hash() const noexcept;

    private:
        friend struct detail::BufferLayout;

        OwnedBuffer(char *data, std::size_t size) noexcept : data_(data), size_(size) {}

        void reset() noexcept;

        char *data_{nullptr};
        std::size_t size_{0};
    };

    inline bool operator==(const OwnedBuffer &a, const OwnedBuffer &b) { return a.as_bytes() == b.as_bytes(); }
    inline bool operator!=(const OwnedBuffer &a, const OwnedBuffer &b) { return !(a == b); }
    inline bool operator<(const OwnedBuffer &a, const OwnedBuffer &b) { return a.as_bytes() < b.as_bytes(); }
    inline bool operator>(const OwnedBuffer &a, const OwnedBuffer &b) { return b < a; }
    inline bool operator<=(const OwnedBuffer &a, const OwnedBuffer &b) { return !(b < a); }
    inline bool operator>=(const OwnedBuffer &a, const OwnedBuffer &b) { return !(a < b); }

    inline bool operator==(const OwnedBuffer &a, std::string_view b) { return a.as_bytes() == b; }
    inline bool operator==(std::string_view a, const OwnedBuffer &b) { return a == b.as_bytes(); }
    inline bool operator!=(const OwnedBuffer &a, std::string_view b) { return !(a == b); }
    inline bool operator!=(std::string_view a, const OwnedBuffer &b) { return !(a == b); }

    // Lossy text rendering.
    std::ostream &operator<<(std::ostream &os, const OwnedBuffer &buf);
} // namespace stackbridge::buffer

template<>
struct std::hash<stackbridge::buffer::OwnedBuffer> {
    std::size_t operator()(const stackbridge::buffer::OwnedBuffer &buf) const noexcept { return buf.hash(); }
};
