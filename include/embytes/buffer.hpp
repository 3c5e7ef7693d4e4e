// ============================================================================
// Buffer
// ----------------------------------------------------------------------------
// Fixed-capacity FIFO byte buffer over caller-supplied storage.
//
// Designed for environments without a heap, threads or an OS: the buffer
// never allocates, never blocks and never throws. It owns a storage value
// (see embytes/storage.hpp) and keeps two cursors into it:
//
//      0 <= read_pos <= write_pos <= capacity
//
//   [ consumed (dead) | readable (pending) | free                 ]
//   0            read_pos             write_pos               capacity
//
// Writes append at write_pos, reads drain from read_pos. Both cursors only
// move forward through write()/read(): once write_pos reaches capacity every
// further write reports 0 bytes. Space is only reclaimed when the caller
// asks for it explicitly (shift(), reset()).
//
// Properties:
//   • Capacity fixed at construction
//   • No heap allocation, no dynamic growth
//   • Short reads / writes are success with a smaller count
//   • Zero count is the only "empty" / "full" signal (no EOF)
//   • No synchronization (NOT thread-safe, single owner)
//
// Example:
//
//   auto buffer = embytes::make_stack_buffer<1024>();
//
//   std::size_t n = buffer.write(embytes::as_bytes("hello world"));
//
//   std::array<std::uint8_t, 128> out{};
//   n = buffer.read(out);     // 11
//   n = buffer.read(out);     // 0
//
// ============================================================================
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include "embytes/config.hpp"
#include "embytes/error.hpp"
#include "embytes/log.hpp"
#include "embytes/storage.hpp"

#ifndef EMBYTES_NO_ALLOCATIONS
#include <ostream>
#endif

namespace embytes {

template <ByteStorage S>
class Buffer;

template <ByteStorage S>
class Reader;

template <ByteStorage S>
class Writer;

} // namespace embytes

#include "embytes/buffer/reader.hpp"
#include "embytes/buffer/writer.hpp"

namespace embytes {

template <ByteStorage S>
class Buffer {
public:
    using storage_type = S;

    explicit Buffer(S storage) noexcept(std::is_nothrow_move_constructible_v<S>)
        : storage_(std::move(storage))
        , capacity_(storage::const_view(storage_).size())
    {}

    // Exclusive ownership: the storage is never aliased through a second buffer
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // A moved-from buffer has zero capacity: a borrowed span may still alias
    // the new owner's bytes
    Buffer(Buffer&& other) noexcept(std::is_nothrow_move_constructible_v<S>)
        : storage_(std::move(other.storage_))
        , capacity_(other.capacity_)
        , write_pos_(other.write_pos_)
        , read_pos_(other.read_pos_)
    {
        other.release_();
    }

    Buffer& operator=(Buffer&& other) noexcept(std::is_nothrow_move_assignable_v<S>)
        requires std::is_move_assignable_v<S>
    {
        if (this != &other) {
            storage_ = std::move(other.storage_);
            capacity_ = other.capacity_;
            write_pos_ = other.write_pos_;
            read_pos_ = other.read_pos_;
            other.release_();
        }
        return *this;
    }

    ~Buffer() = default;

    // ------------------------------------------------------------------------
    // Capacity
    // ------------------------------------------------------------------------

    [[nodiscard]] inline std::size_t capacity() const noexcept {
        return capacity_;
    }

    // Free bytes behind write_pos (does not account for dead capacity)
    [[nodiscard]] inline std::size_t remaining_capacity() const noexcept {
        return capacity_ - write_pos_;
    }

    [[nodiscard]] inline bool has_remaining_capacity() const noexcept {
        return capacity_ > write_pos_;
    }

    // Bytes written but not yet read
    [[nodiscard]] inline std::size_t remaining_len() const noexcept {
        return write_pos_ - read_pos_;
    }

    [[nodiscard]] inline bool has_remaining_len() const noexcept {
        return write_pos_ > read_pos_;
    }

    // Already-read bytes that shift() could reclaim
    [[nodiscard]] inline bool has_dead_capacity() const noexcept {
        return read_pos_ > 0;
    }

    [[nodiscard]] inline std::size_t read_position() const noexcept {
        return read_pos_;
    }

    [[nodiscard]] inline std::size_t write_position() const noexcept {
        return write_pos_;
    }

    // Readable region [read_pos, write_pos)
    [[nodiscard]] inline std::span<const std::uint8_t> data() const noexcept {
        return storage::const_view(storage_).subspan(read_pos_, remaining_len());
    }

    [[nodiscard]] inline const S& storage() const noexcept {
        return storage_;
    }

    // ------------------------------------------------------------------------
    // Write path
    // ------------------------------------------------------------------------

    // Copies as many bytes as fit. Returns the count copied; 0 when the
    // buffer is full or src is empty.
    [[nodiscard]] inline std::size_t write(std::span<const std::uint8_t> src) noexcept {
        const std::size_t n = std::min(src.size(), remaining_capacity());
        if (n == 0) {
            return 0;
        }
        append_(src.first(n));
        return n;
    }

    [[nodiscard]] inline std::size_t write(std::string_view text) noexcept {
        return write(as_bytes(text));
    }

    // Writes until src is exhausted. Fails with OutOfCapacity as soon as a
    // write makes no progress; bytes already copied stay written.
    [[nodiscard]] inline Error write_all(std::span<const std::uint8_t> src) noexcept {
        while (!src.empty()) {
            const std::size_t n = write(src);
            if (n == 0) [[unlikely]] {
                EMBYTES_DEBUG("[embytes] write_all: no remaining capacity (" << src.size()
                              << " bytes outstanding, capacity " << capacity_ << ")");
                return Error::OutOfCapacity;
            }
            src = src.subspan(n);
        }
        return Error::None;
    }

    [[nodiscard]] inline Error write_all(std::string_view text) noexcept {
        return write_all(as_bytes(text));
    }

    // All-or-nothing append: nothing is copied unless src fits as a whole
    [[nodiscard]] inline Error push(std::span<const std::uint8_t> src) noexcept {
        if (src.size() > remaining_capacity()) {
            EMBYTES_DEBUG("[embytes] push(" << src.size() << ") rejected: "
                          << remaining_capacity() << " bytes free");
            return Error::OutOfCapacity;
        }
        if (!src.empty()) {
            append_(src);
        }
        return Error::None;
    }

    [[nodiscard]] inline Error push(std::string_view text) noexcept {
        return push(as_bytes(text));
    }

    // ------------------------------------------------------------------------
    // Read path
    // ------------------------------------------------------------------------

    // Copies as many pending bytes as fit in out. Returns the count copied;
    // 0 when nothing is pending or out is empty.
    [[nodiscard]] inline std::size_t read(std::span<std::uint8_t> out) noexcept {
        const std::size_t n = std::min(out.size(), remaining_len());
        if (n == 0) {
            return 0;
        }
        std::memcpy(out.data(), storage::const_view(storage_).data() + read_pos_, n);
        read_pos_ += n;
        return n;
    }

    // Discards n pending bytes, or nothing if fewer are pending
    [[nodiscard]] inline Error skip(std::size_t n) noexcept {
        if (n > remaining_len()) {
            EMBYTES_DEBUG("[embytes] skip(" << n << ") rejected: "
                          << remaining_len() << " bytes readable");
            return Error::NoData;
        }
        read_pos_ += n;
        return Error::None;
    }

    // ------------------------------------------------------------------------
    // Explicit space reclamation
    // ------------------------------------------------------------------------

    // Moves pending bytes to offset 0, turning dead capacity into free capacity
    inline void shift() noexcept {
        if (read_pos_ == 0) {
            return;
        }
        const std::size_t pending = remaining_len();
        auto bytes = storage::mutable_view(storage_);
        if (pending > 0) {
            std::memmove(bytes.data(), bytes.data() + read_pos_, pending);
        }
        EMBYTES_TRACE("[embytes] shift: reclaimed " << read_pos_ << " bytes");
        write_pos_ = pending;
        read_pos_ = 0;
    }

    // Shifts only when full. Returns true if there is room to write afterwards.
    [[nodiscard]] inline bool ensure_remaining_capacity() noexcept {
        if (!has_remaining_capacity()) {
            shift();
        }
        return has_remaining_capacity();
    }

    // Back to the initial state. Storage contents are left as they are.
    inline void reset() noexcept {
        EMBYTES_TRACE("[embytes] reset: dropping " << remaining_len() << " pending bytes");
        read_pos_ = 0;
        write_pos_ = 0;
    }

    // ------------------------------------------------------------------------
    // Scoped views
    // ------------------------------------------------------------------------

    [[nodiscard]] inline Reader<S> create_reader() noexcept {
        return Reader<S>(*this);
    }

    [[nodiscard]] inline Reader<S> create_reader_with_max(std::size_t max_bytes) noexcept {
        return Reader<S>(*this, max_bytes);
    }

    [[nodiscard]] inline Writer<S> create_writer() noexcept {
        return Writer<S>(*this);
    }

private:
    friend class Reader<S>;
    friend class Writer<S>;

    // Free region [write_pos, capacity)
    [[nodiscard]] inline std::span<std::uint8_t> free_region_() noexcept {
        return storage::mutable_view(storage_).subspan(write_pos_, remaining_capacity());
    }

    // PRECONDITION: 0 < src.size() <= remaining_capacity()
    inline void append_(std::span<const std::uint8_t> src) noexcept {
        std::memcpy(storage::mutable_view(storage_).data() + write_pos_, src.data(), src.size());
        write_pos_ += src.size();
    }

    // PRECONDITION: n <= remaining_capacity()
    inline void commit_written_(std::size_t n) noexcept {
        write_pos_ += n;
    }

    // PRECONDITION: n <= remaining_len()
    inline void commit_read_(std::size_t n) noexcept {
        read_pos_ += n;
    }

    inline void release_() noexcept {
        capacity_ = 0;
        write_pos_ = 0;
        read_pos_ = 0;
    }

private:
    S storage_;
    std::size_t capacity_;
    std::size_t write_pos_{0};
    std::size_t read_pos_{0};
};


// Buffer over zero-filled stack storage of compile-time size
template <std::size_t N = config::default_stack_capacity>
[[nodiscard]] inline Buffer<storage::stack<N>> make_stack_buffer() noexcept {
    return Buffer<storage::stack<N>>(storage::stack<N>{});
}

#ifndef EMBYTES_NO_ALLOCATIONS
template <ByteStorage S>
inline std::ostream& operator<<(std::ostream& os, const Buffer<S>& buffer) {
    return os << "Buffer(len = " << buffer.remaining_len()
              << ", cap = " << buffer.capacity()
              << ", rem_cap = " << buffer.remaining_capacity() << ")";
}
#endif

} // namespace embytes
