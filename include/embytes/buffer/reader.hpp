#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>

#include "embytes/error.hpp"
#include "embytes/log.hpp"
#include "embytes/storage.hpp"

/*
================================================================================
embytes Reader
================================================================================

Scoped, zero-copy view over the readable region of a Buffer.

Consumer workflow:
  - Obtain a reader via Buffer::create_reader() (optionally bounded by a
    maximum byte count)
  - Inspect view() in place (parse, search, decode...)
  - Report how much was consumed via add_bytes_read()
  - Drop the reader: the buffer's read cursor advances by the total consumed

A reader that consumes nothing leaves the buffer untouched, which lets a
parser peek at an incomplete frame and retry once more bytes arrived.

IMPORTANT:
  - The buffer must not be used directly while a reader is alive
  - view() is invalidated when the reader is destroyed
================================================================================
*/

namespace embytes {

template <ByteStorage S>
class Buffer;

template <ByteStorage S>
class Reader {
public:
    static constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

    explicit Reader(Buffer<S>& buffer, std::size_t max_bytes = unbounded) noexcept
        : buffer_(&buffer)
        , limit_(std::min(max_bytes, buffer.remaining_len()))
    {}

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    Reader(Reader&& other) noexcept
        : buffer_(std::exchange(other.buffer_, nullptr))
        , limit_(other.limit_)
        , bytes_read_(std::exchange(other.bytes_read_, 0))
    {}

    Reader& operator=(Reader&&) = delete;

    ~Reader() {
        if (buffer_ != nullptr && bytes_read_ > 0) {
            buffer_->commit_read_(bytes_read_);
        }
    }

    // Every readable byte visible to this reader (consumed or not)
    [[nodiscard]] inline std::span<const std::uint8_t> view() const noexcept {
        return buffer_->data().first(limit_);
    }

    // Bytes not yet marked as consumed
    [[nodiscard]] inline std::span<const std::uint8_t> unread() const noexcept {
        return view().subspan(bytes_read_);
    }

    [[nodiscard]] inline std::size_t size() const noexcept {
        return limit_;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return limit_ == 0;
    }

    [[nodiscard]] inline std::size_t bytes_read() const noexcept {
        return bytes_read_;
    }

    // Marks n more bytes as consumed
    [[nodiscard]] inline Error add_bytes_read(std::size_t n) noexcept {
        if (n > limit_ - bytes_read_) {
            EMBYTES_DEBUG("[embytes] Reader::add_bytes_read(" << n << ") rejected: "
                          << (limit_ - bytes_read_) << " bytes unread");
            return Error::NoData;
        }
        bytes_read_ += n;
        return Error::None;
    }

private:
    Buffer<S>* buffer_;
    std::size_t limit_;
    std::size_t bytes_read_{0};
};

} // namespace embytes
