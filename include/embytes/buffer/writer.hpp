#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "embytes/error.hpp"
#include "embytes/log.hpp"
#include "embytes/storage.hpp"

/*
================================================================================
embytes Writer
================================================================================

Scoped, zero-copy view over the free region of a Buffer.

Producer workflow:
  - Obtain a writer via Buffer::create_writer()
  - Encode directly into view()
  - Publish the bytes via commit(n)
  - Drop the writer: the buffer's write cursor advances by the total committed

Only committed bytes become readable. Bytes written into view() without a
commit are ignored and will be overwritten by the next producer.

The writer never reclaims dead capacity. Call Buffer::shift() beforehand if
the free region is too small.

IMPORTANT:
  - The buffer must not be used directly while a writer is alive
  - view() is invalidated when the writer is destroyed
================================================================================
*/

namespace embytes {

template <ByteStorage S>
class Buffer;

template <ByteStorage S>
class Writer {
public:
    explicit Writer(Buffer<S>& buffer) noexcept
        : buffer_(&buffer)
    {}

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    Writer(Writer&& other) noexcept
        : buffer_(std::exchange(other.buffer_, nullptr))
        , committed_(std::exchange(other.committed_, 0))
    {}

    Writer& operator=(Writer&&) = delete;

    ~Writer() {
        if (buffer_ != nullptr && committed_ > 0) {
            buffer_->commit_written_(committed_);
        }
    }

    // Uncommitted part of the free region
    [[nodiscard]] inline std::span<std::uint8_t> view() noexcept {
        return buffer_->free_region_().subspan(committed_);
    }

    [[nodiscard]] inline std::size_t remaining_capacity() const noexcept {
        return buffer_->remaining_capacity() - committed_;
    }

    [[nodiscard]] inline bool has_remaining_capacity() const noexcept {
        return remaining_capacity() > 0;
    }

    [[nodiscard]] inline std::size_t committed() const noexcept {
        return committed_;
    }

    // Publishes the next n bytes of view()
    [[nodiscard]] inline Error commit(std::size_t n) noexcept {
        if (n > remaining_capacity()) {
            EMBYTES_DEBUG("[embytes] Writer::commit(" << n << ") rejected: "
                          << remaining_capacity() << " bytes free");
            return Error::OutOfCapacity;
        }
        committed_ += n;
        return Error::None;
    }

private:
    Buffer<S>* buffer_;
    std::size_t committed_{0};
};

} // namespace embytes
