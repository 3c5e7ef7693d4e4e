#pragma once

#include "embytes/config.hpp"

#ifdef EMBYTES_NO_ALLOCATIONS
#error "embytes/io/streambuf.hpp requires a hosted build (EMBYTES_NO_ALLOCATIONS is defined)"
#endif

#include <cstddef>
#include <cstdint>
#include <span>
#include <streambuf>

#include "embytes/buffer.hpp"

namespace embytes::io::host {

// -----------------------------------------------------------------------------
// streambuf
// -----------------------------------------------------------------------------
//
// Unbuffered std::streambuf over a Buffer<S>, so std::ostream / std::istream
// can write into and read from the buffer:
//
//   auto buffer = embytes::make_stack_buffer<64>();
//   embytes::io::host::streambuf sb(buffer);
//   std::ostream os(&sb);
//   os << "answer=" << 42;
//
// No get or put area is installed: every stream operation lands directly in
// the buffer's read/write primitives. A short write surfaces as a smaller
// xsputn() count (or eof from overflow()), which std::ostream reports as
// badbit. A drained buffer surfaces as eof.
//
template <ByteStorage S>
class streambuf : public std::streambuf {
public:
    explicit streambuf(Buffer<S>& buffer) noexcept
        : buffer_(buffer)
    {}

    [[nodiscard]] inline Buffer<S>& buffer() noexcept {
        return buffer_;
    }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        const auto byte = static_cast<std::uint8_t>(traits_type::to_char_type(ch));
        if (buffer_.write(std::span<const std::uint8_t>(&byte, 1)) == 0) {
            return traits_type::eof();
        }
        return ch;
    }

    std::streamsize xsputn(const char_type* s, std::streamsize count) override {
        if (count <= 0) {
            return 0;
        }
        const std::span<const std::uint8_t> src(reinterpret_cast<const std::uint8_t*>(s),
                                                static_cast<std::size_t>(count));
        return static_cast<std::streamsize>(buffer_.write(src));
    }

    // Peek without consuming
    int_type underflow() override {
        const auto pending = buffer_.data();
        if (pending.empty()) {
            return traits_type::eof();
        }
        return traits_type::to_int_type(static_cast<char_type>(pending.front()));
    }

    int_type uflow() override {
        std::uint8_t byte = 0;
        if (buffer_.read(std::span<std::uint8_t>(&byte, 1)) == 0) {
            return traits_type::eof();
        }
        return traits_type::to_int_type(static_cast<char_type>(byte));
    }

    std::streamsize xsgetn(char_type* s, std::streamsize count) override {
        if (count <= 0) {
            return 0;
        }
        const std::span<std::uint8_t> out(reinterpret_cast<std::uint8_t*>(s),
                                          static_cast<std::size_t>(count));
        return static_cast<std::streamsize>(buffer_.read(out));
    }

    std::streamsize showmanyc() override {
        const std::size_t pending = buffer_.remaining_len();
        return pending > 0 ? static_cast<std::streamsize>(pending) : -1;
    }

    int sync() override {
        return 0;
    }

private:
    Buffer<S>& buffer_;
};

} // namespace embytes::io::host
