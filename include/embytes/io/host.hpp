#pragma once

#include "embytes/config.hpp"

#ifdef EMBYTES_NO_ALLOCATIONS
#error "embytes/io/host.hpp requires a hosted build (EMBYTES_NO_ALLOCATIONS is defined)"
#endif

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

#include "embytes/buffer.hpp"
#include "embytes/error.hpp"

/*
================================================================================
embytes Host I/O Surface
================================================================================

Blocking reader/writer contract for hosted code (tools, tests, simulators),
following the usual C++ host conventions:

  • Every operation has a non-throwing overload taking std::error_code&
  • ...and a throwing overload raising std::system_error
  • write_all() layers the all-or-nothing contract on top of write()

Adapter<S> forwards to Buffer<S> and only converts embytes::Error into
std::error_code (category "embytes"). read()/write() never fail: a full or
drained buffer reports 0 bytes with a cleared error code. write_all() fails
with Error::OutOfCapacity, which compares equal to
std::errc::no_buffer_space.

See embytes/io/streambuf.hpp to drive a buffer from std::istream /
std::ostream.
================================================================================
*/

namespace embytes::io::host {

template <ByteStorage S>
class Adapter {
public:
    explicit Adapter(Buffer<S>& buffer) noexcept
        : buffer_(buffer)
    {}

    // ------------------------------------------------------------------------
    // Read
    // ------------------------------------------------------------------------

    inline std::size_t read(std::span<std::uint8_t> out, std::error_code& ec) noexcept {
        ec.clear();
        return buffer_.read(out);
    }

    inline std::size_t read(std::span<std::uint8_t> out) {
        std::error_code ec;
        const std::size_t n = read(out, ec);
        detail::throw_error(ec, "embytes::io::host::read");
        return n;
    }

    // ------------------------------------------------------------------------
    // Write
    // ------------------------------------------------------------------------

    inline std::size_t write(std::span<const std::uint8_t> in, std::error_code& ec) noexcept {
        ec.clear();
        return buffer_.write(in);
    }

    inline std::size_t write(std::span<const std::uint8_t> in) {
        std::error_code ec;
        const std::size_t n = write(in, ec);
        detail::throw_error(ec, "embytes::io::host::write");
        return n;
    }

    inline void write_all(std::span<const std::uint8_t> in, std::error_code& ec) noexcept {
        ec = make_error_code(buffer_.write_all(in));
    }

    inline void write_all(std::span<const std::uint8_t> in) {
        std::error_code ec;
        write_all(in, ec);
        detail::throw_error(ec, "embytes::io::host::write_all");
    }

    // ------------------------------------------------------------------------
    // Flush (nothing downstream)
    // ------------------------------------------------------------------------

    inline void flush(std::error_code& ec) noexcept {
        ec.clear();
    }

    inline void flush() {}

    [[nodiscard]] inline Buffer<S>& buffer() noexcept {
        return buffer_;
    }

private:
    Buffer<S>& buffer_;
};

} // namespace embytes::io::host
