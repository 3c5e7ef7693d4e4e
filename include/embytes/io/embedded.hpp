#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "embytes/buffer.hpp"
#include "embytes/error.hpp"

/*
================================================================================
embytes Embedded I/O Surface
================================================================================

Blocking reader/writer contract for bare-metal code (drivers, protocol
stacks, firmware glue). Mirrors the shape of the usual embedded I/O traits:

  ErrorKind read(out, n)    -> bytes moved reported through n
  ErrorKind write(in, n)
  ErrorKind flush()

Rules:
  • No allocation, no exceptions, no <iostream>
  • A zero count is a valid result, not an error
  • Errors are a small closed enum so they fit in a register

Adapter<S> implements the contract for Buffer<S> by forwarding to the
buffer's own read/write/write_all and converting embytes::Error into
ErrorKind. It adds no buffering, retry or waiting: a full buffer reports
0 bytes written immediately.

The free functions read_exact() / write_all() are written against the
concepts only and work with any conforming device, not just buffers.
================================================================================
*/

namespace embytes::io::embedded {

enum class ErrorKind : std::uint8_t {
    None = 0,
    Other,          // Unspecified device error
    WriteZero,      // A write made no progress while bytes were outstanding
    UnexpectedEof,  // A read made no progress while bytes were still expected
    OutOfMemory     // Destination too small for what the device reports
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:          return "None";
    case ErrorKind::Other:         return "Other";
    case ErrorKind::WriteZero:     return "WriteZero";
    case ErrorKind::UnexpectedEof: return "UnexpectedEof";
    case ErrorKind::OutOfMemory:   return "OutOfMemory";
    default:                       return "Unknown";
    }
}

[[nodiscard]]
inline constexpr ErrorKind to_error_kind(Error err) noexcept {
    switch (err) {
    case Error::None:          return ErrorKind::None;
    case Error::OutOfCapacity: return ErrorKind::WriteZero;
    case Error::NoData:        return ErrorKind::UnexpectedEof;
    default:                   return ErrorKind::Other;
    }
}

// -----------------------------------------------------------------------------
// Capability concepts
// -----------------------------------------------------------------------------

template <class R>
concept Read = requires(R& r, std::span<std::uint8_t> out, std::size_t& n) {
    { r.read(out, n) } noexcept -> std::same_as<ErrorKind>;
};

template <class W>
concept Write = requires(W& w, std::span<const std::uint8_t> in, std::size_t& n) {
    { w.write(in, n) } noexcept -> std::same_as<ErrorKind>;
    { w.flush() } noexcept -> std::same_as<ErrorKind>;
};

// -----------------------------------------------------------------------------
// Buffer adapter
// -----------------------------------------------------------------------------

template <ByteStorage S>
class Adapter {
public:
    explicit Adapter(Buffer<S>& buffer) noexcept
        : buffer_(buffer)
    {}

    [[nodiscard]] inline ErrorKind read(std::span<std::uint8_t> out, std::size_t& n) noexcept {
        n = buffer_.read(out);
        return ErrorKind::None;
    }

    [[nodiscard]] inline ErrorKind write(std::span<const std::uint8_t> in, std::size_t& n) noexcept {
        n = buffer_.write(in);
        return ErrorKind::None;
    }

    [[nodiscard]] inline ErrorKind write_all(std::span<const std::uint8_t> in) noexcept {
        return to_error_kind(buffer_.write_all(in));
    }

    // Nothing downstream to flush to
    [[nodiscard]] inline ErrorKind flush() noexcept {
        return ErrorKind::None;
    }

    [[nodiscard]] inline Buffer<S>& buffer() noexcept {
        return buffer_;
    }

private:
    Buffer<S>& buffer_;
};

// -----------------------------------------------------------------------------
// Generic helpers
// -----------------------------------------------------------------------------

template <Write W>
[[nodiscard]] inline ErrorKind write_all(W& w, std::span<const std::uint8_t> in) noexcept {
    while (!in.empty()) {
        std::size_t n = 0;
        const ErrorKind kind = w.write(in, n);
        if (kind != ErrorKind::None) {
            return kind;
        }
        if (n == 0) {
            return ErrorKind::WriteZero;
        }
        in = in.subspan(n);
    }
    return ErrorKind::None;
}

// Fills out completely or reports UnexpectedEof. On failure the bytes
// already read stay at the front of out.
template <Read R>
[[nodiscard]] inline ErrorKind read_exact(R& r, std::span<std::uint8_t> out) noexcept {
    while (!out.empty()) {
        std::size_t n = 0;
        const ErrorKind kind = r.read(out, n);
        if (kind != ErrorKind::None) {
            return kind;
        }
        if (n == 0) {
            return ErrorKind::UnexpectedEof;
        }
        out = out.subspan(n);
    }
    return ErrorKind::None;
}

} // namespace embytes::io::embedded
