#pragma once

#include <cstdint>
#include <string_view>

#include "embytes/config.hpp"

#ifndef EMBYTES_NO_ALLOCATIONS
#include <string>
#include <system_error>
#endif

namespace embytes {

/*
===============================================================================
 embytes::Error
===============================================================================

Buffer-level error classification.

Short operations are NOT errors: a read or write that moves fewer bytes than
requested reports success with a smaller count. The raw read/write
primitives never fail at all.

Explicit failures are reserved for the all-or-nothing helpers, which either
complete or report why they could not:

- OutOfCapacity: a write made zero progress while bytes were outstanding
                 (write_all), or the payload does not fit as a whole
                 (push, Writer::commit, json::serialize).
- NoData:        fewer readable bytes than the caller asked to consume
                 (skip, Reader::add_bytes_read, json::parse on an empty region).
- InvalidJson:   the readable region is not a single well-formed JSON document.

Every failure is recoverable: drain the buffer (or reclaim space) and retry,
or treat the condition as a hard limit.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    OutOfCapacity,
    NoData,
    InvalidJson
};

/// Optional helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:          return "None";
    case Error::OutOfCapacity: return "OutOfCapacity";
    case Error::NoData:        return "NoData";
    case Error::InvalidJson:   return "InvalidJson";
    default:                   return "Unknown";
    }
}

#ifndef EMBYTES_NO_ALLOCATIONS

// -----------------------------------------------------------------------------
// std::error_code integration (host builds only)
// -----------------------------------------------------------------------------
//
// Error::None maps to the "no error" value 0. Conditions:
//   OutOfCapacity -> std::errc::no_buffer_space
//   NoData        -> std::errc::resource_unavailable_try_again
//   InvalidJson   -> std::errc::bad_message
//
[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Error err) noexcept;

namespace detail {

// Throws std::system_error if ec holds an error.
void throw_error(const std::error_code& ec, const char* location);

} // namespace detail

#endif // EMBYTES_NO_ALLOCATIONS

} // namespace embytes

#ifndef EMBYTES_NO_ALLOCATIONS
namespace std {
template <>
struct is_error_code_enum<embytes::Error> : true_type {};
} // namespace std
#endif
