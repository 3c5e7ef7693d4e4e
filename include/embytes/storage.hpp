#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>
#include <string_view>

#include "embytes/config.hpp"

/*
================================================================================
embytes Storage
================================================================================

A Buffer never allocates. It takes ownership of a storage *value* that hands
out two views over the same fixed-length memory:

  • mutable_view(s) -> std::span<std::uint8_t>        (used by writes)
  • const_view(s)   -> std::span<const std::uint8_t>  (used by reads)

The storage value may or may not own the bytes behind it:

  • std::array<std::uint8_t, N>   owns stack / static memory
  • std::vector<std::uint8_t>     owns heap memory (hosted builds)
  • std::span<std::uint8_t>       borrows memory owned elsewhere

Any type exposing as_mut() / as_ref() member functions with the same return
types is accepted as well, which covers memory-mapped regions, DMA windows
and other board-specific memory.

Resolution is purely compile-time. There is no virtual dispatch.

IMPORTANT:
  - The view length is read once, at Buffer construction, and becomes the
    buffer's capacity. Storage must not change length afterwards.
================================================================================
*/

namespace embytes::storage {

// Types with explicit view accessors
template <typename S>
concept MemberViews = requires(S& s, const S& cs) {
    { s.as_mut() } -> std::convertible_to<std::span<std::uint8_t>>;
    { cs.as_ref() } -> std::convertible_to<std::span<const std::uint8_t>>;
};

// Contiguous ranges of writable bytes
template <typename S>
concept ContiguousBytes =
    std::ranges::contiguous_range<S> &&
    std::ranges::sized_range<S> &&
    std::same_as<std::ranges::range_value_t<S>, std::uint8_t> &&
    requires(S& s) {
        { std::ranges::data(s) } -> std::convertible_to<std::uint8_t*>;
    };

template <typename S>
    requires MemberViews<S> || ContiguousBytes<S>
[[nodiscard]]
inline std::span<std::uint8_t> mutable_view(S& s) noexcept {
    if constexpr (MemberViews<S>) {
        return s.as_mut();
    } else {
        return std::span<std::uint8_t>(std::ranges::data(s), std::ranges::size(s));
    }
}

template <typename S>
    requires MemberViews<S> || ContiguousBytes<S>
[[nodiscard]]
inline std::span<const std::uint8_t> const_view(const S& s) noexcept {
    if constexpr (MemberViews<S>) {
        return s.as_ref();
    } else {
        return std::span<const std::uint8_t>(std::ranges::data(s), std::ranges::size(s));
    }
}

// Stack-resident storage of compile-time size
template <std::size_t N = config::default_stack_capacity>
using stack = std::array<std::uint8_t, N>;

} // namespace embytes::storage


namespace embytes {

// ----------------------------------------------------------------------------
// ByteStorage
// ----------------------------------------------------------------------------
//
// The only requirement a Buffer places on its storage.
//
template <typename S>
concept ByteStorage =
    std::move_constructible<S> &&
    requires(S& s, const S& cs) {
        { storage::mutable_view(s) } -> std::same_as<std::span<std::uint8_t>>;
        { storage::const_view(cs) } -> std::same_as<std::span<const std::uint8_t>>;
    };

// Reinterprets text as a read-only byte span (no copy)
[[nodiscard]]
inline std::span<const std::uint8_t> as_bytes(std::string_view text) noexcept {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

// Reinterprets a byte span as text (no copy)
[[nodiscard]]
inline std::string_view as_text(std::span<const std::uint8_t> bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace embytes
