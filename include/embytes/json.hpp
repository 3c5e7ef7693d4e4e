// ============================================================================
// JSON over Buffer
// ----------------------------------------------------------------------------
//
// Two directions, both working in place on the buffer's storage:
//
// -----------------------------------------------------------------------------
// 1. Serialization (allocation-free)
// -----------------------------------------------------------------------------
//
// Any type satisfying JsonWritable is written straight into the buffer's free
// region:
//
//   • StaticJsonWritable:  static constexpr max_json_size() noexcept
//                          std::size_t write_json(char*) const noexcept
//   • DynamicJsonWritable: std::size_t max_json_size() const noexcept
//                          std::size_t write_json(char*) const noexcept
//
// max_json_size() is checked against the free capacity BEFORE anything is
// written, so a serialization either lands completely or not at all
// (Error::OutOfCapacity).
//
// -----------------------------------------------------------------------------
// 2. Parsing (simdjson DOM)
// -----------------------------------------------------------------------------
//
// json::parse() parses the whole readable region as one JSON document with
// the caller's simdjson::dom::parser. On success the region is consumed and
// the element stays valid until the parser is reused. On failure nothing is
// consumed.
//
// Only one document per parse: concatenated documents in the readable region
// are rejected as InvalidJson.
//
// ============================================================================
#pragma once

#include "embytes/config.hpp"

#ifndef EMBYTES_WITH_JSON
#error "embytes/json.hpp requires EMBYTES_WITH_JSON"
#endif

#include <concepts>
#include <cstddef>

#include "simdjson.h"

#include "embytes/buffer.hpp"
#include "embytes/error.hpp"
#include "embytes/log.hpp"
#include "embytes/json/append.hpp"

namespace embytes::json {

// Maximum serialized size is known at compile time
template<typename T>
concept StaticJsonWritable =
    requires(const T& t, char* buffer) {
        { T::max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    }
    &&
    requires {
        // Forces constant-evaluated context
        requires (T::max_json_size() > 0);
    };

// Maximum serialized size depends on runtime data, still bounded
template<typename T>
concept DynamicJsonWritable =
    (!StaticJsonWritable<T>)
    &&
    requires(const T& t, char* buffer) {
        { t.max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    };

template<typename T>
concept JsonWritable = StaticJsonWritable<T> || DynamicJsonWritable<T>;


template <JsonWritable T>
[[nodiscard]] inline std::size_t max_json_size(const T& value) noexcept {
    if constexpr (StaticJsonWritable<T>) {
        return T::max_json_size();
    } else {
        return value.max_json_size();
    }
}

// Serializes value into the writer's uncommitted region and commits it
template <ByteStorage S, JsonWritable T>
[[nodiscard]] inline Error serialize(Writer<S>& writer, const T& value) noexcept {
    const std::size_t bound = max_json_size(value);
    if (bound > writer.remaining_capacity()) {
        EMBYTES_DEBUG("[embytes] json::serialize rejected: needs up to " << bound
                      << " bytes, " << writer.remaining_capacity() << " free");
        return Error::OutOfCapacity;
    }
    const auto out = writer.view();
    const std::size_t n = value.write_json(reinterpret_cast<char*>(out.data()));
    return writer.commit(n);
}

template <ByteStorage S, JsonWritable T>
[[nodiscard]] inline Error serialize(Buffer<S>& buffer, const T& value) noexcept {
    auto writer = buffer.create_writer();
    return serialize(writer, value);
}

// Parses the readable region as a single document and consumes it
template <ByteStorage S>
[[nodiscard]] inline Error parse(Buffer<S>& buffer, simdjson::dom::parser& parser, simdjson::dom::element& out) noexcept {
    const auto pending = buffer.data();
    if (pending.empty()) {
        return Error::NoData;
    }
    const simdjson::error_code error = parser.parse(pending.data(), pending.size()).get(out);
    if (error) {
        EMBYTES_DEBUG("[embytes] json::parse failed: " << simdjson::error_message(error));
        return Error::InvalidJson;
    }
    return buffer.skip(pending.size());
}

} // namespace embytes::json
