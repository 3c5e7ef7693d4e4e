#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <span>
#include <string_view>

#include "embytes/buffer.hpp"
#include "embytes/io/embedded.hpp"
#include "embytes/log.hpp"

#include "common/cli/buffer_params.hpp"

using namespace embytes;
using namespace embytes::io::embedded;

// -----------------------------------------------------------------------------
// Frame encoder
// -----------------------------------------------------------------------------
//
// Length-prefixed frames, encoded in place:
//
//   [ len (1 byte) | payload (len bytes) ]
//
// The frame is built directly inside the buffer's free region and published
// with a single commit, so a frame that does not fit leaves no trace.
//
template <ByteStorage S>
Error encode_frame(Buffer<S>& buffer, std::string_view payload) {
    if (payload.size() > 0xFF) {
        return Error::OutOfCapacity;
    }
    auto writer = buffer.create_writer();
    const std::size_t frame_size = 1 + payload.size();
    if (frame_size > writer.remaining_capacity()) {
        return Error::OutOfCapacity;
    }
    auto out = writer.view();
    out[0] = static_cast<std::uint8_t>(payload.size());
    const auto bytes = as_bytes(payload);
    std::copy(bytes.begin(), bytes.end(), out.begin() + 1);
    return writer.commit(frame_size);
}

// Reads one frame through the embedded I/O surface
template <Read R>
ErrorKind decode_frame(R& device, std::span<std::uint8_t> scratch, std::size_t& len) {
    std::array<std::uint8_t, 1> header{};
    if (const ErrorKind kind = read_exact(device, header); kind != ErrorKind::None) {
        return kind;
    }
    len = header[0];
    if (len > scratch.size()) {
        return ErrorKind::OutOfMemory;
    }
    return read_exact(device, scratch.first(len));
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    examples::cli::buffer::Params defaults;
    defaults.capacity = 32;
    defaults.payload = "frame-one frame-two frame-three";

    const auto params = examples::cli::buffer::configure(argc, argv,
        "embytes - Writer Example\n"
        "Encodes whitespace-separated words as length-prefixed frames.\n",
        "Honours --payload and --log-level.\n"
        "The buffer uses 32 bytes of stack storage.",
        defaults);

    auto buffer = make_stack_buffer<32>();

    std::string_view words = params.payload;
    while (!words.empty()) {
        const auto space = words.find(' ');
        const std::string_view word = words.substr(0, space);
        words.remove_prefix(space == std::string_view::npos ? words.size() : space + 1);
        if (word.empty()) {
            continue;
        }

        const Error err = encode_frame(buffer, word);
        if (err != Error::None) {
            EMBYTES_WARN("Frame \"" << word << "\" rejected: " << to_string(err) << "  " << buffer);
            continue;
        }
        EMBYTES_INFO("Encoded \"" << word << "\"  " << buffer);
    }

    // Drain through the embedded surface, as a UART driver would
    Adapter device(buffer);
    std::array<std::uint8_t, 255> scratch{};
    for (;;) {
        std::size_t len = 0;
        const ErrorKind kind = decode_frame(device, scratch, len);
        if (kind == ErrorKind::UnexpectedEof) {
            break;
        }
        if (kind != ErrorKind::None) {
            EMBYTES_ERROR("Decode failed: " << to_string(kind));
            return 1;
        }
        std::cout << "frame[" << len << "]: " << as_text(std::span<const std::uint8_t>(scratch).first(len)) << "\n";
    }

    return 0;
}
