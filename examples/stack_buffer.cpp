#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "embytes/buffer.hpp"
#include "embytes/log.hpp"

#include "common/cli/buffer_params.hpp"

using namespace embytes;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
//
// Writes the payload into a fixed-capacity buffer chunk by chunk, then drains
// it. Shows that a short write is success with a smaller count and that the
// buffer is single-shot: once full, draining it does not make room again.
//
int main(int argc, char** argv) {
    const auto params = examples::cli::buffer::configure(argc, argv,
        "embytes - Fixed-Capacity Buffer Example\n"
        "Writes a payload in chunks and reads it back.\n",
        "Honours --capacity, --payload, --chunk and --log-level.\n"
        "Try a capacity smaller than the payload to see short writes.");

    params.dump("Parameters", std::cout);

    // The capacity comes from the command line, so the storage is heap-backed.
    // A fixed size would use embytes::make_stack_buffer<N>() instead.
    Buffer buffer{std::vector<std::uint8_t>(params.capacity)};

    // -------------------------------------------------------------
    // Fill
    // -------------------------------------------------------------
    std::string_view pending = params.payload;
    while (!pending.empty()) {
        const std::string_view chunk = pending.substr(0, params.chunk);
        const std::size_t n = buffer.write(chunk);
        EMBYTES_INFO("write(" << chunk.size() << ") -> " << n << "  " << buffer);
        if (n == 0) {
            EMBYTES_WARN("Buffer full, " << pending.size() << " payload bytes dropped");
            break;
        }
        pending.remove_prefix(n);
    }

    // -------------------------------------------------------------
    // Drain
    // -------------------------------------------------------------
    std::vector<std::uint8_t> out(params.chunk);
    std::string received;
    for (;;) {
        const std::size_t n = buffer.read(out);
        EMBYTES_INFO("read(" << out.size() << ") -> " << n << "  " << buffer);
        if (n == 0) {
            break;
        }
        received.append(as_text(std::span<const std::uint8_t>(out).first(n)));
    }

    std::cout << "Received: \"" << received << "\"\n";

    // Drained but not reclaimed
    if (!buffer.has_remaining_capacity()) {
        std::cout << "write after drain -> " << buffer.write("!") << " (no implicit reclaim)\n";
    }

    return 0;
}
