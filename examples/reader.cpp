#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "embytes/buffer.hpp"
#include "embytes/log.hpp"

#include "common/cli/buffer_params.hpp"

using namespace embytes;

// -----------------------------------------------------------------------------
// Comma-separated token decoder
// -----------------------------------------------------------------------------
//
// Peeks at the readable bytes through a scoped Reader. A complete token is
// consumed together with its comma; an incomplete one is left in place and
// retried once more bytes have arrived.
//
template <ByteStorage S>
std::optional<std::string> next_token(Buffer<S>& buffer) {
    auto reader = buffer.create_reader();
    const std::string_view text = as_text(reader.unread());
    const auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    if (reader.add_bytes_read(comma + 1) != Error::None) {
        return std::nullopt;
    }
    return std::string(text.substr(0, comma));
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    examples::cli::buffer::Params defaults;
    defaults.capacity = 16;
    defaults.payload = "temp=21,hum=40,pressure=1013,wind=7,";
    defaults.chunk = 5;

    const auto params = examples::cli::buffer::configure(argc, argv,
        "embytes - Reader Example\n"
        "Decodes comma-terminated tokens from data arriving in chunks.\n",
        "Honours --capacity, --payload, --chunk and --log-level.\n"
        "The buffer is compacted with shift() whenever it runs full.",
        defaults);

    params.dump("Parameters", std::cout);

    Buffer buffer{std::vector<std::uint8_t>(params.capacity)};

    std::string_view incoming = params.payload;
    while (!incoming.empty()) {
        // Make room for the next chunk by dropping bytes already consumed
        if (!buffer.ensure_remaining_capacity()) {
            EMBYTES_ERROR("Token longer than the buffer capacity (" << buffer.capacity() << " bytes)");
            return 1;
        }

        const std::size_t n = buffer.write(incoming.substr(0, params.chunk));
        incoming.remove_prefix(n);
        EMBYTES_DEBUG("received " << n << " bytes  " << buffer);

        while (auto token = next_token(buffer)) {
            std::cout << "token: " << *token << "\n";
        }
    }

    if (buffer.has_remaining_len()) {
        EMBYTES_WARN("Unterminated trailing data: \"" << as_text(buffer.data()) << "\"");
    }

    return 0;
}
