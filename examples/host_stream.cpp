#include <cstdint>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

#include "embytes/buffer.hpp"
#include "embytes/io/host.hpp"
#include "embytes/io/streambuf.hpp"
#include "embytes/log.hpp"

#include "common/cli/buffer_params.hpp"

using namespace embytes;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
//
// Drives a buffer with standard C++ streams, then shows both error styles of
// the host adapter on a full buffer.
//
int main(int argc, char** argv) {
    examples::cli::buffer::Params defaults;
    defaults.capacity = 48;

    const auto params = examples::cli::buffer::configure(argc, argv,
        "embytes - Host Stream Example\n"
        "Formats text into a buffer with std::ostream and parses it back with std::istream.\n",
        "Honours --capacity, --payload and --log-level.\n"
        "A capacity below 40 bytes makes the formatted output overflow.",
        defaults);

    params.dump("Parameters", std::cout);

    Buffer buffer{std::vector<std::uint8_t>(params.capacity)};
    io::host::streambuf sb(buffer);

    // -------------------------------------------------------------
    // Format
    // -------------------------------------------------------------
    std::ostream os(&sb);
    os << "id " << 7 << "\n" << "payload " << params.payload << "\n";
    if (os.bad()) {
        EMBYTES_WARN("Output truncated: " << buffer);
    }
    EMBYTES_INFO("Formatted: " << buffer);

    // -------------------------------------------------------------
    // Parse
    // -------------------------------------------------------------
    std::istream is(&sb);
    std::string key;
    int id = 0;
    if (is >> key >> id) {
        std::cout << key << " = " << id << "\n";
    }
    std::string line;
    while (std::getline(is >> std::ws, line)) {
        std::cout << "line: " << line << "\n";
    }

    // -------------------------------------------------------------
    // Error reporting on a full buffer
    // -------------------------------------------------------------
    io::host::Adapter adapter(buffer);

    std::error_code ec;
    adapter.write_all(as_bytes(std::string(params.capacity + 1, '#')), ec);
    if (ec == std::errc::no_buffer_space) {
        std::cout << "write_all (error_code): " << ec.message() << " [" << ec.category().name() << "]\n";
    }

    try {
        adapter.write_all(as_bytes("more"));
    } catch (const std::system_error& e) {
        std::cout << "write_all (throwing):   " << e.what() << "\n";
    }

    return 0;
}
