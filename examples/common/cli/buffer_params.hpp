#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace embytes::examples::cli::buffer {

struct Params {
    std::size_t capacity  = 64;
    std::string payload   = "hello world";
    std::size_t chunk     = 4;
    std::string log_level = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Capacity  : " << capacity << " bytes\n"
           << "  Payload   : \"" << payload << "\" (" << payload.size() << " bytes)\n"
           << "  Chunk     : " << chunk << " bytes\n"
           << "  Log Level : " << log_level << "\n";
    }
};

// Shared option set of the buffer examples. Each example documents in its
// footer which options it honours.
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description, std::string_view footer, Params defaults = {}) {
    CLI::App app{std::string(description)};
    Params params = defaults;

    app.add_option("-c,--capacity", params.capacity, "Buffer capacity in bytes")->check(capacity_validator)->default_val(params.capacity);
    app.add_option("-p,--payload", params.payload, "Bytes to push through the buffer")->default_val(params.payload);
    app.add_option("--chunk", params.chunk, "Bytes moved per read/write step")->check(CLI::Range(std::size_t{1}, max_capacity))->default_val(params.chunk);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(std::string(footer));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace embytes::examples::cli::buffer
