#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "simdjson.h"

#include "embytes/buffer.hpp"
#include "embytes/json.hpp"
#include "embytes/log.hpp"

#include "common/logger.hpp"

using namespace embytes;

// -----------------------------------------------------------------------------
// Telemetry record
// -----------------------------------------------------------------------------
struct Telemetry {
    std::string_view device;
    std::uint64_t sequence;
    std::uint64_t millivolts;

    std::size_t max_json_size() const noexcept {
        // {"device":<quoted>,"seq":<20>,"mv":<20>}
        return 24 + json::max_quoted_size(device.size()) + 2 * 20;
    }

    std::size_t write_json(char* out) const noexcept {
        std::size_t n = 0;
        n += json::append(out + n, "{\"device\":");
        n += json::append_quoted(out + n, device);
        n += json::append(out + n, ",\"seq\":");
        n += json::append(out + n, sequence);
        n += json::append(out + n, ",\"mv\":");
        n += json::append(out + n, millivolts);
        out[n++] = '}';
        return n;
    }
};

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
//
// Serializes telemetry records straight into a stack buffer, one document at a
// time, and parses each back with simdjson before the next one is written.
//
int main(int argc, char** argv) {
    CLI::App app{"embytes - JSON Round-Trip Example\n"
        "Serializes telemetry records into a buffer and parses them back.\n"};

    std::string device    = "sensor-1";
    std::uint64_t count   = 3;
    std::string log_level = "info";

    app.add_option("-d,--device", device, "Device name embedded in each record")->default_val(device);
    app.add_option("-n,--count", count, "Number of records")->check(CLI::Range(1, 1000))->default_val(count);
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error")->default_val(log_level);

    CLI11_PARSE(app, argc, argv);

    examples::set_log_level(log_level);

    auto buffer = make_stack_buffer<256>();
    simdjson::dom::parser parser;

    for (std::uint64_t seq = 0; seq < count; ++seq) {
        buffer.reset();

        const Telemetry record{device, seq, 3300 - seq * 5};
        if (const Error err = json::serialize(buffer, record); err != Error::None) {
            EMBYTES_ERROR("Serialization failed: " << to_string(err) << "  " << buffer);
            return 1;
        }
        EMBYTES_DEBUG("Serialized: " << as_text(buffer.data()));

        simdjson::dom::element doc;
        if (const Error err = json::parse(buffer, parser, doc); err != Error::None) {
            EMBYTES_ERROR("Parse failed: " << to_string(err));
            return 1;
        }

        std::string_view name;
        std::uint64_t parsed_seq = 0;
        std::uint64_t mv = 0;
        if (doc["device"].get(name) || doc["seq"].get(parsed_seq) || doc["mv"].get(mv)) {
            EMBYTES_ERROR("Unexpected document shape: " << simdjson::to_string(doc));
            return 1;
        }
        std::cout << name << " #" << parsed_seq << ": " << mv << " mV\n";
    }

    return 0;
}
