#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>


namespace embytes::examples::cli {

// Largest heap-backed buffer the examples will create
inline constexpr std::size_t max_capacity = 1 << 20;

// -------------------------------------------------------------
// Buffer capacity validator
// -------------------------------------------------------------
inline auto capacity_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const auto capacity = std::stoul(value);
            if (capacity <= max_capacity) {
                return {};
            }
            return "Capacity must not exceed " + std::to_string(max_capacity) + " bytes";
        } catch (const std::exception&) {
            return "Capacity must be a valid integer";
        }
    },
    "Buffer capacity validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember(std::vector<std::string>{"trace", "debug", "info", "warn", "error"});

} // namespace embytes::examples::cli
