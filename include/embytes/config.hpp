#pragma once

/*
===============================================================================
embytes - Compile-Time Configuration
===============================================================================

All configuration is resolved at compile time. There is no runtime
configuration file, no environment lookup and no global mutable state in the
buffer core.

Feature switches (usually set by the build system):

  EMBYTES_NO_LOG
      Every EMBYTES_* logging macro expands to nothing and the logger header
      (and with it <iostream>) is never included by the core headers.

  EMBYTES_NO_ALLOCATIONS
      Bare-metal profile. Drops everything that needs the hosted runtime:
      the host I/O surface (std::error_code, std::system_error,
      std::streambuf) and the logger. Implies EMBYTES_NO_LOG.

  EMBYTES_WITH_JSON
      Enables embytes/json.hpp (simdjson-backed parsing of readable bytes,
      allocation-free serialization into free capacity).

Design principles:
  - No magic numbers scattered across the codebase
  - Bare-metal builds pay for nothing they do not use
===============================================================================
*/

#include <cstddef>

#if defined(EMBYTES_NO_ALLOCATIONS) && !defined(EMBYTES_NO_LOG)
#define EMBYTES_NO_LOG
#endif

namespace embytes::config {

// -----------------------------------------------------------------------------
// Storage defaults
// -----------------------------------------------------------------------------
inline constexpr std::size_t default_stack_capacity = 1 << 10; // 1024

// -----------------------------------------------------------------------------
// Feature flags (mirrors of the preprocessor switches)
// -----------------------------------------------------------------------------
#ifdef EMBYTES_NO_LOG
inline constexpr bool logging_enabled = false;
#else
inline constexpr bool logging_enabled = true;
#endif

#ifdef EMBYTES_NO_ALLOCATIONS
inline constexpr bool hosted = false;
#else
inline constexpr bool hosted = true;
#endif

#ifdef EMBYTES_WITH_JSON
inline constexpr bool json_enabled = true;
#else
inline constexpr bool json_enabled = false;
#endif

} // namespace embytes::config
