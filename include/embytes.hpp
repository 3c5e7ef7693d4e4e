#pragma once

/*
===============================================================================
embytes - Public API Entry Point
===============================================================================

Fixed-capacity FIFO byte buffer for environments without a heap or OS, with
an embedded-oriented and a host-oriented blocking I/O surface over the same
implementation.

  embytes::Buffer<S>            core buffer over any ByteStorage
  embytes::make_stack_buffer<N> stack storage convenience
  embytes::io::embedded         allocation-free reader/writer surface
  embytes::io::host             std::error_code / std::streambuf surface
  embytes::json                 simdjson parsing, in-place serialization

Bare-metal builds (EMBYTES_NO_ALLOCATIONS) only get the core and the
embedded surface.
===============================================================================
*/

#include <embytes/version.hpp>
#include <embytes/config.hpp>
#include <embytes/error.hpp>
#include <embytes/storage.hpp>
#include <embytes/buffer.hpp>
#include <embytes/io/embedded.hpp>

#ifndef EMBYTES_NO_ALLOCATIONS
#include <embytes/io/host.hpp>
#include <embytes/io/streambuf.hpp>
#endif

#ifdef EMBYTES_WITH_JSON
#include <embytes/json.hpp>
#endif
