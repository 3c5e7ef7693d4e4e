#pragma once

#include "embytes/config.hpp"

// ---------------------------------------------------------
// Logging macros
// ---------------------------------------------------------
//
// Usage: EMBYTES_DEBUG("skip(" << n << ") rejected");
//
// The level is checked before the message is built: a filtered record
// evaluates none of its operands and allocates nothing.
//
// Under EMBYTES_NO_LOG the argument is discarded unevaluated, so
// bare-metal builds never see <iostream>.
//
#ifndef EMBYTES_NO_LOG

#include "embytes/log/logger.hpp"

#define EMBYTES_LOG_LEVEL(lvl, msg)                                        \
    do {                                                                   \
        if (::embytes::log::Logger::instance().enabled((lvl))) {           \
            ::embytes::log::LogStream((lvl)) << msg;                       \
        }                                                                  \
    } while (0)

#define EMBYTES_TRACE(msg)  EMBYTES_LOG_LEVEL(::embytes::log::Level::Trace, msg)
#define EMBYTES_DEBUG(msg)  EMBYTES_LOG_LEVEL(::embytes::log::Level::Debug, msg)
#define EMBYTES_INFO(msg)   EMBYTES_LOG_LEVEL(::embytes::log::Level::Info,  msg)
#define EMBYTES_WARN(msg)   EMBYTES_LOG_LEVEL(::embytes::log::Level::Warn,  msg)
#define EMBYTES_ERROR(msg)  EMBYTES_LOG_LEVEL(::embytes::log::Level::Error, msg)
#define EMBYTES_FATAL(msg)  EMBYTES_LOG_LEVEL(::embytes::log::Level::Fatal, msg)

#else

#define EMBYTES_TRACE(msg)  do {} while(0)
#define EMBYTES_DEBUG(msg)  do {} while(0)
#define EMBYTES_INFO(msg)   do {} while(0)
#define EMBYTES_WARN(msg)   do {} while(0)
#define EMBYTES_ERROR(msg)  do {} while(0)
#define EMBYTES_FATAL(msg)  do {} while(0)

#endif // EMBYTES_NO_LOG
