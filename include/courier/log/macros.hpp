#pragma once

#include "logger.hpp"

/// Logging macros with file and line information

#ifdef COURIER_DEBUG
    #define COURIER_LOG_DEBUG(fmt, ...) \
        ::courier::log::logger::instance().log( \
            ::courier::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define COURIER_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define COURIER_LOG_INFO(fmt, ...) \
    ::courier::log::logger::instance().log( \
        ::courier::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define COURIER_LOG_WARNING(fmt, ...) \
    ::courier::log::logger::instance().log( \
        ::courier::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define COURIER_LOG_ERROR(fmt, ...) \
    ::courier::log::logger::instance().log( \
        ::courier::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )
