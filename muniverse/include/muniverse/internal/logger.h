/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <cstring>

#ifndef MUNIVERSE_LOGGING_DEFINED

#ifdef USE_MUNIVERSE_LOGGING
extern "C"
{
    void muniverse_log(int level, const char* str, size_t sz);
}
#define MUNIVERSE_LOG_BACKEND(level, message) muniverse_log(level, (message).c_str(), (message).length())
#else
// No logging - backend is a no-op
#define MUNIVERSE_LOG_BACKEND(level, message)                                                                          \
    do                                                                                                                 \
    {                                                                                                                  \
        (void)(level);                                                                                                 \
        (void)(message);                                                                                               \
    } while (0)
#endif

// Unified logging macros with levels (0=DEBUG, 1=TRACE, 2=INFO, 3=WARNING, 4=ERROR, 5=CRITICAL)
#ifdef USE_MUNIVERSE_LOGGING

#include <fmt/format.h>

#define MUNIVERSE_DEBUG(format_str, ...)                                                                               \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(0, formatted);                                                                           \
    } while (0)

#define MUNIVERSE_TRACE(format_str, ...)                                                                               \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(1, formatted);                                                                           \
    } while (0)

#define MUNIVERSE_INFO(format_str, ...)                                                                                \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(2, formatted);                                                                           \
    } while (0)

#define MUNIVERSE_WARNING(format_str, ...)                                                                             \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(3, formatted);                                                                           \
    } while (0)

#define MUNIVERSE_ERROR(format_str, ...)                                                                               \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(4, formatted);                                                                           \
    } while (0)

#define MUNIVERSE_CRITICAL(format_str, ...)                                                                            \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        MUNIVERSE_LOG_BACKEND(5, formatted);                                                                           \
    } while (0)

#else
// Disabled logging - all macros are no-ops
#define MUNIVERSE_DEBUG(format_str, ...)
#define MUNIVERSE_TRACE(format_str, ...)
#define MUNIVERSE_INFO(format_str, ...)
#define MUNIVERSE_WARNING(format_str, ...)
#define MUNIVERSE_ERROR(format_str, ...)
#define MUNIVERSE_CRITICAL(format_str, ...)
#endif
#define MUNIVERSE_LOGGING_DEFINED
#endif

namespace muniverse
{
    // levels follow the macro numbering above; anything above 5 silences the sink
    void set_log_level(int level);
}
