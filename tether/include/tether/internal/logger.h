/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <string>

#include <fmt/format.h>

// the host application provides the sink, levels follow spdlog
// 0 debug, 1 trace, 2 info, 3 warn, 4 error, 5 critical
extern "C"
{
    void tether_log(int level, const char* str, size_t sz);
}

#ifdef TETHER_USE_LOGGING
#define TETHER_LOG(level, ...)                                                                                         \
    do                                                                                                                 \
    {                                                                                                                  \
        std::string tether_log_message_ = fmt::format(__VA_ARGS__);                                                    \
        tether_log(level, tether_log_message_.data(), tether_log_message_.size());                                     \
    } while (0)
#else
#define TETHER_LOG(level, ...)                                                                                         \
    do                                                                                                                 \
    {                                                                                                                  \
    } while (0)
#endif

#define TETHER_DEBUG(...) TETHER_LOG(0, __VA_ARGS__)
#define TETHER_TRACE(...) TETHER_LOG(1, __VA_ARGS__)
#define TETHER_INFO(...) TETHER_LOG(2, __VA_ARGS__)
#define TETHER_WARNING(...) TETHER_LOG(3, __VA_ARGS__)
#define TETHER_ERROR(...) TETHER_LOG(4, __VA_ARGS__)
#define TETHER_CRITICAL(...) TETHER_LOG(5, __VA_ARGS__)
