#pragma once

#include <cstdio>

#ifndef TINT_ENABLE_LOGGING
#define TINT_ENABLE_LOGGING 0
#endif

#if TINT_ENABLE_LOGGING
#define TINT_LOG_IMPL(level, ...) \
    do { \
        std::fprintf(stderr, "[tint][%s] ", level); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define TINT_LOG_DEBUG(...) TINT_LOG_IMPL("debug", __VA_ARGS__)
#define TINT_LOG_INFO(...) TINT_LOG_IMPL("info", __VA_ARGS__)
#define TINT_LOG_WARN(...) TINT_LOG_IMPL("warn", __VA_ARGS__)
#define TINT_LOG_ERROR(...) TINT_LOG_IMPL("error", __VA_ARGS__)
#else
#define TINT_LOG_DEBUG(...) do { } while (0)
#define TINT_LOG_INFO(...) do { } while (0)
#define TINT_LOG_WARN(...) do { } while (0)
#define TINT_LOG_ERROR(...) do { } while (0)
#endif
