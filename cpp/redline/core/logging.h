#pragma once

#include <cstdio>

#ifndef REDLINE_ENABLE_LOGGING
#define REDLINE_ENABLE_LOGGING 0
#endif

// One line per event on stderr, prefixed with the severity tag.
#if REDLINE_ENABLE_LOGGING
#define REDLINE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[redline:debug] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define REDLINE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[redline:warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define REDLINE_LOG_DEBUG(...) do { } while (0)
#define REDLINE_LOG_WARN(...) do { } while (0)
#endif
