#pragma once

#include <cstdio>

#ifndef POLYFLAT_ENABLE_LOGGING
#define POLYFLAT_ENABLE_LOGGING 0
#endif

#if POLYFLAT_ENABLE_LOGGING
#define POLYFLAT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[polyflat] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define POLYFLAT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[polyflat] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define POLYFLAT_LOG_DEBUG(...) do { } while (0)
#define POLYFLAT_LOG_WARN(...) do { } while (0)
#endif
