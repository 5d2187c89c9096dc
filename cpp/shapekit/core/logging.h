#pragma once

#include <cstdio>

#ifndef SHAPEKIT_ENABLE_LOGGING
#define SHAPEKIT_ENABLE_LOGGING 0
#endif

#if SHAPEKIT_ENABLE_LOGGING
#define SHAPEKIT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[shapekit] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SHAPEKIT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[shapekit][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SHAPEKIT_LOG_DEBUG(...) do { } while (0)
#define SHAPEKIT_LOG_WARN(...) do { } while (0)
#endif
