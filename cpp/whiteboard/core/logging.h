#pragma once

#include <cstdio>

#ifndef WHITEBOARD_ENABLE_LOGGING
#define WHITEBOARD_ENABLE_LOGGING 0
#endif

#if WHITEBOARD_ENABLE_LOGGING
#define WHITEBOARD_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[whiteboard] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define WHITEBOARD_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[whiteboard] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define WHITEBOARD_LOG_DEBUG(...) do { } while (0)
#define WHITEBOARD_LOG_WARN(...) do { } while (0)
#endif
