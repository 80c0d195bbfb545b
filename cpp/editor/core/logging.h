#pragma once

#include <cstdio>

#ifndef EDITOR_ENABLE_LOGGING
#define EDITOR_ENABLE_LOGGING 0
#endif

#if EDITOR_ENABLE_LOGGING
#define EDITOR_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[editor] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define EDITOR_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[editor][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define EDITOR_LOG_DEBUG(...) do { } while (0)
#define EDITOR_LOG_WARN(...) do { } while (0)
#endif
