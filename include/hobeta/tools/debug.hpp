#pragma once

#include <atomic>
#include <system_error>

#include <cstdio>

namespace hobeta {

extern std::atomic_bool verbose_mode;

} // namespace hobeta

#if !defined(NDEBUG)
#    define DEBUG_LOG(fmt, ...)                                                                                        \
        std::fprintf(stderr, "[%s:%d %s] " fmt "\n", __FILE__, __LINE__, __func__ __VA_OPT__(, ) __VA_ARGS__)
#else
#    define DEBUG_LOG(...) ((void)0)
#endif

#if !defined(NDEBUG)
#    define DEBUG_ERRNO(err, context)                                                                                  \
        std::fprintf(stderr, "[%s:%d %s] %s: %s (%d)\n", __FILE__, __LINE__, __func__, context,                        \
                     std::system_category().message(err).c_str(), err)
#else
#    define DEBUG_ERRNO(...) ((void)0)
#endif

#define VERBOSE_LOG(fmt, ...)                                                                                          \
    do {                                                                                                               \
        if (::hobeta::verbose_mode.load(std::memory_order_relaxed))                                                    \
            std::fprintf(stderr, "[hobeta] " fmt "\n" __VA_OPT__(, ) __VA_ARGS__);                                     \
    } while (0)
