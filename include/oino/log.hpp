/**
 * oino/log.hpp - Leveled logging to stderr
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * One process-wide level shared by all oino components. Messages are
 * printf-style and tagged with the component that emitted them:
 *
 *   OINO_LOG_WARN("schema", "skipping '%s'", fragment.c_str());
 */

#pragma once

#include <atomic>
#include <cstdio>

namespace oino {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

inline std::atomic<log_level> g_log_level{log_level::warn};

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

}  // namespace oino

#define OINO_LOG(level, tag, fmt, ...) \
    do { \
        if (oino::log_enabled(level)) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define OINO_LOG_ERROR(tag, fmt, ...) OINO_LOG(oino::log_level::error, tag, fmt, ##__VA_ARGS__)
#define OINO_LOG_WARN(tag, fmt, ...)  OINO_LOG(oino::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define OINO_LOG_INFO(tag, fmt, ...)  OINO_LOG(oino::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define OINO_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define OINO_LOG_DEBUG(tag, fmt, ...) OINO_LOG(oino::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
