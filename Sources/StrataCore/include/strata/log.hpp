#pragma once

#ifdef __cplusplus

#include <atomic>
#include <cstdio>
#include <string>
#include <vector>

namespace strata {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in StrataCore/src/log.cpp.
extern std::atomic<log_level> g_log_level;

/// Set when at least one tag has debug output switched on.
extern std::atomic<bool> g_has_debug_tags;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// Enable debug output for the given tags ("db", "schema", "object", "cascade", "query", "config")
/// regardless of the global level. Replaces any previously enabled set.
void set_debug_tags(const std::vector<std::string>& tags);
std::vector<std::string> debug_tags();
bool is_debug_tag(const char* tag);

/// "off", "error", "warn", "info", "debug"; throws configuration_error otherwise.
log_level parse_log_level(const std::string& name);

/// Applies a LOG_DEBUG style value:
///   1/true/yes/y             -> global debug
///   0/false/no/n, empty      -> info
///   a,b,c                    -> info plus debug for the listed tags
void configure_logging(const std::string& value);

/// configure_logging() with the LOG_DEBUG environment variable (unset counts as empty).
void configure_logging_from_env();

inline bool log_enabled(log_level level, const char* tag) {
    if (static_cast<int>(level) <= static_cast<int>(g_log_level.load(std::memory_order_relaxed))) {
        return true;
    }
    return level == log_level::debug &&
           g_has_debug_tags.load(std::memory_order_relaxed) &&
           is_debug_tag(tag);
}

}  // namespace strata

#define STRATA_LOG(level, tag, fmt, ...) \
    do { \
        if (::strata::log_enabled(level, tag)) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) STRATA_LOG(strata::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  STRATA_LOG(strata::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  STRATA_LOG(strata::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) STRATA_LOG(strata::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
