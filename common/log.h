#pragma once

#include <string>

//
// Leveled logging for conductor
//
// Usage:
//
//   LOG_INF("agent registered: %s\n", id.c_str());
//   LOG_WRN("heartbeat timeout: %s\n", id.c_str());
//
// Messages at or below the current verbosity are written to stderr and, when
// a log file is set, mirrored there. LOG_DBG is only printed at verbosity 4.
//

#ifndef __GNUC__
#    define CONDUCTOR_LOG_ATTRIBUTE_FORMAT(...)
#elif defined(__MINGW32__)
#    define CONDUCTOR_LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#else
#    define CONDUCTOR_LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#endif

enum conductor_log_level {
    CONDUCTOR_LOG_LEVEL_NONE  = 0,
    CONDUCTOR_LOG_LEVEL_ERROR = 1,
    CONDUCTOR_LOG_LEVEL_WARN  = 2,
    CONDUCTOR_LOG_LEVEL_INFO  = 3,
    CONDUCTOR_LOG_LEVEL_DEBUG = 4,
};

// Set the maximum level that is printed
void conductor_log_set_verbosity(int verbosity);
int  conductor_log_get_verbosity();

// Parse "error", "warn", "info", "debug" or "none" (case-sensitive)
// Returns the fallback when the name is not recognized
int conductor_log_level_from_string(const std::string & name, int fallback);

// Mirror output to a file (empty path closes it)
bool conductor_log_set_file(const std::string & path);

void conductor_log_add(conductor_log_level level, const char * fmt, ...) CONDUCTOR_LOG_ATTRIBUTE_FORMAT(2, 3);

#define LOG_TMPL(level, ...) \
    do { \
        if ((level) <= conductor_log_get_verbosity()) { \
            conductor_log_add((level), __VA_ARGS__); \
        } \
    } while (0)

#define LOG_ERR(...) LOG_TMPL(CONDUCTOR_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(CONDUCTOR_LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_INF(...) LOG_TMPL(CONDUCTOR_LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_DBG(...) LOG_TMPL(CONDUCTOR_LOG_LEVEL_DEBUG, __VA_ARGS__)
