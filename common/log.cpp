#include "log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

static std::atomic<int> g_verbosity{CONDUCTOR_LOG_LEVEL_INFO};
static std::mutex       g_log_mutex;
static FILE *           g_log_file = nullptr;

void conductor_log_set_verbosity(int verbosity) {
    g_verbosity.store(verbosity);
}

int conductor_log_get_verbosity() {
    return g_verbosity.load();
}

int conductor_log_level_from_string(const std::string & name, int fallback) {
    if (name == "none")  return CONDUCTOR_LOG_LEVEL_NONE;
    if (name == "error") return CONDUCTOR_LOG_LEVEL_ERROR;
    if (name == "warn")  return CONDUCTOR_LOG_LEVEL_WARN;
    if (name == "info")  return CONDUCTOR_LOG_LEVEL_INFO;
    if (name == "debug") return CONDUCTOR_LOG_LEVEL_DEBUG;
    return fallback;
}

bool conductor_log_set_file(const std::string & path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (g_log_file) {
        fclose(g_log_file);
        g_log_file = nullptr;
    }

    if (path.empty()) {
        return true;
    }

    g_log_file = fopen(path.c_str(), "a");
    return g_log_file != nullptr;
}

static const char * level_tag(conductor_log_level level) {
    switch (level) {
        case CONDUCTOR_LOG_LEVEL_ERROR: return "E";
        case CONDUCTOR_LOG_LEVEL_WARN:  return "W";
        case CONDUCTOR_LOG_LEVEL_INFO:  return "I";
        case CONDUCTOR_LOG_LEVEL_DEBUG: return "D";
        default:                        return " ";
    }
}

void conductor_log_add(conductor_log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);

    va_list args_copy;
    va_copy(args_copy, args);
    const int n = vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    std::vector<char> buf(n > 0 ? n + 1 : 1);
    vsnprintf(buf.data(), buf.size(), fmt, args);
    va_end(args);

    const auto now = std::chrono::system_clock::now();
    const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&tt, &tm_buf);

    char ts[32];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mutex);

    fprintf(stderr, "%s.%03d %s %s", ts, (int) ms, level_tag(level), buf.data());
    fflush(stderr);

    if (g_log_file) {
        fprintf(g_log_file, "%s.%03d %s %s", ts, (int) ms, level_tag(level), buf.data());
        fflush(g_log_file);
    }
}
