#include "ratelimit.h"
#include "failure.h"
#include "log.h"

#include <algorithm>
#include <mutex>
#include <set>

namespace conductor {

const char* rate_limit_class_to_string(rate_limit_class limit_class) {
    switch (limit_class) {
        case RATE_LIMIT_GLOBAL: return "global";
        case RATE_LIMIT_AGENT: return "agent";
        case RATE_LIMIT_EXTERNAL: return "external";
        default: return "unknown";
    }
}

struct rate_limiter::impl {
    struct window {
        int count;
        int64_t reset_at;  // Monotonic ms
    };

    rate_limit_config limits[RATE_LIMIT_EXTERNAL + 1];
    int block_threshold;

    std::map<std::string, window> windows;          // "class:identifier"
    std::map<std::string, int> suspicious;          // "identifier:activity"
    std::set<std::string> blocked;
    int64_t total_rejections = 0;
    mutable std::mutex mutex;

    explicit impl(const conductor_params& params) : block_threshold(params.block_threshold) {
        limits[RATE_LIMIT_GLOBAL] = params.rate_limit_global;
        limits[RATE_LIMIT_AGENT] = params.rate_limit_agent;
        limits[RATE_LIMIT_EXTERNAL] = params.rate_limit_external;
    }

    static std::string key_for(const std::string& identifier, rate_limit_class limit_class) {
        return std::string(rate_limit_class_to_string(limit_class)) + ":" + identifier;
    }

    // Caller holds the mutex
    void suspicious_locked(const std::string& identifier, const std::string& activity) {
        int count = ++suspicious[identifier + ":" + activity];
        if (count > block_threshold && blocked.insert(identifier).second) {
            LOG_WRN("blocked %s after %d suspicious activities (%s)\n",
                    identifier.c_str(), count, activity.c_str());
        }
    }
};

rate_limiter::rate_limiter(const conductor_params& params)
    : pimpl(std::make_unique<impl>(params)) {}

rate_limiter::~rate_limiter() = default;

bool rate_limiter::check(const std::string& identifier, rate_limit_class limit_class) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    if (pimpl->blocked.count(identifier) > 0) {
        pimpl->total_rejections++;
        return false;
    }

    const rate_limit_config& limit = pimpl->limits[limit_class];
    int64_t now = get_monotonic_ms();

    auto& w = pimpl->windows[impl::key_for(identifier, limit_class)];
    if (w.reset_at == 0 || now >= w.reset_at) {
        w.count = 0;
        w.reset_at = now + limit.window_ms;
    }

    if (w.count >= limit.max_requests) {
        pimpl->total_rejections++;
        // The global window is shared by every sender and is never blocked
        if (limit_class != RATE_LIMIT_GLOBAL) {
            pimpl->suspicious_locked(identifier, "rate_limit_exceeded");
        }
        return false;
    }

    w.count++;
    return true;
}

void rate_limiter::acquire(const std::string& identifier, rate_limit_class limit_class) {
    if (!check(identifier, limit_class)) {
        bool blocked = is_blocked(identifier);
        throw conductor_error(ERROR_TYPE_RATE_LIMIT,
                              blocked ? "identifier is blocked: " + identifier
                                      : "rate limit exceeded for " + identifier,
                              json{{"identifier", identifier},
                                   {"class", rate_limit_class_to_string(limit_class)},
                                   {"blocked", blocked}},
                              "rate_limiter",
                              !blocked);
    }
}

int rate_limiter::remaining(const std::string& identifier, rate_limit_class limit_class) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    const rate_limit_config& limit = pimpl->limits[limit_class];
    auto it = pimpl->windows.find(impl::key_for(identifier, limit_class));
    if (it == pimpl->windows.end() || get_monotonic_ms() >= it->second.reset_at) {
        return limit.max_requests;
    }
    return std::max(0, limit.max_requests - it->second.count);
}

void rate_limiter::record_suspicious(const std::string& identifier, const std::string& activity) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->suspicious_locked(identifier, activity);
}

bool rate_limiter::is_blocked(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->blocked.count(identifier) > 0;
}

bool rate_limiter::unblock(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    if (pimpl->blocked.erase(identifier) == 0) {
        return false;
    }

    // Forget the violations that led to the block
    std::string prefix = identifier + ":";
    for (auto it = pimpl->suspicious.begin(); it != pimpl->suspicious.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = pimpl->suspicious.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

size_t rate_limiter::cleanup() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    int64_t now = get_monotonic_ms();
    size_t cleaned = 0;
    for (auto it = pimpl->windows.begin(); it != pimpl->windows.end();) {
        if (now >= it->second.reset_at) {
            it = pimpl->windows.erase(it);
            cleaned++;
        } else {
            ++it;
        }
    }

    if (cleaned > 0) {
        LOG_DBG("cleaned %zu expired rate limit windows\n", cleaned);
    }
    return cleaned;
}

void rate_limiter::reset() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->windows.clear();
    pimpl->suspicious.clear();
    pimpl->blocked.clear();
    pimpl->total_rejections = 0;
}

rate_limiter::stats rate_limiter::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    stats s;
    s.active_windows = pimpl->windows.size();
    s.blocked_identifiers = pimpl->blocked.size();
    s.suspicious_activities = pimpl->suspicious.size();
    s.total_rejections = pimpl->total_rejections;
    return s;
}

std::string rate_limiter::stats::to_json() const {
    json j;
    j["active_windows"] = active_windows;
    j["blocked_identifiers"] = blocked_identifiers;
    j["suspicious_activities"] = suspicious_activities;
    j["total_rejections"] = total_rejections;
    return j.dump();
}

} // namespace conductor
