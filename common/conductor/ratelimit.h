#pragma once

#include "params.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace conductor {

// Rate limit classes
enum rate_limit_class {
    RATE_LIMIT_GLOBAL,
    RATE_LIMIT_AGENT,
    RATE_LIMIT_EXTERNAL
};

// Convert rate limit class to string
const char* rate_limit_class_to_string(rate_limit_class limit_class);

// Fixed-window rate limiter keyed by (class, identifier)
// Rejections are recorded as suspicious activity; identifiers that exceed
// the block threshold are blocked until unblock() is called
class rate_limiter {
public:
    explicit rate_limiter(const conductor_params& params);
    ~rate_limiter();

    // Count a request, returns false when it is over the limit or blocked
    bool check(const std::string& identifier, rate_limit_class limit_class);

    // Same as check() but throws ERROR_TYPE_RATE_LIMIT on rejection
    void acquire(const std::string& identifier, rate_limit_class limit_class);

    // Requests left in the current window
    int remaining(const std::string& identifier, rate_limit_class limit_class) const;

    // Record a suspicious activity for an identifier
    void record_suspicious(const std::string& identifier, const std::string& activity);

    bool is_blocked(const std::string& identifier) const;
    bool unblock(const std::string& identifier);

    // Drop expired windows, returns the number removed
    size_t cleanup();

    // Forget all windows, violations and blocks
    void reset();

    struct stats {
        size_t active_windows;
        size_t blocked_identifiers;
        size_t suspicious_activities;
        int64_t total_rejections;

        std::string to_json() const;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
