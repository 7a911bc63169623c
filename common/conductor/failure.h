#pragma once

#include "message.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace conductor {

// Error types
enum error_type {
    ERROR_TYPE_NONE,
    ERROR_TYPE_VALIDATION,          // Malformed registration or workflow
    ERROR_TYPE_AGENT_NOT_FOUND,     // Target agent is not registered
    ERROR_TYPE_UNAVAILABLE,         // Target agent is inactive or in error
    ERROR_TYPE_UNSUPPORTED_METHOD,  // Target has no handler for the method
    ERROR_TYPE_TIMEOUT,             // No response within the timeout
    ERROR_TYPE_EXECUTION,           // Handler raised an error
    ERROR_TYPE_CIRCUIT_OPEN,        // Rejected by a circuit breaker
    ERROR_TYPE_RATE_LIMIT,          // Rejected by the rate limiter
    ERROR_TYPE_CONFIGURATION,       // Cycle or missing dependency at runtime
    ERROR_TYPE_INTERNAL_ERROR
};

// Convert error type to string
const char* error_type_to_string(error_type type);

// Whether an error type is retryable unless stated otherwise
bool error_type_is_retryable(error_type type);

// Structured error raised by every conductor component
class conductor_error : public std::runtime_error {
public:
    conductor_error(error_type type,
                    const std::string& message,
                    json details = json::object(),
                    std::string source = "");

    conductor_error(error_type type,
                    const std::string& message,
                    json details,
                    std::string source,
                    bool retryable);

    error_type type() const { return type_; }
    const json& details() const { return details_; }
    const std::string& source() const { return source_; }
    bool retryable() const { return retryable_; }
    int64_t timestamp() const { return timestamp_; }

    // Retries performed before this error was raised (set by with_retry)
    int retry_count() const { return retry_count_; }
    void set_retry_count(int count) { retry_count_ = count; }

    // Serialize to JSON
    std::string to_json() const;

private:
    error_type type_;
    json details_;
    std::string source_;
    bool retryable_;
    int retry_count_;
    int64_t timestamp_;
};

// Retry policy for with_retry
struct retry_policy {
    int max_retries;                 // Retries after the first attempt
    std::vector<int64_t> delays_ms;  // Delay before retry N (last entry repeats)

    // Delay to sleep after the given failed attempt (0-based)
    int64_t delay_for(int attempt) const;

    // Exponential delays: initial * multiplier^n, capped at max_delay_ms
    static retry_policy exponential(int max_retries,
                                    int64_t initial_delay_ms,
                                    double multiplier,
                                    int64_t max_delay_ms);

    // Default policy (3 retries, 1s 2s 4s 8s)
    static retry_policy default_policy();

    // Aggressive retry policy
    static retry_policy aggressive_policy();

    // Conservative policy (fewer retries)
    static retry_policy conservative_policy();

    // No retries at all
    static retry_policy none();
};

// Run an operation, retrying conductor_errors flagged retryable
// The error of the final attempt is rethrown with its attempt count set;
// other exceptions propagate immediately
template<typename Func>
auto with_retry(Func&& func, const retry_policy& policy = retry_policy::default_policy())
    -> decltype(func()) {
    for (int attempt = 0; ; attempt++) {
        try {
            return func();
        } catch (conductor_error& err) {
            err.set_retry_count(attempt);
            if (!err.retryable() || attempt >= policy.max_retries) {
                throw;
            }
            int64_t delay = policy.delay_for(attempt);
            if (delay > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
        }
    }
}

// Circuit breaker state
enum circuit_state {
    CIRCUIT_CLOSED,   // Normal operation
    CIRCUIT_OPEN,     // Too many failures, reject requests
    CIRCUIT_HALF_OPEN // Testing if service recovered
};

// Convert circuit state to string
const char* circuit_state_to_string(circuit_state state);

// Circuit breaker for a protected call-site
// In half-open state exactly one trial call is admitted
class circuit_breaker {
public:
    // Constructor
    circuit_breaker(int failure_threshold = 5,
                    int64_t recovery_timeout_ms = 60000);
    ~circuit_breaker();

    // Record success (closes a closed or half-open circuit, ignored while open)
    void record_success();

    // Record failure
    void record_failure();

    // Check if request is allowed (claims the trial slot when half-open)
    // trial is set when this call claimed the half-open trial
    bool allow_request(bool* trial = nullptr);

    // Give back a claimed trial whose call never ran
    void release_trial();

    // Get current state
    circuit_state get_state() const;

    // Reset circuit breaker
    void reset();

    // Get statistics
    struct stats {
        circuit_state state;
        int failure_count;
        int failure_threshold;
        int64_t recovery_timeout_ms;
        int64_t next_attempt_at;      // Unix epoch ms, 0 when closed
        int64_t last_failure_time;
        int64_t last_state_change;
        int64_t rejected_requests;

        std::string to_json() const;
    };
    stats get_stats() const;

    // Wrap an operation: rejected with ERROR_TYPE_CIRCUIT_OPEN while open,
    // otherwise the outcome is recorded and the result or error passed through
    template<typename Func>
    auto execute(Func&& func) -> decltype(func()) {
        if (!allow_request()) {
            throw open_error();
        }
        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                record_success();
            } else {
                auto result = func();
                record_success();
                return result;
            }
        } catch (...) {
            record_failure();
            throw;
        }
    }

private:
    conductor_error open_error() const;

    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
