#include "failure.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace conductor {

// Convert error type to string
const char* error_type_to_string(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE: return "none";
        case ERROR_TYPE_VALIDATION: return "validation";
        case ERROR_TYPE_AGENT_NOT_FOUND: return "agent_not_found";
        case ERROR_TYPE_UNAVAILABLE: return "unavailable";
        case ERROR_TYPE_UNSUPPORTED_METHOD: return "unsupported_method";
        case ERROR_TYPE_TIMEOUT: return "timeout";
        case ERROR_TYPE_EXECUTION: return "execution";
        case ERROR_TYPE_CIRCUIT_OPEN: return "circuit_open";
        case ERROR_TYPE_RATE_LIMIT: return "rate_limit";
        case ERROR_TYPE_CONFIGURATION: return "configuration";
        case ERROR_TYPE_INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

bool error_type_is_retryable(error_type type) {
    return type == ERROR_TYPE_TIMEOUT ||
           type == ERROR_TYPE_CIRCUIT_OPEN ||
           type == ERROR_TYPE_RATE_LIMIT;
}

// conductor_error implementation
conductor_error::conductor_error(error_type type,
                                 const std::string& message,
                                 json details,
                                 std::string source)
    : conductor_error(type, message, std::move(details), std::move(source),
                      error_type_is_retryable(type)) {}

conductor_error::conductor_error(error_type type,
                                 const std::string& message,
                                 json details,
                                 std::string source,
                                 bool retryable)
    : std::runtime_error(message),
      type_(type),
      details_(std::move(details)),
      source_(std::move(source)),
      retryable_(retryable),
      retry_count_(0),
      timestamp_(get_timestamp_ms()) {}

std::string conductor_error::to_json() const {
    json j;
    j["type"] = error_type_to_string(type_);
    j["message"] = what();
    j["details"] = details_;
    j["source"] = source_;
    j["retryable"] = retryable_;
    j["retry_count"] = retry_count_;
    j["timestamp"] = timestamp_;
    return j.dump();
}

// retry_policy implementation
int64_t retry_policy::delay_for(int attempt) const {
    if (delays_ms.empty() || attempt < 0) {
        return 0;
    }
    size_t index = std::min(static_cast<size_t>(attempt), delays_ms.size() - 1);
    return delays_ms[index];
}

retry_policy retry_policy::exponential(int max_retries,
                                       int64_t initial_delay_ms,
                                       double multiplier,
                                       int64_t max_delay_ms) {
    retry_policy p;
    p.max_retries = max_retries;
    for (int i = 0; i < max_retries; i++) {
        double delay = static_cast<double>(initial_delay_ms) * std::pow(multiplier, i);
        p.delays_ms.push_back(std::min(static_cast<int64_t>(delay), max_delay_ms));
    }
    return p;
}

retry_policy retry_policy::default_policy() {
    retry_policy p;
    p.max_retries = 3;
    p.delays_ms = {1000, 2000, 4000, 8000};
    return p;
}

retry_policy retry_policy::aggressive_policy() {
    return exponential(5, 500, 1.5, 10000);
}

retry_policy retry_policy::conservative_policy() {
    retry_policy p;
    p.max_retries = 1;
    p.delays_ms = {2000};
    return p;
}

retry_policy retry_policy::none() {
    retry_policy p;
    p.max_retries = 0;
    return p;
}

// Convert circuit state to string
const char* circuit_state_to_string(circuit_state state) {
    switch (state) {
        case CIRCUIT_CLOSED: return "closed";
        case CIRCUIT_OPEN: return "open";
        case CIRCUIT_HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

// circuit_breaker implementation
struct circuit_breaker::impl {
    int failure_threshold;
    int64_t recovery_timeout_ms;
    circuit_state state;
    int failure_count;
    bool trial_in_flight;
    int64_t opened_at;          // Monotonic ms
    int64_t next_attempt_at;    // Unix epoch ms
    int64_t last_failure_time;
    int64_t last_state_change;
    int64_t rejected_requests;
    mutable std::mutex mutex;

    impl(int fail_thresh, int64_t recovery)
        : failure_threshold(std::max(1, fail_thresh)),
          recovery_timeout_ms(recovery),
          state(CIRCUIT_CLOSED),
          failure_count(0),
          trial_in_flight(false),
          opened_at(0),
          next_attempt_at(0),
          last_failure_time(0),
          last_state_change(get_timestamp_ms()),
          rejected_requests(0) {}

    void trip() {
        state = CIRCUIT_OPEN;
        trial_in_flight = false;
        opened_at = get_monotonic_ms();
        last_state_change = get_timestamp_ms();
        next_attempt_at = last_state_change + recovery_timeout_ms;
    }
};

circuit_breaker::circuit_breaker(int failure_threshold, int64_t recovery_timeout_ms)
    : pimpl(std::make_unique<impl>(failure_threshold, recovery_timeout_ms)) {}

circuit_breaker::~circuit_breaker() = default;

void circuit_breaker::record_success() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    // An open circuit closes only through a half-open trial
    if (pimpl->state == CIRCUIT_OPEN) {
        return;
    }

    if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->last_state_change = get_timestamp_ms();
    }
    pimpl->state = CIRCUIT_CLOSED;
    pimpl->failure_count = 0;
    pimpl->trial_in_flight = false;
    pimpl->next_attempt_at = 0;
}

void circuit_breaker::record_failure() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->last_failure_time = get_timestamp_ms();
    pimpl->failure_count++;

    if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->trip();
    } else if (pimpl->state == CIRCUIT_CLOSED &&
               pimpl->failure_count >= pimpl->failure_threshold) {
        pimpl->trip();
    }
}

bool circuit_breaker::allow_request(bool* trial) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    if (trial) {
        *trial = false;
    }

    if (pimpl->state == CIRCUIT_CLOSED) {
        return true;
    }

    if (pimpl->state == CIRCUIT_OPEN) {
        int64_t now = get_monotonic_ms();
        if ((now - pimpl->opened_at) >= pimpl->recovery_timeout_ms) {
            pimpl->state = CIRCUIT_HALF_OPEN;
            pimpl->trial_in_flight = true;
            pimpl->last_state_change = get_timestamp_ms();
            if (trial) {
                *trial = true;
            }
            return true;
        }
        pimpl->rejected_requests++;
        return false;
    }

    // CIRCUIT_HALF_OPEN: only the first caller gets the trial
    if (!pimpl->trial_in_flight) {
        pimpl->trial_in_flight = true;
        if (trial) {
            *trial = true;
        }
        return true;
    }
    pimpl->rejected_requests++;
    return false;
}

void circuit_breaker::release_trial() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->trial_in_flight = false;
    }
}

circuit_state circuit_breaker::get_state() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->state;
}

void circuit_breaker::reset() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->state = CIRCUIT_CLOSED;
    pimpl->failure_count = 0;
    pimpl->trial_in_flight = false;
    pimpl->next_attempt_at = 0;
    pimpl->last_state_change = get_timestamp_ms();
}

circuit_breaker::stats circuit_breaker::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    stats s;
    s.state = pimpl->state;
    s.failure_count = pimpl->failure_count;
    s.failure_threshold = pimpl->failure_threshold;
    s.recovery_timeout_ms = pimpl->recovery_timeout_ms;
    s.next_attempt_at = pimpl->state == CIRCUIT_CLOSED ? 0 : pimpl->next_attempt_at;
    s.last_failure_time = pimpl->last_failure_time;
    s.last_state_change = pimpl->last_state_change;
    s.rejected_requests = pimpl->rejected_requests;
    return s;
}

std::string circuit_breaker::stats::to_json() const {
    json j;
    j["state"] = circuit_state_to_string(state);
    j["failure_count"] = failure_count;
    j["failure_threshold"] = failure_threshold;
    j["recovery_timeout_ms"] = recovery_timeout_ms;
    j["next_attempt_at"] = next_attempt_at;
    j["last_failure_time"] = last_failure_time;
    j["last_state_change"] = last_state_change;
    j["rejected_requests"] = rejected_requests;
    return j.dump();
}

conductor_error circuit_breaker::open_error() const {
    stats s = get_stats();
    return conductor_error(ERROR_TYPE_CIRCUIT_OPEN,
                           "circuit breaker is open",
                           json{{"next_attempt_at", s.next_attempt_at},
                                {"failure_count", s.failure_count}},
                           "circuit_breaker");
}

} // namespace conductor
