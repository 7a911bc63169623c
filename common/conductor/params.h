// params.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace conductor {

// Fixed-window limit for one rate-limit class
struct rate_limit_config {
    int max_requests;
    int64_t window_ms;
};

struct conductor_params {
    // Event bus
    size_t max_history;                      // Events kept for diagnostics and wait_for

    // Router
    int32_t n_dispatch_workers;              // Threads draining the message queue
    size_t max_queue_size;
    int64_t default_timeout_ms;              // send_message timeout when none is given
    int default_retry_attempts;              // Resend budget stamped on messages; the router never resends
    int64_t heartbeat_timeout_ms;            // Silence before an agent is marked inactive
    int64_t heartbeat_check_interval_ms;     // Sweep period
    size_t message_history_size;             // Settled deliveries kept for get_message_history

    // Response cache
    bool enable_cache;
    int64_t cache_ttl_ms;
    size_t cache_max_size;
    std::vector<std::string> idempotent_methods;

    // Circuit breakers (one per agent)
    bool enable_circuit_breakers;
    int circuit_failure_threshold;
    int64_t circuit_recovery_timeout_ms;

    // Rate limiting (applied to message senders)
    bool enable_rate_limits;
    rate_limit_config rate_limit_global;
    rate_limit_config rate_limit_agent;
    rate_limit_config rate_limit_external;
    int block_threshold;                     // Violations before an identifier is blocked

    // Workflows
    int64_t step_timeout_ms;                 // Default per-step timeout
    int step_retry_count;                    // Default per-step retries
    std::vector<int64_t> step_retry_delays_ms;

    // Shared knowledge
    size_t knowledge_max_versions;           // Versions kept per key

    // Logging
    std::string log_level;                   // none, error, warn, info, debug
    std::string log_file;                    // Empty: stderr only
};

// Default parameters
conductor_params conductor_default_params();

// Overlay the keys present in a JSON document onto the defaults
// Throws conductor_error (ERROR_TYPE_CONFIGURATION) on malformed input
conductor_params conductor_params_from_json(const std::string & json_str);

// Load parameters from a JSON file, then apply CONDUCTOR_LOG_LEVEL
conductor_params conductor_params_load(const std::string & path);

// Apply environment overrides (CONDUCTOR_LOG_LEVEL)
void conductor_params_apply_env(conductor_params & params);

// Serialize for diagnostics
std::string conductor_params_to_json(const conductor_params & params);

} // namespace conductor
