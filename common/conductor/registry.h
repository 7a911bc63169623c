#pragma once

#include "agent.h"
#include "cache.h"
#include "event.h"
#include "failure.h"
#include "message.h"
#include "params.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

class rate_limiter;

// Options for a routed message
struct send_options {
    message_priority priority = MESSAGE_PRIORITY_NORMAL;
    int64_t timeout_ms = 0;      // 0: router default
    int retry_attempts = -1;     // < 0: router default; never resent by the router
    bool cacheable = true;       // Allow cache reads and writes for idempotent methods
};

// Per-agent outcome of a broadcast
struct broadcast_result {
    bool ok = false;
    json value;
    error_type error = ERROR_TYPE_NONE;
    std::string error_message;

    std::string to_json() const;
};

// One settled message, kept in the router's bounded history
struct delivery_record {
    std::string message_id;
    std::string from;
    std::string to;
    std::string method;
    bool ok = false;
    bool cached = false;
    json result;                     // Set when ok
    error_type error = ERROR_TYPE_NONE;
    std::string error_message;
    int64_t timestamp = 0;           // Settlement time (Unix epoch ms)
    double processing_time_ms = 0.0;

    std::string to_json() const;
};

// Selects agents for broadcast
using agent_filter = std::function<bool(const agent_info&)>;

// Router-wide counters
struct router_metrics {
    int64_t total_messages;
    int64_t successful_messages;
    int64_t failed_messages;
    int64_t cached_responses;
    double average_response_time_ms;
    int active_agents;
    size_t queued_messages;

    std::string to_json() const;
};

// Handle to a message accepted by the router
// get() may be called once; it waits until the message timeout and throws
// the delivery error (ERROR_TYPE_TIMEOUT when no response arrived)
class pending_reply {
public:
    pending_reply(pending_reply&&) noexcept;
    pending_reply& operator=(pending_reply&&) noexcept;
    ~pending_reply();

    json get();

    // Whether a response or error is available without waiting
    bool ready() const;

    const std::string& message_id() const;
    const std::string& agent_id() const;

private:
    friend class agent_registry;

    struct state;
    explicit pending_reply(std::unique_ptr<state> st);

    std::unique_ptr<state> st;
};

// Agent registry and message router
// Messages are queued by priority and drained by dispatch workers; a
// background sweep marks agents with stale heartbeats inactive.
// Lifecycle events are emitted under the "router" prefix.
class agent_registry {
public:
    agent_registry(event_bus& bus,
                   const conductor_params& params,
                   rate_limiter* limiter = nullptr);
    ~agent_registry();

    // Disable copy and move
    agent_registry(const agent_registry&) = delete;
    agent_registry& operator=(const agent_registry&) = delete;

    // Start dispatch workers and the heartbeat sweep
    void start();

    // Stop all threads; undelivered messages fail with ERROR_TYPE_UNAVAILABLE
    void stop();

    bool is_running() const;

    // Register agent, returns its ID
    // Throws ERROR_TYPE_VALIDATION for a malformed descriptor or duplicate ID
    std::string register_agent(const agent_descriptor& descriptor);

    // Unregister agent
    bool unregister_agent(const std::string& agent_id);

    // Send message and wait for the result
    json send_message(const std::string& from,
                      const std::string& to,
                      const std::string& method,
                      const json& args,
                      const send_options& options = {});

    // Validate and enqueue a message, or serve it from the cache
    // Rejections (not found, unavailable, unsupported method, circuit open,
    // rate limited) are thrown here and never enqueued
    pending_reply send_message_async(const std::string& from,
                                     const std::string& to,
                                     const std::string& method,
                                     const json& args,
                                     const send_options& options = {});

    // Send to every routable agent exposing the method, except the sender
    std::map<std::string, broadcast_result> broadcast_message(
        const std::string& from,
        const std::string& method,
        const json& args,
        const agent_filter& filter = nullptr,
        const send_options& options = {});

    // Least-loaded routable agent holding every required capability
    // Agents at their max_load are skipped; ties are broken by registration order
    std::optional<std::string> find_optimal_agent(
        const std::vector<std::string>& required_capabilities,
        const std::vector<std::string>& exclude = {});

    std::optional<agent_info> get_agent_status(const std::string& agent_id) const;

    // All agents in registration order
    std::vector<agent_info> list_agents() const;

    // Refresh heartbeat, restoring an inactive agent
    bool heartbeat(const std::string& agent_id);

    bool set_agent_status(const std::string& agent_id, agent_status status);

    // Mark agents with stale heartbeats inactive, returns their IDs
    std::vector<std::string> sweep_heartbeats();

    router_metrics get_metrics() const;

    // Most recent settled deliveries, oldest first (limit 0: everything kept)
    std::vector<delivery_record> get_message_history(size_t limit = 50) const;

    std::optional<agent_stats> get_agent_stats(const std::string& agent_id) const;

    // Per-agent circuit breaker (empty when breakers are disabled)
    std::optional<circuit_breaker::stats> get_circuit_stats(const std::string& agent_id) const;
    bool reset_circuit(const std::string& agent_id);

    response_cache::stats get_cache_stats() const;
    void clear_cache();

    size_t queue_depth() const;

    // Mean load score over registered agents
    double average_load() const;

    // Export registry state to JSON
    std::string export_state() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl;
};

} // namespace conductor
