#pragma once

#include "message.h"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace conductor {

// Agent status
enum agent_status {
    AGENT_STATUS_ACTIVE,     // Routable, no work in flight
    AGENT_STATUS_BUSY,       // Routable, processing messages
    AGENT_STATUS_INACTIVE,   // Missed heartbeats or switched off
    AGENT_STATUS_ERROR       // Marked failed by its owner
};

// Convert agent status to string
const char* agent_status_to_string(agent_status status);

// Parse an agent status, returns false when the name is unknown
bool agent_status_from_string(const std::string& str, agent_status& out);

// Method handler: receives the message arguments, returns the result
// Errors are reported by throwing
using method_handler = std::function<json(const json& args)>;

// What an agent supplies at registration
struct agent_descriptor {
    std::string id;                                  // Generated when empty
    std::string name;                                // Human-readable name
    std::string version;
    std::string description;
    std::vector<std::string> capabilities;           // Routing tags
    std::map<std::string, method_handler> methods;   // Method table
    int max_load = 0;                                // Concurrent messages before routing skips it, 0: unbounded
};

// Throws ERROR_TYPE_VALIDATION when a descriptor cannot be registered
void validate_agent_descriptor(const agent_descriptor& descriptor);

// Agent information as tracked by the registry
struct agent_info {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    std::set<std::string> capabilities;
    std::vector<std::string> methods;
    agent_status status;
    int load_score;              // Messages in flight, never negative
    int max_load;                // Capacity for find_optimal_agent, 0: unbounded
    int64_t last_heartbeat;      // Last heartbeat timestamp (ms)
    int64_t registered_at;       // Registration timestamp (ms)
    uint64_t registration_order; // Tie-breaker for routing

    agent_info()
        : status(AGENT_STATUS_ACTIVE), load_score(0), max_load(0), last_heartbeat(0),
          registered_at(0), registration_order(0) {}

    // Serialize to JSON
    std::string to_json() const;

    // Check if agent has capability
    bool has_capability(const std::string& capability) const;

    // Check if the capability set is a superset of the requirement
    bool has_capabilities(const std::vector<std::string>& required) const;

    bool has_method(const std::string& method) const;

    // Active or busy
    bool is_routable() const;

    // Below max_load (always true when unbounded)
    bool has_capacity() const;

    // Check if agent is healthy (based on heartbeat)
    bool is_healthy(int64_t timeout_ms = 60000) const;
};

// Per-agent delivery statistics
struct agent_stats {
    std::string agent_id;
    int64_t total_requests;
    int64_t successful_requests;
    int64_t failed_requests;
    double avg_response_time_ms;
    int64_t last_request_time;

    agent_stats()
        : total_requests(0), successful_requests(0), failed_requests(0),
          avg_response_time_ms(0.0), last_request_time(0) {}

    // Serialize to JSON
    std::string to_json() const;
};

} // namespace conductor
