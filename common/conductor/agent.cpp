#include "agent.h"
#include "failure.h"

#include <algorithm>

namespace conductor {

// Convert agent status to string
const char* agent_status_to_string(agent_status status) {
    switch (status) {
        case AGENT_STATUS_ACTIVE: return "active";
        case AGENT_STATUS_BUSY: return "busy";
        case AGENT_STATUS_INACTIVE: return "inactive";
        case AGENT_STATUS_ERROR: return "error";
        default: return "unknown";
    }
}

bool agent_status_from_string(const std::string& str, agent_status& out) {
    if (str == "active") { out = AGENT_STATUS_ACTIVE; return true; }
    if (str == "busy") { out = AGENT_STATUS_BUSY; return true; }
    if (str == "inactive") { out = AGENT_STATUS_INACTIVE; return true; }
    if (str == "error") { out = AGENT_STATUS_ERROR; return true; }
    return false;
}

void validate_agent_descriptor(const agent_descriptor& descriptor) {
    auto reject = [&descriptor](const std::string& reason) {
        return conductor_error(ERROR_TYPE_VALIDATION,
                               "invalid agent registration: " + reason,
                               json{{"agent_id", descriptor.id}, {"name", descriptor.name}},
                               "registry");
    };

    if (descriptor.name.empty()) {
        throw reject("name is required");
    }
    if (descriptor.methods.empty()) {
        throw reject("at least one method is required");
    }
    for (const auto& [method, handler] : descriptor.methods) {
        if (method.empty()) {
            throw reject("method names must not be empty");
        }
        if (!handler) {
            throw reject("method '" + method + "' has no handler");
        }
    }
    if (descriptor.max_load < 0) {
        throw reject("max_load must not be negative");
    }
    for (const auto& capability : descriptor.capabilities) {
        if (capability.empty()) {
            throw reject("capabilities must not be empty");
        }
    }
}

// agent_info implementation
std::string agent_info::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["version"] = version;
    j["description"] = description;
    j["capabilities"] = capabilities;
    j["methods"] = methods;
    j["status"] = agent_status_to_string(status);
    j["load_score"] = load_score;
    j["max_load"] = max_load;
    j["last_heartbeat"] = last_heartbeat;
    j["registered_at"] = registered_at;
    return j.dump();
}

bool agent_info::has_capability(const std::string& capability) const {
    return capabilities.count(capability) > 0;
}

bool agent_info::has_capabilities(const std::vector<std::string>& required) const {
    return std::all_of(required.begin(), required.end(),
        [this](const std::string& cap) { return has_capability(cap); });
}

bool agent_info::has_method(const std::string& method) const {
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

bool agent_info::is_routable() const {
    return status == AGENT_STATUS_ACTIVE || status == AGENT_STATUS_BUSY;
}

bool agent_info::has_capacity() const {
    return max_load <= 0 || load_score < max_load;
}

bool agent_info::is_healthy(int64_t timeout_ms) const {
    return is_routable() && (get_timestamp_ms() - last_heartbeat) <= timeout_ms;
}

// agent_stats implementation
std::string agent_stats::to_json() const {
    json j;
    j["agent_id"] = agent_id;
    j["total_requests"] = total_requests;
    j["successful_requests"] = successful_requests;
    j["failed_requests"] = failed_requests;
    j["avg_response_time_ms"] = avg_response_time_ms;
    j["last_request_time"] = last_request_time;
    return j.dump();
}

} // namespace conductor
