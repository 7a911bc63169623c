#pragma once

#include "event.h"
#include "knowledge.h"
#include "params.h"
#include "ratelimit.h"
#include "registry.h"
#include "workflow.h"

#include <memory>
#include <string>

namespace conductor {

// Read-only snapshot for liveness and readiness checks
struct health_snapshot {
    struct agent_counts {
        int total = 0;
        int active = 0;
        int busy = 0;
        int offline = 0;     // Inactive or error
    };

    agent_counts agents;
    size_t pending_events = 0;      // Delayed or retried emissions not yet dispatched
    size_t queued_messages = 0;
    size_t active_workflows = 0;
    size_t knowledge_items = 0;
    double average_load = 0.0;
    int64_t timestamp = 0;

    // Healthy when at least one agent can take work
    bool is_healthy() const;

    std::string to_json() const;
};

// Owns the bus, rate limiter, router, workflow coordinator and shared knowledge
// Construct once at process start and pass it to whoever needs a component
class conductor_context {
public:
    explicit conductor_context(const conductor_params& params = conductor_default_params());
    ~conductor_context();

    conductor_context(const conductor_context&) = delete;
    conductor_context& operator=(const conductor_context&) = delete;

    // Start router threads
    void start();

    // Drain workflows, stop the router, then the bus
    void stop();

    event_bus& bus();
    rate_limiter& limiter();
    agent_registry& registry();
    workflow_coordinator& workflows();
    knowledge_base& knowledge();

    const conductor_params& params() const;

    health_snapshot health() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
