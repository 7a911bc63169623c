#include "context.h"
#include "log.h"

#include <mutex>

namespace conductor {

bool health_snapshot::is_healthy() const {
    return agents.active + agents.busy > 0;
}

std::string health_snapshot::to_json() const {
    json j;
    j["agents"] = {
        {"total", agents.total},
        {"active", agents.active},
        {"busy", agents.busy},
        {"offline", agents.offline},
    };
    j["pending_events"] = pending_events;
    j["queued_messages"] = queued_messages;
    j["active_workflows"] = active_workflows;
    j["knowledge_items"] = knowledge_items;
    j["average_load"] = average_load;
    j["healthy"] = is_healthy();
    j["timestamp"] = timestamp;
    return j.dump();
}

struct conductor_context::impl {
    conductor_params params;

    // Declaration order is construction order; teardown runs in reverse
    event_bus bus;
    rate_limiter limiter;
    agent_registry registry;
    workflow_coordinator workflows;
    knowledge_base knowledge;

    std::mutex mutex;
    bool started = false;
    bool stopped = false;

    explicit impl(const conductor_params& p)
        : params(p),
          bus(p.max_history),
          limiter(p),
          registry(bus, p, &limiter),
          workflows(registry, bus, p),
          knowledge(bus, p.knowledge_max_versions) {}
};

static void apply_logging(const conductor_params& params) {
    conductor_log_set_verbosity(
        conductor_log_level_from_string(params.log_level, CONDUCTOR_LOG_LEVEL_INFO));
    if (!params.log_file.empty() && !conductor_log_set_file(params.log_file)) {
        LOG_WRN("cannot open log file %s, logging to stderr only\n", params.log_file.c_str());
    }
}

conductor_context::conductor_context(const conductor_params& params) {
    conductor_params effective = params;
    conductor_params_apply_env(effective);
    apply_logging(effective);
    pimpl = std::make_unique<impl>(effective);
}

conductor_context::~conductor_context() {
    stop();
}

void conductor_context::start() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (pimpl->started) {
        return;
    }
    pimpl->registry.start();
    pimpl->started = true;
    LOG_INF("conductor context started\n");
}

void conductor_context::stop() {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->stopped) {
            return;
        }
        pimpl->stopped = true;
    }

    pimpl->workflows.shutdown();
    pimpl->registry.stop();
    pimpl->bus.shutdown();
    LOG_INF("conductor context stopped\n");
}

event_bus& conductor_context::bus() {
    return pimpl->bus;
}

rate_limiter& conductor_context::limiter() {
    return pimpl->limiter;
}

agent_registry& conductor_context::registry() {
    return pimpl->registry;
}

workflow_coordinator& conductor_context::workflows() {
    return pimpl->workflows;
}

knowledge_base& conductor_context::knowledge() {
    return pimpl->knowledge;
}

const conductor_params& conductor_context::params() const {
    return pimpl->params;
}

health_snapshot conductor_context::health() const {
    health_snapshot h;
    for (const auto& info : pimpl->registry.list_agents()) {
        h.agents.total++;
        switch (info.status) {
            case AGENT_STATUS_ACTIVE: h.agents.active++; break;
            case AGENT_STATUS_BUSY: h.agents.busy++; break;
            case AGENT_STATUS_INACTIVE:
            case AGENT_STATUS_ERROR: h.agents.offline++; break;
        }
    }
    h.pending_events = pimpl->bus.pending_events();
    h.queued_messages = pimpl->registry.queue_depth();
    h.active_workflows = pimpl->workflows.active_count();
    h.knowledge_items = pimpl->knowledge.size();
    h.average_load = pimpl->registry.average_load();
    h.timestamp = get_timestamp_ms();
    return h;
}

} // namespace conductor
