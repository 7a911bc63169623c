#include "workflow.h"
#include "registry.h"
#include "log.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <system_error>

namespace conductor {

const char* workflow_status_to_string(workflow_status status) {
    switch (status) {
        case WORKFLOW_STATUS_PENDING: return "pending";
        case WORKFLOW_STATUS_RUNNING: return "running";
        case WORKFLOW_STATUS_COMPLETED: return "completed";
        case WORKFLOW_STATUS_FAILED: return "failed";
        default: return "unknown";
    }
}

const char* step_status_to_string(step_status status) {
    switch (status) {
        case STEP_STATUS_PENDING: return "pending";
        case STEP_STATUS_RUNNING: return "running";
        case STEP_STATUS_COMPLETED: return "completed";
        case STEP_STATUS_FAILED: return "failed";
        default: return "unknown";
    }
}

static conductor_error invalid_workflow(const workflow_definition& definition,
                                        const std::string& reason,
                                        json details = json::object()) {
    details["workflow"] = definition.name;
    return conductor_error(ERROR_TYPE_VALIDATION, "invalid workflow: " + reason,
                           details, "workflow");
}

std::vector<std::vector<std::string>> workflow_waves(const workflow_definition& definition) {
    std::map<std::string, std::set<std::string>> deps;
    std::vector<std::string> order;

    for (const auto& step : definition.steps) {
        deps[step.id].insert(step.dependencies.begin(), step.dependencies.end());
        order.push_back(step.id);
    }

    std::vector<std::vector<std::string>> waves;
    std::set<std::string> placed;

    while (placed.size() < order.size()) {
        std::vector<std::string> wave;
        for (const auto& id : order) {
            if (placed.count(id) > 0) {
                continue;
            }
            const auto& required = deps[id];
            bool ready = std::all_of(required.begin(), required.end(),
                [&placed](const std::string& dep) { return placed.count(dep) > 0; });
            if (ready) {
                wave.push_back(id);
            }
        }

        if (wave.empty()) {
            json blocked = json::array();
            for (const auto& id : order) {
                if (placed.count(id) == 0) {
                    blocked.push_back(id);
                }
            }
            throw invalid_workflow(definition, "dependency cycle", json{{"steps", blocked}});
        }

        placed.insert(wave.begin(), wave.end());
        waves.push_back(std::move(wave));
    }

    return waves;
}

void validate_workflow(const workflow_definition& definition) {
    if (definition.steps.empty()) {
        throw invalid_workflow(definition, "no steps");
    }

    std::set<std::string> ids;
    for (const auto& step : definition.steps) {
        if (step.id.empty()) {
            throw invalid_workflow(definition, "step id is required");
        }
        if (!ids.insert(step.id).second) {
            throw invalid_workflow(definition, "duplicate step id " + step.id, json{{"step", step.id}});
        }
        if (step.operation.empty()) {
            throw invalid_workflow(definition, "step " + step.id + " has no operation",
                                   json{{"step", step.id}});
        }
        if (step.agent_id.empty() && step.required_capabilities.empty()) {
            throw invalid_workflow(definition, "step " + step.id + " has no agent or capabilities",
                                   json{{"step", step.id}});
        }
        if (step.timeout_ms < 0) {
            throw invalid_workflow(definition, "step " + step.id + " has a negative timeout",
                                   json{{"step", step.id}});
        }
    }

    for (const auto& step : definition.steps) {
        for (const auto& dep : step.dependencies) {
            if (dep == step.id) {
                throw invalid_workflow(definition, "step " + step.id + " depends on itself",
                                       json{{"step", step.id}});
            }
            if (ids.count(dep) == 0) {
                throw invalid_workflow(definition,
                                       "step " + step.id + " depends on unknown step " + dep,
                                       json{{"step", step.id}, {"dependency", dep}});
            }
        }
    }

    workflow_waves(definition);
}

static json step_to_json_value(const workflow_step& step) {
    const auto& def = step.definition;
    json j;
    j["id"] = def.id;
    j["agent_id"] = def.agent_id;
    j["required_capabilities"] = def.required_capabilities;
    j["operation"] = def.operation;
    j["input"] = def.input;
    j["dependencies"] = def.dependencies;
    j["timeout_ms"] = def.timeout_ms;
    j["retry_count"] = def.retry_count;
    j["status"] = step_status_to_string(step.status);
    j["result"] = step.result;
    j["error"] = step.error;
    j["error_type"] = error_type_to_string(step.error_kind);
    j["assigned_agent"] = step.assigned_agent;
    j["attempts"] = step.attempts;
    j["started_at"] = step.started_at;
    j["finished_at"] = step.finished_at;
    return j;
}

std::string workflow_step::to_json() const {
    return step_to_json_value(*this).dump();
}

bool workflow::is_terminal() const {
    return status == WORKFLOW_STATUS_COMPLETED || status == WORKFLOW_STATUS_FAILED;
}

const workflow_step* workflow::find_step(const std::string& step_id) const {
    for (const auto& step : steps) {
        if (step.id() == step_id) {
            return &step;
        }
    }
    return nullptr;
}

std::string workflow::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["status"] = workflow_status_to_string(status);
    j["created_at"] = created_at;
    j["completed_at"] = completed_at;
    j["duration_ms"] = duration_ms;
    j["error"] = error;
    j["metadata"] = metadata;
    j["steps"] = json::object();
    for (const auto& step : steps) {
        j["steps"][step.id()] = step_to_json_value(step);
    }
    return j.dump();
}

// workflow_coordinator implementation
struct workflow_coordinator::impl {
    agent_registry& registry;
    event_namespace events;
    conductor_params params;

    std::map<std::string, workflow> workflows;
    std::vector<std::string> order;
    std::map<std::string, std::future<void>> tasks;
    bool shutting_down = false;

    mutable std::mutex mutex;
    std::condition_variable cv;

    impl(agent_registry& reg, event_bus& bus, const conductor_params& p)
        : registry(reg), events(bus.scope("workflow")), params(p) {}

    // Caller holds the mutex
    workflow_step& step_locked(const std::string& workflow_id, const std::string& step_id) {
        for (auto& step : workflows.at(workflow_id).steps) {
            if (step.id() == step_id) {
                return step;
            }
        }
        throw conductor_error(ERROR_TYPE_INTERNAL_ERROR, "unknown step " + step_id,
                              json{{"workflow_id", workflow_id}}, "workflow");
    }

    struct step_outcome {
        bool ok = false;
        json result;
        std::string error;
        error_type error_kind = ERROR_TYPE_NONE;
        std::string assigned_agent;
        int attempts = 0;
    };

    step_outcome execute_step(const std::string& workflow_id, const workflow_step_definition& def) {
        retry_policy policy;
        policy.max_retries = def.retry_count >= 0 ? def.retry_count : params.step_retry_count;
        policy.delays_ms = params.step_retry_delays_ms;

        send_options options;
        options.priority = def.priority;
        options.timeout_ms = def.timeout_ms > 0 ? def.timeout_ms : params.step_timeout_ms;
        options.retry_attempts = policy.max_retries;

        step_outcome outcome;
        try {
            outcome.result = with_retry([&]() {
                outcome.attempts++;

                std::string target = def.agent_id;
                if (target.empty()) {
                    std::optional<std::string> best = registry.find_optimal_agent(def.required_capabilities);
                    if (!best) {
                        throw conductor_error(ERROR_TYPE_UNAVAILABLE,
                                              "no routable agent for step " + def.id,
                                              json{{"step", def.id},
                                                   {"required_capabilities", def.required_capabilities}},
                                              "workflow");
                    }
                    target = *best;
                }
                outcome.assigned_agent = target;

                return registry.send_message("workflow:" + workflow_id, target,
                                             def.operation, def.input, options);
            }, policy);
            outcome.ok = true;
        } catch (const conductor_error& e) {
            outcome.error = e.what();
            outcome.error_kind = e.type();
        } catch (const std::exception& e) {
            outcome.error = e.what();
            outcome.error_kind = ERROR_TYPE_INTERNAL_ERROR;
        }
        return outcome;
    }

    void finish(const std::string& workflow_id, bool failed, const std::string& error) {
        json payload;
        {
            std::lock_guard<std::mutex> lock(mutex);
            workflow& wf = workflows.at(workflow_id);
            wf.status = failed ? WORKFLOW_STATUS_FAILED : WORKFLOW_STATUS_COMPLETED;
            wf.error = error;
            wf.completed_at = get_timestamp_ms();
            wf.duration_ms = wf.completed_at - wf.created_at;
            payload = json::parse(wf.to_json());
        }
        cv.notify_all();

        emit_options options;
        options.correlation_id = workflow_id;
        if (failed) {
            LOG_WRN("workflow %s failed: %s\n", workflow_id.c_str(), error.c_str());
            events.emit("failed", payload, options);
        } else {
            LOG_INF("workflow %s completed in %lld ms\n", workflow_id.c_str(),
                    (long long) payload.value("duration_ms", int64_t(0)));
            events.emit("completed", payload, options);
        }
    }

    void run(const std::string& workflow_id) {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex);
            workflow& wf = workflows.at(workflow_id);
            wf.status = WORKFLOW_STATUS_RUNNING;
            name = wf.name;
        }
        cv.notify_all();

        emit_options options;
        options.correlation_id = workflow_id;
        events.emit("started", json{{"workflow_id", workflow_id}, {"name", name}}, options);

        std::string failure;
        try {
            failure = run_waves(workflow_id, options);
        } catch (const std::exception& e) {
            // Scheduling broke down (thread start, bookkeeping); settle what is left
            failure = std::string("internal error: ") + e.what();
            LOG_ERR("workflow %s: %s\n", workflow_id.c_str(), failure.c_str());
            std::lock_guard<std::mutex> lock(mutex);
            int64_t now = get_timestamp_ms();
            for (auto& step : workflows.at(workflow_id).steps) {
                if (step.status == STEP_STATUS_PENDING || step.status == STEP_STATUS_RUNNING) {
                    step.status = STEP_STATUS_FAILED;
                    step.error = failure;
                    step.error_kind = ERROR_TYPE_INTERNAL_ERROR;
                    step.finished_at = now;
                }
            }
        }

        finish(workflow_id, !failure.empty(), failure);
    }

    // Dispatch dependency waves until every step settled or one failed
    // Returns the failure message, empty on success
    std::string run_waves(const std::string& workflow_id, const emit_options& options) {
        std::set<std::string> completed;
        std::string failure;

        while (true) {
            std::vector<workflow_step_definition> ready;
            size_t pending = 0;
            {
                std::lock_guard<std::mutex> lock(mutex);
                workflow& wf = workflows.at(workflow_id);
                int64_t now = get_timestamp_ms();
                for (auto& step : wf.steps) {
                    if (step.status != STEP_STATUS_PENDING) {
                        continue;
                    }
                    pending++;
                    const auto& deps = step.definition.dependencies;
                    bool satisfied = std::all_of(deps.begin(), deps.end(),
                        [&completed](const std::string& dep) { return completed.count(dep) > 0; });
                    if (satisfied) {
                        step.status = STEP_STATUS_RUNNING;
                        step.started_at = now;
                        ready.push_back(step.definition);
                    }
                }
            }

            if (pending == 0) {
                break;
            }
            if (ready.empty()) {
                failure = "circular or missing dependency";
                break;
            }

            LOG_DBG("workflow %s: dispatching wave of %zu steps\n", workflow_id.c_str(), ready.size());

            // Fan out, then fan in once every step of the wave has settled
            std::vector<std::future<step_outcome>> wave;
            for (const auto& def : ready) {
                wave.push_back(std::async(std::launch::async,
                    [this, workflow_id, def]() { return execute_step(workflow_id, def); }));
            }

            for (size_t i = 0; i < ready.size(); i++) {
                step_outcome outcome = wave[i].get();
                const auto& def = ready[i];

                json payload;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    workflow_step& step = step_locked(workflow_id, def.id);
                    step.finished_at = get_timestamp_ms();
                    step.attempts = outcome.attempts;
                    step.assigned_agent = outcome.assigned_agent;
                    if (outcome.ok) {
                        step.status = STEP_STATUS_COMPLETED;
                        step.result = outcome.result;
                        completed.insert(def.id);
                    } else {
                        step.status = STEP_STATUS_FAILED;
                        step.error = outcome.error;
                        step.error_kind = outcome.error_kind;
                        if (failure.empty()) {
                            failure = "step " + def.id + " failed: " + outcome.error;
                        }
                    }
                    payload = {
                        {"workflow_id", workflow_id},
                        {"step_id", def.id},
                        {"agent_id", step.assigned_agent},
                        {"attempts", step.attempts},
                        {"duration_ms", step.finished_at - step.started_at},
                    };
                    if (!outcome.ok) {
                        payload["error"] = outcome.error;
                        payload["error_type"] = error_type_to_string(outcome.error_kind);
                    }
                }
                cv.notify_all();

                events.emit(outcome.ok ? "step_completed" : "step_failed", payload, options);
            }

            if (!failure.empty()) {
                break;
            }
        }

        return failure;
    }

    static void join_task(const std::string& workflow_id, std::future<void>& task) {
        try {
            task.get();
        } catch (const std::exception& e) {
            LOG_ERR("workflow %s: runner ended with %s\n", workflow_id.c_str(), e.what());
        }
    }

    // Caller holds the mutex
    void reap_locked() {
        for (auto it = tasks.begin(); it != tasks.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                join_task(it->first, it->second);
                it = tasks.erase(it);
            } else {
                ++it;
            }
        }
    }
};

workflow_coordinator::workflow_coordinator(agent_registry& registry,
                                           event_bus& bus,
                                           const conductor_params& params)
    : pimpl(std::make_unique<impl>(registry, bus, params)) {}

workflow_coordinator::~workflow_coordinator() {
    shutdown();
}

std::string workflow_coordinator::submit(const workflow_definition& definition) {
    validate_workflow(definition);

    workflow wf;
    wf.id = generate_uuid();
    wf.name = definition.name;
    wf.status = WORKFLOW_STATUS_PENDING;
    wf.created_at = get_timestamp_ms();
    wf.metadata = definition.metadata;
    for (const auto& def : definition.steps) {
        workflow_step step;
        step.definition = def;
        wf.steps.push_back(std::move(step));
    }

    std::string id = wf.id;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->shutting_down) {
            throw conductor_error(ERROR_TYPE_UNAVAILABLE, "workflow coordinator is shutting down",
                                  json{{"workflow", definition.name}}, "workflow", false);
        }
        pimpl->reap_locked();
        pimpl->workflows.emplace(id, std::move(wf));
        pimpl->order.push_back(id);

        impl* p = pimpl.get();
        try {
            pimpl->tasks.emplace(id, std::async(std::launch::async, [p, id]() { p->run(id); }));
        } catch (const std::system_error& e) {
            pimpl->workflows.erase(id);
            pimpl->order.pop_back();
            throw conductor_error(ERROR_TYPE_INTERNAL_ERROR,
                                  std::string("cannot start workflow runner: ") + e.what(),
                                  json{{"workflow", definition.name}}, "workflow");
        }
    }

    LOG_INF("workflow submitted: %s (%s, %zu steps)\n",
            id.c_str(), definition.name.c_str(), definition.steps.size());
    return id;
}

std::optional<workflow> workflow_coordinator::get_status(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->workflows.find(workflow_id);
    if (it == pimpl->workflows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<workflow> workflow_coordinator::wait(const std::string& workflow_id, int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->workflows.find(workflow_id);
    if (it == pimpl->workflows.end()) {
        return std::nullopt;
    }

    auto done = [this, &workflow_id]() {
        return pimpl->workflows.at(workflow_id).is_terminal();
    };

    if (timeout_ms <= 0) {
        pimpl->cv.wait(lock, done);
    } else if (!pimpl->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), done)) {
        throw conductor_error(ERROR_TYPE_TIMEOUT,
                              "timeout waiting for workflow " + workflow_id,
                              json{{"workflow_id", workflow_id}, {"timeout_ms", timeout_ms}},
                              "workflow");
    }

    return pimpl->workflows.at(workflow_id);
}

std::vector<workflow> workflow_coordinator::list_workflows() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    std::vector<workflow> result;
    for (const auto& id : pimpl->order) {
        result.push_back(pimpl->workflows.at(id));
    }
    return result;
}

size_t workflow_coordinator::active_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    size_t count = 0;
    for (const auto& [id, wf] : pimpl->workflows) {
        if (!wf.is_terminal()) {
            count++;
        }
    }
    return count;
}

void workflow_coordinator::shutdown() {
    std::map<std::string, std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->shutting_down = true;
        tasks.swap(pimpl->tasks);
    }

    for (auto& [id, task] : tasks) {
        impl::join_task(id, task);
    }
}

} // namespace conductor
