#pragma once

#include "event.h"
#include "failure.h"
#include "message.h"
#include "params.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

class agent_registry;

// Workflow status
enum workflow_status {
    WORKFLOW_STATUS_PENDING,
    WORKFLOW_STATUS_RUNNING,
    WORKFLOW_STATUS_COMPLETED,
    WORKFLOW_STATUS_FAILED
};

// Step status
enum step_status {
    STEP_STATUS_PENDING,
    STEP_STATUS_RUNNING,
    STEP_STATUS_COMPLETED,
    STEP_STATUS_FAILED
};

const char* workflow_status_to_string(workflow_status status);
const char* step_status_to_string(step_status status);

// One step as submitted
struct workflow_step_definition {
    std::string id;
    std::string agent_id;                            // Target agent, empty to route by capability
    std::vector<std::string> required_capabilities;  // Used when agent_id is empty
    std::string operation;                           // Method invoked on the agent
    json input = json::object();
    std::vector<std::string> dependencies;           // Step IDs that must complete first
    int64_t timeout_ms = 0;                          // 0: coordinator default
    int retry_count = -1;                            // < 0: coordinator default
    message_priority priority = MESSAGE_PRIORITY_HIGH;
};

struct workflow_definition {
    std::string name;
    std::vector<workflow_step_definition> steps;
    json metadata = json::object();
};

// Throws ERROR_TYPE_VALIDATION for empty or duplicate step IDs, missing
// operations or targets, unknown dependencies and cycles
void validate_workflow(const workflow_definition& definition);

// Dependency layers: every step of wave N depends only on waves < N
// Throws like validate_workflow
std::vector<std::vector<std::string>> workflow_waves(const workflow_definition& definition);

// Step record
struct workflow_step {
    workflow_step_definition definition;
    step_status status = STEP_STATUS_PENDING;
    json result;
    std::string error;
    error_type error_kind = ERROR_TYPE_NONE;
    std::string assigned_agent;
    int attempts = 0;
    int64_t started_at = 0;
    int64_t finished_at = 0;

    const std::string& id() const { return definition.id; }

    std::string to_json() const;
};

// Workflow record
struct workflow {
    std::string id;
    std::string name;
    std::vector<workflow_step> steps;   // Submission order
    workflow_status status = WORKFLOW_STATUS_PENDING;
    int64_t created_at = 0;
    int64_t completed_at = 0;           // 0 while not terminal
    int64_t duration_ms = 0;            // completed_at - created_at
    std::string error;
    json metadata = json::object();

    bool is_terminal() const;

    const workflow_step* find_step(const std::string& step_id) const;

    std::string to_json() const;
};

// Dependency-ordered workflow execution over the router
// Each workflow runs on its own task; the steps of a wave run concurrently.
// Lifecycle events are emitted under the "workflow" prefix.
class workflow_coordinator {
public:
    workflow_coordinator(agent_registry& registry,
                         event_bus& bus,
                         const conductor_params& params);
    ~workflow_coordinator();

    workflow_coordinator(const workflow_coordinator&) = delete;
    workflow_coordinator& operator=(const workflow_coordinator&) = delete;

    // Validate and start a workflow, returns its ID
    std::string submit(const workflow_definition& definition);

    std::optional<workflow> get_status(const std::string& workflow_id) const;

    // Wait until the workflow is terminal
    // Returns nullopt for an unknown ID, throws ERROR_TYPE_TIMEOUT on expiry
    std::optional<workflow> wait(const std::string& workflow_id, int64_t timeout_ms);

    // All workflows in submission order
    std::vector<workflow> list_workflows() const;

    // Workflows that are pending or running
    size_t active_count() const;

    // Reject new submissions and wait for running workflows
    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
