// Test suite for the workflow coordinator

#include "../common/conductor/context.h"
#include "../common/conductor/registry.h"
#include "../common/conductor/workflow.h"
#include "../common/log.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace conductor;

// Test helpers
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

static bool wait_until(const std::function<bool()>& pred, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

static conductor_params test_params() {
    conductor_params params = conductor_default_params();
    params.n_dispatch_workers = 4;
    params.heartbeat_check_interval_ms = 60000;
    params.step_timeout_ms = 2000;
    params.step_retry_delays_ms = {10};
    return params;
}

static workflow_step_definition make_step(const std::string& id,
                                          const std::string& agent_id,
                                          const std::string& operation,
                                          const std::vector<std::string>& dependencies = {}) {
    workflow_step_definition step;
    step.id = id;
    step.agent_id = agent_id;
    step.operation = operation;
    step.input = json{{"step", id}};
    step.dependencies = dependencies;
    return step;
}

static error_type validation_error_of(const workflow_definition& definition) {
    try {
        validate_workflow(definition);
    } catch (const conductor_error& e) {
        return e.type();
    }
    return ERROR_TYPE_NONE;
}

// Execution window of one handler call
struct call_window {
    int64_t started = 0;
    int64_t finished = 0;
};

// Steps run in dependency waves; siblings run concurrently
static bool test_dependency_waves() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    std::mutex mutex;
    std::map<std::string, call_window> windows;

    agent_descriptor worker;
    worker.id = "worker";
    worker.name = "worker";
    worker.capabilities = {"work"};
    worker.methods["work"] = [&mutex, &windows](const json& args) {
        std::string step = args["step"].get<std::string>();
        int64_t started = get_monotonic_ms();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::lock_guard<std::mutex> lock(mutex);
        windows[step] = {started, get_monotonic_ms()};
        return json{{"done", step}};
    };
    registry.register_agent(worker);

    workflow_definition definition;
    definition.name = "diamond";
    definition.steps.push_back(make_step("s1", "worker", "work"));
    definition.steps.push_back(make_step("s2", "worker", "work", {"s1"}));
    definition.steps.push_back(make_step("s3", "worker", "work", {"s1"}));
    definition.steps.push_back(make_step("s4", "worker", "work", {"s2", "s3"}));

    auto waves = workflow_waves(definition);
    TEST_ASSERT(waves.size() == 3, "Three waves");
    TEST_ASSERT(waves[1].size() == 2 && waves[1][0] == "s2" && waves[1][1] == "s3",
                "Middle wave keeps submission order");

    std::string id = coordinator.submit(definition);
    TEST_ASSERT(!id.empty(), "Workflow ID returned");

    auto result = coordinator.wait(id, 5000);
    TEST_ASSERT(result.has_value(), "Workflow known");
    TEST_ASSERT(result->status == WORKFLOW_STATUS_COMPLETED, "Workflow completed");
    TEST_ASSERT(result->completed_at >= result->created_at, "Completion time recorded");

    for (const char* step_id : {"s1", "s2", "s3", "s4"}) {
        const workflow_step* step = result->find_step(step_id);
        TEST_ASSERT(step != nullptr, "Step present");
        TEST_ASSERT(step->status == STEP_STATUS_COMPLETED, "Step completed");
        TEST_ASSERT(step->result["done"] == step_id, "Step result stored");
        TEST_ASSERT(step->assigned_agent == "worker", "Step assigned to its agent");
    }

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(windows["s2"].started >= windows["s1"].finished, "s2 waits for s1");
    TEST_ASSERT(windows["s3"].started >= windows["s1"].finished, "s3 waits for s1");
    TEST_ASSERT(windows["s2"].started < windows["s3"].finished &&
                windows["s3"].started < windows["s2"].finished,
                "Siblings run concurrently");
    TEST_ASSERT(windows["s4"].started >= windows["s2"].finished &&
                windows["s4"].started >= windows["s3"].finished,
                "s4 waits for both dependencies");

    TEST_ASSERT(wait_until([&]() { return bus.get_history("workflow:completed").size() == 1; }, 1000),
                "Completed event");
    TEST_ASSERT(bus.get_history("workflow:started").size() == 1, "Started event");
    TEST_ASSERT(bus.get_history("workflow:step_completed").size() == 4, "Step events");
    auto completed = bus.get_history("workflow:completed");
    TEST_ASSERT(completed[0].payload["steps"].contains("s4"), "Completed event carries the steps");

    return true;
}

// Malformed workflows are rejected before anything runs
static bool test_validation() {
    workflow_definition empty;
    empty.name = "empty";
    TEST_ASSERT(validation_error_of(empty) == ERROR_TYPE_VALIDATION, "No steps rejected");

    workflow_definition cycle;
    cycle.name = "cycle";
    cycle.steps.push_back(make_step("a", "worker", "work", {"c"}));
    cycle.steps.push_back(make_step("b", "worker", "work", {"a"}));
    cycle.steps.push_back(make_step("c", "worker", "work", {"b"}));
    TEST_ASSERT(validation_error_of(cycle) == ERROR_TYPE_VALIDATION, "Cycle rejected");

    workflow_definition self;
    self.name = "self";
    self.steps.push_back(make_step("a", "worker", "work", {"a"}));
    TEST_ASSERT(validation_error_of(self) == ERROR_TYPE_VALIDATION, "Self dependency rejected");

    workflow_definition unknown;
    unknown.name = "unknown";
    unknown.steps.push_back(make_step("a", "worker", "work", {"missing"}));
    TEST_ASSERT(validation_error_of(unknown) == ERROR_TYPE_VALIDATION, "Unknown dependency rejected");

    workflow_definition duplicate;
    duplicate.name = "duplicate";
    duplicate.steps.push_back(make_step("a", "worker", "work"));
    duplicate.steps.push_back(make_step("a", "worker", "work"));
    TEST_ASSERT(validation_error_of(duplicate) == ERROR_TYPE_VALIDATION, "Duplicate ID rejected");

    workflow_definition untargeted;
    untargeted.name = "untargeted";
    untargeted.steps.push_back(make_step("a", "", "work"));
    TEST_ASSERT(validation_error_of(untargeted) == ERROR_TYPE_VALIDATION, "Step without target rejected");

    workflow_definition valid;
    valid.name = "valid";
    valid.steps.push_back(make_step("a", "worker", "work"));
    valid.steps.push_back(make_step("b", "worker", "work", {"a"}));
    TEST_ASSERT(validation_error_of(valid) == ERROR_TYPE_NONE, "Valid workflow accepted");

    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    workflow_coordinator coordinator(registry, bus, params);

    bool rejected = false;
    try {
        coordinator.submit(cycle);
    } catch (const conductor_error& e) {
        rejected = e.type() == ERROR_TYPE_VALIDATION;
    }
    TEST_ASSERT(rejected, "submit rejects a cycle");
    TEST_ASSERT(coordinator.list_workflows().empty(), "Rejected workflow not stored");

    return true;
}

// A failed step fails the workflow after its wave settles
static bool test_step_failure() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    std::atomic<int> late_calls{0};

    agent_descriptor worker;
    worker.id = "worker";
    worker.name = "worker";
    worker.methods["ok"] = [](const json& args) { return json{{"done", args["step"]}}; };
    worker.methods["slow"] = [](const json& args) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return json{{"done", args["step"]}};
    };
    worker.methods["fail"] = [](const json&) -> json {
        throw std::runtime_error("cannot process input");
    };
    worker.methods["late"] = [&late_calls](const json&) {
        late_calls++;
        return json::object();
    };
    registry.register_agent(worker);

    workflow_definition definition;
    definition.name = "partial";
    definition.steps.push_back(make_step("s1", "worker", "ok"));
    definition.steps.push_back(make_step("s2", "worker", "fail", {"s1"}));
    definition.steps.push_back(make_step("s3", "worker", "slow", {"s1"}));
    definition.steps.push_back(make_step("s4", "worker", "late", {"s2", "s3"}));

    std::string id = coordinator.submit(definition);
    auto result = coordinator.wait(id, 5000);

    TEST_ASSERT(result->status == WORKFLOW_STATUS_FAILED, "Workflow failed");
    TEST_ASSERT(result->error.find("s2") != std::string::npos, "Error names the failed step");
    TEST_ASSERT(result->find_step("s1")->status == STEP_STATUS_COMPLETED, "s1 completed");
    TEST_ASSERT(result->find_step("s2")->status == STEP_STATUS_FAILED, "s2 failed");
    TEST_ASSERT(result->find_step("s2")->error_kind == ERROR_TYPE_EXECUTION, "Failure classified");
    TEST_ASSERT(result->find_step("s3")->status == STEP_STATUS_COMPLETED, "Sibling settled");
    TEST_ASSERT(result->find_step("s4")->status == STEP_STATUS_PENDING, "Later step never started");
    TEST_ASSERT(late_calls.load() == 0, "Later step handler never called");

    TEST_ASSERT(wait_until([&]() { return bus.get_history("workflow:failed").size() == 1; }, 1000),
                "Workflow failure event");
    TEST_ASSERT(bus.get_history("workflow:step_failed").size() == 1, "Step failure event");
    TEST_ASSERT(bus.get_history("workflow:completed").empty(), "No completion event");

    return true;
}

// Steps without an agent are routed by capability
static bool test_capability_routing() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    agent_descriptor writer;
    writer.id = "writer";
    writer.name = "writer";
    writer.capabilities = {"text"};
    writer.methods["compute"] = [](const json&) { return json{{"by", "writer"}}; };
    registry.register_agent(writer);

    agent_descriptor calc;
    calc.id = "calc";
    calc.name = "calc";
    calc.capabilities = {"math", "text"};
    calc.methods["compute"] = [](const json& args) {
        return json{{"by", "calc"}, {"sum", args["a"].get<int>() + args["b"].get<int>()}};
    };
    registry.register_agent(calc);

    workflow_definition definition;
    definition.name = "routed";
    workflow_step_definition step = make_step("sum", "", "compute");
    step.required_capabilities = {"math"};
    step.input = json{{"a", 2}, {"b", 3}};
    definition.steps.push_back(step);

    std::string id = coordinator.submit(definition);
    auto result = coordinator.wait(id, 5000);

    TEST_ASSERT(result->status == WORKFLOW_STATUS_COMPLETED, "Routed workflow completed");
    const workflow_step* sum = result->find_step("sum");
    TEST_ASSERT(sum->assigned_agent == "calc", "Capable agent selected");
    TEST_ASSERT(sum->result["sum"] == 5, "Result from the capable agent");

    workflow_definition unroutable;
    unroutable.name = "unroutable";
    workflow_step_definition orphan = make_step("orphan", "", "compute");
    orphan.required_capabilities = {"vision"};
    unroutable.steps.push_back(orphan);

    std::string failed_id = coordinator.submit(unroutable);
    auto failed = coordinator.wait(failed_id, 5000);
    TEST_ASSERT(failed->status == WORKFLOW_STATUS_FAILED, "Unroutable workflow failed");
    TEST_ASSERT(failed->find_step("orphan")->error_kind == ERROR_TYPE_UNAVAILABLE, "No agent is unavailable");
    TEST_ASSERT(failed->find_step("orphan")->attempts == 1, "Unavailable is not retried");

    return true;
}

// Retryable step errors are retried up to the step budget
static bool test_step_retry() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    std::atomic<int> calls{0};

    agent_descriptor flaky;
    flaky.id = "flaky";
    flaky.name = "flaky";
    flaky.methods["fetch"] = [&calls](const json&) -> json {
        if (++calls < 3) {
            throw conductor_error(ERROR_TYPE_TIMEOUT, "upstream timed out");
        }
        return json{{"attempt", calls.load()}};
    };
    flaky.methods["broken"] = [](const json&) -> json {
        throw std::runtime_error("bad input");
    };
    registry.register_agent(flaky);

    workflow_definition definition;
    definition.name = "retry";
    workflow_step_definition step = make_step("fetch", "flaky", "fetch");
    step.retry_count = 2;
    definition.steps.push_back(step);

    auto result = coordinator.wait(coordinator.submit(definition), 5000);
    TEST_ASSERT(result->status == WORKFLOW_STATUS_COMPLETED, "Retried step completed");
    TEST_ASSERT(result->find_step("fetch")->attempts == 3, "Three attempts");
    TEST_ASSERT(result->find_step("fetch")->result["attempt"] == 3, "Result of the last attempt");

    workflow_definition broken;
    broken.name = "broken";
    workflow_step_definition bad = make_step("bad", "flaky", "broken");
    bad.retry_count = 3;
    broken.steps.push_back(bad);

    auto failed = coordinator.wait(coordinator.submit(broken), 5000);
    TEST_ASSERT(failed->status == WORKFLOW_STATUS_FAILED, "Broken step fails");
    TEST_ASSERT(failed->find_step("bad")->attempts == 1, "Execution errors are not retried");

    return true;
}

// wait() times out on running workflows and knows nothing of unknown IDs
static bool test_wait_timeout() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    agent_descriptor blocker;
    blocker.id = "blocker";
    blocker.name = "blocker";
    blocker.methods["hold"] = [gate](const json&) {
        gate.wait();
        return json{{"released", true}};
    };
    registry.register_agent(blocker);

    workflow_definition definition;
    definition.name = "held";
    definition.steps.push_back(make_step("hold", "blocker", "hold"));

    std::string id = coordinator.submit(definition);

    bool timed_out = false;
    try {
        coordinator.wait(id, 50);
    } catch (const conductor_error& e) {
        timed_out = e.type() == ERROR_TYPE_TIMEOUT;
    }

    auto running = coordinator.get_status(id);
    size_t active = coordinator.active_count();
    release.set_value();

    TEST_ASSERT(timed_out, "wait times out while the workflow runs");
    TEST_ASSERT(running && !running->is_terminal(), "Workflow still running");
    TEST_ASSERT(active == 1, "One active workflow");

    auto result = coordinator.wait(id, 5000);
    TEST_ASSERT(result->status == WORKFLOW_STATUS_COMPLETED, "Workflow completes after release");
    TEST_ASSERT(coordinator.active_count() == 0, "No active workflows");

    TEST_ASSERT(!coordinator.wait("no-such-workflow", 10).has_value(), "Unknown workflow");
    TEST_ASSERT(!coordinator.get_status("no-such-workflow").has_value(), "Unknown workflow status");

    auto all = coordinator.list_workflows();
    TEST_ASSERT(all.size() == 1 && all[0].id == id, "Workflow listed");

    json j = json::parse(result->to_json());
    TEST_ASSERT(j["status"] == "completed", "Serialized status");
    TEST_ASSERT(j["steps"]["hold"]["status"] == "completed", "Steps keyed by ID");

    return true;
}

// Shutdown waits for running workflows and rejects new ones
static bool test_shutdown() {
    conductor_params params = test_params();
    event_bus bus;
    agent_registry registry(bus, params);
    registry.start();
    workflow_coordinator coordinator(registry, bus, params);

    agent_descriptor worker;
    worker.id = "worker";
    worker.name = "worker";
    worker.methods["work"] = [](const json&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return json{{"ok", true}};
    };
    registry.register_agent(worker);

    workflow_definition definition;
    definition.name = "drain";
    definition.steps.push_back(make_step("a", "worker", "work"));

    std::string id = coordinator.submit(definition);
    coordinator.shutdown();

    auto status = coordinator.get_status(id);
    TEST_ASSERT(status && status->status == WORKFLOW_STATUS_COMPLETED, "Running workflow drained");

    bool rejected = false;
    try {
        coordinator.submit(definition);
    } catch (const conductor_error& e) {
        rejected = e.type() == ERROR_TYPE_UNAVAILABLE;
    }
    TEST_ASSERT(rejected, "Submissions rejected after shutdown");

    return true;
}

// The context wires the components together and reports health
static bool test_context_health() {
    conductor_params params = test_params();
    params.log_level = "none";

    conductor_context ctx(params);
    ctx.start();

    agent_descriptor worker;
    worker.id = "worker";
    worker.name = "worker";
    worker.capabilities = {"work"};
    worker.methods["work"] = [](const json& args) { return json{{"done", args["step"]}}; };
    ctx.registry().register_agent(worker);

    agent_descriptor spare = worker;
    spare.id = "spare";
    spare.name = "spare";
    ctx.registry().register_agent(spare);
    ctx.registry().set_agent_status("spare", AGENT_STATUS_INACTIVE);

    health_snapshot health = ctx.health();
    TEST_ASSERT(health.agents.total == 2, "Two agents");
    TEST_ASSERT(health.agents.active == 1, "One active agent");
    TEST_ASSERT(health.agents.offline == 1, "One offline agent");
    TEST_ASSERT(health.is_healthy(), "Healthy with an active agent");

    workflow_definition definition;
    definition.name = "context";
    workflow_step_definition step = make_step("only", "", "work");
    step.required_capabilities = {"work"};
    definition.steps.push_back(step);

    auto result = ctx.workflows().wait(ctx.workflows().submit(definition), 5000);
    TEST_ASSERT(result->status == WORKFLOW_STATUS_COMPLETED, "Workflow through the context");
    TEST_ASSERT(result->find_step("only")->assigned_agent == "worker", "Inactive agent skipped");

    json j = json::parse(ctx.health().to_json());
    TEST_ASSERT(j["active_workflows"] == 0, "No active workflows");
    TEST_ASSERT(j["agents"]["total"] == 2, "Serialized agent counts");

    ctx.stop();
    ctx.stop();
    TEST_ASSERT(!ctx.registry().is_running(), "Router stopped with the context");

    ctx.registry().set_agent_status("worker", AGENT_STATUS_ERROR);
    TEST_ASSERT(!ctx.health().is_healthy(), "Unhealthy without routable agents");

    return true;
}

// Shared knowledge is versioned and announced on the bus
static bool test_knowledge_base() {
    conductor_params params = test_params();
    params.log_level = "none";
    params.knowledge_max_versions = 2;

    conductor_context ctx(params);

    std::mutex mutex;
    std::vector<json> updates;
    ctx.bus().subscribe("coordinator:knowledge_updated", [&](const json& payload, const event_metadata&) {
        std::lock_guard<std::mutex> lock(mutex);
        updates.push_back(payload);
    });

    knowledge_base& kb = ctx.knowledge();
    TEST_ASSERT(kb.put("plan", json{{"steps", 1}}, "planner", {"draft"}) == 1, "First version");
    TEST_ASSERT(kb.put("plan", json{{"steps", 2}}, "planner", {"draft"}) == 2, "Second version");
    TEST_ASSERT(kb.put("plan", json{{"steps", 3}}, "reviewer", {"final", "draft"}) == 3, "Third version");
    kb.put("notes", "check inputs", "reviewer", {"draft"});

    TEST_ASSERT((*kb.get("plan"))["steps"] == 3, "Latest value returned");
    TEST_ASSERT(kb.get_entry("plan")->source == "reviewer", "Source kept");
    TEST_ASSERT(!kb.get("missing").has_value(), "Unknown key");

    auto history = kb.get_history("plan");
    TEST_ASSERT(history.size() == 2, "Old versions dropped");
    TEST_ASSERT(history.front().version == 2 && history.back().version == 3, "History oldest first");

    TEST_ASSERT(kb.query({"draft"}).size() == 2, "Tag query over latest entries");
    auto finals = kb.query({"final", "draft"});
    TEST_ASSERT(finals.size() == 1 && finals[0].key == "plan", "Every tag required");

    auto keys = kb.keys();
    TEST_ASSERT(keys.size() == 2 && keys[0] == "notes" && keys[1] == "plan", "Keys sorted");

    bool rejected = false;
    try {
        kb.put("", 1, "planner");
    } catch (const conductor_error& e) {
        rejected = e.type() == ERROR_TYPE_VALIDATION;
    }
    TEST_ASSERT(rejected, "Empty key rejected");

    {
        std::lock_guard<std::mutex> lock(mutex);
        TEST_ASSERT(updates.size() == 4, "Every write announced");
        TEST_ASSERT(updates[2]["key"] == "plan" && updates[2]["version"] == 3, "Update payload");
        TEST_ASSERT(updates[2]["source"] == "reviewer" && updates[2]["value"]["steps"] == 3, "Update value");
    }

    TEST_ASSERT(ctx.health().knowledge_items == 2, "Health counts knowledge keys");
    TEST_ASSERT(json::parse(ctx.health().to_json())["knowledge_items"] == 2, "Serialized knowledge count");

    TEST_ASSERT(kb.erase("notes"), "Key erased");
    TEST_ASSERT(kb.put("plan", json{{"steps", 4}}, "planner") == 4, "Versions keep counting");
    TEST_ASSERT(kb.size() == 1, "One key left");

    ctx.stop();
    return true;
}

int main() {
    conductor_log_set_verbosity(CONDUCTOR_LOG_LEVEL_NONE);

    std::cout << "=== Workflow Coordinator Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_validation);
    RUN_TEST(test_dependency_waves);
    RUN_TEST(test_step_failure);
    RUN_TEST(test_capability_routing);
    RUN_TEST(test_step_retry);
    RUN_TEST(test_wait_timeout);
    RUN_TEST(test_shutdown);
    RUN_TEST(test_context_health);
    RUN_TEST(test_knowledge_base);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << std::endl << "Some tests failed!" << std::endl;
        return 1;
    }
}
