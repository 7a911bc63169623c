#include "conductor.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace conductor;

// ============================================================================
// Example Agents
// ============================================================================

static agent_descriptor make_price_agent() {
    agent_descriptor desc;
    desc.id = "market";
    desc.name = "Market Data";
    desc.version = "1.2.0";
    desc.description = "Quotes and fee estimates";
    desc.capabilities = {"market", "pricing"};

    desc.methods["bitcoin/price"] = [](const json& args) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return json{{"currency", args.value("currency", "usd")}, {"price", 67250.5}};
    };
    desc.methods["bitcoin/fees"] = [](const json&) {
        return json{{"fast", 24}, {"medium", 12}, {"slow", 4}};
    };
    desc.methods["ping"] = [](const json&) {
        return json{{"agent", "market"}};
    };
    return desc;
}

static agent_descriptor make_writer_agent(const std::string& id) {
    agent_descriptor desc;
    desc.id = id;
    desc.name = "Writer " + id;
    desc.version = "0.9.0";
    desc.capabilities = {"text", "summarize"};

    desc.methods["summarize"] = [id](const json& args) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return json{{"summary", "Price is " + args.dump()}, {"by", id}};
    };
    desc.methods["ping"] = [id](const json&) {
        return json{{"agent", id}};
    };
    return desc;
}

static agent_descriptor make_flaky_agent() {
    agent_descriptor desc;
    desc.id = "flaky";
    desc.name = "Flaky Upstream";
    desc.capabilities = {"news"};
    desc.methods["news/latest"] = [](const json&) -> json {
        throw std::runtime_error("upstream returned 503");
    };
    return desc;
}

// ============================================================================
// Demo Functions
// ============================================================================

static void demo_routing(conductor_context& ctx) {
    std::cout << "\n=== Demo 1: Routing, Caching and Broadcast ===" << std::endl;

    agent_registry& registry = ctx.registry();

    json price = registry.send_message("demo", "market", "bitcoin/price", json{{"currency", "eur"}});
    std::cout << "Price: " << price.dump() << std::endl;

    registry.send_message("demo", "market", "bitcoin/price", json{{"currency", "eur"}});
    auto cache = registry.get_cache_stats();
    std::cout << "Cache hits after repeat: " << cache.hits << std::endl;

    auto best = registry.find_optimal_agent({"summarize"});
    std::cout << "Least loaded summarizer: " << best.value_or("<none>") << std::endl;

    auto replies = registry.broadcast_message("demo", "ping", json::object());
    for (const auto& [agent_id, reply] : replies) {
        std::cout << "  " << agent_id << " -> " << reply.to_json() << std::endl;
    }

    std::cout << "Demo 1 completed\n" << std::endl;
}

static void demo_workflow(conductor_context& ctx) {
    std::cout << "\n=== Demo 2: Dependency-Ordered Workflow ===" << std::endl;

    ctx.bus().subscribe("workflow:step_completed", [](const json& payload, const event_metadata&) {
        std::cout << "  step " << payload["step_id"].get<std::string>()
                  << " done by " << payload["agent_id"].get<std::string>() << std::endl;
    });

    workflow_definition definition;
    definition.name = "market-brief";

    workflow_step_definition price;
    price.id = "price";
    price.agent_id = "market";
    price.operation = "bitcoin/price";
    definition.steps.push_back(price);

    workflow_step_definition fees;
    fees.id = "fees";
    fees.agent_id = "market";
    fees.operation = "bitcoin/fees";
    definition.steps.push_back(fees);

    workflow_step_definition brief;
    brief.id = "brief";
    brief.required_capabilities = {"summarize"};
    brief.operation = "summarize";
    brief.input = json{{"topic", "bitcoin"}};
    brief.dependencies = {"price", "fees"};
    definition.steps.push_back(brief);

    std::string id = ctx.workflows().submit(definition);
    auto result = ctx.workflows().wait(id, 10000);
    std::cout << "Workflow " << workflow_status_to_string(result->status)
              << " in " << result->duration_ms << " ms" << std::endl;

    if (const workflow_step* step = result->find_step("brief")) {
        ctx.knowledge().put("market-brief", step->result, step->assigned_agent, {"bitcoin", "brief"});
    }
    for (const auto& entry : ctx.knowledge().query({"bitcoin"})) {
        std::cout << "Knowledge " << entry.key << " v" << entry.version
                  << " from " << entry.source << std::endl;
    }

    std::cout << "Demo 2 completed\n" << std::endl;
}

static void demo_circuit_breaker(conductor_context& ctx) {
    std::cout << "\n=== Demo 3: Circuit Breaker Pattern ===" << std::endl;

    agent_registry& registry = ctx.registry();

    for (int i = 0; i < 4; i++) {
        try {
            registry.send_message("demo", "flaky", "news/latest", json::object());
        } catch (const conductor_error& e) {
            std::cout << "Request " << (i + 1) << ": " << error_type_to_string(e.type())
                      << " (" << e.what() << ")" << std::endl;
        }
    }

    if (auto cb = registry.get_circuit_stats("flaky")) {
        std::cout << "Circuit: " << cb->to_json() << std::endl;
    }

    std::cout << "Demo 3 completed\n" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    std::cout << "==================================================" << std::endl;
    std::cout << "  Conductor Agent Orchestration Demo" << std::endl;
    std::cout << "==================================================" << std::endl;

    try {
        conductor_params params = argc > 1 ? conductor_params_load(argv[1])
                                           : conductor_default_params();
        params.circuit_failure_threshold = 3;

        conductor_context ctx(params);
        ctx.start();

        ctx.registry().register_agent(make_price_agent());
        ctx.registry().register_agent(make_writer_agent("writer-1"));
        ctx.registry().register_agent(make_writer_agent("writer-2"));
        ctx.registry().register_agent(make_flaky_agent());

        demo_routing(ctx);
        demo_workflow(ctx);
        demo_circuit_breaker(ctx);

        auto history = ctx.registry().get_message_history(5);
        std::cout << "Last " << history.size() << " deliveries:" << std::endl;
        for (const auto& record : history) {
            std::cout << "  " << record.to_json() << std::endl;
        }

        std::cout << "Health: " << ctx.health().to_json() << std::endl;
        ctx.stop();

        std::cout << "\n==================================================" << std::endl;
        std::cout << "  All demos completed successfully!" << std::endl;
        std::cout << "==================================================" << std::endl;

    } catch (const std::exception& e) {
        LOG_ERR("demo failed: %s\n", e.what());
        return 1;
    }

    return 0;
}
