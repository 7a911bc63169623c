#include "params.h"
#include "failure.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace conductor {

conductor_params conductor_default_params() {
    conductor_params params;

    // Event bus defaults
    params.max_history = 1000;

    // Router defaults
    params.n_dispatch_workers = 4;
    params.max_queue_size = 10000;
    params.default_timeout_ms = 30000;
    params.default_retry_attempts = 3;
    params.heartbeat_timeout_ms = 60000;
    params.heartbeat_check_interval_ms = 30000;
    params.message_history_size = 1000;

    // Cache defaults
    params.enable_cache = true;
    params.cache_ttl_ms = 5 * 60 * 1000;
    params.cache_max_size = 500;
    params.idempotent_methods = {
        "resources/list",
        "resources/read",
        "tools/list",
        "prompts/list",
        "bitcoin/price",
        "bitcoin/fees",
        "news/list",
    };

    // Circuit breaker defaults
    params.enable_circuit_breakers = true;
    params.circuit_failure_threshold = 5;
    params.circuit_recovery_timeout_ms = 60000;

    // Rate limit defaults (per minute)
    params.enable_rate_limits = true;
    params.rate_limit_global = {1000, 60000};
    params.rate_limit_agent = {100, 60000};
    params.rate_limit_external = {50, 60000};
    params.block_threshold = 10;

    // Workflow defaults
    params.step_timeout_ms = 30000;
    params.step_retry_count = 0;
    params.step_retry_delays_ms = {1000, 2000, 4000, 8000};

    // Knowledge defaults
    params.knowledge_max_versions = 16;

    // Logging defaults
    params.log_level = "info";
    params.log_file = "";

    return params;
}

static void read_rate_limit(const json & j, const char * key, rate_limit_config & out) {
    if (!j.contains(key)) {
        return;
    }
    const json & limit = j.at(key);
    out.max_requests = limit.value("max_requests", out.max_requests);
    out.window_ms = limit.value("window_ms", out.window_ms);
}

static json write_rate_limit(const rate_limit_config & limit) {
    return json{{"max_requests", limit.max_requests}, {"window_ms", limit.window_ms}};
}

conductor_params conductor_params_from_json(const std::string & json_str) {
    conductor_params params = conductor_default_params();

    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            throw conductor_error(ERROR_TYPE_CONFIGURATION,
                                  "configuration must be a JSON object",
                                  json::object(), "params");
        }

        params.max_history = j.value("max_history", params.max_history);

        params.n_dispatch_workers = j.value("n_dispatch_workers", params.n_dispatch_workers);
        params.max_queue_size = j.value("max_queue_size", params.max_queue_size);
        params.default_timeout_ms = j.value("default_timeout_ms", params.default_timeout_ms);
        params.default_retry_attempts = j.value("default_retry_attempts", params.default_retry_attempts);
        params.heartbeat_timeout_ms = j.value("heartbeat_timeout_ms", params.heartbeat_timeout_ms);
        params.heartbeat_check_interval_ms = j.value("heartbeat_check_interval_ms", params.heartbeat_check_interval_ms);
        params.message_history_size = j.value("message_history_size", params.message_history_size);

        params.enable_cache = j.value("enable_cache", params.enable_cache);
        params.cache_ttl_ms = j.value("cache_ttl_ms", params.cache_ttl_ms);
        params.cache_max_size = j.value("cache_max_size", params.cache_max_size);
        params.idempotent_methods = j.value("idempotent_methods", params.idempotent_methods);

        params.enable_circuit_breakers = j.value("enable_circuit_breakers", params.enable_circuit_breakers);
        params.circuit_failure_threshold = j.value("circuit_failure_threshold", params.circuit_failure_threshold);
        params.circuit_recovery_timeout_ms = j.value("circuit_recovery_timeout_ms", params.circuit_recovery_timeout_ms);

        params.enable_rate_limits = j.value("enable_rate_limits", params.enable_rate_limits);
        if (j.contains("rate_limits")) {
            const json & limits = j.at("rate_limits");
            read_rate_limit(limits, "global", params.rate_limit_global);
            read_rate_limit(limits, "agent", params.rate_limit_agent);
            read_rate_limit(limits, "external", params.rate_limit_external);
        }
        params.block_threshold = j.value("block_threshold", params.block_threshold);

        params.step_timeout_ms = j.value("step_timeout_ms", params.step_timeout_ms);
        params.step_retry_count = j.value("step_retry_count", params.step_retry_count);
        params.step_retry_delays_ms = j.value("step_retry_delays_ms", params.step_retry_delays_ms);

        params.knowledge_max_versions = j.value("knowledge_max_versions", params.knowledge_max_versions);

        params.log_level = j.value("log_level", params.log_level);
        params.log_file = j.value("log_file", params.log_file);
    } catch (const json::exception & e) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION,
                              std::string("invalid configuration: ") + e.what(),
                              json::object(), "params");
    }

    if (params.n_dispatch_workers < 1) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION,
                              "n_dispatch_workers must be at least 1",
                              json{{"n_dispatch_workers", params.n_dispatch_workers}}, "params");
    }
    if (params.heartbeat_check_interval_ms <= 0 || params.heartbeat_timeout_ms <= 0) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION,
                              "heartbeat intervals must be positive",
                              json::object(), "params");
    }

    if (params.knowledge_max_versions < 1) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION,
                              "knowledge_max_versions must be at least 1",
                              json::object(), "params");
    }

    return params;
}

void conductor_params_apply_env(conductor_params & params) {
    const char * level = std::getenv("CONDUCTOR_LOG_LEVEL");
    if (level != nullptr && level[0] != '\0') {
        params.log_level = level;
    }
}

conductor_params conductor_params_load(const std::string & path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION,
                              "cannot open configuration file: " + path,
                              json{{"path", path}}, "params");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    conductor_params params = conductor_params_from_json(buffer.str());
    conductor_params_apply_env(params);
    return params;
}

std::string conductor_params_to_json(const conductor_params & params) {
    json j;
    j["max_history"] = params.max_history;
    j["n_dispatch_workers"] = params.n_dispatch_workers;
    j["max_queue_size"] = params.max_queue_size;
    j["default_timeout_ms"] = params.default_timeout_ms;
    j["default_retry_attempts"] = params.default_retry_attempts;
    j["heartbeat_timeout_ms"] = params.heartbeat_timeout_ms;
    j["heartbeat_check_interval_ms"] = params.heartbeat_check_interval_ms;
    j["message_history_size"] = params.message_history_size;
    j["enable_cache"] = params.enable_cache;
    j["cache_ttl_ms"] = params.cache_ttl_ms;
    j["cache_max_size"] = params.cache_max_size;
    j["idempotent_methods"] = params.idempotent_methods;
    j["enable_circuit_breakers"] = params.enable_circuit_breakers;
    j["circuit_failure_threshold"] = params.circuit_failure_threshold;
    j["circuit_recovery_timeout_ms"] = params.circuit_recovery_timeout_ms;
    j["enable_rate_limits"] = params.enable_rate_limits;
    j["rate_limits"] = {
        {"global", write_rate_limit(params.rate_limit_global)},
        {"agent", write_rate_limit(params.rate_limit_agent)},
        {"external", write_rate_limit(params.rate_limit_external)},
    };
    j["block_threshold"] = params.block_threshold;
    j["step_timeout_ms"] = params.step_timeout_ms;
    j["step_retry_count"] = params.step_retry_count;
    j["step_retry_delays_ms"] = params.step_retry_delays_ms;
    j["knowledge_max_versions"] = params.knowledge_max_versions;
    j["log_level"] = params.log_level;
    j["log_file"] = params.log_file;
    return j.dump(2);
}

} // namespace conductor
