#include "registry.h"
#include "ratelimit.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <set>
#include <thread>

namespace conductor {

// broadcast_result implementation
std::string broadcast_result::to_json() const {
    json j;
    j["ok"] = ok;
    if (ok) {
        j["value"] = value;
    } else {
        j["error"] = error_type_to_string(error);
        j["error_message"] = error_message;
    }
    return j.dump();
}

// delivery_record implementation
std::string delivery_record::to_json() const {
    json j;
    j["message_id"] = message_id;
    j["from"] = from;
    j["to"] = to;
    j["method"] = method;
    j["ok"] = ok;
    j["cached"] = cached;
    if (ok) {
        j["result"] = result;
    } else {
        j["error"] = error_type_to_string(error);
        j["error_message"] = error_message;
    }
    j["timestamp"] = timestamp;
    j["processing_time_ms"] = processing_time_ms;
    return j.dump();
}

// router_metrics implementation
std::string router_metrics::to_json() const {
    json j;
    j["total_messages"] = total_messages;
    j["successful_messages"] = successful_messages;
    j["failed_messages"] = failed_messages;
    j["cached_responses"] = cached_responses;
    j["average_response_time_ms"] = average_response_time_ms;
    j["active_agents"] = active_agents;
    j["queued_messages"] = queued_messages;
    return j.dump();
}

enum delivery_state {
    DELIVERY_QUEUED,
    DELIVERY_RUNNING,
    DELIVERY_DONE
};

// One accepted message, shared by the caller, the router and its workers
struct delivery {
    routed_message msg;
    std::promise<json> promise;
    std::mutex mutex;
    delivery_state state = DELIVERY_QUEUED;
    bool settled = false;        // Promise fulfilled (result, error or timeout)
    bool load_taken = false;     // Agent load incremented at dequeue
    bool load_released = false;  // Agent load decremented once
    bool holds_trial = false;    // Admitted as the breaker's half-open trial
    bool cacheable = false;
    std::string cache_key;
};

// Caller holds d.mutex
static bool settle_error_locked(delivery & d, const conductor_error & err) {
    if (d.settled) {
        return false;
    }
    d.settled = true;
    d.state = DELIVERY_DONE;
    d.promise.set_exception(std::make_exception_ptr(err));
    return true;
}

static conductor_error make_timeout_error(const routed_message & msg) {
    return conductor_error(ERROR_TYPE_TIMEOUT,
                           "message to " + msg.to_agent + " timed out after " +
                               std::to_string(msg.timeout_ms) + " ms",
                           json{{"agent_id", msg.to_agent},
                                {"method", msg.method},
                                {"message_id", msg.message_id},
                                {"timeout_ms", msg.timeout_ms},
                                {"retry_attempts", msg.retry_attempts}},
                           "router");
}

// pending_reply implementation
struct pending_reply::state {
    std::shared_ptr<delivery> d;
    std::future<json> future;
    int64_t deadline;                  // Monotonic ms
    std::function<void()> on_timeout;  // Settles the delivery with a timeout
};

pending_reply::pending_reply(std::unique_ptr<state> s) : st(std::move(s)) {}
pending_reply::pending_reply(pending_reply&&) noexcept = default;
pending_reply& pending_reply::operator=(pending_reply&&) noexcept = default;
pending_reply::~pending_reply() = default;

json pending_reply::get() {
    if (!st || !st->future.valid()) {
        throw conductor_error(ERROR_TYPE_INTERNAL_ERROR, "reply already consumed",
                              json::object(), "router");
    }

    int64_t remaining = std::max<int64_t>(0, st->deadline - get_monotonic_ms());
    if (st->future.wait_for(std::chrono::milliseconds(remaining)) != std::future_status::ready) {
        st->on_timeout();
    }

    return st->future.get();
}

bool pending_reply::ready() const {
    return st && st->future.valid() &&
           st->future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

const std::string& pending_reply::message_id() const {
    return st->d->msg.message_id;
}

const std::string& pending_reply::agent_id() const {
    return st->d->msg.to_agent;
}

// agent_registry implementation
struct agent_registry::impl {
    struct agent_entry {
        agent_info info;
        std::map<std::string, method_handler> methods;
        agent_stats stats;
        std::shared_ptr<circuit_breaker> breaker;
    };

    event_namespace events;
    conductor_params params;
    rate_limiter* limiter;
    std::set<std::string> idempotent;

    std::map<std::string, agent_entry> agents;
    uint64_t next_order = 0;

    response_cache cache;
    message_queue queue;
    std::map<std::string, std::shared_ptr<delivery>> in_flight;
    std::deque<delivery_record> history;

    // Statistics
    int64_t total_messages = 0;
    int64_t successful_messages = 0;
    int64_t failed_messages = 0;
    int64_t cached_responses = 0;
    int64_t timed_samples = 0;
    double average_response_time_ms = 0.0;

    std::vector<std::thread> workers;
    std::thread heartbeat_thread;
    std::condition_variable heartbeat_cv;
    bool running = false;
    bool stopped = false;

    mutable std::mutex mutex;

    impl(event_bus & bus, const conductor_params & p, rate_limiter * rl)
        : events(bus.scope("router")),
          params(p),
          limiter(rl),
          idempotent(p.idempotent_methods.begin(), p.idempotent_methods.end()),
          cache(p.cache_ttl_ms, p.cache_max_size),
          queue(p.max_queue_size) {}

    bool is_idempotent(const std::string & method) const {
        return idempotent.count(method) > 0;
    }

    // Caller holds the mutex
    void release_load_locked(const std::string & agent_id) {
        auto it = agents.find(agent_id);
        if (it == agents.end()) {
            return;
        }
        agent_info & info = it->second.info;
        info.load_score = std::max(0, info.load_score - 1);
        if (info.load_score == 0 && info.status == AGENT_STATUS_BUSY) {
            info.status = AGENT_STATUS_ACTIVE;
        }
        info.last_heartbeat = get_timestamp_ms();
    }

    // Caller holds the mutex
    void record_locked(const routed_message & msg, const json * result, const conductor_error * err,
                       double duration_ms, bool cached) {
        delivery_record r;
        r.message_id = msg.message_id;
        r.from = msg.from_agent;
        r.to = msg.to_agent;
        r.method = msg.method;
        r.ok = result != nullptr;
        r.cached = cached;
        if (result) {
            r.result = *result;
        }
        if (err) {
            r.error = err->type();
            r.error_message = err->what();
        }
        r.timestamp = get_timestamp_ms();
        r.processing_time_ms = duration_ms;

        history.push_back(std::move(r));
        while (history.size() > params.message_history_size) {
            history.pop_front();
        }
    }

    void forget(const std::string & message_id) {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight.erase(message_id);
    }

    void emit_failed(const routed_message & msg, const conductor_error & err) {
        LOG_WRN("message %s to %s (%s) failed: %s\n",
                msg.message_id.c_str(), msg.to_agent.c_str(), msg.method.c_str(), err.what());

        emit_options options;
        options.correlation_id = msg.message_id;
        events.emit("message_failed", json{
            {"message_id", msg.message_id},
            {"from", msg.from_agent},
            {"to", msg.to_agent},
            {"method", msg.method},
            {"error", error_type_to_string(err.type())},
            {"error_message", err.what()},
        }, options);
    }

    void emit_delivered(const routed_message & msg, double duration_ms, bool cached) {
        emit_options options;
        options.correlation_id = msg.message_id;
        events.emit("message_delivered", json{
            {"message_id", msg.message_id},
            {"from", msg.from_agent},
            {"to", msg.to_agent},
            {"method", msg.method},
            {"duration_ms", duration_ms},
            {"cached", cached},
        }, options);
    }

    void complete(const std::shared_ptr<delivery> & d, const json & result, int64_t started) {
        double duration = static_cast<double>(get_monotonic_ms() - started);
        bool counted = false;

        // Cached before the caller is woken so an immediate resend hits it
        if (d->cacheable) {
            cache.put(d->cache_key, result, d->msg.to_agent);
        }

        {
            std::lock_guard<std::mutex> dlock(d->mutex);
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (d->load_taken && !d->load_released) {
                    release_load_locked(d->msg.to_agent);
                    d->load_released = true;
                }

                // A late reply was already counted as a timeout
                if (!d->settled) {
                    auto it = agents.find(d->msg.to_agent);
                    if (it != agents.end()) {
                        agent_stats & stats = it->second.stats;
                        stats.successful_requests++;
                        stats.avg_response_time_ms +=
                            (duration - stats.avg_response_time_ms) / stats.successful_requests;
                        if (it->second.breaker) {
                            it->second.breaker->record_success();
                        }
                    }

                    successful_messages++;
                    timed_samples++;
                    average_response_time_ms +=
                        (duration - average_response_time_ms) / timed_samples;
                    record_locked(d->msg, &result, nullptr, duration, false);
                    counted = true;
                }
            }

            if (!d->settled) {
                d->settled = true;
                d->state = DELIVERY_DONE;
                d->promise.set_value(result);
            }
        }

        forget(d->msg.message_id);

        if (counted) {
            emit_delivered(d->msg, duration, false);
        } else {
            LOG_DBG("late response for message %s from %s discarded\n",
                    d->msg.message_id.c_str(), d->msg.to_agent.c_str());
        }
    }

    void fail(const std::shared_ptr<delivery> & d, const conductor_error & err) {
        bool counted = false;
        {
            std::lock_guard<std::mutex> dlock(d->mutex);
            {
                std::lock_guard<std::mutex> lock(mutex);
                bool ran = d->load_taken;
                if (d->load_taken && !d->load_released) {
                    release_load_locked(d->msg.to_agent);
                    d->load_released = true;
                }

                if (!d->settled) {
                    auto it = agents.find(d->msg.to_agent);
                    if (it != agents.end()) {
                        const std::shared_ptr<circuit_breaker> & breaker = it->second.breaker;
                        if (ran) {
                            it->second.stats.failed_requests++;
                            if (breaker) {
                                breaker->record_failure();
                            }
                        } else if (breaker && d->holds_trial) {
                            // The trial never reached the agent
                            breaker->release_trial();
                        }
                    }

                    failed_messages++;
                    record_locked(d->msg, nullptr, &err, 0.0, false);
                    counted = true;
                }
            }
            settle_error_locked(*d, err);
        }

        forget(d->msg.message_id);

        if (counted) {
            emit_failed(d->msg, err);
        }
    }

    // Caller gave up waiting
    void expire(const std::shared_ptr<delivery> & d) {
        conductor_error err = make_timeout_error(d->msg);
        {
            std::lock_guard<std::mutex> dlock(d->mutex);
            if (d->settled) {
                return;
            }

            if (d->state == DELIVERY_QUEUED) {
                queue.remove(d->msg.message_id);
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                if (d->load_taken && !d->load_released) {
                    release_load_locked(d->msg.to_agent);
                    d->load_released = true;
                }

                auto it = agents.find(d->msg.to_agent);
                if (it != agents.end()) {
                    it->second.stats.failed_requests++;
                    if (it->second.breaker) {
                        it->second.breaker->record_failure();
                    }
                }
                failed_messages++;
                record_locked(d->msg, nullptr, &err, static_cast<double>(d->msg.timeout_ms), false);
            }

            settle_error_locked(*d, err);
        }

        forget(d->msg.message_id);
        emit_failed(d->msg, err);
    }

    void process(const routed_message & msg) {
        std::shared_ptr<delivery> d;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = in_flight.find(msg.message_id);
            if (it == in_flight.end()) {
                return;
            }
            d = it->second;
        }

        method_handler handler;
        std::optional<conductor_error> rejection;
        {
            std::lock_guard<std::mutex> dlock(d->mutex);
            if (d->settled) {
                return;
            }

            std::lock_guard<std::mutex> lock(mutex);
            auto it = agents.find(msg.to_agent);
            if (it == agents.end()) {
                rejection.emplace(ERROR_TYPE_AGENT_NOT_FOUND,
                                  "agent " + msg.to_agent + " was unregistered",
                                  json{{"agent_id", msg.to_agent}, {"message_id", msg.message_id}},
                                  "router");
            } else if (!it->second.info.is_routable()) {
                rejection.emplace(ERROR_TYPE_UNAVAILABLE,
                                  "agent " + msg.to_agent + " is " +
                                      agent_status_to_string(it->second.info.status),
                                  json{{"agent_id", msg.to_agent}, {"message_id", msg.message_id}},
                                  "router");
            } else {
                agent_entry & entry = it->second;
                handler = entry.methods.at(msg.method);

                int64_t now = get_timestamp_ms();
                entry.info.load_score++;
                entry.info.status = AGENT_STATUS_BUSY;
                entry.info.last_heartbeat = now;
                entry.stats.total_requests++;
                entry.stats.last_request_time = now;

                d->state = DELIVERY_RUNNING;
                d->load_taken = true;
            }
        }

        if (rejection) {
            fail(d, *rejection);
            return;
        }

        LOG_DBG("dispatching %s.%s (message %s, priority %s)\n",
                msg.to_agent.c_str(), msg.method.c_str(), msg.message_id.c_str(),
                message_priority_to_string(msg.priority));

        int64_t started = get_monotonic_ms();
        try {
            json result = handler(msg.args);
            complete(d, result, started);
        } catch (const conductor_error & e) {
            json details = {
                {"agent_id", msg.to_agent},
                {"method", msg.method},
                {"message_id", msg.message_id},
                {"retry_attempts", msg.retry_attempts},
                {"cause", e.details()},
            };
            fail(d, conductor_error(e.type(), "agent " + msg.to_agent + ": " + e.what(),
                                    details, msg.to_agent, e.retryable()));
        } catch (const std::exception & e) {
            json details = {
                {"agent_id", msg.to_agent},
                {"method", msg.method},
                {"message_id", msg.message_id},
                {"retry_attempts", msg.retry_attempts},
            };
            fail(d, conductor_error(ERROR_TYPE_EXECUTION, "agent " + msg.to_agent + ": " + e.what(),
                                    details, msg.to_agent));
        } catch (...) {
            json details = {
                {"agent_id", msg.to_agent},
                {"method", msg.method},
                {"message_id", msg.message_id},
                {"retry_attempts", msg.retry_attempts},
            };
            fail(d, conductor_error(ERROR_TYPE_EXECUTION,
                                    "agent " + msg.to_agent + ": handler threw a non-standard exception",
                                    details, msg.to_agent));
        }
    }

    void worker_loop() {
        routed_message msg;
        while (queue.pop(msg, -1)) {
            process(msg);
        }
    }

    std::vector<std::string> sweep() {
        std::vector<agent_info> timed_out;
        {
            std::lock_guard<std::mutex> lock(mutex);
            int64_t now = get_timestamp_ms();
            for (auto & [id, entry] : agents) {
                agent_info & info = entry.info;
                if (info.status == AGENT_STATUS_ACTIVE &&
                    info.load_score == 0 &&
                    now - info.last_heartbeat > params.heartbeat_timeout_ms) {
                    info.status = AGENT_STATUS_INACTIVE;
                    timed_out.push_back(info);
                }
            }
        }

        std::vector<std::string> ids;
        for (const auto & info : timed_out) {
            LOG_WRN("agent %s (%s) missed its heartbeat, marked inactive\n",
                    info.id.c_str(), info.name.c_str());
            events.emit("agent_timeout", json{
                {"agent_id", info.id},
                {"name", info.name},
                {"last_heartbeat", info.last_heartbeat},
                {"timeout_ms", params.heartbeat_timeout_ms},
            });
            ids.push_back(info.id);
        }
        return ids;
    }

    void heartbeat_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopped) {
            heartbeat_cv.wait_for(lock, std::chrono::milliseconds(params.heartbeat_check_interval_ms),
                                  [this]() { return stopped; });
            if (stopped) {
                break;
            }

            lock.unlock();
            sweep();
            cache.purge_expired();
            if (limiter) {
                limiter->cleanup();
            }
            lock.lock();
        }
    }
};

agent_registry::agent_registry(event_bus& bus, const conductor_params& params, rate_limiter* limiter)
    : pimpl(std::make_shared<impl>(bus, params, limiter)) {}

agent_registry::~agent_registry() {
    stop();
}

void agent_registry::start() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (pimpl->running) {
        return;
    }
    if (pimpl->stopped) {
        throw conductor_error(ERROR_TYPE_CONFIGURATION, "router cannot be restarted after stop",
                              json::object(), "router");
    }

    pimpl->running = true;

    impl * p = pimpl.get();
    for (int i = 0; i < pimpl->params.n_dispatch_workers; i++) {
        pimpl->workers.emplace_back([p]() { p->worker_loop(); });
    }
    pimpl->heartbeat_thread = std::thread([p]() { p->heartbeat_loop(); });

    LOG_INF("router started with %d dispatch workers\n", pimpl->params.n_dispatch_workers);
}

void agent_registry::stop() {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->stopped) {
            return;
        }
        pimpl->stopped = true;
        pimpl->running = false;
    }

    pimpl->queue.close();
    pimpl->heartbeat_cv.notify_all();

    for (auto & worker : pimpl->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    pimpl->workers.clear();
    if (pimpl->heartbeat_thread.joinable()) {
        pimpl->heartbeat_thread.join();
    }

    std::vector<std::shared_ptr<delivery>> outstanding;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (const auto & [id, d] : pimpl->in_flight) {
            outstanding.push_back(d);
        }
    }
    for (const auto & d : outstanding) {
        pimpl->fail(d, conductor_error(ERROR_TYPE_UNAVAILABLE, "router stopped",
                                       json{{"message_id", d->msg.message_id}}, "router", false));
    }

    LOG_INF("router stopped\n");
}

bool agent_registry::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->running;
}

std::string agent_registry::register_agent(const agent_descriptor& descriptor) {
    validate_agent_descriptor(descriptor);

    impl::agent_entry entry;
    entry.info.id = descriptor.id.empty() ? generate_uuid() : descriptor.id;
    entry.info.name = descriptor.name;
    entry.info.version = descriptor.version;
    entry.info.description = descriptor.description;
    entry.info.capabilities.insert(descriptor.capabilities.begin(), descriptor.capabilities.end());
    for (const auto& [method, handler] : descriptor.methods) {
        entry.info.methods.push_back(method);
    }
    entry.info.status = AGENT_STATUS_ACTIVE;
    entry.info.load_score = 0;
    entry.info.max_load = descriptor.max_load;
    entry.info.registered_at = get_timestamp_ms();
    entry.info.last_heartbeat = entry.info.registered_at;
    entry.methods = descriptor.methods;
    entry.stats.agent_id = entry.info.id;
    if (pimpl->params.enable_circuit_breakers) {
        entry.breaker = std::make_shared<circuit_breaker>(pimpl->params.circuit_failure_threshold,
                                                          pimpl->params.circuit_recovery_timeout_ms);
    }

    std::string id = entry.info.id;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->agents.count(id) > 0) {
            throw conductor_error(ERROR_TYPE_VALIDATION, "agent already registered: " + id,
                                  json{{"agent_id", id}}, "registry");
        }
        entry.info.registration_order = pimpl->next_order++;
        pimpl->agents.emplace(id, std::move(entry));
    }

    LOG_INF("agent registered: %s (%s, %zu methods, %zu capabilities)\n",
            id.c_str(), descriptor.name.c_str(), descriptor.methods.size(), descriptor.capabilities.size());

    pimpl->events.emit("agent_registered", json{
        {"agent_id", id},
        {"name", descriptor.name},
        {"version", descriptor.version},
        {"capabilities", descriptor.capabilities},
    });

    return id;
}

bool agent_registry::unregister_agent(const std::string& agent_id) {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end()) {
            return false;
        }
        name = it->second.info.name;
        pimpl->agents.erase(it);
    }

    pimpl->cache.erase_owner(agent_id);

    LOG_INF("agent unregistered: %s (%s)\n", agent_id.c_str(), name.c_str());
    pimpl->events.emit("agent_unregistered", json{{"agent_id", agent_id}, {"name", name}});
    return true;
}

json agent_registry::send_message(const std::string& from,
                                  const std::string& to,
                                  const std::string& method,
                                  const json& args,
                                  const send_options& options) {
    return send_message_async(from, to, method, args, options).get();
}

pending_reply agent_registry::send_message_async(const std::string& from,
                                                 const std::string& to,
                                                 const std::string& method,
                                                 const json& args,
                                                 const send_options& options) {
    routed_message msg;
    msg.message_id = generate_uuid();
    msg.from_agent = from;
    msg.to_agent = to;
    msg.method = method;
    msg.args = args;
    msg.priority = options.priority;
    msg.timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : pimpl->params.default_timeout_ms;
    msg.retry_attempts = options.retry_attempts >= 0 ? options.retry_attempts
                                                     : pimpl->params.default_retry_attempts;
    msg.enqueued_at = get_timestamp_ms();

    std::shared_ptr<circuit_breaker> breaker;
    bool sender_is_agent = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);

        if (!pimpl->running) {
            throw conductor_error(ERROR_TYPE_UNAVAILABLE, "router is not running",
                                  json{{"agent_id", to}}, "router", false);
        }

        auto it = pimpl->agents.find(to);
        if (it == pimpl->agents.end()) {
            throw conductor_error(ERROR_TYPE_AGENT_NOT_FOUND, "agent not found: " + to,
                                  json{{"agent_id", to}, {"method", method}}, "router");
        }

        const impl::agent_entry & entry = it->second;
        if (!entry.info.is_routable()) {
            throw conductor_error(ERROR_TYPE_UNAVAILABLE,
                                  "agent " + to + " is " + agent_status_to_string(entry.info.status),
                                  json{{"agent_id", to}, {"status", agent_status_to_string(entry.info.status)}},
                                  "router");
        }
        if (entry.methods.count(method) == 0) {
            throw conductor_error(ERROR_TYPE_UNSUPPORTED_METHOD,
                                  "agent " + to + " does not support method " + method,
                                  json{{"agent_id", to}, {"method", method}}, "router");
        }

        breaker = entry.breaker;
        sender_is_agent = pimpl->agents.count(from) > 0;
    }

    if (pimpl->limiter && pimpl->params.enable_rate_limits) {
        pimpl->limiter->acquire("*", RATE_LIMIT_GLOBAL);
        pimpl->limiter->acquire(from.empty() ? "anonymous" : from,
                                sender_is_agent ? RATE_LIMIT_AGENT : RATE_LIMIT_EXTERNAL);
    }

    auto d = std::make_shared<delivery>();
    d->msg = msg;
    d->cacheable = pimpl->params.enable_cache && options.cacheable && pimpl->is_idempotent(method);
    if (d->cacheable) {
        d->cache_key = response_cache::make_key(to, method, args);
    }

    auto st = std::make_unique<pending_reply::state>();
    st->d = d;
    st->future = d->promise.get_future();
    st->deadline = get_monotonic_ms() + msg.timeout_ms;

    std::weak_ptr<impl> weak = pimpl;
    st->on_timeout = [weak, d]() {
        if (auto p = weak.lock()) {
            p->expire(d);
            return;
        }
        std::lock_guard<std::mutex> dlock(d->mutex);
        settle_error_locked(*d, make_timeout_error(d->msg));
    };

    if (d->cacheable) {
        std::optional<json> cached = pimpl->cache.get(d->cache_key);
        if (cached) {
            {
                std::lock_guard<std::mutex> lock(pimpl->mutex);
                pimpl->total_messages++;
                pimpl->successful_messages++;
                pimpl->cached_responses++;
                pimpl->record_locked(msg, &*cached, nullptr, 0.0, true);
            }
            {
                std::lock_guard<std::mutex> dlock(d->mutex);
                d->settled = true;
                d->state = DELIVERY_DONE;
                d->promise.set_value(*cached);
            }
            LOG_DBG("cache hit for %s.%s\n", to.c_str(), method.c_str());
            pimpl->emit_delivered(msg, 0.0, true);
            return pending_reply(std::move(st));
        }
    }

    bool trial = false;
    if (breaker && !breaker->allow_request(&trial)) {
        circuit_breaker::stats cb = breaker->get_stats();
        throw conductor_error(ERROR_TYPE_CIRCUIT_OPEN,
                              "circuit breaker open for agent " + to,
                              json{{"agent_id", to},
                                   {"failure_count", cb.failure_count},
                                   {"next_attempt_at", cb.next_attempt_at}},
                              "router");
    }
    d->holds_trial = trial;

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->in_flight[msg.message_id] = d;
        pimpl->total_messages++;
    }

    if (!pimpl->queue.push(msg)) {
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            pimpl->in_flight.erase(msg.message_id);
            pimpl->total_messages--;
        }
        if (breaker && trial) {
            breaker->release_trial();
        }
        throw conductor_error(ERROR_TYPE_UNAVAILABLE, "message queue is full or closed",
                              json{{"agent_id", to}, {"queue_size", pimpl->queue.size()}},
                              "router", true);
    }

    return pending_reply(std::move(st));
}

std::map<std::string, broadcast_result> agent_registry::broadcast_message(
    const std::string& from,
    const std::string& method,
    const json& args,
    const agent_filter& filter,
    const send_options& options) {

    std::vector<agent_info> candidates;
    for (const auto& info : list_agents()) {
        if (info.id == from || !info.is_routable() || !info.has_method(method)) {
            continue;
        }
        if (filter && !filter(info)) {
            continue;
        }
        candidates.push_back(info);
    }

    std::map<std::string, broadcast_result> results;
    std::vector<pending_reply> replies;

    for (const auto& info : candidates) {
        try {
            replies.push_back(send_message_async(from, info.id, method, args, options));
        } catch (const conductor_error& e) {
            broadcast_result& r = results[info.id];
            r.error = e.type();
            r.error_message = e.what();
        }
    }

    for (auto& reply : replies) {
        broadcast_result& r = results[reply.agent_id()];
        try {
            r.value = reply.get();
            r.ok = true;
        } catch (const conductor_error& e) {
            r.error = e.type();
            r.error_message = e.what();
        } catch (const std::exception& e) {
            r.error = ERROR_TYPE_INTERNAL_ERROR;
            r.error_message = e.what();
        }
    }

    LOG_DBG("broadcast %s from %s reached %zu agents\n", method.c_str(), from.c_str(), results.size());
    return results;
}

std::optional<std::string> agent_registry::find_optimal_agent(
    const std::vector<std::string>& required_capabilities,
    const std::vector<std::string>& exclude) {

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    int64_t now = get_timestamp_ms();
    const agent_info* best = nullptr;

    for (const auto& [id, entry] : pimpl->agents) {
        const agent_info& info = entry.info;
        if (std::find(exclude.begin(), exclude.end(), id) != exclude.end()) {
            continue;
        }
        if (!info.is_routable() || !info.has_capacity() || !info.has_capabilities(required_capabilities)) {
            continue;
        }
        if (entry.breaker) {
            circuit_breaker::stats cb = entry.breaker->get_stats();
            if (cb.state == CIRCUIT_OPEN && cb.next_attempt_at > now) {
                continue;
            }
        }

        if (best == nullptr ||
            info.load_score < best->load_score ||
            (info.load_score == best->load_score && info.registration_order < best->registration_order)) {
            best = &info;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return best->id;
}

std::optional<agent_info> agent_registry::get_agent_status(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<agent_info> agent_registry::list_agents() const {
    std::vector<agent_info> result;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (const auto& [id, entry] : pimpl->agents) {
            result.push_back(entry.info);
        }
    }
    std::sort(result.begin(), result.end(), [](const agent_info& a, const agent_info& b) {
        return a.registration_order < b.registration_order;
    });
    return result;
}

bool agent_registry::heartbeat(const std::string& agent_id) {
    bool restored = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end()) {
            return false;
        }

        agent_info& info = it->second.info;
        info.last_heartbeat = get_timestamp_ms();
        if (info.status == AGENT_STATUS_INACTIVE) {
            info.status = info.load_score > 0 ? AGENT_STATUS_BUSY : AGENT_STATUS_ACTIVE;
            restored = true;
        }
    }

    if (restored) {
        LOG_INF("agent %s restored by heartbeat\n", agent_id.c_str());
    }
    return true;
}

bool agent_registry::set_agent_status(const std::string& agent_id, agent_status status) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return false;
    }
    it->second.info.status = status;
    if (status == AGENT_STATUS_ACTIVE || status == AGENT_STATUS_BUSY) {
        it->second.info.last_heartbeat = get_timestamp_ms();
    }
    return true;
}

std::vector<std::string> agent_registry::sweep_heartbeats() {
    return pimpl->sweep();
}

router_metrics agent_registry::get_metrics() const {
    size_t queued = pimpl->queue.size();

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    router_metrics m;
    m.total_messages = pimpl->total_messages;
    m.successful_messages = pimpl->successful_messages;
    m.failed_messages = pimpl->failed_messages;
    m.cached_responses = pimpl->cached_responses;
    m.average_response_time_ms = pimpl->average_response_time_ms;
    m.active_agents = 0;
    for (const auto& [id, entry] : pimpl->agents) {
        if (entry.info.status == AGENT_STATUS_ACTIVE) {
            m.active_agents++;
        }
    }
    m.queued_messages = queued;
    return m;
}

std::vector<delivery_record> agent_registry::get_message_history(size_t limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    const auto & history = pimpl->history;
    size_t start = (limit > 0 && history.size() > limit) ? history.size() - limit : 0;
    return std::vector<delivery_record>(history.begin() + start, history.end());
}

std::optional<agent_stats> agent_registry::get_agent_stats(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return std::nullopt;
    }
    return it->second.stats;
}

std::optional<circuit_breaker::stats> agent_registry::get_circuit_stats(const std::string& agent_id) const {
    std::shared_ptr<circuit_breaker> breaker;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end() || !it->second.breaker) {
            return std::nullopt;
        }
        breaker = it->second.breaker;
    }
    return breaker->get_stats();
}

bool agent_registry::reset_circuit(const std::string& agent_id) {
    std::shared_ptr<circuit_breaker> breaker;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end() || !it->second.breaker) {
            return false;
        }
        breaker = it->second.breaker;
    }
    breaker->reset();
    return true;
}

response_cache::stats agent_registry::get_cache_stats() const {
    return pimpl->cache.get_stats();
}

void agent_registry::clear_cache() {
    pimpl->cache.clear();
}

size_t agent_registry::queue_depth() const {
    return pimpl->queue.size();
}

double agent_registry::average_load() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (pimpl->agents.empty()) {
        return 0.0;
    }
    int64_t total = 0;
    for (const auto& [id, entry] : pimpl->agents) {
        total += entry.info.load_score;
    }
    return static_cast<double>(total) / pimpl->agents.size();
}

std::string agent_registry::export_state() const {
    json j;
    j["metrics"] = json::parse(get_metrics().to_json());
    j["cache"] = json::parse(get_cache_stats().to_json());

    json agents = json::array();
    for (const auto& info : list_agents()) {
        json a = json::parse(info.to_json());
        if (auto stats = get_agent_stats(info.id)) {
            a["stats"] = json::parse(stats->to_json());
        }
        if (auto cb = get_circuit_stats(info.id)) {
            a["circuit"] = json::parse(cb->to_json());
        }
        agents.push_back(a);
    }
    j["agents"] = agents;

    return j.dump();
}

} // namespace conductor
