#include "event.h"
#include "failure.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace conductor {

static json metadata_to_json(const event_metadata & meta) {
    json j;
    j["event_name"] = meta.event_name;
    j["timestamp"] = meta.timestamp;
    j["source"] = meta.source;
    j["correlation_id"] = meta.correlation_id;
    j["retry_count"] = meta.retry_count;
    return j;
}

std::string event_metadata::to_json() const {
    return metadata_to_json(*this).dump();
}

std::string event_record::to_json() const {
    json j;
    j["event_name"] = event_name;
    j["payload"] = payload;
    j["metadata"] = metadata_to_json(metadata);
    j["listeners_notified"] = listeners_notified;
    j["errors"] = json::array();
    for (const auto & err : errors) {
        j["errors"].push_back(json{{"listener_id", err.listener_id}, {"message", err.message}});
    }
    return j.dump();
}

std::string event_bus_metrics::to_json() const {
    json j;
    j["total_events"] = total_events;
    j["total_listeners"] = total_listeners;
    j["event_counts"] = event_counts;
    j["total_errors"] = total_errors;
    j["error_rate"] = error_rate;
    j["average_listeners_per_event"] = average_listeners_per_event;
    j["last_event_timestamp"] = last_event_timestamp;
    return j.dump();
}

// event_bus implementation
struct event_bus::impl {
    struct listener {
        std::string id;
        int priority;
        bool once;
        event_filter filter;
        event_handler handler;
        uint64_t sequence;
        std::atomic<bool> removed{false};
    };

    using listener_ptr = std::shared_ptr<listener>;

    struct scheduled_emit {
        std::string event_name;
        json payload;
        event_metadata metadata;
        emit_retry retry;
        bool with_retry;
    };

    // Listeners per event, sorted by descending priority then insertion
    std::map<std::string, std::vector<listener_ptr>> listeners;
    uint64_t next_sequence = 0;

    std::deque<event_record> history;
    size_t max_history;

    // Metrics
    int64_t total_events = 0;
    int64_t total_errors = 0;
    int64_t failed_events = 0;
    int64_t last_event_timestamp = 0;
    std::map<std::string, int64_t> event_counts;

    event_error_hook error_hook;

    // Timer thread state
    std::multimap<int64_t, scheduled_emit> scheduled;  // Keyed by monotonic due time
    std::condition_variable timer_cv;
    std::thread timer_thread;
    bool stopping = false;

    mutable std::mutex mutex;

    explicit impl(size_t max_hist) : max_history(max_hist) {
        timer_thread = std::thread([this]() { timer_loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return;
            }
            stopping = true;
            scheduled.clear();
        }
        timer_cv.notify_all();
        if (timer_thread.joinable()) {
            timer_thread.join();
        }
    }

    // Caller holds the mutex
    template<typename Pred>
    bool remove_if_locked(const std::string & event_name, Pred pred) {
        auto it = listeners.find(event_name);
        if (it == listeners.end()) {
            return false;
        }

        auto & vec = it->second;
        auto lit = std::find_if(vec.begin(), vec.end(), pred);
        if (lit == vec.end()) {
            return false;
        }

        (*lit)->removed.store(true);
        vec.erase(lit);
        if (vec.empty()) {
            listeners.erase(it);
        }
        return true;
    }

    bool remove_locked(const std::string & event_name, const std::string & listener_id) {
        return remove_if_locked(event_name,
            [&listener_id](const listener_ptr & l) { return l->id == listener_id; });
    }

    bool claim_locked(const std::string & event_name, const listener_ptr & target) {
        return remove_if_locked(event_name,
            [&target](const listener_ptr & l) { return l == target; });
    }

    void schedule(int64_t delay_ms, scheduled_emit entry) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                LOG_WRN("event bus stopped, dropping scheduled event %s\n", entry.event_name.c_str());
                return;
            }
            scheduled.emplace(get_monotonic_ms() + delay_ms, std::move(entry));
        }
        timer_cv.notify_all();
    }

    void timer_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            if (scheduled.empty()) {
                timer_cv.wait(lock);
                continue;
            }

            int64_t due = scheduled.begin()->first;
            int64_t now = get_monotonic_ms();
            if (due > now) {
                timer_cv.wait_for(lock, std::chrono::milliseconds(due - now));
                continue;
            }

            scheduled_emit entry = std::move(scheduled.begin()->second);
            scheduled.erase(scheduled.begin());

            lock.unlock();
            dispatch(entry.event_name, entry.payload, entry.metadata, entry.retry, entry.with_retry);
            lock.lock();
        }
    }

    void report_error(const std::exception & err,
                      const std::string & event_name,
                      const std::string & listener_id,
                      std::vector<listener_error> & errors) {
        errors.push_back({listener_id, err.what()});
        LOG_ERR("error in listener %s for event %s: %s\n",
                listener_id.c_str(), event_name.c_str(), err.what());

        event_error_hook hook;
        {
            std::lock_guard<std::mutex> lock(mutex);
            hook = error_hook;
        }
        if (hook) {
            try {
                hook(err, event_name, listener_id);
            } catch (const std::exception & hook_err) {
                LOG_ERR("error in event error hook: %s\n", hook_err.what());
            } catch (...) {
                LOG_ERR("non-standard exception in event error hook\n");
            }
        }
    }

    void dispatch(const std::string & event_name,
                  const json & payload,
                  const event_metadata & meta,
                  const emit_retry & retry,
                  bool with_retry) {
        std::vector<listener_ptr> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            total_events++;
            event_counts[event_name]++;
            last_event_timestamp = meta.timestamp;

            auto it = listeners.find(event_name);
            if (it != listeners.end()) {
                snapshot = it->second;
            }
        }

        std::vector<listener_error> errors;
        int notified = 0;

        for (const auto & l : snapshot) {
            if (l->removed.load()) {
                continue;
            }

            try {
                if (l->filter && !l->filter(payload, meta)) {
                    continue;
                }
            } catch (const std::exception & e) {
                report_error(e, event_name, l->id, errors);
                continue;
            } catch (...) {
                report_error(std::runtime_error("filter threw a non-standard exception"),
                             event_name, l->id, errors);
                continue;
            }

            if (l->once) {
                // Claim the listener so concurrent dispatches cannot fire it again
                std::lock_guard<std::mutex> lock(mutex);
                if (!claim_locked(event_name, l)) {
                    continue;
                }
            }

            try {
                l->handler(payload, meta);
                notified++;
            } catch (const std::exception & e) {
                report_error(e, event_name, l->id, errors);
            } catch (...) {
                report_error(std::runtime_error("listener threw a non-standard exception"),
                             event_name, l->id, errors);
            }
        }

        if (!errors.empty() && with_retry && meta.retry_count < retry.attempts) {
            scheduled_emit next;
            next.event_name = event_name;
            next.payload = payload;
            next.metadata = meta;
            next.metadata.retry_count = meta.retry_count + 1;
            next.retry = retry;
            next.with_retry = true;

            int shift = std::min(next.metadata.retry_count - 1, 20);
            int64_t delay = retry.backoff_ms * (int64_t(1) << shift);
            LOG_WRN("retrying event %s in %lld ms (attempt %d/%d)\n",
                    event_name.c_str(), (long long) delay, next.metadata.retry_count, retry.attempts);
            schedule(delay, std::move(next));
        }

        event_record record;
        record.event_name = event_name;
        record.payload = payload;
        record.metadata = meta;
        record.listeners_notified = notified;
        record.errors = std::move(errors);

        {
            std::lock_guard<std::mutex> lock(mutex);
            total_errors += record.errors.size();
            if (!record.errors.empty()) {
                failed_events++;
            }
            history.push_back(std::move(record));
            while (history.size() > max_history) {
                history.pop_front();
            }
        }

        LOG_DBG("event emitted: %s (%d listeners notified)\n", event_name.c_str(), notified);
    }

    event_metadata make_metadata(const std::string & event_name, const emit_options & options) {
        event_metadata meta;
        meta.event_name = event_name;
        meta.timestamp = get_timestamp_ms();
        meta.source = options.source;
        meta.correlation_id = options.correlation_id.empty() ? generate_uuid() : options.correlation_id;
        meta.retry_count = 0;
        return meta;
    }

    void emit(const std::string & event_name, const json & payload,
              const emit_options & options, bool with_retry) {
        event_metadata meta = make_metadata(event_name, options);

        if (options.delay_ms > 0) {
            scheduled_emit entry;
            entry.event_name = event_name;
            entry.payload = payload;
            entry.metadata = meta;
            entry.retry = options.retry;
            entry.with_retry = with_retry;
            schedule(options.delay_ms, std::move(entry));
            return;
        }

        dispatch(event_name, payload, meta, options.retry, with_retry);
    }
};

event_bus::event_bus(size_t max_history) : pimpl(std::make_unique<impl>(max_history)) {}

event_bus::~event_bus() {
    pimpl->stop();
}

std::string event_bus::subscribe(const std::string & event_name,
                                 event_handler handler,
                                 const listener_options & options) {
    if (!handler) {
        throw conductor_error(ERROR_TYPE_VALIDATION, "listener handler is empty",
                              json{{"event", event_name}}, "event_bus");
    }

    auto l = std::make_shared<impl::listener>();
    l->id = options.listener_id.empty() ? generate_uuid() : options.listener_id;
    l->priority = options.priority;
    l->once = options.once;
    l->filter = options.filter;
    l->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->remove_locked(event_name, l->id);
    l->sequence = pimpl->next_sequence++;

    auto & vec = pimpl->listeners[event_name];
    auto pos = std::upper_bound(vec.begin(), vec.end(), l,
        [](const impl::listener_ptr & a, const impl::listener_ptr & b) {
            if (a->priority != b->priority) {
                return a->priority > b->priority;
            }
            return a->sequence < b->sequence;
        });
    vec.insert(pos, l);

    LOG_DBG("subscribed to event: %s (listener: %s)\n", event_name.c_str(), l->id.c_str());
    return l->id;
}

std::string event_bus::once(const std::string & event_name,
                            event_handler handler,
                            listener_options options) {
    options.once = true;
    return subscribe(event_name, std::move(handler), options);
}

bool event_bus::unsubscribe(const std::string & event_name, const std::string & listener_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->remove_locked(event_name, listener_id);
}

size_t event_bus::unsubscribe_all(const std::string & event_name) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->listeners.find(event_name);
    if (it == pimpl->listeners.end()) {
        return 0;
    }

    size_t count = it->second.size();
    for (const auto & l : it->second) {
        l->removed.store(true);
    }
    pimpl->listeners.erase(it);
    return count;
}

void event_bus::emit(const std::string & event_name, const json & payload, const emit_options & options) {
    pimpl->emit(event_name, payload, options, true);
}

void event_bus::emit_sync(const std::string & event_name, const json & payload, const emit_options & options) {
    pimpl->emit(event_name, payload, options, false);
}

event_record event_bus::wait_for(const std::string & event_name,
                                 int64_t timeout_ms,
                                 event_filter filter) {
    auto promise = std::make_shared<std::promise<event_record>>();
    std::future<event_record> future = promise->get_future();

    listener_options options;
    options.once = true;
    options.filter = std::move(filter);
    options.priority = 0;

    std::string listener_id = subscribe(event_name,
        [promise, event_name](const json & payload, const event_metadata & meta) {
            event_record record;
            record.event_name = event_name;
            record.payload = payload;
            record.metadata = meta;
            record.listeners_notified = 1;
            promise->set_value(std::move(record));
        }, options);

    if (timeout_ms <= 0) {
        return future.get();
    }

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready) {
        return future.get();
    }

    if (!unsubscribe(event_name, listener_id)) {
        // A dispatch claimed the listener just before the timeout
        return future.get();
    }

    throw conductor_error(ERROR_TYPE_TIMEOUT,
                          "timeout waiting for event: " + event_name,
                          json{{"event", event_name}, {"timeout_ms", timeout_ms}},
                          "event_bus");
}

std::vector<std::string> event_bus::event_names() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    std::vector<std::string> names;
    for (const auto & [name, vec] : pimpl->listeners) {
        names.push_back(name);
    }
    return names;
}

size_t event_bus::listener_count(const std::string & event_name) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->listeners.find(event_name);
    return it == pimpl->listeners.end() ? 0 : it->second.size();
}

size_t event_bus::total_listener_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    size_t count = 0;
    for (const auto & [name, vec] : pimpl->listeners) {
        count += vec.size();
    }
    return count;
}

bool event_bus::has_listeners(const std::string & event_name) const {
    return listener_count(event_name) > 0;
}

std::vector<event_record> event_bus::get_history(const std::string & event_name, size_t limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<event_record> records;
    for (const auto & record : pimpl->history) {
        if (event_name.empty() || record.event_name == event_name) {
            records.push_back(record);
        }
    }

    if (limit > 0 && records.size() > limit) {
        records.erase(records.begin(), records.end() - limit);
    }
    return records;
}

void event_bus::clear_history() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->history.clear();
}

event_bus_metrics event_bus::get_metrics() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    event_bus_metrics m;
    m.total_events = pimpl->total_events;
    m.total_listeners = 0;
    for (const auto & [name, vec] : pimpl->listeners) {
        m.total_listeners += vec.size();
    }
    m.event_counts = pimpl->event_counts;
    m.total_errors = pimpl->total_errors;
    m.error_rate = pimpl->total_events > 0
        ? static_cast<double>(pimpl->failed_events) / pimpl->total_events
        : 0.0;
    m.average_listeners_per_event = pimpl->listeners.empty()
        ? 0.0
        : static_cast<double>(m.total_listeners) / pimpl->listeners.size();
    m.last_event_timestamp = pimpl->last_event_timestamp;
    return m;
}

void event_bus::reset_metrics() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->total_events = 0;
    pimpl->total_errors = 0;
    pimpl->failed_events = 0;
    pimpl->last_event_timestamp = 0;
    pimpl->event_counts.clear();
}

void event_bus::set_error_hook(event_error_hook hook) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->error_hook = std::move(hook);
}

size_t event_bus::pending_events() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->scheduled.size();
}

void event_bus::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    for (const auto & [name, vec] : pimpl->listeners) {
        for (const auto & l : vec) {
            l->removed.store(true);
        }
    }
    pimpl->listeners.clear();
    pimpl->history.clear();
    pimpl->scheduled.clear();
    pimpl->total_events = 0;
    pimpl->total_errors = 0;
    pimpl->failed_events = 0;
    pimpl->last_event_timestamp = 0;
    pimpl->event_counts.clear();
    LOG_INF("event bus cleared\n");
}

void event_bus::shutdown() {
    pimpl->stop();
}

event_namespace event_bus::scope(const std::string & prefix) {
    return event_namespace(*this, prefix);
}

// event_namespace implementation
event_namespace::event_namespace(event_bus & bus, std::string prefix)
    : bus_(bus), prefix_(std::move(prefix)) {}

std::string event_namespace::qualify(const std::string & event_name) const {
    return prefix_ + ":" + event_name;
}

std::string event_namespace::subscribe(const std::string & event_name,
                                       event_handler handler,
                                       const listener_options & options) {
    return bus_.subscribe(qualify(event_name), std::move(handler), options);
}

std::string event_namespace::once(const std::string & event_name,
                                  event_handler handler,
                                  listener_options options) {
    return bus_.once(qualify(event_name), std::move(handler), std::move(options));
}

bool event_namespace::unsubscribe(const std::string & event_name, const std::string & listener_id) {
    return bus_.unsubscribe(qualify(event_name), listener_id);
}

void event_namespace::emit(const std::string & event_name, const json & payload, emit_options options) {
    if (options.source.empty()) {
        options.source = prefix_;
    }
    bus_.emit(qualify(event_name), payload, options);
}

void event_namespace::emit_sync(const std::string & event_name, const json & payload, emit_options options) {
    if (options.source.empty()) {
        options.source = prefix_;
    }
    bus_.emit_sync(qualify(event_name), payload, options);
}

event_record event_namespace::wait_for(const std::string & event_name,
                                       int64_t timeout_ms,
                                       event_filter filter) {
    return bus_.wait_for(qualify(event_name), timeout_ms, std::move(filter));
}

} // namespace conductor
