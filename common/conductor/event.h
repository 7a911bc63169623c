#pragma once

#include "message.h"

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace conductor {

// Metadata delivered with every event
struct event_metadata {
    std::string event_name;
    int64_t timestamp;           // Unix epoch ms
    std::string source;          // Emitting subsystem (may be empty)
    std::string correlation_id;  // Generated when the emitter gives none
    int retry_count;             // 0 on first dispatch

    event_metadata() : timestamp(0), retry_count(0) {}

    std::string to_json() const;
};

// Listener callback and filter
using event_handler = std::function<void(const json & payload, const event_metadata & meta)>;
using event_filter = std::function<bool(const json & payload, const event_metadata & meta)>;

// Called for every listener error
using event_error_hook = std::function<void(const std::exception & err,
                                            const std::string & event_name,
                                            const std::string & listener_id)>;

struct listener_options {
    int priority = 0;            // Higher priority is called first
    bool once = false;           // Remove before the first invocation
    event_filter filter;         // Skip events the filter rejects
    std::string listener_id;     // Generated when empty; an existing id is replaced
};

// Re-emission policy for emit(): backoff_ms * 2^(attempt-1)
struct emit_retry {
    int attempts = 0;
    int64_t backoff_ms = 0;
};

struct emit_options {
    std::string source;
    std::string correlation_id;
    int64_t delay_ms = 0;        // Dispatch from the timer thread after the delay
    emit_retry retry;            // Ignored by emit_sync()
};

struct listener_error {
    std::string listener_id;
    std::string message;
};

// One dispatched event as kept in the history
struct event_record {
    std::string event_name;
    json payload;
    event_metadata metadata;
    int listeners_notified = 0;
    std::vector<listener_error> errors;

    std::string to_json() const;
};

struct event_bus_metrics {
    int64_t total_events;
    size_t total_listeners;
    std::map<std::string, int64_t> event_counts;
    int64_t total_errors;                 // Listener errors across all dispatches
    double error_rate;                    // Share of dispatches with at least one error
    double average_listeners_per_event;
    int64_t last_event_timestamp;

    std::string to_json() const;
};

class event_namespace;

// In-process publish/subscribe bus
// Handlers run on the emitting thread, or on the bus timer thread for
// delayed emissions and retries. Handlers may call back into the bus.
class event_bus {
public:
    explicit event_bus(size_t max_history = 1000);
    ~event_bus();

    event_bus(const event_bus &) = delete;
    event_bus & operator=(const event_bus &) = delete;

    // Subscribe to an event, returns the listener ID
    std::string subscribe(const std::string & event_name,
                          event_handler handler,
                          const listener_options & options = {});

    // Subscribe for a single invocation
    std::string once(const std::string & event_name,
                     event_handler handler,
                     listener_options options = {});

    bool unsubscribe(const std::string & event_name, const std::string & listener_id);

    // Remove every listener of an event, returns how many were removed
    size_t unsubscribe_all(const std::string & event_name);

    // Dispatch to all listeners; listener errors never stop dispatch and
    // trigger re-emission when options.retry is set
    void emit(const std::string & event_name,
              const json & payload,
              const emit_options & options = {});

    // Fire-and-forget dispatch without retries
    void emit_sync(const std::string & event_name,
                   const json & payload,
                   const emit_options & options = {});

    // Block until a matching event is dispatched
    // Throws ERROR_TYPE_TIMEOUT after timeout_ms (<= 0 waits indefinitely)
    event_record wait_for(const std::string & event_name,
                          int64_t timeout_ms,
                          event_filter filter = nullptr);

    // Introspection
    std::vector<std::string> event_names() const;
    size_t listener_count(const std::string & event_name) const;
    size_t total_listener_count() const;
    bool has_listeners(const std::string & event_name) const;

    // History, oldest first; empty name matches all events, limit 0 returns all
    std::vector<event_record> get_history(const std::string & event_name = "", size_t limit = 0) const;
    void clear_history();

    event_bus_metrics get_metrics() const;
    void reset_metrics();

    // Single global error hook (replaces the previous one)
    void set_error_hook(event_error_hook hook);

    // Delayed emissions and retries not yet dispatched
    size_t pending_events() const;

    // Drop all listeners, history, metrics and scheduled emissions
    void clear();

    // Stop the timer thread, scheduled emissions are dropped
    void shutdown();

    // Namespaced view that prefixes event names with "prefix:"
    event_namespace scope(const std::string & prefix);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// Event bus view for a subsystem
class event_namespace {
public:
    event_namespace(event_bus & bus, std::string prefix);

    std::string subscribe(const std::string & event_name,
                          event_handler handler,
                          const listener_options & options = {});
    std::string once(const std::string & event_name,
                     event_handler handler,
                     listener_options options = {});
    bool unsubscribe(const std::string & event_name, const std::string & listener_id);

    // source defaults to the prefix
    void emit(const std::string & event_name, const json & payload, emit_options options = {});
    void emit_sync(const std::string & event_name, const json & payload, emit_options options = {});

    event_record wait_for(const std::string & event_name,
                          int64_t timeout_ms,
                          event_filter filter = nullptr);

    const std::string & prefix() const { return prefix_; }

    // "prefix:event_name"
    std::string qualify(const std::string & event_name) const;

private:
    event_bus & bus_;
    std::string prefix_;
};

} // namespace conductor
