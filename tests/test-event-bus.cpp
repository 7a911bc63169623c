// Test suite for the event bus

#include "../common/conductor/event.h"
#include "../common/conductor/failure.h"
#include "../common/log.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
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

// Listeners fire by descending priority, insertion order on ties
static bool test_priority_order() {
    event_bus bus;
    std::vector<std::string> calls;

    listener_options low;
    low.priority = 1;
    listener_options high;
    high.priority = 10;
    listener_options mid;
    mid.priority = 5;

    bus.subscribe("e", [&](const json &, const event_metadata &) { calls.push_back("low"); }, low);
    bus.subscribe("e", [&](const json &, const event_metadata &) { calls.push_back("high-a"); }, high);
    bus.subscribe("e", [&](const json &, const event_metadata &) { calls.push_back("mid"); }, mid);
    bus.subscribe("e", [&](const json &, const event_metadata &) { calls.push_back("high-b"); }, high);
    bus.subscribe("e", [&](const json &, const event_metadata &) { calls.push_back("default"); });

    bus.emit("e", json{{"n", 1}});

    TEST_ASSERT(calls.size() == 5, "All listeners should fire");
    TEST_ASSERT(calls[0] == "high-a", "First high priority listener first");
    TEST_ASSERT(calls[1] == "high-b", "Ties keep insertion order");
    TEST_ASSERT(calls[2] == "mid", "Medium priority third");
    TEST_ASSERT(calls[3] == "low", "Low priority fourth");
    TEST_ASSERT(calls[4] == "default", "Priority 0 last");

    return true;
}

// once() listeners fire at most once and are removed
static bool test_once_listener() {
    event_bus bus;
    int count = 0;

    bus.once("e", [&](const json &, const event_metadata &) { count++; });
    TEST_ASSERT(bus.listener_count("e") == 1, "Once listener registered");

    bus.emit("e", json::object());
    bus.emit("e", json::object());

    TEST_ASSERT(count == 1, "Once listener should fire exactly once");
    TEST_ASSERT(bus.listener_count("e") == 0, "Once listener should be removed");
    TEST_ASSERT(!bus.has_listeners("e"), "No listeners left");

    return true;
}

// Concurrent emits cannot fire a once listener twice
static bool test_once_concurrent() {
    event_bus bus;
    std::atomic<int> count{0};

    bus.once("e", [&](const json &, const event_metadata &) { count++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&bus]() { bus.emit("e", json::object()); });
    }
    for (auto & t : threads) {
        t.join();
    }

    TEST_ASSERT(count.load() == 1, "Once listener should fire exactly once under concurrency");
    return true;
}

// Filters are checked before invocation
static bool test_filter() {
    event_bus bus;
    std::vector<int> seen;

    listener_options options;
    options.filter = [](const json & payload, const event_metadata &) {
        return payload.value("value", 0) > 5;
    };
    bus.subscribe("e", [&](const json & payload, const event_metadata &) {
        seen.push_back(payload["value"].get<int>());
    }, options);

    bus.emit("e", json{{"value", 3}});
    bus.emit("e", json{{"value", 7}});
    bus.emit("e", json{{"value", 10}});

    TEST_ASSERT(seen.size() == 2, "Only matching payloads should be delivered");
    TEST_ASSERT(seen[0] == 7 && seen[1] == 10, "Matching payloads in order");

    return true;
}

// A failing listener does not stop dispatch and reaches the error hook
static bool test_error_isolation() {
    event_bus bus;
    int hook_calls = 0;
    std::string hook_listener;
    bool second_called = false;

    bus.set_error_hook([&](const std::exception & err, const std::string & event_name, const std::string & listener_id) {
        hook_calls++;
        hook_listener = listener_id;
        (void) err;
        (void) event_name;
    });

    listener_options first;
    first.priority = 10;
    first.listener_id = "thrower";
    bus.subscribe("e", [](const json &, const event_metadata &) {
        throw std::runtime_error("boom");
    }, first);
    bus.subscribe("e", [&](const json &, const event_metadata &) { second_called = true; });

    bus.emit("e", json::object());

    TEST_ASSERT(second_called, "Second listener should still be called");
    TEST_ASSERT(hook_calls == 1, "Error hook should be called once");
    TEST_ASSERT(hook_listener == "thrower", "Error hook receives the listener ID");

    auto history = bus.get_history("e");
    TEST_ASSERT(history.size() == 1, "Dispatch recorded in history");
    TEST_ASSERT(history[0].errors.size() == 1, "History records the error");
    TEST_ASSERT(history[0].errors[0].message == "boom", "Error message kept");
    TEST_ASSERT(history[0].listeners_notified == 1, "One listener succeeded");

    auto metrics = bus.get_metrics();
    TEST_ASSERT(metrics.total_errors == 1, "Metrics count the error");
    TEST_ASSERT(metrics.error_rate > 0.99, "The only dispatch had an error");

    return true;
}

// emit with retry: a listener that always throws is invoked 1 + attempts times
static bool test_emit_retry() {
    event_bus bus;
    std::mutex mutex;
    std::vector<int64_t> times;
    std::vector<int> retry_counts;

    bus.subscribe("e", [&](const json &, const event_metadata & meta) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            times.push_back(get_monotonic_ms());
            retry_counts.push_back(meta.retry_count);
        }
        throw std::runtime_error("always fails");
    });

    emit_options options;
    options.retry.attempts = 2;
    options.retry.backoff_ms = 100;
    bus.emit("e", json{{"k", "v"}}, options);

    bool done = wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return times.size() >= 3;
    }, 3000);
    TEST_ASSERT(done, "Listener should be invoked three times");

    // No fourth attempt
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(times.size() == 3, "Exactly initial + 2 retries");
    TEST_ASSERT(retry_counts[0] == 0 && retry_counts[1] == 1 && retry_counts[2] == 2,
                "retry_count increments per attempt");

    int64_t first_gap = times[1] - times[0];
    int64_t second_gap = times[2] - times[1];
    TEST_ASSERT(first_gap >= 90, "First retry waits the base backoff");
    TEST_ASSERT(second_gap >= 190, "Second retry waits twice the base backoff");
    TEST_ASSERT(second_gap > first_gap, "Delay increases between retries");

    return true;
}

// emit_sync ignores retry policies
static bool test_emit_sync_no_retry() {
    event_bus bus;
    std::atomic<int> count{0};

    bus.subscribe("e", [&](const json &, const event_metadata &) {
        count++;
        throw std::runtime_error("fails");
    });

    emit_options options;
    options.retry.attempts = 3;
    options.retry.backoff_ms = 10;
    bus.emit_sync("e", json::object(), options);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    TEST_ASSERT(count.load() == 1, "emit_sync should not retry");
    TEST_ASSERT(bus.pending_events() == 0, "Nothing scheduled");

    return true;
}

// Listeners and filters throwing non-standard exceptions are isolated too
static bool test_non_standard_throw() {
    event_bus bus;
    int hook_calls = 0;
    std::string hook_message;
    bool last_called = false;

    bus.set_error_hook([&](const std::exception & err, const std::string &, const std::string &) {
        hook_calls++;
        hook_message = err.what();
    });

    listener_options first;
    first.priority = 10;
    first.listener_id = "int-thrower";
    bus.subscribe("e", [](const json &, const event_metadata &) {
        throw 42;
    }, first);

    listener_options second;
    second.priority = 5;
    second.listener_id = "bad-filter";
    second.filter = [](const json &, const event_metadata &) -> bool {
        throw "no filter today";
    };
    bus.subscribe("e", [](const json &, const event_metadata &) {}, second);

    bus.subscribe("e", [&](const json &, const event_metadata &) { last_called = true; });

    bus.emit("e", json::object());

    TEST_ASSERT(last_called, "Dispatch continues past non-standard throws");
    TEST_ASSERT(hook_calls == 2, "Both failures reach the error hook");
    TEST_ASSERT(hook_message == "filter threw a non-standard exception", "Filter failure described");

    auto history = bus.get_history("e");
    TEST_ASSERT(history.size() == 1, "Dispatch recorded");
    TEST_ASSERT(history[0].errors.size() == 2, "Both errors recorded");
    TEST_ASSERT(history[0].errors[0].listener_id == "int-thrower", "Listener error recorded first");
    TEST_ASSERT(history[0].listeners_notified == 1, "Only the last listener succeeded");

    return true;
}

// A large retry budget keeps the backoff shift bounded
static bool test_emit_retry_large_budget() {
    event_bus bus;
    std::atomic<int> count{0};

    bus.subscribe("e", [&](const json &, const event_metadata &) {
        count++;
        throw std::runtime_error("always fails");
    });

    emit_options options;
    options.retry.attempts = 80;
    options.retry.backoff_ms = 0;
    bus.emit("e", json::object(), options);

    TEST_ASSERT(wait_until([&]() { return count.load() == 81; }, 5000),
                "Initial attempt plus 80 retries");
    TEST_ASSERT(wait_until([&]() { return bus.pending_events() == 0; }, 1000), "Nothing left scheduled");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    TEST_ASSERT(count.load() == 81, "No retry past the budget");

    auto history = bus.get_history("e", 1);
    TEST_ASSERT(history.size() == 1 && history[0].metadata.retry_count == 80, "Last retry numbered 80");

    return true;
}

// Delayed emission runs on the timer thread
static bool test_delayed_emit() {
    event_bus bus;
    std::atomic<int> count{0};

    bus.subscribe("e", [&](const json &, const event_metadata &) { count++; });

    emit_options options;
    options.delay_ms = 100;
    bus.emit("e", json::object(), options);

    TEST_ASSERT(count.load() == 0, "Delayed event not dispatched immediately");
    TEST_ASSERT(bus.pending_events() == 1, "Delayed event is pending");

    TEST_ASSERT(wait_until([&]() { return count.load() == 1; }, 2000), "Delayed event dispatched");
    TEST_ASSERT(bus.pending_events() == 0, "Nothing pending after dispatch");

    return true;
}

// wait_for resolves on the next matching event
static bool test_wait_for() {
    event_bus bus;

    std::thread emitter([&bus]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus.emit("ready", json{{"id", "other"}});
        bus.emit("ready", json{{"id", "mine"}});
    });

    event_record record = bus.wait_for("ready", 2000, [](const json & payload, const event_metadata &) {
        return payload.value("id", "") == "mine";
    });
    emitter.join();

    TEST_ASSERT(record.payload["id"] == "mine", "wait_for returns the matching payload");
    TEST_ASSERT(record.metadata.event_name == "ready", "Metadata carries the event name");
    TEST_ASSERT(bus.listener_count("ready") == 0, "wait_for listener removed");

    return true;
}

// wait_for times out and removes its listener
static bool test_wait_for_timeout() {
    event_bus bus;

    bool timed_out = false;
    try {
        bus.wait_for("never", 50);
    } catch (const conductor_error & e) {
        timed_out = e.type() == ERROR_TYPE_TIMEOUT;
    }

    TEST_ASSERT(timed_out, "wait_for should throw a timeout error");
    TEST_ASSERT(bus.listener_count("never") == 0, "Timed out listener removed");

    return true;
}

// History is capped and FIFO-trimmed
static bool test_history_cap() {
    event_bus bus(5);

    for (int i = 0; i < 10; i++) {
        bus.emit("e", json{{"i", i}});
    }

    auto history = bus.get_history();
    TEST_ASSERT(history.size() == 5, "History capped at max size");
    TEST_ASSERT(history.front().payload["i"] == 5, "Oldest entries dropped");
    TEST_ASSERT(history.back().payload["i"] == 9, "Newest entry kept");

    auto limited = bus.get_history("e", 2);
    TEST_ASSERT(limited.size() == 2, "Limit returns the most recent entries");
    TEST_ASSERT(limited[0].payload["i"] == 8, "Limit keeps chronological order");

    bus.clear_history();
    TEST_ASSERT(bus.get_history().empty(), "History cleared");

    return true;
}

// Namespaced view prefixes names and defaults the source
static bool test_namespace() {
    event_bus bus;
    event_namespace router = bus.scope("router");

    std::string source;
    std::string name;
    bus.subscribe("router:agent_registered", [&](const json &, const event_metadata & meta) {
        source = meta.source;
        name = meta.event_name;
    });

    router.emit("agent_registered", json{{"agent_id", "a"}});

    TEST_ASSERT(name == "router:agent_registered", "Event name is prefixed");
    TEST_ASSERT(source == "router", "Source defaults to the prefix");
    TEST_ASSERT(router.qualify("x") == "router:x", "qualify joins with a colon");

    return true;
}

// Unsubscribe, introspection and metrics
static bool test_unsubscribe_and_metrics() {
    event_bus bus;
    int count = 0;

    std::string id = bus.subscribe("a", [&](const json &, const event_metadata &) { count++; });
    bus.subscribe("a", [&](const json &, const event_metadata &) { count++; });
    bus.subscribe("b", [&](const json &, const event_metadata &) { count++; });

    TEST_ASSERT(bus.total_listener_count() == 3, "Three listeners");
    TEST_ASSERT(bus.event_names().size() == 2, "Two event names");

    TEST_ASSERT(bus.unsubscribe("a", id), "Unsubscribe by ID");
    TEST_ASSERT(!bus.unsubscribe("a", id), "Second unsubscribe fails");
    TEST_ASSERT(!bus.unsubscribe("missing", id), "Unknown event fails");

    bus.emit("a", json::object());
    TEST_ASSERT(count == 1, "Only remaining listener fires");

    TEST_ASSERT(bus.unsubscribe_all("b") == 1, "unsubscribe_all reports count");
    TEST_ASSERT(bus.unsubscribe_all("b") == 0, "Nothing left to remove");

    bus.emit("b", json::object());
    auto metrics = bus.get_metrics();
    TEST_ASSERT(metrics.total_events == 2, "Two dispatches counted");
    TEST_ASSERT(metrics.event_counts["a"] == 1, "Per-event count for a");
    TEST_ASSERT(metrics.event_counts["b"] == 1, "Per-event count for b");
    TEST_ASSERT(metrics.total_listeners == 1, "One listener left");

    bus.reset_metrics();
    TEST_ASSERT(bus.get_metrics().total_events == 0, "Metrics reset");

    return true;
}

// Listeners may subscribe from inside a handler
static bool test_reentrant_subscribe() {
    event_bus bus;
    int inner = 0;

    bus.once("outer", [&](const json &, const event_metadata &) {
        bus.subscribe("inner", [&](const json &, const event_metadata &) { inner++; });
        bus.emit("inner", json::object());
    });

    bus.emit("outer", json::object());
    TEST_ASSERT(inner == 1, "Handler can subscribe and emit");

    return true;
}

int main() {
    conductor_log_set_verbosity(CONDUCTOR_LOG_LEVEL_NONE);

    std::cout << "=== Event Bus Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_priority_order);
    RUN_TEST(test_once_listener);
    RUN_TEST(test_once_concurrent);
    RUN_TEST(test_filter);
    RUN_TEST(test_error_isolation);
    RUN_TEST(test_emit_retry);
    RUN_TEST(test_emit_sync_no_retry);
    RUN_TEST(test_emit_retry_large_budget);
    RUN_TEST(test_non_standard_throw);
    RUN_TEST(test_delayed_emit);
    RUN_TEST(test_wait_for);
    RUN_TEST(test_wait_for_timeout);
    RUN_TEST(test_history_cap);
    RUN_TEST(test_namespace);
    RUN_TEST(test_unsubscribe_and_metrics);
    RUN_TEST(test_reentrant_subscribe);

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
