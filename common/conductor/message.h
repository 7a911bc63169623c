#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace conductor {

using json = nlohmann::json;

// Message priority tiers (higher drains first)
enum message_priority {
    MESSAGE_PRIORITY_LOW,
    MESSAGE_PRIORITY_NORMAL,
    MESSAGE_PRIORITY_HIGH,
    MESSAGE_PRIORITY_URGENT
};

// Convert message priority to string
const char* message_priority_to_string(message_priority priority);

// Parse "low", "normal", "high" or "urgent" (anything else is normal)
message_priority message_priority_from_string(const std::string& str);

// Routed message between agents
struct routed_message {
    std::string message_id;      // UUID
    std::string from_agent;      // Sender ID (may be an external caller)
    std::string to_agent;        // Target agent ID
    std::string method;          // Method name in the target's method table
    json args;                   // Method arguments
    message_priority priority;   // Queue tier
    int64_t timeout_ms;          // Caller-side timeout
    int retry_attempts;          // Caller's resend budget, echoed in failure details
    int64_t enqueued_at;         // Timestamp (Unix epoch ms)
    uint64_t sequence;           // FIFO order within a tier (set by the queue)

    routed_message()
        : args(json::object()), priority(MESSAGE_PRIORITY_NORMAL),
          timeout_ms(30000), retry_attempts(3), enqueued_at(0), sequence(0) {}

    // Serialize to JSON
    std::string to_json() const;

    // Deserialize from JSON
    static routed_message from_json(const std::string& json_str);
};

// Priority-ordered message queue
// urgent > high > normal > low, FIFO within a tier
class message_queue {
public:
    message_queue(size_t max_size = 10000);
    ~message_queue();

    // Push message to queue, returns false when full or closed
    bool push(const routed_message& msg);

    // Pop the highest priority message (blocking with timeout)
    // timeout_ms == 0 is non-blocking, timeout_ms < 0 waits until a message
    // arrives or the queue is closed
    bool pop(routed_message& msg, int64_t timeout_ms = 0);

    // Remove a queued message by ID
    bool remove(const std::string& message_id);

    // Wake all waiters and reject further pushes
    void close();

    // Get queue size
    size_t size() const;

    // Check if queue is empty
    bool empty() const;

    // Clear all messages
    void clear();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// Generate UUID for messages, listeners and workflows
std::string generate_uuid();

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

// Monotonic clock in milliseconds, for timeouts and windows
int64_t get_monotonic_ms();

} // namespace conductor
