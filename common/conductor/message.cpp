#include "message.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace conductor {

// Helper function to generate UUID v4
std::string generate_uuid() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::lock_guard<std::mutex> lock(mutex);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

// Get current timestamp in milliseconds
int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

int64_t get_monotonic_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

const char* message_priority_to_string(message_priority priority) {
    switch (priority) {
        case MESSAGE_PRIORITY_LOW: return "low";
        case MESSAGE_PRIORITY_NORMAL: return "normal";
        case MESSAGE_PRIORITY_HIGH: return "high";
        case MESSAGE_PRIORITY_URGENT: return "urgent";
        default: return "normal";
    }
}

message_priority message_priority_from_string(const std::string& str) {
    if (str == "low") return MESSAGE_PRIORITY_LOW;
    if (str == "high") return MESSAGE_PRIORITY_HIGH;
    if (str == "urgent") return MESSAGE_PRIORITY_URGENT;
    return MESSAGE_PRIORITY_NORMAL;
}

// routed_message serialization
std::string routed_message::to_json() const {
    json j;
    j["message_id"] = message_id;
    j["from_agent"] = from_agent;
    j["to_agent"] = to_agent;
    j["method"] = method;
    j["args"] = args;
    j["priority"] = message_priority_to_string(priority);
    j["timeout_ms"] = timeout_ms;
    j["retry_attempts"] = retry_attempts;
    j["enqueued_at"] = enqueued_at;
    return j.dump();
}

routed_message routed_message::from_json(const std::string& json_str) {
    json j = json::parse(json_str);
    routed_message msg;
    msg.message_id = j.value("message_id", "");
    msg.from_agent = j.value("from_agent", "");
    msg.to_agent = j.value("to_agent", "");
    msg.method = j.value("method", "");
    msg.args = j.value("args", json::object());
    msg.priority = message_priority_from_string(j.value("priority", "normal"));
    msg.timeout_ms = j.value("timeout_ms", int64_t(30000));
    msg.retry_attempts = j.value("retry_attempts", 3);
    msg.enqueued_at = j.value("enqueued_at", get_timestamp_ms());
    return msg;
}

// Message queue implementation
// One FIFO deque per priority tier, drained from the highest tier down
struct message_queue::impl {
    std::deque<routed_message> tiers[MESSAGE_PRIORITY_URGENT + 1];
    size_t max_size;
    size_t count = 0;
    uint64_t next_sequence = 0;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool closed = false;

    impl(size_t max) : max_size(max) {}

    bool take(routed_message& msg) {
        for (int p = MESSAGE_PRIORITY_URGENT; p >= MESSAGE_PRIORITY_LOW; p--) {
            if (!tiers[p].empty()) {
                msg = std::move(tiers[p].front());
                tiers[p].pop_front();
                count--;
                return true;
            }
        }
        return false;
    }
};

message_queue::message_queue(size_t max_size) : pimpl(std::make_unique<impl>(max_size)) {}

message_queue::~message_queue() {
    close();
}

bool message_queue::push(const routed_message& msg) {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->closed || pimpl->count >= pimpl->max_size) {
            return false;
        }
        routed_message queued = msg;
        queued.sequence = pimpl->next_sequence++;
        pimpl->tiers[queued.priority].push_back(std::move(queued));
        pimpl->count++;
    }
    pimpl->cv.notify_one();
    return true;
}

bool message_queue::pop(routed_message& msg, int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    auto ready = [this]() {
        return pimpl->count > 0 || pimpl->closed;
    };

    if (timeout_ms < 0) {
        pimpl->cv.wait(lock, ready);
    } else if (timeout_ms > 0) {
        if (!pimpl->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) {
            return false;
        }
    }

    if (pimpl->closed) {
        return false;
    }

    return pimpl->take(msg);
}

bool message_queue::remove(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    for (auto& tier : pimpl->tiers) {
        auto it = std::find_if(tier.begin(), tier.end(),
            [&message_id](const routed_message& m) { return m.message_id == message_id; });
        if (it != tier.end()) {
            tier.erase(it);
            pimpl->count--;
            return true;
        }
    }
    return false;
}

void message_queue::close() {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->closed = true;
    }
    pimpl->cv.notify_all();
}

size_t message_queue::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->count;
}

bool message_queue::empty() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->count == 0;
}

void message_queue::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    for (auto& tier : pimpl->tiers) {
        tier.clear();
    }
    pimpl->count = 0;
}

} // namespace conductor
