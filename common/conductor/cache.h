#pragma once

#include "message.h"

#include <memory>
#include <optional>
#include <string>

namespace conductor {

// TTL + LRU cache for idempotent method responses
class response_cache {
public:
    response_cache(int64_t ttl_ms = 300000, size_t max_size = 500);
    ~response_cache();

    // "agent_id:method:<args dump>"
    static std::string make_key(const std::string& agent_id,
                                const std::string& method,
                                const json& args);

    // Returns the cached value when present and not expired
    std::optional<json> get(const std::string& key);

    // Insert or refresh an entry, evicting the least recently used one when full
    // owner tags the entry for erase_owner (the agent that produced it)
    void put(const std::string& key, const json& value, const std::string& owner = "");

    bool erase(const std::string& key);

    // Drop all entries tagged with the owner
    size_t erase_owner(const std::string& owner);

    // Drop expired entries, returns the number removed
    size_t purge_expired();

    void clear();
    size_t size() const;

    struct stats {
        int64_t hits;
        int64_t misses;
        int64_t evictions;
        int64_t expirations;
        size_t size;
        size_t max_size;
        double hit_rate;

        std::string to_json() const;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
