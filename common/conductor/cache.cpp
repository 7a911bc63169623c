#include "cache.h"

#include <list>
#include <mutex>
#include <unordered_map>

namespace conductor {

struct response_cache::impl {
    struct entry {
        json value;
        std::string owner;
        int64_t expires_at;                    // Monotonic ms
        std::list<std::string>::iterator lru;  // Position in the recency list
    };

    int64_t ttl_ms;
    size_t max_size;

    std::unordered_map<std::string, entry> entries;
    std::list<std::string> recency;  // Most recently used first

    int64_t hits = 0;
    int64_t misses = 0;
    int64_t evictions = 0;
    int64_t expirations = 0;

    mutable std::mutex mutex;

    impl(int64_t ttl, size_t max) : ttl_ms(ttl), max_size(max == 0 ? 1 : max) {}

    void drop(std::unordered_map<std::string, entry>::iterator it) {
        recency.erase(it->second.lru);
        entries.erase(it);
    }
};

response_cache::response_cache(int64_t ttl_ms, size_t max_size)
    : pimpl(std::make_unique<impl>(ttl_ms, max_size)) {}

response_cache::~response_cache() = default;

std::string response_cache::make_key(const std::string& agent_id,
                                     const std::string& method,
                                     const json& args) {
    return agent_id + ":" + method + ":" + args.dump();
}

std::optional<json> response_cache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->entries.find(key);
    if (it == pimpl->entries.end()) {
        pimpl->misses++;
        return std::nullopt;
    }

    if (get_monotonic_ms() >= it->second.expires_at) {
        pimpl->drop(it);
        pimpl->expirations++;
        pimpl->misses++;
        return std::nullopt;
    }

    pimpl->recency.splice(pimpl->recency.begin(), pimpl->recency, it->second.lru);
    pimpl->hits++;
    return it->second.value;
}

void response_cache::put(const std::string& key, const json& value, const std::string& owner) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    int64_t expires_at = get_monotonic_ms() + pimpl->ttl_ms;

    auto it = pimpl->entries.find(key);
    if (it != pimpl->entries.end()) {
        it->second.value = value;
        it->second.owner = owner;
        it->second.expires_at = expires_at;
        pimpl->recency.splice(pimpl->recency.begin(), pimpl->recency, it->second.lru);
        return;
    }

    while (pimpl->entries.size() >= pimpl->max_size && !pimpl->recency.empty()) {
        pimpl->entries.erase(pimpl->recency.back());
        pimpl->recency.pop_back();
        pimpl->evictions++;
    }

    pimpl->recency.push_front(key);
    pimpl->entries.emplace(key, impl::entry{value, owner, expires_at, pimpl->recency.begin()});
}

bool response_cache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->entries.find(key);
    if (it == pimpl->entries.end()) {
        return false;
    }
    pimpl->drop(it);
    return true;
}

size_t response_cache::erase_owner(const std::string& owner) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    size_t removed = 0;
    for (auto it = pimpl->entries.begin(); it != pimpl->entries.end();) {
        if (it->second.owner == owner) {
            pimpl->recency.erase(it->second.lru);
            it = pimpl->entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t response_cache::purge_expired() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    int64_t now = get_monotonic_ms();
    size_t removed = 0;
    for (auto it = pimpl->entries.begin(); it != pimpl->entries.end();) {
        if (now >= it->second.expires_at) {
            pimpl->recency.erase(it->second.lru);
            it = pimpl->entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    pimpl->expirations += removed;
    return removed;
}

void response_cache::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->entries.clear();
    pimpl->recency.clear();
}

size_t response_cache::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->entries.size();
}

response_cache::stats response_cache::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    stats s;
    s.hits = pimpl->hits;
    s.misses = pimpl->misses;
    s.evictions = pimpl->evictions;
    s.expirations = pimpl->expirations;
    s.size = pimpl->entries.size();
    s.max_size = pimpl->max_size;
    int64_t lookups = pimpl->hits + pimpl->misses;
    s.hit_rate = lookups > 0 ? static_cast<double>(pimpl->hits) / lookups : 0.0;
    return s;
}

std::string response_cache::stats::to_json() const {
    json j;
    j["hits"] = hits;
    j["misses"] = misses;
    j["evictions"] = evictions;
    j["expirations"] = expirations;
    j["size"] = size;
    j["max_size"] = max_size;
    j["hit_rate"] = hit_rate;
    return j.dump();
}

} // namespace conductor
