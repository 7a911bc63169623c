#include "knowledge.h"
#include "failure.h"
#include "log.h"

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>

namespace conductor {

json knowledge_entry::to_json() const {
    return json{
        {"key", key},
        {"value", value},
        {"source", source},
        {"timestamp", timestamp},
        {"version", version},
        {"tags", tags},
    };
}

struct knowledge_base::impl {
    event_namespace events;
    size_t max_versions;

    mutable std::mutex mutex;
    std::map<std::string, std::deque<knowledge_entry>> entries;
    std::map<std::string, int> last_version;

    impl(event_bus& bus, size_t max_v)
        : events(bus.scope("coordinator")), max_versions(std::max<size_t>(max_v, 1)) {}
};

knowledge_base::knowledge_base(event_bus& bus, size_t max_versions)
    : pimpl(std::make_unique<impl>(bus, max_versions)) {}

knowledge_base::~knowledge_base() = default;

int knowledge_base::put(const std::string& key,
                        const json& value,
                        const std::string& source,
                        const std::vector<std::string>& tags) {
    if (key.empty()) {
        throw conductor_error(ERROR_TYPE_VALIDATION, "knowledge key must not be empty",
                              json{{"source", source}}, "knowledge");
    }

    knowledge_entry entry;
    entry.key = key;
    entry.value = value;
    entry.source = source;
    entry.timestamp = get_timestamp_ms();
    entry.tags = tags;

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        // Versions keep counting after erase so readers never see one reused
        entry.version = ++pimpl->last_version[key];

        auto& versions = pimpl->entries[key];
        versions.push_back(entry);
        while (versions.size() > pimpl->max_versions) {
            versions.pop_front();
        }
    }

    LOG_DBG("knowledge %s v%d from %s\n", key.c_str(), entry.version, source.c_str());

    pimpl->events.emit("knowledge_updated", json{
        {"key", key},
        {"value", value},
        {"source", source},
        {"version", entry.version},
    });
    return entry.version;
}

std::optional<json> knowledge_base::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->entries.find(key);
    if (it == pimpl->entries.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back().value;
}

std::optional<knowledge_entry> knowledge_base::get_entry(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->entries.find(key);
    if (it == pimpl->entries.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<knowledge_entry> knowledge_base::get_history(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->entries.find(key);
    if (it == pimpl->entries.end()) {
        return {};
    }
    return std::vector<knowledge_entry>(it->second.begin(), it->second.end());
}

std::vector<knowledge_entry> knowledge_base::query(const std::vector<std::string>& tags) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<knowledge_entry> results;
    for (const auto& kv : pimpl->entries) {
        if (kv.second.empty()) {
            continue;
        }
        const auto& latest = kv.second.back();
        bool has_all = std::all_of(tags.begin(), tags.end(), [&latest](const std::string& tag) {
            return std::find(latest.tags.begin(), latest.tags.end(), tag) != latest.tags.end();
        });
        if (has_all) {
            results.push_back(latest);
        }
    }
    return results;
}

std::vector<std::string> knowledge_base::keys() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    std::vector<std::string> result;
    result.reserve(pimpl->entries.size());
    for (const auto& kv : pimpl->entries) {
        result.push_back(kv.first);
    }
    return result;
}

bool knowledge_base::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->entries.erase(key) > 0;
}

size_t knowledge_base::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->entries.size();
}

void knowledge_base::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->entries.clear();
    pimpl->last_version.clear();
}

std::string knowledge_base::to_json() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    json j = json::object();
    for (const auto& kv : pimpl->entries) {
        if (!kv.second.empty()) {
            j[kv.first] = kv.second.back().to_json();
        }
    }
    return j.dump();
}

} // namespace conductor
