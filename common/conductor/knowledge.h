#pragma once

#include "event.h"
#include "message.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

struct knowledge_entry {
    std::string key;
    json value;
    std::string source;              // Agent or component that wrote it
    int64_t timestamp = 0;
    int version = 0;                 // 1 for the first write of a key
    std::vector<std::string> tags;

    json to_json() const;
};

// Versioned key/value store shared by agents
// Every put emits "coordinator:knowledge_updated" {key, value, source, version}
class knowledge_base {
public:
    // max_versions: versions kept per key, the oldest are dropped first
    knowledge_base(event_bus& bus, size_t max_versions = 16);
    ~knowledge_base();

    knowledge_base(const knowledge_base&) = delete;
    knowledge_base& operator=(const knowledge_base&) = delete;

    // Store a new version, returns its version number
    // Throws conductor_error (validation) on an empty key
    int put(const std::string& key,
            const json& value,
            const std::string& source,
            const std::vector<std::string>& tags = {});

    // Latest value
    std::optional<json> get(const std::string& key) const;
    std::optional<knowledge_entry> get_entry(const std::string& key) const;

    // Kept versions, oldest first
    std::vector<knowledge_entry> get_history(const std::string& key) const;

    // Latest entries carrying every tag (all entries for an empty list)
    std::vector<knowledge_entry> query(const std::vector<std::string>& tags) const;

    // Sorted
    std::vector<std::string> keys() const;

    bool erase(const std::string& key);
    size_t size() const;
    void clear();

    // {"key": latest entry, ...}
    std::string to_json() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace conductor
