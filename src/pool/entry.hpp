#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace sandpool::pool {

using json = nlohmann::json;

// One warm sandbox waiting in a pool. Never mutated once pushed; consumed
// exactly once, by pop or remove.
struct PoolEntry {
    std::string id;              // Unique within a store
    std::string partition_key;   // e.g. region or image
    json data = json::object();  // How to reach/use the sandbox
    int64_t created_at = 0;      // Epoch milliseconds

    bool is_stale(int64_t now_ms, int64_t max_age_ms) const {
        return now_ms - created_at > max_age_ms;
    }

    json to_json() const {
        return {{"id", id}, {"partition_key", partition_key},
                {"data", data}, {"created_at", created_at}};
    }

    static PoolEntry from_json(const json& j) {
        PoolEntry e;
        e.id = j.at("id").get<std::string>();
        e.partition_key = j.at("partition_key").get<std::string>();
        if (j.contains("data")) e.data = j["data"];
        if (j.contains("created_at")) e.created_at = j["created_at"].get<int64_t>();
        return e;
    }
};

} // namespace sandpool::pool
