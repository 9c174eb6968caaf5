#include "pool/store.hpp"
#include "pool/memory_store.hpp"
#include "pool/postgres_store.hpp"
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandpool::pool {

StoreConfig StoreConfig::from_json(const nlohmann::json& j) {
    StoreConfig config;
    if (j.contains("kind")) {
        std::string kind = j["kind"].get<std::string>();
        if (kind == "memory") {
            config.kind = StoreKind::MEMORY;
        } else if (kind == "postgres") {
            config.kind = StoreKind::POSTGRES;
        } else {
            throw std::invalid_argument("unknown store kind: " + kind);
        }
    }
    if (j.contains("conninfo")) config.conninfo = j["conninfo"].get<std::string>();
    if (j.contains("pool_size")) config.pool_size = j["pool_size"].get<int>();
    if (j.contains("partitions")) {
        for (const auto& p : j["partitions"]) {
            config.partitions.push_back(p.get<std::string>());
        }
    }
    return config;
}

std::unique_ptr<Store> make_store(const StoreConfig& config) {
    switch (config.kind) {
        case StoreKind::MEMORY:
            return std::make_unique<MemoryStore>(config.partitions);
        case StoreKind::POSTGRES:
            if (config.conninfo.empty()) {
                spdlog::error("Postgres store requires conninfo");
                return nullptr;
            }
            return std::make_unique<PostgresStore>(config.conninfo, config.pool_size,
                                                   config.partitions);
    }
    return nullptr;
}

} // namespace sandpool::pool
