/**
 * Pool store interface
 *
 * Backend contract for warm pools. pop is atomic across concurrent
 * callers: no entry is ever handed out twice. Entries older than the
 * caller's max age are discarded lazily when pop walks past them, and
 * pop serves the oldest fresh entry first.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pool/entry.hpp"

namespace sandpool::pool {

// Pending flags older than this are treated as abandoned
constexpr int64_t kPendingStaleMs = 5 * 60 * 1000;

// Wall clock in ms, injectable so expiry can be driven by tests
using Clock = std::function<int64_t()>;

enum class PopStatus {
    OK,
    EMPTY,      // pool_empty, no fresh entry for the partition
    ERROR
};

struct PopResult {
    PopStatus status = PopStatus::EMPTY;
    PoolEntry entry;
    std::string error;
};

class Store {
public:
    virtual ~Store() = default;

    virtual const char* name() const = 0;

    // Connect / prepare. Must be called before any other operation.
    virtual bool init() = 0;

    virtual PopResult pop(const std::string& partition_key, int64_t max_age_ms) = 0;
    virtual bool push(const PoolEntry& entry) = 0;
    virtual bool remove(const std::string& id) = 0;

    virtual size_t count(const std::string& partition_key) = 0;
    virtual std::map<std::string, size_t> counts_by_partition() = 0;

    // Pending flags (one per partition, self-expire after kPendingStaleMs).
    // set_pending(key, true) is a claim: it returns true only for the caller
    // that raised the flag, false if it was already held or on failure.
    // set_pending(key, false) returns false only on failure.
    virtual bool pending(const std::string& partition_key) = 0;
    virtual bool set_pending(const std::string& partition_key, bool pending) = 0;
    virtual size_t pending_count() = 0;

    virtual void stop() = 0;
};

enum class StoreKind {
    MEMORY,
    POSTGRES
};

struct StoreConfig {
    StoreKind kind = StoreKind::MEMORY;
    std::string conninfo;                 // libpq connection string
    int pool_size = 4;                    // Connections held by the postgres store
    std::vector<std::string> partitions;  // Pre-registered partitions

    static StoreConfig from_json(const nlohmann::json& j);
};

// nullptr when the backend kind is not available
std::unique_ptr<Store> make_store(const StoreConfig& config);

} // namespace sandpool::pool
