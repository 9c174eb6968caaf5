#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "pool/store.hpp"

namespace sandpool::pool {

// Single-node store. One mutex owns all state, which is what makes pop atomic.
class MemoryStore : public Store {
public:
    explicit MemoryStore(std::vector<std::string> partitions = {}, Clock clock = {});

    const char* name() const override { return "memory"; }

    bool init() override;

    PopResult pop(const std::string& partition_key, int64_t max_age_ms) override;
    bool push(const PoolEntry& entry) override;
    bool remove(const std::string& id) override;

    size_t count(const std::string& partition_key) override;
    std::map<std::string, size_t> counts_by_partition() override;

    bool pending(const std::string& partition_key) override;
    bool set_pending(const std::string& partition_key, bool pending) override;
    size_t pending_count() override;

    void stop() override;

private:
    void expire_pending_locked(int64_t now);

    Clock clock_;
    std::mutex mutex_;
    std::vector<std::string> initial_partitions_;
    std::map<std::string, std::deque<PoolEntry>> entries_;   // Oldest at front
    std::unordered_map<std::string, int64_t> pending_;       // partition -> set at (ms)
};

} // namespace sandpool::pool
