#include "pool/memory_store.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandpool::pool {

MemoryStore::MemoryStore(std::vector<std::string> partitions, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(util::now_ms)),
      initial_partitions_(std::move(partitions)) {}

bool MemoryStore::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : initial_partitions_) {
        entries_[p];
    }
    return true;
}

PopResult MemoryStore::pop(const std::string& partition_key, int64_t max_age_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    PopResult result;

    auto it = entries_.find(partition_key);
    if (it == entries_.end()) {
        return result;
    }

    int64_t now = clock_();
    auto& queue = it->second;
    size_t discarded = 0;
    while (!queue.empty()) {
        PoolEntry entry = std::move(queue.front());
        queue.pop_front();
        if (entry.is_stale(now, max_age_ms)) {
            discarded++;
            continue;
        }
        if (discarded > 0) {
            spdlog::debug("Discarded {} stale entries from {}", discarded, partition_key);
        }
        result.status = PopStatus::OK;
        result.entry = std::move(entry);
        return result;
    }

    if (discarded > 0) {
        spdlog::debug("Discarded {} stale entries from {}", discarded, partition_key);
    }
    return result;
}

bool MemoryStore::push(const PoolEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[entry.partition_key].push_back(entry);
    return true;
}

bool MemoryStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [partition, queue] : entries_) {
        queue.erase(std::remove_if(queue.begin(), queue.end(),
                                   [&](const PoolEntry& e) { return e.id == id; }),
                    queue.end());
    }
    return true;
}

size_t MemoryStore::count(const std::string& partition_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(partition_key);
    return it == entries_.end() ? 0 : it->second.size();
}

std::map<std::string, size_t> MemoryStore::counts_by_partition() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, size_t> counts;
    for (const auto& [partition, queue] : entries_) {
        counts[partition] = queue.size();
    }
    return counts;
}

// Caller holds mutex_
void MemoryStore::expire_pending_locked(int64_t now) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now - it->second > kPendingStaleMs) {
            spdlog::warn("Pending flag for {} expired, assuming abandoned refill", it->first);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

bool MemoryStore::pending(const std::string& partition_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_pending_locked(clock_());
    return pending_.count(partition_key) > 0;
}

bool MemoryStore::set_pending(const std::string& partition_key, bool pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending) {
        pending_.erase(partition_key);
        return true;
    }
    // First set wins; an expired flag can be claimed again
    int64_t now = clock_();
    expire_pending_locked(now);
    return pending_.emplace(partition_key, now).second;
}

size_t MemoryStore::pending_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_pending_locked(clock_());
    return pending_.size();
}

void MemoryStore::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    pending_.clear();
}

} // namespace sandpool::pool
