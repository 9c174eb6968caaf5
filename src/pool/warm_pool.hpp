/**
 * Warm sandbox pool
 *
 * Keeps each partition topped up with pre-provisioned sandboxes so
 * callers skip cold-start latency. Provisioning runs asynchronously. A
 * refill must first claim the partition's pending flag in the store, so at
 * most one refill per partition is in flight, across nodes when the store
 * is shared. A cold checkout triggers a refill of its partition at once.
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "pool/store.hpp"
#include "runtime/adapter.hpp"

namespace sandpool::pool {

constexpr const char* kPoolMarkerVar = "SANDPOOL_POOL";
constexpr const char* kPoolPartitionVar = "SANDPOOL_POOL_PARTITION";

struct PoolConfig {
    std::vector<std::string> partitions;
    int target_per_partition = 1;
    int64_t max_age_ms = 4LL * 60 * 60 * 1000;   // 4h
    int replenish_interval_ms = 60000;
    int health_port = 4001;
    int health_timeout_ms = 120000;
    int health_interval_ms = 2000;
    bool stop_after_warm = true;                  // Park warmed sandboxes stopped
    std::string partition_field = "region";       // Sandbox config key that receives the partition
    nlohmann::json sandbox = nlohmann::json::object();  // Spec template

    static PoolConfig from_json(const nlohmann::json& j);
};

// What a caller gets back from a warm checkout
struct SandboxInfo {
    std::string sandbox_id;
    std::string partition;
    nlohmann::json private_ip;      // string or null
    nlohmann::json metadata = nlohmann::json::object();
    int64_t created_at = 0;

    static SandboxInfo from_entry(const PoolEntry& entry);
    PoolEntry to_entry() const;
    nlohmann::json to_json() const;
};

enum class CheckoutStatus {
    WARM,
    COLD,       // pool_empty, caller should create from scratch
    ERROR
};

const char* checkout_status_to_string(CheckoutStatus status);

struct CheckoutResult {
    CheckoutStatus status = CheckoutStatus::COLD;
    SandboxInfo sandbox;
    runtime::Error error;
};

struct PoolStatus {
    std::map<std::string, size_t> pool;
    size_t pending = 0;

    nlohmann::json to_json() const;
};

class WarmPool {
public:
    WarmPool(PoolConfig config,
             std::shared_ptr<runtime::SandboxAdapter> adapter,
             std::shared_ptr<Store> store);
    ~WarmPool();

    // Non-copyable
    WarmPool(const WarmPool&) = delete;
    WarmPool& operator=(const WarmPool&) = delete;

    // Init the store, replenish once, then keep replenishing in the background
    bool start();

    // Stop the loop and wait for in-flight provisioning. Provisioned
    // sandboxes are left running for later reconciliation.
    void stop();

    bool running() const { return running_; }

    CheckoutResult checkout(const std::string& partition);

    // Checkout + adapter update, replacing the pool markers with real config
    CheckoutResult claim(const std::string& partition, const runtime::SandboxSpec& update_spec);

    PoolStatus status();

    void register_partition(const std::string& partition);
    void unregister_partition(const std::string& partition, bool cleanup = false);
    std::vector<std::string> partitions() const;
    bool is_registered(const std::string& partition) const;

    // One pass: start provisioning for every partition below target whose
    // pending flag could be claimed. Returns the number of tasks started.
    int replenish();

    // Block until all in-flight provisioning and cleanup tasks are done
    void wait_idle();

    // Spec for a new warm sandbox in this partition
    runtime::SandboxSpec build_spec(const std::string& partition) const;

    const PoolConfig& config() const { return config_; }

private:
    bool refill(const std::string& partition);
    void provision(const std::string& partition);
    void cleanup_partition(const std::string& partition);
    void run_async(std::function<void()> task);
    void request_replenish();
    void loop();

    PoolConfig config_;
    std::shared_ptr<runtime::SandboxAdapter> adapter_;
    std::shared_ptr<Store> store_;

    mutable std::mutex mutex_;             // partitions, loop state
    std::condition_variable loop_cv_;
    bool replenish_requested_ = false;
    std::atomic<bool> running_{false};
    std::thread loop_thread_;

    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
};

} // namespace sandpool::pool
