#include "pool/warm_pool.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <limits>

namespace sandpool::pool {

using runtime::Error;
using runtime::ErrorKind;

const char* checkout_status_to_string(CheckoutStatus status) {
    switch (status) {
        case CheckoutStatus::WARM: return "warm";
        case CheckoutStatus::COLD: return "cold";
        case CheckoutStatus::ERROR: return "error";
    }
    return "unknown";
}

// ============================================================================
// Config and records
// ============================================================================

PoolConfig PoolConfig::from_json(const nlohmann::json& j) {
    PoolConfig c;
    if (j.contains("partitions")) {
        for (const auto& p : j["partitions"]) {
            c.partitions.push_back(p.get<std::string>());
        }
    }
    if (j.contains("target_per_partition")) c.target_per_partition = j["target_per_partition"].get<int>();
    if (j.contains("max_age_ms")) c.max_age_ms = j["max_age_ms"].get<int64_t>();
    if (j.contains("replenish_interval_ms")) c.replenish_interval_ms = j["replenish_interval_ms"].get<int>();
    if (j.contains("health_port")) c.health_port = j["health_port"].get<int>();
    if (j.contains("health_timeout_ms")) c.health_timeout_ms = j["health_timeout_ms"].get<int>();
    if (j.contains("health_interval_ms")) c.health_interval_ms = j["health_interval_ms"].get<int>();
    if (j.contains("stop_after_warm")) c.stop_after_warm = j["stop_after_warm"].get<bool>();
    if (j.contains("partition_field")) c.partition_field = j["partition_field"].get<std::string>();
    if (j.contains("sandbox")) c.sandbox = j["sandbox"];
    return c;
}

SandboxInfo SandboxInfo::from_entry(const PoolEntry& entry) {
    SandboxInfo info;
    info.sandbox_id = entry.id;
    info.partition = entry.partition_key;
    info.created_at = entry.created_at;
    if (entry.data.is_object()) {
        info.private_ip = entry.data.value("private_ip", nlohmann::json(nullptr));
        info.metadata = entry.data.value("metadata", nlohmann::json::object());
    }
    return info;
}

PoolEntry SandboxInfo::to_entry() const {
    PoolEntry entry;
    entry.id = sandbox_id;
    entry.partition_key = partition;
    entry.data = {{"private_ip", private_ip}, {"metadata", metadata}};
    entry.created_at = created_at;
    return entry;
}

nlohmann::json SandboxInfo::to_json() const {
    return {{"sandbox_id", sandbox_id}, {"partition", partition}, {"private_ip", private_ip},
            {"metadata", metadata}, {"created_at", created_at}};
}

nlohmann::json PoolStatus::to_json() const {
    return {{"pool", pool}, {"pending", pending}};
}

// ============================================================================
// WarmPool
// ============================================================================

WarmPool::WarmPool(PoolConfig config,
                   std::shared_ptr<runtime::SandboxAdapter> adapter,
                   std::shared_ptr<Store> store)
    : config_(std::move(config)),
      adapter_(std::move(adapter)),
      store_(std::move(store)) {}

WarmPool::~WarmPool() {
    stop();
}

bool WarmPool::start() {
    if (running_) return true;

    if (!store_->init()) {
        spdlog::error("Pool store {} failed to initialize", store_->name());
        return false;
    }

    spdlog::info("Starting sandbox pool ({} adapter, {} store) for {} partition(s)",
                 adapter_->name(), store_->name(), partitions().size());

    running_ = true;
    replenish();
    loop_thread_ = std::thread(&WarmPool::loop, this);
    return true;
}

void WarmPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !loop_thread_.joinable()) return;
        running_ = false;
    }
    loop_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    wait_idle();
    spdlog::info("Pool stopped, leaving sandboxes running for reconciliation");
}

void WarmPool::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        loop_cv_.wait_for(lock, std::chrono::milliseconds(config_.replenish_interval_ms),
                          [this] { return !running_ || replenish_requested_; });
        if (!running_) break;
        replenish_requested_ = false;

        lock.unlock();
        replenish();
        lock.lock();
    }
}

void WarmPool::request_replenish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replenish_requested_ = true;
    }
    loop_cv_.notify_all();
}

void WarmPool::run_async(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    // Drop finished tasks
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& f) {
                     return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                 }),
                 tasks_.end());
    tasks_.push_back(std::async(std::launch::async, std::move(task)));
}

void WarmPool::wait_idle() {
    while (true) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            pending.swap(tasks_);
        }
        if (pending.empty()) return;
        for (auto& f : pending) {
            f.wait();
        }
    }
}

// ============================================================================
// Checkout
// ============================================================================

CheckoutResult WarmPool::checkout(const std::string& partition) {
    CheckoutResult result;

    PopResult popped = store_->pop(partition, config_.max_age_ms);
    switch (popped.status) {
        case PopStatus::OK:
            result.status = CheckoutStatus::WARM;
            result.sandbox = SandboxInfo::from_entry(popped.entry);
            spdlog::info("Checked out warm sandbox {} for partition {}",
                         result.sandbox.sandbox_id, partition);
            request_replenish();
            break;
        case PopStatus::EMPTY:
            spdlog::debug("No warm sandbox available for partition {}", partition);
            result.status = CheckoutStatus::COLD;
            result.error = Error(ErrorKind::POOL_EMPTY, partition);
            // Refill now rather than on the next interval tick
            if (running_ && is_registered(partition)) {
                refill(partition);
            }
            break;
        case PopStatus::ERROR:
            result.status = CheckoutStatus::ERROR;
            result.error = Error(ErrorKind::STORE_ERROR, popped.error);
            break;
    }
    return result;
}

CheckoutResult WarmPool::claim(const std::string& partition, const runtime::SandboxSpec& update_spec) {
    CheckoutResult result = checkout(partition);
    if (result.status != CheckoutStatus::WARM) {
        return result;
    }

    auto updated = adapter_->update(result.sandbox.sandbox_id, update_spec);
    if (!updated.success) {
        spdlog::error("Update of claimed sandbox {} failed: {}",
                      result.sandbox.sandbox_id, updated.error.to_string());
        result.status = CheckoutStatus::ERROR;
        result.error = updated.error;
    }
    return result;
}

PoolStatus WarmPool::status() {
    PoolStatus s;
    s.pool = store_->counts_by_partition();
    s.pending = store_->pending_count();
    return s;
}

// ============================================================================
// Partitions
// ============================================================================

std::vector<std::string> WarmPool::partitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.partitions;
}

bool WarmPool::is_registered(const std::string& partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& parts = config_.partitions;
    return std::find(parts.begin(), parts.end(), partition) != parts.end();
}

void WarmPool::register_partition(const std::string& partition) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& parts = config_.partitions;
        if (std::find(parts.begin(), parts.end(), partition) != parts.end()) return;
        parts.push_back(partition);
    }
    spdlog::info("Registered partition {}", partition);
    request_replenish();
}

void WarmPool::unregister_partition(const std::string& partition, bool cleanup) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& parts = config_.partitions;
        parts.erase(std::remove(parts.begin(), parts.end(), partition), parts.end());
    }
    spdlog::info("Unregistered partition {}{}", partition, cleanup ? " (cleanup)" : "");

    if (cleanup) {
        run_async([this, partition] { cleanup_partition(partition); });
    }
}

void WarmPool::cleanup_partition(const std::string& partition) {
    int terminated = 0;
    while (true) {
        PopResult popped = store_->pop(partition, std::numeric_limits<int64_t>::max());
        if (popped.status != PopStatus::OK) {
            if (popped.status == PopStatus::ERROR) {
                spdlog::warn("Cleanup of {} stopped: {}", partition, popped.error);
            }
            break;
        }
        auto result = adapter_->terminate(popped.entry.id);
        if (!result.success) {
            spdlog::warn("Failed to terminate sandbox {}: {}", popped.entry.id,
                         result.error.to_string());
        } else {
            terminated++;
        }
    }
    spdlog::info("Cleaned up partition {}: {} sandbox(es) terminated", partition, terminated);
}

// ============================================================================
// Replenish
// ============================================================================

runtime::SandboxSpec WarmPool::build_spec(const std::string& partition) const {
    nlohmann::json tmpl = config_.sandbox.is_object() ? config_.sandbox : nlohmann::json::object();
    tmpl[config_.partition_field] = partition;

    // Markers sit beneath user env
    nlohmann::json env = {{kPoolMarkerVar, "true"}, {kPoolPartitionVar, partition}};
    if (tmpl.contains("env") && tmpl["env"].is_object()) {
        for (const auto& [key, value] : tmpl["env"].items()) {
            env[key] = value;
        }
    }
    tmpl["env"] = env;

    return runtime::SandboxSpec::from_json(tmpl);
}

int WarmPool::replenish() {
    int started = 0;
    for (const auto& partition : partitions()) {
        if (refill(partition)) started++;
    }
    return started;
}

bool WarmPool::refill(const std::string& partition) {
    size_t count = store_->count(partition);
    if (count >= static_cast<size_t>(config_.target_per_partition)) return false;

    // The pending flag is the claim; losing it means another refill is in flight
    if (!store_->set_pending(partition, true)) {
        spdlog::debug("Partition {} already has a refill in flight", partition);
        return false;
    }
    spdlog::debug("Partition {} has {}/{} warm, provisioning", partition, count,
                  config_.target_per_partition);
    run_async([this, partition] { provision(partition); });
    return true;
}

void WarmPool::provision(const std::string& partition) {
    auto fail = [&](const std::string& what, const Error& error) {
        spdlog::warn("Failed to create warm sandbox for {}: {}: {}", partition, what, error.to_string());
        store_->set_pending(partition, false);
    };

    runtime::SandboxSpec spec;
    try {
        spec = build_spec(partition);
    } catch (const std::exception& e) {
        fail("invalid sandbox template", Error(ErrorKind::INVALID_CONFIG, e.what()));
        return;
    }

    auto created = adapter_->create(spec);
    if (!created.success) {
        fail("create", created.error);
        return;
    }
    const std::string& id = created.sandbox_id;

    runtime::ReadyOptions ready_opts;
    ready_opts.port = config_.health_port;
    ready_opts.timeout_ms = config_.health_timeout_ms;
    ready_opts.interval_ms = config_.health_interval_ms;

    auto ready = adapter_->await_ready(id, created.metadata, ready_opts);
    if (!ready.success) {
        fail("await_ready " + id, ready.error);
        auto t = adapter_->terminate(id);
        if (!t.success) spdlog::warn("Failed to terminate {}: {}", id, t.error.to_string());
        return;
    }

    if (config_.stop_after_warm) {
        auto stopped = adapter_->stop(id);
        if (!stopped.success) {
            fail("stop " + id, stopped.error);
            auto t = adapter_->terminate(id);
            if (!t.success) spdlog::warn("Failed to terminate {}: {}", id, t.error.to_string());
            return;
        }
    }

    SandboxInfo info;
    info.sandbox_id = id;
    info.partition = partition;
    info.metadata = created.metadata;
    info.private_ip = created.metadata.is_object()
        ? created.metadata.value("private_ip", nlohmann::json(nullptr)) : nlohmann::json(nullptr);
    info.created_at = util::now_ms();

    if (!store_->push(info.to_entry())) {
        fail("push " + id, Error(ErrorKind::STORE_ERROR, "push failed"));
        return;
    }
    store_->set_pending(partition, false);
    spdlog::info("Warm sandbox created for {}: {}", partition, id);
}

} // namespace sandpool::pool
