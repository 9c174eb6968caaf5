#include "pool/runner.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>

namespace sandpool::pool {

using runtime::Error;
using runtime::ErrorKind;
using runtime::OpResult;
using runtime::SandboxStatus;

const char* run_mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::WARM: return "warm";
        case RunMode::COLD: return "cold";
        case RunMode::SESSION: return "session";
    }
    return "unknown";
}

RunnerConfig RunnerConfig::from_json(const nlohmann::json& j) {
    RunnerConfig c;
    if (j.contains("default_partition")) c.default_partition = j["default_partition"].get<std::string>();
    if (j.contains("session_volume")) c.session_volume = j["session_volume"];
    return c;
}

Runner::Runner(RunnerConfig config,
               std::shared_ptr<WarmPool> pool,
               std::shared_ptr<runtime::SandboxAdapter> adapter)
    : config_(std::move(config)),
      pool_(std::move(pool)),
      adapter_(std::move(adapter)) {}

std::string Runner::session_key(const std::string& session_id, const std::string& partition) {
    return session_id + ":" + partition;
}

// ============================================================================
// Operations
// ============================================================================

runtime::ExecResponse Runner::run(const std::string& command, const RunOptions& opts) {
    runtime::ExecResponse response;
    Lease lease;
    if (!acquire(opts, lease, response.error)) {
        return response;
    }
    response = adapter_->exec(lease.sandbox.sandbox_id, command, opts.exec);
    release(lease);
    return response;
}

OpResult Runner::transaction(const Operation& op, const RunOptions& opts) {
    Lease lease;
    Error error;
    if (!acquire(opts, lease, error)) {
        return OpResult::fail(error);
    }

    OpResult result;
    try {
        result = op(*adapter_, lease.sandbox);
    } catch (...) {
        release(lease);
        throw;
    }
    release(lease);
    return result;
}

OpResult Runner::end_session(const std::string& session_id, const std::string& partition,
                             bool delete_volumes) {
    RunOptions opts;
    opts.partition = partition;
    std::string resolved;
    Error error;
    if (!partition_for(opts, resolved, error)) {
        return OpResult::fail(error);
    }
    std::string key = session_key(session_id, resolved);

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) {
            return OpResult::fail(Error(ErrorKind::SESSION_NOT_FOUND, key));
        }
        session = it->second;
        sessions_.erase(it);
    }

    // Waits for an in-flight use of the session
    std::lock_guard<std::mutex> lock(session->mutex);
    session->ended = true;
    const SandboxInfo& sandbox = session->sandbox;
    if (sandbox.sandbox_id.empty()) {
        return OpResult::fail(Error(ErrorKind::SESSION_NOT_FOUND, key));
    }

    auto terminated = adapter_->terminate(sandbox.sandbox_id);
    if (!terminated.success) {
        spdlog::error("Failed to terminate session {} sandbox {}: {}", key, sandbox.sandbox_id,
                      terminated.error.to_string());
        return terminated;
    }
    spdlog::info("Ended session {} (sandbox {})", key, sandbox.sandbox_id);

    if (delete_volumes) {
        auto deleted = adapter_->delete_volumes(sandbox.sandbox_id, sandbox.metadata);
        if (!deleted.success) {
            spdlog::warn("Volumes of session {} not deleted: {}", key, deleted.error.to_string());
        }
        return deleted;
    }
    return terminated;
}

std::vector<std::string> Runner::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(sessions_.size());
    for (const auto& [key, session] : sessions_) {
        keys.push_back(key);
    }
    return keys;
}

// ============================================================================
// Acquire / release
// ============================================================================

bool Runner::acquire(const RunOptions& opts, Lease& lease, Error& error) {
    std::string partition;
    if (!partition_for(opts, partition, error)) {
        return false;
    }
    bool acquired = opts.session.empty()
        ? acquire_stateless(partition, lease, error)
        : acquire_session(opts.session, partition, lease, error);
    if (acquired) {
        spdlog::debug("Using {} sandbox {} in {}", run_mode_to_string(lease.mode),
                      lease.sandbox.sandbox_id, partition);
    }
    return acquired;
}

bool Runner::acquire_stateless(const std::string& partition, Lease& lease, Error& error) {
    CheckoutResult checked = pool_->checkout(partition);
    if (checked.status == CheckoutStatus::WARM) {
        if (ensure_running(checked.sandbox, error)) {
            lease.mode = RunMode::WARM;
            lease.sandbox = checked.sandbox;
            return true;
        }
        spdlog::warn("Warm sandbox {} unusable, cold starting: {}", checked.sandbox.sandbox_id,
                     error.to_string());
        auto t = adapter_->terminate(checked.sandbox.sandbox_id);
        if (!t.success) {
            spdlog::warn("Failed to terminate {}: {}", checked.sandbox.sandbox_id, t.error.to_string());
        }
    } else if (checked.status == CheckoutStatus::ERROR) {
        spdlog::warn("Checkout from {} failed, cold starting: {}", partition,
                     checked.error.to_string());
    }

    runtime::SandboxSpec spec;
    try {
        spec = pool_->build_spec(partition);
    } catch (const nlohmann::json::exception& e) {
        error = Error(ErrorKind::INVALID_CONFIG, e.what());
        return false;
    }
    if (!create_ready(spec, partition, lease.sandbox, error)) {
        return false;
    }
    lease.mode = RunMode::COLD;
    spdlog::info("Cold started sandbox {} in {}", lease.sandbox.sandbox_id, partition);
    return true;
}

bool Runner::acquire_session(const std::string& session_id, const std::string& partition,
                             Lease& lease, Error& error) {
    std::string key = session_key(session_id, partition);

    while (true) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = sessions_[key];
            if (!slot) slot = std::make_shared<Session>();
            session = slot;
        }

        std::unique_lock<std::mutex> session_lock(session->mutex);
        // Ended while we waited; look it up again
        if (session->ended) continue;

        if (session->sandbox.sandbox_id.empty()) {
            bool created = false;
            try {
                created = create_ready(session_spec(partition), partition, session->sandbox, error);
            } catch (const nlohmann::json::exception& e) {
                error = Error(ErrorKind::INVALID_CONFIG, e.what());
            }
            if (!created) {
                session->ended = true;
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = sessions_.find(key);
                if (it != sessions_.end() && it->second == session) sessions_.erase(it);
                return false;
            }
            spdlog::info("Started session {} on sandbox {}", key, session->sandbox.sandbox_id);
        } else if (!ensure_running(session->sandbox, error)) {
            return false;
        }

        lease.mode = RunMode::SESSION;
        lease.sandbox = session->sandbox;
        lease.session = session;
        lease.session_lock = std::move(session_lock);
        return true;
    }
}

void Runner::release(Lease& lease) {
    const std::string& id = lease.sandbox.sandbox_id;
    if (lease.mode == RunMode::SESSION) {
        auto stopped = adapter_->stop(id);
        if (!stopped.success) {
            spdlog::warn("Failed to stop session sandbox {}: {}", id, stopped.error.to_string());
        }
    } else {
        // Pool entries are handed out once
        auto terminated = adapter_->terminate(id);
        if (!terminated.success) {
            spdlog::warn("Failed to terminate {} sandbox {}: {}", run_mode_to_string(lease.mode), id,
                         terminated.error.to_string());
        }
    }
    if (lease.session_lock.owns_lock()) {
        lease.session_lock.unlock();
    }
}

// ============================================================================
// Helpers
// ============================================================================

bool Runner::create_ready(const runtime::SandboxSpec& spec, const std::string& partition,
                          SandboxInfo& out, Error& error) {
    auto created = adapter_->create(spec);
    if (!created.success) {
        error = created.error;
        return false;
    }

    auto ready = adapter_->await_ready(created.sandbox_id, created.metadata, ready_options());
    if (!ready.success) {
        error = ready.error;
        auto t = adapter_->terminate(created.sandbox_id);
        if (!t.success) spdlog::warn("Failed to terminate {}: {}", created.sandbox_id, t.error.to_string());
        return false;
    }

    out.sandbox_id = created.sandbox_id;
    out.partition = partition;
    out.metadata = created.metadata;
    out.private_ip = created.metadata.is_object()
        ? created.metadata.value("private_ip", nlohmann::json(nullptr)) : nlohmann::json(nullptr);
    out.created_at = util::now_ms();
    return true;
}

bool Runner::ensure_running(const SandboxInfo& sandbox, Error& error) {
    auto st = adapter_->status(sandbox.sandbox_id);
    if (!st.success) {
        error = st.error;
        return false;
    }

    switch (st.status) {
        case SandboxStatus::RUNNING:
            return true;
        case SandboxStatus::STOPPED: {
            auto started = adapter_->start(sandbox.sandbox_id);
            if (!started.success) {
                error = started.error;
                return false;
            }
            auto ready = adapter_->await_ready(sandbox.sandbox_id, sandbox.metadata, ready_options());
            if (!ready.success) {
                error = ready.error;
                return false;
            }
            return true;
        }
        default:
            error = Error(ErrorKind::UNEXPECTED_STATUS, runtime::sandbox_status_to_string(st.status));
            return false;
    }
}

bool Runner::partition_for(const RunOptions& opts, std::string& partition, Error& error) const {
    if (!opts.partition.empty()) {
        partition = opts.partition;
    } else if (!config_.default_partition.empty()) {
        partition = config_.default_partition;
    } else {
        auto parts = pool_->partitions();
        if (parts.empty()) {
            error = Error(ErrorKind::INVALID_CONFIG, "no partition given and none configured");
            return false;
        }
        partition = parts.front();
    }
    return true;
}

runtime::SandboxSpec Runner::session_spec(const std::string& partition) const {
    const PoolConfig& pc = pool_->config();
    nlohmann::json tmpl = pc.sandbox.is_object() ? pc.sandbox : nlohmann::json::object();
    tmpl[pc.partition_field] = partition;
    if (!config_.session_volume.is_null()) {
        tmpl["mounts"] = nlohmann::json::array({config_.session_volume});
    }
    return runtime::SandboxSpec::from_json(tmpl);
}

runtime::ReadyOptions Runner::ready_options() const {
    const PoolConfig& pc = pool_->config();
    runtime::ReadyOptions opts;
    opts.port = pc.health_port;
    opts.timeout_ms = pc.health_timeout_ms;
    opts.interval_ms = pc.health_interval_ms;
    return opts;
}

} // namespace sandpool::pool
