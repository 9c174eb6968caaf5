/**
 * Sandbox runner
 *
 * Runs work in sandboxes on behalf of callers, in one of two modes:
 *
 *   stateless  a warm sandbox from the pool, or a cold-started one when the
 *              partition is empty. Terminated after use.
 *   session    one dedicated sandbox per (session, partition), created on
 *              first use with the session volume mounted. Stopped after
 *              each use and started again on the next one.
 *
 * Calls on the same session are serialized; everything else runs in
 * parallel.
 */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pool/warm_pool.hpp"
#include "runtime/adapter.hpp"

namespace sandpool::pool {

struct RunnerConfig {
    std::string default_partition;                  // Empty = first pool partition
    nlohmann::json session_volume = nullptr;        // Mount given to session sandboxes

    static RunnerConfig from_json(const nlohmann::json& j);
};

struct RunOptions {
    std::string session;        // Empty = stateless
    std::string partition;      // Empty = default partition
    runtime::ExecOptions exec;
};

enum class RunMode {
    WARM,
    COLD,
    SESSION
};

const char* run_mode_to_string(RunMode mode);

class Runner {
public:
    using Operation = std::function<runtime::OpResult(runtime::SandboxAdapter&, const SandboxInfo&)>;

    Runner(RunnerConfig config,
           std::shared_ptr<WarmPool> pool,
           std::shared_ptr<runtime::SandboxAdapter> adapter);

    // Non-copyable
    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    runtime::ExecResponse run(const std::string& command, const RunOptions& opts = {});

    // Several operations against the same sandbox. Exceptions thrown by op
    // propagate after the sandbox has been released.
    runtime::OpResult transaction(const Operation& op, const RunOptions& opts = {});

    // Terminate a session's sandbox, optionally deleting its volumes.
    // SESSION_NOT_FOUND if the session was never started or already ended.
    runtime::OpResult end_session(const std::string& session_id, const std::string& partition = "",
                                  bool delete_volumes = false);

    // Keys ("<session>:<partition>") of live sessions
    std::vector<std::string> sessions() const;

    static std::string session_key(const std::string& session_id, const std::string& partition);

private:
    struct Session {
        std::mutex mutex;       // Held for the duration of each use
        SandboxInfo sandbox;
        bool ended = false;
    };

    struct Lease {
        RunMode mode = RunMode::WARM;
        SandboxInfo sandbox;
        std::shared_ptr<Session> session;
        std::unique_lock<std::mutex> session_lock;
    };

    bool acquire(const RunOptions& opts, Lease& lease, runtime::Error& error);
    void release(Lease& lease);

    bool acquire_stateless(const std::string& partition, Lease& lease, runtime::Error& error);
    bool acquire_session(const std::string& session_id, const std::string& partition,
                         Lease& lease, runtime::Error& error);

    // Create from spec and wait until healthy; terminated again on failure
    bool create_ready(const runtime::SandboxSpec& spec, const std::string& partition,
                      SandboxInfo& out, runtime::Error& error);

    // Running as is, stopped gets started, anything else is an error
    bool ensure_running(const SandboxInfo& sandbox, runtime::Error& error);

    bool partition_for(const RunOptions& opts, std::string& partition, runtime::Error& error) const;
    runtime::SandboxSpec session_spec(const std::string& partition) const;
    runtime::ReadyOptions ready_options() const;

    RunnerConfig config_;
    std::shared_ptr<WarmPool> pool_;
    std::shared_ptr<runtime::SandboxAdapter> adapter_;

    mutable std::mutex mutex_;  // sessions_
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace sandpool::pool
