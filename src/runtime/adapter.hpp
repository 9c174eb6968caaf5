/**
 * Sandbox adapter interface
 *
 * One capability surface over different sandbox providers (local
 * containers, remote fleet machines). Providers implement the lifecycle
 * primitives; file transfer is built once on top of exec.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/errors.hpp"

namespace sandpool::runtime {

using json = nlohmann::json;

// Proxy-only network attachment
struct ProxySpec {
    std::string ip;               // Empty = no proxy (network mode none)
    int port = 4000;
    std::string network;          // Container network that can reach the proxy

    bool enabled() const { return !ip.empty(); }
};

struct PortMapping {
    int host_port = 0;            // 0 = let the provider choose
    int container_port = 0;
};

// Provider-neutral sandbox configuration. Keys not used by a provider
// are ignored by it.
struct SandboxSpec {
    std::string image;
    std::string workdir;
    std::map<std::string, std::string> env;
    std::vector<PortMapping> ports;
    int memory_mb = 0;            // 0 = provider default
    double cpu = 0;               // 0 = provider default
    std::string cpu_kind;
    int pids_limit = 0;           // 0 = unlimited

    // Fleet
    std::string app_name;
    std::string region;
    std::string api_token;
    json mounts = json::array();  // Raw, validated by each provider
    bool skip_launch = false;
    bool auto_destroy = true;
    bool create_app = false;
    std::string org;
    std::string network;

    ProxySpec proxy;

    // Create from JSON (throws nlohmann::json::exception on wrong types)
    static SandboxSpec from_json(const json& j);

    // Serialize to JSON
    json to_json() const;
};

struct ExecOptions {
    int timeout_ms = 30000;
    std::string workdir;          // Empty = sandbox default
};

struct ExecResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
};

struct ExecResponse {
    bool success = false;
    ExecResult result;
    Error error;
};

struct CreateResult {
    bool success = false;
    std::string sandbox_id;
    json metadata = json::object();  // private_ip, created_volumes
    Error error;
};

struct ReadResult {
    bool success = false;
    std::string content;
    Error error;
};

struct OpResult {
    bool success = false;
    json body;                    // Provider response, when there is one
    Error error;

    static OpResult ok(json b = nullptr) { return {true, std::move(b), {}}; }
    static OpResult fail(Error e) { return {false, nullptr, std::move(e)}; }
};

struct UrlResult {
    bool success = false;
    std::string url;
    Error error;
};

enum class SandboxStatus {
    RUNNING,
    STOPPED,
    TERMINATED,
    UNKNOWN
};

inline const char* sandbox_status_to_string(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::RUNNING: return "running";
        case SandboxStatus::STOPPED: return "stopped";
        case SandboxStatus::TERMINATED: return "terminated";
        case SandboxStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

struct StatusResult {
    bool success = false;
    SandboxStatus status = SandboxStatus::UNKNOWN;
    Error error;
};

struct ReadyOptions {
    int port = 4001;
    int timeout_ms = 60000;
    int interval_ms = 2000;
};

class SandboxAdapter {
public:
    virtual ~SandboxAdapter() = default;

    virtual const char* name() const = 0;

    virtual CreateResult create(const SandboxSpec& spec) = 0;
    virtual ExecResponse exec(const std::string& sandbox_id, const std::string& command,
                              const ExecOptions& opts = {}) = 0;
    virtual OpResult terminate(const std::string& sandbox_id) = 0;
    virtual StatusResult status(const std::string& sandbox_id) = 0;

    // Optional lifecycle, NOT_IMPLEMENTED by default
    virtual UrlResult get_url(const std::string& sandbox_id, int port);
    virtual OpResult start(const std::string& sandbox_id);
    virtual OpResult stop(const std::string& sandbox_id);
    virtual OpResult update(const std::string& sandbox_id, const SandboxSpec& spec);
    virtual OpResult await_ready(const std::string& sandbox_id, const json& metadata,
                                 const ReadyOptions& opts);
    // Delete volumes created along with the sandbox (metadata from create)
    virtual OpResult delete_volumes(const std::string& sandbox_id, const json& metadata);

    // File transfer over exec
    ReadResult read_file(const std::string& sandbox_id, const std::string& path,
                         const ExecOptions& opts = {});
    OpResult write_file(const std::string& sandbox_id, const std::string& path,
                        const std::string& content, const ExecOptions& opts = {});
    OpResult write_files(const std::string& sandbox_id,
                         const std::vector<std::pair<std::string, std::string>>& files,
                         const ExecOptions& opts = {});
};

} // namespace sandpool::runtime
