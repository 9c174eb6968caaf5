/**
 * Remote fleet machine adapter
 *
 * Sandboxes are machines managed through the Fly Machines REST API.
 * A sandbox id is "<app>:<machine>"; everything after the first colon
 * belongs to the machine id. Machines are addressed inside the fleet via
 * http://<machine>.vm.<app>.internal:<port>.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "fleet/client.hpp"
#include "fleet/rate_limiter.hpp"
#include "fleet/volume_manager.hpp"
#include "runtime/adapter.hpp"
#include "runtime/http_transport.hpp"

namespace sandpool::fleet {

using runtime::SandboxSpec;

struct FleetSettings {
    std::string api_token;                  // Falls back to FLY_API_TOKEN
    std::string app_name;                   // Falls back to FLY_APP_NAME
    std::string base_url = kDefaultBaseUrl;
    std::string default_image = "ghcr.io/sandpool/sandbox:latest";
    int exec_limit_ms = 60000;              // Provider cap on exec duration

    static FleetSettings from_json(const json& j);
};

class FleetAdapter : public runtime::SandboxAdapter {
public:
    FleetAdapter(FleetSettings settings,
                 std::shared_ptr<runtime::HttpTransport> transport,
                 std::shared_ptr<RateLimiter> limiter);

    // Non-copyable
    FleetAdapter(const FleetAdapter&) = delete;
    FleetAdapter& operator=(const FleetAdapter&) = delete;

    const char* name() const override { return "fleet"; }

    runtime::CreateResult create(const SandboxSpec& spec) override;
    runtime::ExecResponse exec(const std::string& sandbox_id, const std::string& command,
                               const runtime::ExecOptions& opts = {}) override;
    runtime::OpResult terminate(const std::string& sandbox_id) override;
    runtime::StatusResult status(const std::string& sandbox_id) override;

    runtime::UrlResult get_url(const std::string& sandbox_id, int port) override;
    runtime::OpResult start(const std::string& sandbox_id) override;
    runtime::OpResult stop(const std::string& sandbox_id) override;
    runtime::OpResult update(const std::string& sandbox_id, const SandboxSpec& spec) override;
    runtime::OpResult await_ready(const std::string& sandbox_id, const json& metadata,
                                  const runtime::ReadyOptions& opts) override;
    // Deletes metadata["created_volumes"]; volumes that are already gone count as deleted
    runtime::OpResult delete_volumes(const std::string& sandbox_id, const json& metadata) override;

    // Block server-side until the machine reaches state (timeout capped at 60s)
    runtime::OpResult wait(const std::string& sandbox_id, const std::string& state,
                           int timeout_s = 60, const std::string& instance_id = "");

    // Terminate, then optionally delete the whole app
    runtime::OpResult terminate_with_app(const std::string& sandbox_id, bool destroy_app);

    ApiResult list_volumes(const std::string& app, std::vector<VolumeInfo>& out);
    ApiResult get_machine_volumes(const std::string& sandbox_id, std::vector<ResolvedMount>& out);

    // Split "<app>:<machine>" on the first colon
    static bool parse_sandbox_id(const std::string& sandbox_id, std::string& app,
                                 std::string& machine, Error& error);

    // Machine config body for POST /apps/{app}/machines (mounts excluded)
    json build_machine_config(const SandboxSpec& spec) const;

    FleetClient& client() { return client_; }

private:
    // Explicit token, else settings, else FLY_API_TOKEN
    bool resolve_token(const std::string& explicit_token, std::string& token, Error& error) const;
    bool resolve_app(const std::string& explicit_app, std::string& app, Error& error) const;

    runtime::OpResult maybe_create_app(const SandboxSpec& spec, const std::string& app,
                                       const std::string& token);

    // Parse the id and resolve the token in one step
    bool prepare(const std::string& sandbox_id, std::string& app, std::string& machine,
                 std::string& token, Error& error) const;

    FleetSettings settings_;
    std::shared_ptr<runtime::HttpTransport> transport_;
    FleetClient client_;
    VolumeManager volumes_;
};

} // namespace sandpool::fleet
