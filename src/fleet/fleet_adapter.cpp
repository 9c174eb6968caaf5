#include "fleet/fleet_adapter.hpp"
#include "runtime/health_poller.hpp"
#include "runtime/network_env.hpp"
#include "util/env.hpp"
#include "util/shell.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace sandpool::fleet {

using runtime::CreateResult;
using runtime::ExecOptions;
using runtime::ExecResponse;
using runtime::OpResult;
using runtime::SandboxStatus;
using runtime::StatusResult;
using runtime::UrlResult;

namespace {

json build_services(const std::vector<runtime::PortMapping>& ports) {
    json services = json::array();
    for (const auto& p : ports) {
        json port = {{"port", p.container_port}, {"handlers", json::array({"http"})}};
        services.push_back({
            {"ports", json::array({port})},
            {"protocol", "tcp"},
            {"internal_port", p.container_port}
        });
    }
    return services;
}

OpResult from_api(ApiResult r) {
    if (r.success) return OpResult::ok(std::move(r.body));
    return OpResult::fail(std::move(r.error));
}

} // namespace

FleetSettings FleetSettings::from_json(const json& j) {
    FleetSettings s;
    if (j.contains("api_token")) s.api_token = j["api_token"].get<std::string>();
    if (j.contains("app_name")) s.app_name = j["app_name"].get<std::string>();
    if (j.contains("base_url")) s.base_url = j["base_url"].get<std::string>();
    if (j.contains("default_image")) s.default_image = j["default_image"].get<std::string>();
    if (j.contains("exec_limit_ms")) s.exec_limit_ms = j["exec_limit_ms"].get<int>();
    return s;
}

FleetAdapter::FleetAdapter(FleetSettings settings,
                           std::shared_ptr<runtime::HttpTransport> transport,
                           std::shared_ptr<RateLimiter> limiter)
    : settings_(std::move(settings)),
      transport_(transport),
      client_(transport, std::move(limiter), settings_.base_url),
      volumes_(client_) {}

// ============================================================================
// Identity and credentials
// ============================================================================

bool FleetAdapter::parse_sandbox_id(const std::string& sandbox_id, std::string& app,
                                    std::string& machine, Error& error) {
    auto pos = sandbox_id.find(':');
    if (pos == std::string::npos) {
        error = Error(ErrorKind::INVALID_SANDBOX_ID,
                      "Invalid sandbox_id format '" + sandbox_id + "'. Expected 'app_name:machine_id'");
        return false;
    }
    app = sandbox_id.substr(0, pos);
    machine = sandbox_id.substr(pos + 1);
    return true;
}

bool FleetAdapter::resolve_token(const std::string& explicit_token, std::string& token,
                                 Error& error) const {
    token = !explicit_token.empty() ? explicit_token
          : !settings_.api_token.empty() ? settings_.api_token
          : util::get_env("FLY_API_TOKEN");
    if (token.empty()) {
        error = Error(ErrorKind::API_TOKEN_REQUIRED,
                      "api_token is required in config or FLY_API_TOKEN env var");
        return false;
    }
    return true;
}

bool FleetAdapter::resolve_app(const std::string& explicit_app, std::string& app,
                               Error& error) const {
    app = !explicit_app.empty() ? explicit_app
        : !settings_.app_name.empty() ? settings_.app_name
        : util::get_env("FLY_APP_NAME");
    if (app.empty()) {
        error = Error(ErrorKind::APP_NAME_REQUIRED,
                      "app_name is required in config or FLY_APP_NAME env var");
        return false;
    }
    return true;
}

bool FleetAdapter::prepare(const std::string& sandbox_id, std::string& app, std::string& machine,
                           std::string& token, Error& error) const {
    return parse_sandbox_id(sandbox_id, app, machine, error) &&
           resolve_token("", token, error);
}

// ============================================================================
// Machine config
// ============================================================================

json FleetAdapter::build_machine_config(const SandboxSpec& spec) const {
    json config;
    config["image"] = spec.image.empty() ? settings_.default_image : spec.image;
    config["env"] = runtime::merge_network_env(spec.env, spec.proxy);
    config["guest"] = {
        {"memory_mb", spec.memory_mb > 0 ? spec.memory_mb : 256},
        {"cpus", spec.cpu > 0 ? std::max(1, static_cast<int>(spec.cpu)) : 1},
        {"cpu_kind", spec.cpu_kind.empty() ? "shared" : spec.cpu_kind}
    };
    config["services"] = build_services(spec.ports);
    config["auto_destroy"] = spec.auto_destroy;
    config["restart"] = {{"policy", "no"}};
    return config;
}

OpResult FleetAdapter::maybe_create_app(const SandboxSpec& spec, const std::string& app,
                                        const std::string& token) {
    if (!spec.create_app) return OpResult::ok();

    if (spec.org.empty()) {
        return OpResult::fail(Error(ErrorKind::INVALID_CONFIG, "org is required when create_app is true"));
    }

    auto existing = client_.get_app(app, token);
    if (existing.success) return OpResult::ok();
    if (!existing.not_found()) {
        return OpResult::fail(Error(existing.error.kind,
                                    "app check failed: " + existing.error.message,
                                    existing.error.code));
    }

    spdlog::info("Creating app {} in org {}{}", app, spec.org,
                 spec.network.empty() ? "" : " on network " + spec.network);
    auto created = client_.create_app(app, spec.org, spec.network, token);
    if (created.success) return OpResult::ok();

    if (created.error.kind == ErrorKind::API_ERROR && created.error.code == 422 &&
        created.error.message.find("already exists") != std::string::npos) {
        return OpResult::ok();
    }
    return OpResult::fail(Error(created.error.kind,
                                "app creation failed: " + created.error.message,
                                created.error.code));
}

// ============================================================================
// Lifecycle
// ============================================================================

CreateResult FleetAdapter::create(const SandboxSpec& spec) {
    CreateResult result;

    std::string app, token;
    if (!resolve_app(spec.app_name, app, result.error) ||
        !resolve_token(spec.api_token, token, result.error)) {
        return result;
    }

    std::vector<ValidatedMount> mounts;
    if (!VolumeManager::validate(spec.mounts, mounts, result.error)) {
        spdlog::error("Rejected mount for {}: {}", app, result.error.message);
        return result;
    }

    auto app_ready = maybe_create_app(spec, app, token);
    if (!app_ready.success) {
        result.error = app_ready.error;
        return result;
    }

    auto resolved = volumes_.resolve(mounts, app, spec.region, token);
    if (!resolved.success) {
        result.error = resolved.error;
        return result;
    }

    json body;
    body["skip_launch"] = spec.skip_launch;
    body["config"] = build_machine_config(spec);
    if (!spec.region.empty()) body["region"] = spec.region;
    if (!resolved.mounts.empty()) body["config"]["mounts"] = mounts_to_json(resolved.mounts);

    auto created = client_.post("/apps/" + app + "/machines", body, token);
    if (!created.success || !created.body.is_object() || !created.body.contains("id")) {
        result.error = created.success
            ? Error(ErrorKind::PROVIDER_ERROR, "machine response without id")
            : created.error;
        spdlog::error("Machine creation in {} failed: {}", app, result.error.to_string());
        volumes_.cleanup(resolved.created_volumes, app, token);
        return result;
    }

    std::string machine_id = created.body["id"].get<std::string>();
    result.success = true;
    result.sandbox_id = app + ":" + machine_id;
    result.metadata = {
        {"private_ip", created.body.value("private_ip", json(nullptr))},
        {"created_volumes", resolved.created_volumes}
    };
    spdlog::info("Created machine {} in {}", machine_id, app);
    return result;
}

ExecResponse FleetAdapter::exec(const std::string& sandbox_id, const std::string& command,
                                const ExecOptions& opts) {
    ExecResponse response;
    std::string app, machine, token;
    if (!prepare(sandbox_id, app, machine, token, response.error)) {
        return response;
    }

    int timeout_ms = std::min(opts.timeout_ms, settings_.exec_limit_ms);
    std::string full = opts.workdir.empty()
        ? command : "cd " + util::shell_quote(opts.workdir) + " && " + command;

    json body = {
        {"command", json::array({"sh", "-c", full})},
        {"timeout", std::max(1, timeout_ms / 1000)}
    };

    auto r = client_.post("/apps/" + app + "/machines/" + machine + "/exec", body, token);
    if (!r.success) {
        response.error = r.error;
        return response;
    }
    if (!r.body.is_object() || !r.body.contains("exit_code") || !r.body["exit_code"].is_number()) {
        response.error = Error(ErrorKind::PROVIDER_ERROR, "unexpected exec response: " + r.body.dump());
        return response;
    }

    auto text = [&](const char* key) {
        return r.body.contains(key) && r.body[key].is_string() ? r.body[key].get<std::string>() : "";
    };
    response.success = true;
    response.result.exit_code = r.body["exit_code"].get<int>();
    response.result.stdout_data = text("stdout");
    response.result.stderr_data = text("stderr");
    return response;
}

OpResult FleetAdapter::terminate(const std::string& sandbox_id) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) {
        return OpResult::fail(error);
    }

    auto r = client_.del("/apps/" + app + "/machines/" + machine + "?force=true", token);
    if (r.success || r.not_found()) {
        spdlog::info("Destroyed machine {} in {}", machine, app);
        return OpResult::ok();
    }
    return from_api(std::move(r));
}

StatusResult FleetAdapter::status(const std::string& sandbox_id) {
    StatusResult result;
    std::string app, machine, token;
    if (!prepare(sandbox_id, app, machine, token, result.error)) {
        return result;
    }

    auto r = client_.get_machine(app, machine, token);
    result.success = true;
    if (r.not_found()) {
        result.status = SandboxStatus::TERMINATED;
        return result;
    }

    std::string state = r.success && r.body.is_object() && r.body.contains("state") &&
                        r.body["state"].is_string() ? r.body["state"].get<std::string>() : "";
    if (state == "started") {
        result.status = SandboxStatus::RUNNING;
    } else if (state == "stopped" || state == "suspended") {
        result.status = SandboxStatus::STOPPED;
    } else if (state == "destroyed" || state == "destroying") {
        result.status = SandboxStatus::TERMINATED;
    } else {
        result.status = SandboxStatus::UNKNOWN;
    }
    return result;
}

UrlResult FleetAdapter::get_url(const std::string& sandbox_id, int port) {
    UrlResult result;
    std::string app, machine;
    if (!parse_sandbox_id(sandbox_id, app, machine, result.error)) {
        return result;
    }
    result.success = true;
    result.url = "http://" + machine + ".vm." + app + ".internal:" + std::to_string(port);
    return result;
}

OpResult FleetAdapter::start(const std::string& sandbox_id) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) return OpResult::fail(error);
    return from_api(client_.post("/apps/" + app + "/machines/" + machine + "/start",
                                 json::object(), token));
}

OpResult FleetAdapter::stop(const std::string& sandbox_id) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) return OpResult::fail(error);
    return from_api(client_.post("/apps/" + app + "/machines/" + machine + "/stop",
                                 json::object(), token));
}

OpResult FleetAdapter::update(const std::string& sandbox_id, const SandboxSpec& spec) {
    std::string app, machine, token;
    Error error;
    if (!parse_sandbox_id(sandbox_id, app, machine, error) ||
        !resolve_token(spec.api_token, token, error)) {
        return OpResult::fail(error);
    }
    if (spec.image.empty()) {
        return OpResult::fail(Error(ErrorKind::INVALID_CONFIG, "image is required for update"));
    }

    std::vector<ValidatedMount> mounts;
    if (!VolumeManager::validate(spec.mounts, mounts, error)) {
        return OpResult::fail(error);
    }

    json config = build_machine_config(spec);
    if (spec.ports.empty()) config.erase("services");

    if (!mounts.empty()) {
        auto resolved = volumes_.resolve(mounts, app, spec.region, token);
        if (!resolved.success) return OpResult::fail(resolved.error);
        config["mounts"] = mounts_to_json(resolved.mounts);
    } else {
        // Keep what is attached today
        std::vector<ResolvedMount> existing;
        auto r = volumes_.machine_volumes(app, machine, token, existing);
        if (r.success && !existing.empty()) {
            config["mounts"] = mounts_to_json(existing);
        }
    }

    spdlog::info("Updating machine {} in {} to {}", machine, app, spec.image);
    return from_api(client_.post("/apps/" + app + "/machines/" + machine,
                                 json{{"config", config}}, token));
}

OpResult FleetAdapter::wait(const std::string& sandbox_id, const std::string& state,
                            int timeout_s, const std::string& instance_id) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) return OpResult::fail(error);

    timeout_s = std::clamp(timeout_s, 1, 60);
    std::string query = "state=" + state + "&timeout=" + std::to_string(timeout_s);
    if (!instance_id.empty()) query += "&instance_id=" + instance_id;

    return from_api(client_.get("/apps/" + app + "/machines/" + machine + "/wait?" + query, token));
}

OpResult FleetAdapter::await_ready(const std::string& sandbox_id, const json& metadata,
                                   const runtime::ReadyOptions& opts) {
    auto started_at = std::chrono::steady_clock::now();
    auto deadline = started_at + std::chrono::milliseconds(opts.timeout_ms);

    // Phase 1: machine reaches "started". A 408 only means the server-side
    // wait expired; the machine may still come up before our deadline.
    auto waited = wait(sandbox_id, "started", std::min(opts.timeout_ms / 1000, 60));
    if (!waited.success &&
        !(waited.error.kind == ErrorKind::API_ERROR && waited.error.code == 408)) {
        return waited;
    }

    // Phase 2: health endpoint answers 200
    std::string url;
    if (metadata.is_object() && metadata.contains("private_ip") && metadata["private_ip"].is_string()) {
        url = "http://[" + metadata["private_ip"].get<std::string>() + "]:" +
              std::to_string(opts.port) + "/health";
    } else {
        auto base = get_url(sandbox_id, opts.port);
        if (!base.success) return OpResult::fail(base.error);
        url = base.url + "/health";
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return runtime::poll_health(*transport_, url, static_cast<int>(std::max<int64_t>(0, remaining)),
                                opts.interval_ms);
}

// ============================================================================
// Extensions
// ============================================================================

OpResult FleetAdapter::delete_volumes(const std::string& sandbox_id, const json& metadata) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) return OpResult::fail(error);

    if (!metadata.is_object() || !metadata.contains("created_volumes") ||
        !metadata["created_volumes"].is_array()) {
        return OpResult::ok();
    }

    OpResult result = OpResult::ok();
    for (const auto& volume : metadata["created_volumes"]) {
        if (!volume.is_string()) continue;
        auto deleted = client_.delete_volume(app, volume.get<std::string>(), token);
        if (!deleted.success) {
            spdlog::warn("Failed to delete volume {} in {}: {}", volume.get<std::string>(), app,
                         deleted.error.to_string());
            if (result.success) result = OpResult::fail(deleted.error);
        } else {
            spdlog::info("Deleted volume {} in {}", volume.get<std::string>(), app);
        }
    }
    return result;
}

OpResult FleetAdapter::terminate_with_app(const std::string& sandbox_id, bool destroy_app) {
    std::string app, machine, token;
    Error error;
    if (!prepare(sandbox_id, app, machine, token, error)) return OpResult::fail(error);

    auto terminated = terminate(sandbox_id);
    if (!terminated.success || !destroy_app) return terminated;

    spdlog::info("Deleting app {}", app);
    return from_api(client_.delete_app(app, token));
}

ApiResult FleetAdapter::list_volumes(const std::string& app, std::vector<VolumeInfo>& out) {
    ApiResult result;
    std::string token;
    if (!resolve_token("", token, result.error)) return result;
    return volumes_.list(app, token, out);
}

ApiResult FleetAdapter::get_machine_volumes(const std::string& sandbox_id,
                                            std::vector<ResolvedMount>& out) {
    ApiResult result;
    std::string app, machine, token;
    if (!prepare(sandbox_id, app, machine, token, result.error)) return result;
    return volumes_.machine_volumes(app, machine, token, out);
}

} // namespace sandpool::fleet
