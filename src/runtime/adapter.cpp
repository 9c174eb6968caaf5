#include "runtime/adapter.hpp"
#include "runtime/file_transfer.hpp"

namespace sandpool::runtime {

// ============================================================================
// SandboxSpec
// ============================================================================

SandboxSpec SandboxSpec::from_json(const json& j) {
    SandboxSpec spec;

    if (j.contains("image")) spec.image = j["image"].get<std::string>();
    if (j.contains("workdir")) spec.workdir = j["workdir"].get<std::string>();
    if (j.contains("env")) {
        for (const auto& [key, value] : j["env"].items()) {
            spec.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    if (j.contains("ports")) {
        for (const auto& p : j["ports"]) {
            PortMapping mapping;
            if (p.is_object()) {
                mapping.host_port = p.value("host", 0);
                mapping.container_port = p.at("container").get<int>();
            } else {
                mapping.container_port = p.get<int>();
            }
            spec.ports.push_back(mapping);
        }
    }

    // Resources
    if (j.contains("memory_mb")) spec.memory_mb = j["memory_mb"].get<int>();
    if (j.contains("cpu")) spec.cpu = j["cpu"].get<double>();
    if (j.contains("cpu_kind")) spec.cpu_kind = j["cpu_kind"].get<std::string>();
    if (j.contains("pids_limit")) spec.pids_limit = j["pids_limit"].get<int>();

    // Fleet
    if (j.contains("app_name")) spec.app_name = j["app_name"].get<std::string>();
    if (j.contains("region")) spec.region = j["region"].get<std::string>();
    if (j.contains("api_token")) spec.api_token = j["api_token"].get<std::string>();
    if (j.contains("mounts")) spec.mounts = j["mounts"];
    if (j.contains("skip_launch")) spec.skip_launch = j["skip_launch"].get<bool>();
    if (j.contains("auto_destroy")) spec.auto_destroy = j["auto_destroy"].get<bool>();
    if (j.contains("create_app")) spec.create_app = j["create_app"].get<bool>();
    if (j.contains("org")) spec.org = j["org"].get<std::string>();
    if (j.contains("network")) spec.network = j["network"].get<std::string>();

    // Proxy
    if (j.contains("proxy") && !j["proxy"].is_null()) {
        auto& p = j["proxy"];
        spec.proxy.ip = p.at("ip").get<std::string>();
        if (p.contains("port")) spec.proxy.port = p["port"].get<int>();
        if (p.contains("network")) spec.proxy.network = p["network"].get<std::string>();
    }

    return spec;
}

json SandboxSpec::to_json() const {
    json j;
    j["image"] = image;
    if (!workdir.empty()) j["workdir"] = workdir;
    j["env"] = env;

    json port_list = json::array();
    for (const auto& p : ports) {
        if (p.host_port > 0) {
            port_list.push_back({{"host", p.host_port}, {"container", p.container_port}});
        } else {
            port_list.push_back(p.container_port);
        }
    }
    j["ports"] = port_list;

    if (memory_mb > 0) j["memory_mb"] = memory_mb;
    if (cpu > 0) j["cpu"] = cpu;
    if (!cpu_kind.empty()) j["cpu_kind"] = cpu_kind;
    if (pids_limit > 0) j["pids_limit"] = pids_limit;
    if (!app_name.empty()) j["app_name"] = app_name;
    if (!region.empty()) j["region"] = region;
    if (!mounts.empty()) j["mounts"] = mounts;
    j["skip_launch"] = skip_launch;
    j["auto_destroy"] = auto_destroy;
    if (create_app) {
        j["create_app"] = true;
        j["org"] = org;
    }
    if (!network.empty()) j["network"] = network;
    if (proxy.enabled()) {
        j["proxy"] = {{"ip", proxy.ip}, {"port", proxy.port}};
        if (!proxy.network.empty()) j["proxy"]["network"] = proxy.network;
    }
    // api_token is never serialized
    return j;
}

// ============================================================================
// SandboxAdapter defaults
// ============================================================================

namespace {

Error not_implemented(const SandboxAdapter& adapter, const char* op) {
    return Error(ErrorKind::NOT_IMPLEMENTED, std::string(adapter.name()) + " does not support " + op);
}

} // namespace

UrlResult SandboxAdapter::get_url(const std::string&, int) {
    return {false, "", not_implemented(*this, "get_url")};
}

OpResult SandboxAdapter::start(const std::string&) {
    return OpResult::fail(not_implemented(*this, "start"));
}

OpResult SandboxAdapter::stop(const std::string&) {
    return OpResult::fail(not_implemented(*this, "stop"));
}

OpResult SandboxAdapter::update(const std::string&, const SandboxSpec&) {
    return OpResult::fail(not_implemented(*this, "update"));
}

OpResult SandboxAdapter::await_ready(const std::string&, const json&, const ReadyOptions&) {
    return OpResult::fail(not_implemented(*this, "await_ready"));
}

OpResult SandboxAdapter::delete_volumes(const std::string&, const json&) {
    return OpResult::fail(not_implemented(*this, "delete_volumes"));
}

// ============================================================================
// File transfer
// ============================================================================

ReadResult SandboxAdapter::read_file(const std::string& sandbox_id, const std::string& path,
                                     const ExecOptions& opts) {
    return transfer_read(
        [this, &sandbox_id](const std::string& cmd, const ExecOptions& o) {
            return exec(sandbox_id, cmd, o);
        },
        path, opts);
}

OpResult SandboxAdapter::write_file(const std::string& sandbox_id, const std::string& path,
                                    const std::string& content, const ExecOptions& opts) {
    return transfer_write(
        [this, &sandbox_id](const std::string& cmd, const ExecOptions& o) {
            return exec(sandbox_id, cmd, o);
        },
        path, content, opts);
}

OpResult SandboxAdapter::write_files(const std::string& sandbox_id,
                                     const std::vector<std::pair<std::string, std::string>>& files,
                                     const ExecOptions& opts) {
    return transfer_write_many(
        [this, &sandbox_id](const std::string& cmd, const ExecOptions& o) {
            return exec(sandbox_id, cmd, o);
        },
        files, opts);
}

} // namespace sandpool::runtime
