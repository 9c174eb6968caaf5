#include "runtime/docker_adapter.hpp"
#include "runtime/network_env.hpp"
#include "util/process.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace sandpool::runtime {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string format_cpus(double cpu) {
    std::ostringstream ss;
    ss << cpu;
    return ss.str();
}

} // namespace

DockerSettings DockerSettings::from_json(const json& j) {
    DockerSettings s;
    if (j.contains("docker_binary")) s.docker_binary = j["docker_binary"].get<std::string>();
    if (j.contains("default_image")) s.default_image = j["default_image"].get<std::string>();
    if (j.contains("default_workdir")) s.default_workdir = j["default_workdir"].get<std::string>();
    if (j.contains("proxy_network")) s.default_proxy_network = j["proxy_network"].get<std::string>();
    if (j.contains("command_timeout_ms")) s.command_timeout_ms = j["command_timeout_ms"].get<int>();
    return s;
}

DockerAdapter::DockerAdapter(DockerSettings settings)
    : settings_(std::move(settings)) {}

std::string DockerAdapter::generate_name() {
    return "sandpool-sandbox-" + util::random_hex(8);
}

// ============================================================================
// docker run arguments
// ============================================================================

bool DockerAdapter::build_run_args(const std::string& container_name, const SandboxSpec& spec,
                                   std::vector<std::string>& args, Error& error) const {
    std::string image = spec.image.empty() ? settings_.default_image : spec.image;
    std::string workdir = spec.workdir.empty() ? settings_.default_workdir : spec.workdir;

    args = {"run", "-d", "--name", container_name, "-w", workdir};

    // Resource limits
    if (spec.memory_mb > 0) {
        args.insert(args.end(), {"--memory", std::to_string(spec.memory_mb) + "m"});
    }
    if (spec.cpu > 0) {
        args.insert(args.end(), {"--cpus", format_cpus(spec.cpu)});
    }
    if (spec.pids_limit > 0) {
        args.insert(args.end(), {"--pids-limit", std::to_string(spec.pids_limit)});
    }

    // Security
    args.insert(args.end(), {"--cap-drop", "ALL", "--security-opt", "no-new-privileges"});

    // Network attachment: no interfaces but loopback, or the proxy network only
    if (spec.proxy.enabled()) {
        std::string network = spec.proxy.network.empty()
            ? settings_.default_proxy_network : spec.proxy.network;
        args.insert(args.end(), {"--network", network});
    } else {
        args.insert(args.end(), {"--network", "none"});
    }

    // Bind mounts
    if (spec.mounts.is_array()) {
        for (const auto& m : spec.mounts) {
            if (!m.is_object() || !m.contains("source") || !m.contains("path") ||
                !m["source"].is_string() || !m["path"].is_string()) {
                error = Error(ErrorKind::INVALID_MOUNT, m.dump());
                return false;
            }
            std::error_code ec;
            auto source = fs::absolute(m["source"].get<std::string>(), ec);
            std::string bind = (ec ? m["source"].get<std::string>() : source.string()) +
                               ":" + m["path"].get<std::string>();
            if (m.value("readonly", false)) bind += ":ro";
            args.insert(args.end(), {"-v", bind});
        }
    }

    // Ports
    for (const auto& p : spec.ports) {
        if (p.host_port > 0) {
            args.insert(args.end(), {"-p", std::to_string(p.host_port) + ":" +
                                           std::to_string(p.container_port)});
        } else {
            args.insert(args.end(), {"-p", std::to_string(p.container_port)});
        }
    }

    // Environment, network variables last so they cannot be overridden
    for (const auto& [key, value] : merge_network_env(spec.env, spec.proxy)) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }

    args.insert(args.end(), {image, "tail", "-f", "/dev/null"});
    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

CreateResult DockerAdapter::create(const SandboxSpec& spec) {
    CreateResult result;
    std::string container_name = generate_name();

    std::vector<std::string> args;
    if (!build_run_args(container_name, spec, args, result.error)) {
        spdlog::error("Invalid mount for container {}: {}", container_name, result.error.message);
        return result;
    }
    args.insert(args.begin(), settings_.docker_binary);

    spdlog::info("Creating container {} from {}", container_name,
                 spec.image.empty() ? settings_.default_image : spec.image);

    util::ProcessOptions opts;
    opts.timeout_ms = settings_.command_timeout_ms;
    auto proc = util::run_process(args, opts);
    if (!proc.ok()) {
        std::string msg = !proc.stderr_data.empty() ? trim(proc.stderr_data)
                        : !proc.error.empty() ? proc.error : trim(proc.stdout_data);
        spdlog::error("docker run failed for {}: {}", container_name, msg);
        result.error = proc.timed_out ? Error(ErrorKind::TIMEOUT, "docker run")
                                      : Error(ErrorKind::PROVIDER_ERROR, msg, proc.exit_code);
        return result;
    }

    result.success = true;
    result.sandbox_id = container_name;
    result.metadata = {{"container_id", trim(proc.stdout_data)},
                       {"network_mode", spec.proxy.enabled() ? "proxy_only" : "none"}};
    return result;
}

ExecResponse DockerAdapter::exec(const std::string& sandbox_id, const std::string& command,
                                 const ExecOptions& opts) {
    ExecResponse response;

    std::vector<std::string> args = {settings_.docker_binary, "exec"};
    if (!opts.workdir.empty()) {
        args.insert(args.end(), {"-w", opts.workdir});
    }
    args.insert(args.end(), {sandbox_id, "sh", "-c", command});

    util::ProcessOptions popts;
    popts.timeout_ms = opts.timeout_ms;
    auto proc = util::run_process(args, popts);

    if (!proc.started) {
        response.error = Error(ErrorKind::PROVIDER_ERROR, proc.error);
        return response;
    }
    if (proc.timed_out) {
        // The command may still be running inside the container
        spdlog::warn("exec in {} timed out after {}ms", sandbox_id, opts.timeout_ms);
        response.error = Error(ErrorKind::TIMEOUT, "exec in " + sandbox_id);
        return response;
    }

    response.success = true;
    response.result.exit_code = proc.exit_code;
    response.result.stdout_data = std::move(proc.stdout_data);
    response.result.stderr_data = std::move(proc.stderr_data);
    return response;
}

OpResult DockerAdapter::run_simple(const std::vector<std::string>& args, const std::string& what) {
    std::vector<std::string> argv = {settings_.docker_binary};
    argv.insert(argv.end(), args.begin(), args.end());

    util::ProcessOptions opts;
    opts.timeout_ms = settings_.command_timeout_ms;
    auto proc = util::run_process(argv, opts);
    if (proc.timed_out) {
        return OpResult::fail(Error(ErrorKind::TIMEOUT, what));
    }
    if (!proc.ok()) {
        std::string msg = proc.stderr_data.empty() ? proc.error : trim(proc.stderr_data);
        spdlog::debug("{} failed: {}", what, msg);
        return OpResult::fail(Error(ErrorKind::PROVIDER_ERROR, msg, proc.exit_code));
    }
    return OpResult::ok(trim(proc.stdout_data));
}

OpResult DockerAdapter::terminate(const std::string& sandbox_id) {
    spdlog::info("Removing container {}", sandbox_id);
    auto result = run_simple({"rm", "-f", sandbox_id}, "docker rm " + sandbox_id);
    if (!result.success && result.error.message.find("No such container") != std::string::npos) {
        return OpResult::ok();
    }
    return result;
}

StatusResult DockerAdapter::status(const std::string& sandbox_id) {
    StatusResult result;
    auto inspect = run_simple({"inspect", "-f", "{{.State.Status}}", sandbox_id},
                              "docker inspect " + sandbox_id);
    result.success = true;
    if (!inspect.success) {
        result.status = inspect.error.message.find("No such") != std::string::npos
            ? SandboxStatus::TERMINATED : SandboxStatus::UNKNOWN;
        return result;
    }

    std::string state = inspect.body.get<std::string>();
    if (state == "running") {
        result.status = SandboxStatus::RUNNING;
    } else if (state == "exited" || state == "paused" || state == "created") {
        result.status = SandboxStatus::STOPPED;
    } else if (state == "dead" || state == "removing") {
        result.status = SandboxStatus::TERMINATED;
    } else {
        result.status = SandboxStatus::UNKNOWN;
    }
    return result;
}

UrlResult DockerAdapter::get_url(const std::string& sandbox_id, int port) {
    return {true, "http://" + sandbox_id + ":" + std::to_string(port), {}};
}

OpResult DockerAdapter::start(const std::string& sandbox_id) {
    return run_simple({"start", sandbox_id}, "docker start " + sandbox_id);
}

OpResult DockerAdapter::stop(const std::string& sandbox_id) {
    return run_simple({"stop", sandbox_id}, "docker stop " + sandbox_id);
}

OpResult DockerAdapter::await_ready(const std::string& sandbox_id, const json&,
                                    const ReadyOptions& opts) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.timeout_ms);
    while (true) {
        auto st = status(sandbox_id);
        if (st.status == SandboxStatus::RUNNING) {
            return OpResult::ok();
        }
        if (st.status == SandboxStatus::TERMINATED) {
            return OpResult::fail(Error(ErrorKind::NOT_FOUND, sandbox_id));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return OpResult::fail(Error(ErrorKind::TIMEOUT, "container " + sandbox_id + " not running"));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(
            std::min(opts.interval_ms, 500)));
    }
}

} // namespace sandpool::runtime
