/**
 * Local container adapter
 *
 * Runs sandboxes as containers through the docker CLI. Containers drop
 * all capabilities and are attached either to no network at all or to a
 * network whose only route out is the designated proxy.
 */
#pragma once
#include <string>
#include <vector>
#include "runtime/adapter.hpp"

namespace sandpool::runtime {

struct DockerSettings {
    std::string docker_binary = "docker";
    std::string default_image = "ubuntu:22.04";
    std::string default_workdir = "/workspace";
    std::string default_proxy_network = "sandpool-proxy";
    int command_timeout_ms = 120000;   // run / rm / inspect / start / stop

    static DockerSettings from_json(const json& j);
};

class DockerAdapter : public SandboxAdapter {
public:
    explicit DockerAdapter(DockerSettings settings = {});

    // Non-copyable
    DockerAdapter(const DockerAdapter&) = delete;
    DockerAdapter& operator=(const DockerAdapter&) = delete;

    const char* name() const override { return "docker"; }

    CreateResult create(const SandboxSpec& spec) override;
    ExecResponse exec(const std::string& sandbox_id, const std::string& command,
                      const ExecOptions& opts = {}) override;
    OpResult terminate(const std::string& sandbox_id) override;
    StatusResult status(const std::string& sandbox_id) override;

    UrlResult get_url(const std::string& sandbox_id, int port) override;
    OpResult start(const std::string& sandbox_id) override;
    OpResult stop(const std::string& sandbox_id) override;
    OpResult await_ready(const std::string& sandbox_id, const json& metadata,
                         const ReadyOptions& opts) override;

    // Arguments after "docker" for `docker run`. Fails with INVALID_MOUNT
    // when a mount entry lacks source or path.
    bool build_run_args(const std::string& container_name, const SandboxSpec& spec,
                        std::vector<std::string>& args, Error& error) const;

    static std::string generate_name();

private:
    OpResult run_simple(const std::vector<std::string>& args, const std::string& what);

    DockerSettings settings_;
};

} // namespace sandpool::runtime
