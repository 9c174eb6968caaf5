#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include "fleet/fleet_adapter.hpp"
#include "fleet/rate_limiter.hpp"
#include "pool/runner.hpp"
#include "pool/store.hpp"
#include "pool/warm_pool.hpp"
#include "runtime/docker_adapter.hpp"
#include "runtime/http_transport.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <memory>
#include <thread>

using json = nlohmann::json;
using namespace sandpool;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

bool load_config(const std::string& path, json& out) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open config file {}", path);
        return false;
    }
    try {
        out = json::parse(in);
    } catch (const json::parse_error& e) {
        spdlog::error("Invalid JSON in {}: {}", path, e.what());
        return false;
    }
    return true;
}

std::shared_ptr<runtime::SandboxAdapter> make_adapter(const json& cfg) {
    std::string kind = cfg.value("kind", "docker");
    if (kind == "docker") {
        return std::make_shared<runtime::DockerAdapter>(runtime::DockerSettings::from_json(cfg));
    }
    if (kind == "fleet") {
        auto limiter = fleet::RateLimiter::shared();
        return std::make_shared<fleet::FleetAdapter>(fleet::FleetSettings::from_json(cfg),
                                                     std::make_shared<runtime::CurlTransport>(),
                                                     limiter);
    }
    spdlog::error("Unknown adapter kind: {}", kind);
    return nullptr;
}

void print_summary(const pool::WarmPool& warm_pool, const std::string& adapter,
                   const std::string& store) {
    fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold, "\n  sandpoold\n");
    fmt::print("  adapter     {}\n", fmt::format(fg(fmt::color::green), "{}", adapter));
    fmt::print("  store       {}\n", fmt::format(fg(fmt::color::yellow), "{}", store));
    fmt::print("  partitions  {}\n", fmt::join(warm_pool.partitions(), ", "));
    fmt::print("  target      {} per partition\n\n", warm_pool.config().target_per_partition);
}

} // namespace

int main(int argc, char** argv) {
    util::load_dotenv();
    util::init_logger();

    std::string level = util::get_env("SANDPOOL_LOG_LEVEL");
    util::set_log_level(util::parse_log_level(level.empty() ? "info" : level));

    std::string config_path = argc > 1 ? argv[1] : util::get_env("SANDPOOL_CONFIG");
    json config = json::object();
    if (!config_path.empty() && !load_config(config_path, config)) {
        return 1;
    }

    pool::PoolConfig pool_config;
    pool::RunnerConfig runner_config;
    pool::StoreConfig store_config;
    std::shared_ptr<runtime::SandboxAdapter> adapter;
    try {
        pool_config = pool::PoolConfig::from_json(config);
        runner_config = pool::RunnerConfig::from_json(config.value("runner", json::object()));
        store_config = pool::StoreConfig::from_json(config.value("store", json::object()));
        if (store_config.partitions.empty()) {
            store_config.partitions = pool_config.partitions;
        }
        if (config.contains("rate_limits")) {
            fleet::RateLimiter::ensure_started(
                fleet::RateLimiterConfig::from_json(config["rate_limits"]));
        }
        adapter = make_adapter(config.value("adapter", json::object()));
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }
    if (!adapter) return 1;

    std::shared_ptr<pool::Store> store = pool::make_store(store_config);
    if (!store) return 1;

    auto warm_pool = std::make_shared<pool::WarmPool>(pool_config, adapter, store);
    print_summary(*warm_pool, adapter->name(), store->name());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!warm_pool->start()) {
        spdlog::error("Failed to start pool");
        return 1;
    }

    // sandpoold <config> <command...>: run once through the pool and exit
    if (argc > 2) {
        std::string command;
        for (int i = 2; i < argc; i++) {
            if (i > 2) command += " ";
            command += argv[i];
        }
        pool::Runner runner(runner_config, warm_pool, adapter);
        pool::RunOptions opts;
        opts.session = util::get_env("SANDPOOL_SESSION");
        auto response = runner.run(command, opts);

        int status = 1;
        if (response.success) {
            fmt::print("{}", response.result.stdout_data);
            fmt::print(stderr, "{}", response.result.stderr_data);
            status = response.result.exit_code;
        } else {
            spdlog::error("Run failed: {}", response.error.to_string());
        }
        warm_pool->stop();
        store->stop();
        fleet::RateLimiter::stop_shared();
        return status;
    }

    auto interval = std::chrono::milliseconds(pool_config.replenish_interval_ms);
    auto next_report = std::chrono::steady_clock::now() + interval;
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_report) {
            spdlog::info("Pool status: {}", warm_pool->status().to_json().dump());
            next_report += interval;
        }
    }

    spdlog::info("Shutting down...");
    warm_pool->stop();
    store->stop();
    fleet::RateLimiter::stop_shared();
    return 0;
}
