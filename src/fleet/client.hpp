/**
 * Fleet Machines API client
 *
 * Thin REST client over an HttpTransport. Every call takes a token from
 * the rate limiter first: GET uses the read class, POST/DELETE the
 * mutation class.
 */
#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "fleet/rate_limiter.hpp"
#include "runtime/errors.hpp"
#include "runtime/http_transport.hpp"

namespace sandpool::fleet {

using json = nlohmann::json;
using runtime::Error;
using runtime::ErrorKind;

constexpr const char* kDefaultBaseUrl = "https://api.machines.dev/v1";

struct ApiResult {
    bool success = false;
    json body;          // Parsed response (string if not JSON)
    Error error;

    bool not_found() const { return !success && error.kind == ErrorKind::NOT_FOUND; }
};

class FleetClient {
public:
    FleetClient(std::shared_ptr<runtime::HttpTransport> transport,
                std::shared_ptr<RateLimiter> limiter,
                std::string base_url = kDefaultBaseUrl);

    ApiResult get(const std::string& path, const std::string& api_token);
    ApiResult post(const std::string& path, const json& body, const std::string& api_token);
    ApiResult del(const std::string& path, const std::string& api_token);

    // Volumes
    ApiResult create_volume(const std::string& app, const std::string& name, int size_gb,
                            const std::string& region, const std::string& api_token);
    ApiResult delete_volume(const std::string& app, const std::string& volume_id,
                            const std::string& api_token);  // 404 counts as success
    ApiResult list_volumes(const std::string& app, const std::string& api_token);
    ApiResult get_volume(const std::string& app, const std::string& volume_id,
                         const std::string& api_token);

    // Machines
    ApiResult get_machine(const std::string& app, const std::string& machine_id,
                          const std::string& api_token);
    ApiResult list_machines(const std::string& app, const std::string& api_token);

    // Apps
    ApiResult create_app(const std::string& app, const std::string& org,
                         const std::string& network, const std::string& api_token);
    ApiResult get_app(const std::string& app, const std::string& api_token);
    ApiResult delete_app(const std::string& app, const std::string& api_token);  // 404 counts as success

    const std::string& base_url() const { return base_url_; }

    static std::string extract_error(const json& body);

private:
    ApiResult request(const std::string& method, const std::string& path,
                      const json* body, const std::string& api_token);

    std::shared_ptr<runtime::HttpTransport> transport_;
    std::shared_ptr<RateLimiter> limiter_;
    std::string base_url_;
    int max_retries_ = 3;
    int request_timeout_ms_ = 120000;
};

} // namespace sandpool::fleet
