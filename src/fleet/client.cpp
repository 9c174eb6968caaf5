#include "fleet/client.hpp"
#include <spdlog/spdlog.h>

namespace sandpool::fleet {

FleetClient::FleetClient(std::shared_ptr<runtime::HttpTransport> transport,
                         std::shared_ptr<RateLimiter> limiter,
                         std::string base_url)
    : transport_(std::move(transport)),
      limiter_(std::move(limiter)),
      base_url_(std::move(base_url)) {}

std::string FleetClient::extract_error(const json& body) {
    if (body.is_object()) {
        if (body.contains("error")) {
            const auto& err = body["error"];
            if (err.is_string()) return err.get<std::string>();
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
        }
        if (body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    }
    if (body.is_string()) return body.get<std::string>();
    return body.dump();
}

// ============================================================================
// Requests
// ============================================================================

ApiResult FleetClient::get(const std::string& path, const std::string& api_token) {
    return request("GET", path, nullptr, api_token);
}

ApiResult FleetClient::post(const std::string& path, const json& body, const std::string& api_token) {
    return request("POST", path, &body, api_token);
}

ApiResult FleetClient::del(const std::string& path, const std::string& api_token) {
    return request("DELETE", path, nullptr, api_token);
}

ApiResult FleetClient::request(const std::string& method, const std::string& path,
                               const json* body, const std::string& api_token) {
    ApiResult result;
    OperationClass cls = method == "GET" ? OperationClass::READ : OperationClass::MUTATION;

    runtime::HttpRequest req;
    req.method = method;
    req.url = base_url_ + path;
    req.headers["Authorization"] = "Bearer " + api_token;
    req.headers["Content-Type"] = "application/json";
    req.timeout_ms = request_timeout_ms_;
    if (body) req.body = body->dump();

    for (int attempt = 0; ; attempt++) {
        // Retries go back through the limiter, which throttles them
        if (limiter_ && !limiter_->acquire(cls)) {
            result.error = Error(ErrorKind::STOPPED, "rate limiter stopped");
            return result;
        }

        runtime::HttpResponse resp = transport_->perform(req);
        if (!resp.success) {
            spdlog::warn("{} {} failed: {}", method, path, resp.error.to_string());
            result.error = resp.error;
            return result;
        }

        json parsed;
        if (resp.body.empty()) {
            parsed = json::object();
        } else {
            try {
                parsed = json::parse(resp.body);
            } catch (const json::parse_error&) {
                parsed = resp.body;
            }
        }

        if (resp.status >= 200 && resp.status < 300) {
            result.success = true;
            result.body = std::move(parsed);
            return result;
        }
        if (resp.status == 404) {
            result.error = Error(ErrorKind::NOT_FOUND, path, 404);
            return result;
        }
        if (resp.status == 429) {
            if (attempt < max_retries_) {
                spdlog::debug("{} {} rate limited, retry {}/{}", method, path, attempt + 1, max_retries_);
                continue;
            }
            result.error = Error(ErrorKind::RATE_LIMITED, path, 429);
            return result;
        }

        result.error = Error(ErrorKind::API_ERROR, extract_error(parsed), resp.status);
        spdlog::warn("{} {} returned {}: {}", method, path, resp.status, result.error.message);
        return result;
    }
}

// ============================================================================
// Volumes
// ============================================================================

ApiResult FleetClient::create_volume(const std::string& app, const std::string& name, int size_gb,
                                     const std::string& region, const std::string& api_token) {
    json body = {{"name", name}, {"size_gb", size_gb}};
    if (!region.empty()) body["region"] = region;
    return post("/apps/" + app + "/volumes", body, api_token);
}

ApiResult FleetClient::delete_volume(const std::string& app, const std::string& volume_id,
                                     const std::string& api_token) {
    auto result = del("/apps/" + app + "/volumes/" + volume_id, api_token);
    if (result.not_found()) {
        return {true, json::object(), {}};
    }
    return result;
}

ApiResult FleetClient::list_volumes(const std::string& app, const std::string& api_token) {
    return get("/apps/" + app + "/volumes", api_token);
}

ApiResult FleetClient::get_volume(const std::string& app, const std::string& volume_id,
                                  const std::string& api_token) {
    return get("/apps/" + app + "/volumes/" + volume_id, api_token);
}

// ============================================================================
// Machines and apps
// ============================================================================

ApiResult FleetClient::get_machine(const std::string& app, const std::string& machine_id,
                                   const std::string& api_token) {
    return get("/apps/" + app + "/machines/" + machine_id, api_token);
}

ApiResult FleetClient::list_machines(const std::string& app, const std::string& api_token) {
    return get("/apps/" + app + "/machines", api_token);
}

ApiResult FleetClient::create_app(const std::string& app, const std::string& org,
                                  const std::string& network, const std::string& api_token) {
    json body = {{"app_name", app}, {"org_slug", org}};
    if (!network.empty()) body["network"] = network;
    return post("/apps", body, api_token);
}

ApiResult FleetClient::get_app(const std::string& app, const std::string& api_token) {
    return get("/apps/" + app, api_token);
}

ApiResult FleetClient::delete_app(const std::string& app, const std::string& api_token) {
    auto result = del("/apps/" + app, api_token);
    if (result.not_found()) {
        return {true, json::object(), {}};
    }
    return result;
}

} // namespace sandpool::fleet
