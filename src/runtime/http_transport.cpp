#include "runtime/http_transport.hpp"
#include "util/process.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace sandpool::runtime {

namespace {

constexpr int kCurlTimeoutExit = 28;
constexpr const char* kStatusMarker = "\n__SANDPOOL_HTTP_STATUS__:";

// Quote a value for a curl config file
std::string config_quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += "\"";
    return out;
}

} // namespace

CurlTransport::CurlTransport(std::string curl_binary)
    : curl_binary_(std::move(curl_binary)) {}

std::string CurlTransport::build_config(const HttpRequest& request) {
    std::string cfg;
    cfg += "silent\n";
    cfg += "show-error\n";
    cfg += "request = " + config_quote(request.method) + "\n";
    cfg += "url = " + config_quote(request.url) + "\n";
    for (const auto& [key, value] : request.headers) {
        cfg += "header = " + config_quote(key + ": " + value) + "\n";
    }
    if (!request.body.empty()) {
        cfg += "data-raw = " + config_quote(request.body) + "\n";
    }
    if (request.timeout_ms > 0) {
        cfg += "max-time = " + std::to_string(std::max(1, request.timeout_ms / 1000)) + "\n";
    }
    cfg += "write-out = " + config_quote(std::string(kStatusMarker) + "%{http_code}") + "\n";
    return cfg;
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    util::ProcessOptions opts;
    opts.stdin_data = build_config(request);
    // curl enforces max-time itself; this only guards against a wedged child
    if (request.timeout_ms > 0) {
        opts.timeout_ms = request.timeout_ms + 5000;
    }

    auto proc = util::run_process({curl_binary_, "-K", "-"}, opts);
    if (!proc.started) {
        response.error = Error(ErrorKind::TRANSPORT_ERROR, proc.error);
        return response;
    }
    if (proc.timed_out || proc.exit_code == kCurlTimeoutExit) {
        response.error = Error(ErrorKind::TIMEOUT, request.method + " " + request.url);
        return response;
    }
    if (proc.exit_code != 0) {
        std::string msg = proc.stderr_data.empty() ? proc.error : proc.stderr_data;
        spdlog::debug("curl {} {} exited with {}: {}", request.method, request.url,
                      proc.exit_code, msg);
        response.error = Error(ErrorKind::TRANSPORT_ERROR, msg, proc.exit_code);
        return response;
    }

    auto pos = proc.stdout_data.rfind(kStatusMarker);
    if (pos == std::string::npos) {
        response.error = Error(ErrorKind::TRANSPORT_ERROR, "missing status in curl output");
        return response;
    }

    try {
        response.status = std::stoi(proc.stdout_data.substr(pos + std::string(kStatusMarker).size()));
    } catch (const std::exception&) {
        response.error = Error(ErrorKind::TRANSPORT_ERROR, "unparseable status in curl output");
        return response;
    }

    response.body = proc.stdout_data.substr(0, pos);
    response.success = response.status > 0;
    if (!response.success) {
        response.error = Error(ErrorKind::TRANSPORT_ERROR, "no HTTP status received");
    }
    return response;
}

} // namespace sandpool::runtime
