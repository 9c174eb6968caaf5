/**
 * HTTP transport
 *
 * Minimal request/response seam used by the fleet client and the health
 * poller. CurlTransport drives the curl binary; tests substitute a mock.
 */
#pragma once
#include <map>
#include <string>
#include "runtime/errors.hpp"

namespace sandpool::runtime {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;              // Sent only when non-empty
    int timeout_ms = 120000;
};

struct HttpResponse {
    bool success = false;          // A response was received (any status)
    int status = 0;
    std::string body;
    Error error;                   // TIMEOUT or TRANSPORT_ERROR when !success
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string curl_binary = "curl");

    HttpResponse perform(const HttpRequest& request) override;

    // curl config text fed on stdin (-K -), so headers such as the
    // Authorization token never show up in the process list
    static std::string build_config(const HttpRequest& request);

private:
    std::string curl_binary_;
};

} // namespace sandpool::runtime
