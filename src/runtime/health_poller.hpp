#pragma once
#include <string>
#include "runtime/adapter.hpp"
#include "runtime/http_transport.hpp"

namespace sandpool::runtime {

// GET url until it answers HTTP 200 or timeout_ms elapses.
// On success the response body is returned in OpResult::body (as a string).
OpResult poll_health(HttpTransport& transport, const std::string& url,
                     int timeout_ms, int interval_ms);

} // namespace sandpool::runtime
