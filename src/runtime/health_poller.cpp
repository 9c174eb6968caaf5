#include "runtime/health_poller.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace sandpool::runtime {

OpResult poll_health(HttpTransport& transport, const std::string& url,
                     int timeout_ms, int interval_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    int attempts = 0;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (remaining <= 0) break;

        HttpRequest req;
        req.url = url;
        req.timeout_ms = static_cast<int>(std::min<int64_t>(remaining, 10000));
        attempts++;

        HttpResponse resp = transport.perform(req);
        if (resp.success && resp.status == 200) {
            spdlog::debug("Health check {} ready after {} attempt(s)", url, attempts);
            return OpResult::ok(resp.body);
        }

        remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (remaining <= 0) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(
            std::min<int64_t>(interval_ms, remaining)));
    }

    spdlog::warn("Health check {} timed out after {}ms ({} attempts)", url, timeout_ms, attempts);
    return OpResult::fail(Error(ErrorKind::TIMEOUT, "health check " + url));
}

} // namespace sandpool::runtime
