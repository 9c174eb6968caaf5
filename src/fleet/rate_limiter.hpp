/**
 * Token bucket rate limiter
 *
 * Guards metered control-plane APIs. Each operation class has its own
 * bucket (burst capacity + refill interval) and waiter queue, so
 * exhausting one class never blocks the other. A dedicated worker thread
 * performs refills; a refill hands its token straight to the oldest
 * waiter when there is one.
 */
#pragma once
#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>

namespace sandpool::fleet {

enum class OperationClass {
    MUTATION,   // create, start, stop, delete
    READ        // GET
};

const char* operation_class_to_string(OperationClass cls);

struct BucketConfig {
    int burst = 1;
    int refill_interval_ms = 1000;  // One token per interval
};

struct RateLimiterConfig {
    BucketConfig mutation{3, 1000};
    BucketConfig read{10, 200};

    static RateLimiterConfig from_json(const nlohmann::json& j);
};

class RateLimiter {
public:
    explicit RateLimiter(const RateLimiterConfig& config = {});
    ~RateLimiter();

    // Non-copyable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Block until a token of this class is available, then consume it.
    // Returns false if the limiter was stopped while waiting.
    bool acquire(OperationClass cls);

    // Consume a token only if one is available right now
    bool try_acquire(OperationClass cls);

    int available(OperationClass cls) const;
    size_t waiting(OperationClass cls) const;
    const RateLimiterConfig& config() const { return config_; }

    // Wake all waiters (they fail) and join the worker. Idempotent.
    void stop();
    bool stopped() const;

    // Process-wide limiter, started on first use
    static std::shared_ptr<RateLimiter> ensure_started(const RateLimiterConfig& config = {});
    static std::shared_ptr<RateLimiter> shared();
    static void stop_shared();

private:
    using Clock = std::chrono::steady_clock;

    struct Waiter {
        bool granted = false;
    };

    struct Bucket {
        BucketConfig config;
        int tokens = 0;
        std::deque<std::shared_ptr<Waiter>> waiters;
        std::optional<Clock::time_point> next_refill;
    };

    Bucket& bucket(OperationClass cls) { return buckets_[static_cast<size_t>(cls)]; }
    const Bucket& bucket(OperationClass cls) const { return buckets_[static_cast<size_t>(cls)]; }

    void maybe_schedule_refill(Bucket& b);
    void refill(Bucket& b);
    void worker_loop();

    RateLimiterConfig config_;
    std::array<Bucket, 2> buckets_;

    mutable std::mutex mutex_;
    std::condition_variable worker_cv_;
    std::condition_variable waiters_cv_;
    bool stopped_ = false;
    std::mutex join_mutex_;     // Serializes the join across concurrent stop() calls
    std::thread worker_;
};

} // namespace sandpool::fleet
