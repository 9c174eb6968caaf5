#include "fleet/rate_limiter.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandpool::fleet {

const char* operation_class_to_string(OperationClass cls) {
    switch (cls) {
        case OperationClass::MUTATION: return "mutation";
        case OperationClass::READ: return "read";
    }
    return "unknown";
}

namespace {

BucketConfig bucket_from_json(const nlohmann::json& j, BucketConfig defaults) {
    if (j.contains("burst")) defaults.burst = j["burst"].get<int>();
    if (j.contains("refill_ms")) defaults.refill_interval_ms = j["refill_ms"].get<int>();
    defaults.burst = std::max(1, defaults.burst);
    defaults.refill_interval_ms = std::max(1, defaults.refill_interval_ms);
    return defaults;
}

struct SharedRegistry {
    std::mutex mutex;
    std::shared_ptr<RateLimiter> limiter;
};

SharedRegistry& registry() {
    static SharedRegistry instance;
    return instance;
}

} // namespace

RateLimiterConfig RateLimiterConfig::from_json(const nlohmann::json& j) {
    RateLimiterConfig config;
    if (j.contains("mutation")) config.mutation = bucket_from_json(j["mutation"], config.mutation);
    if (j.contains("read")) config.read = bucket_from_json(j["read"], config.read);
    return config;
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter(const RateLimiterConfig& config)
    : config_(config) {
    bucket(OperationClass::MUTATION).config = config_.mutation;
    bucket(OperationClass::MUTATION).tokens = config_.mutation.burst;
    bucket(OperationClass::READ).config = config_.read;
    bucket(OperationClass::READ).tokens = config_.read.burst;

    worker_ = std::thread(&RateLimiter::worker_loop, this);
    spdlog::debug("Rate limiter started (mutation {}/{}ms, read {}/{}ms)",
                  config_.mutation.burst, config_.mutation.refill_interval_ms,
                  config_.read.burst, config_.read.refill_interval_ms);
}

RateLimiter::~RateLimiter() {
    stop();
}

bool RateLimiter::acquire(OperationClass cls) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_) return false;

    Bucket& b = bucket(cls);
    if (b.tokens > 0) {
        b.tokens--;
        maybe_schedule_refill(b);
        return true;
    }

    auto waiter = std::make_shared<Waiter>();
    b.waiters.push_back(waiter);
    maybe_schedule_refill(b);

    waiters_cv_.wait(lock, [&] { return waiter->granted || stopped_; });
    return waiter->granted;
}

bool RateLimiter::try_acquire(OperationClass cls) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return false;

    Bucket& b = bucket(cls);
    if (b.tokens <= 0) return false;
    b.tokens--;
    maybe_schedule_refill(b);
    return true;
}

int RateLimiter::available(OperationClass cls) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket(cls).tokens;
}

size_t RateLimiter::waiting(OperationClass cls) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket(cls).waiters.size();
}

bool RateLimiter::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

void RateLimiter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (auto& b : buckets_) {
            b.waiters.clear();
            b.next_refill.reset();
        }
    }
    worker_cv_.notify_all();
    waiters_cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

// Caller holds mutex_
void RateLimiter::maybe_schedule_refill(Bucket& b) {
    bool needs_refill = b.tokens < b.config.burst || !b.waiters.empty();
    if (needs_refill && !b.next_refill) {
        b.next_refill = Clock::now() + std::chrono::milliseconds(b.config.refill_interval_ms);
        worker_cv_.notify_one();
    }
}

// Caller holds mutex_
void RateLimiter::refill(Bucket& b) {
    b.next_refill.reset();

    if (!b.waiters.empty()) {
        // Token goes directly to the oldest waiter
        b.waiters.front()->granted = true;
        b.waiters.pop_front();
        waiters_cv_.notify_all();
    } else {
        b.tokens = std::min(b.tokens + 1, b.config.burst);
    }

    maybe_schedule_refill(b);
}

void RateLimiter::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        std::optional<Clock::time_point> earliest;
        for (const auto& b : buckets_) {
            if (b.next_refill && (!earliest || *b.next_refill < *earliest)) {
                earliest = b.next_refill;
            }
        }

        if (!earliest) {
            worker_cv_.wait(lock);
            continue;
        }

        if (worker_cv_.wait_until(lock, *earliest) == std::cv_status::no_timeout) {
            continue;  // Schedule may have changed
        }

        auto now = Clock::now();
        for (auto& b : buckets_) {
            if (b.next_refill && *b.next_refill <= now) {
                refill(b);
            }
        }
    }
}

// ============================================================================
// Process-wide instance
// ============================================================================

std::shared_ptr<RateLimiter> RateLimiter::ensure_started(const RateLimiterConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (!reg.limiter || reg.limiter->stopped()) {
        reg.limiter = std::make_shared<RateLimiter>(config);
    }
    return reg.limiter;
}

std::shared_ptr<RateLimiter> RateLimiter::shared() {
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        if (reg.limiter && !reg.limiter->stopped()) return reg.limiter;
    }
    return ensure_started();
}

void RateLimiter::stop_shared() {
    std::shared_ptr<RateLimiter> limiter;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        limiter.swap(reg.limiter);
    }
    if (limiter) {
        limiter->stop();
    }
}

} // namespace sandpool::fleet
