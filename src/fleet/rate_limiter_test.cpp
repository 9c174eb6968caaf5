#include "fleet/rate_limiter.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using namespace sandpool::fleet;  // NOLINT
using Clock = std::chrono::steady_clock;

int64_t elapsed_ms(Clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

RateLimiterConfig config(int mutation_burst, int mutation_ms, int read_burst, int read_ms) {
  RateLimiterConfig c;
  c.mutation = {mutation_burst, mutation_ms};
  c.read = {read_burst, read_ms};
  return c;
}

/*
 * Buckets
 */

// NOLINTNEXTLINE
TEST(RateLimiter, BurstThenThrottle) {
  RateLimiter limiter(config(3, 1000, 10, 200));
  auto start = Clock::now();
  for (int i = 0; i < 3; i++) {
    EXPECT_TRUE(limiter.acquire(OperationClass::MUTATION));
  }
  EXPECT_LT(elapsed_ms(start), 100);
  EXPECT_EQ(limiter.available(OperationClass::MUTATION), 0);

  EXPECT_TRUE(limiter.acquire(OperationClass::MUTATION));
  EXPECT_GE(elapsed_ms(start), 900);
}

// NOLINTNEXTLINE
TEST(RateLimiter, TryAcquireNeverBlocks) {
  RateLimiter limiter(config(1, 5000, 1, 5000));
  EXPECT_TRUE(limiter.try_acquire(OperationClass::READ));
  auto start = Clock::now();
  EXPECT_FALSE(limiter.try_acquire(OperationClass::READ));
  EXPECT_LT(elapsed_ms(start), 100);
}

// NOLINTNEXTLINE
TEST(RateLimiter, ClassesAreIndependent) {
  RateLimiter limiter(config(1, 5000, 2, 5000));
  EXPECT_TRUE(limiter.try_acquire(OperationClass::MUTATION));
  EXPECT_FALSE(limiter.try_acquire(OperationClass::MUTATION));

  auto start = Clock::now();
  EXPECT_TRUE(limiter.acquire(OperationClass::READ));
  EXPECT_TRUE(limiter.acquire(OperationClass::READ));
  EXPECT_LT(elapsed_ms(start), 100);
}

// NOLINTNEXTLINE
TEST(RateLimiter, RefillCapsAtBurst) {
  RateLimiter limiter(config(2, 50, 1, 1000));
  EXPECT_TRUE(limiter.try_acquire(OperationClass::MUTATION));
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  EXPECT_EQ(limiter.available(OperationClass::MUTATION), 2);
}

// NOLINTNEXTLINE
TEST(RateLimiter, WaitersAreAllServed) {
  RateLimiter limiter(config(1, 100, 1, 1000));
  ASSERT_TRUE(limiter.try_acquire(OperationClass::MUTATION));

  std::atomic<int> granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; i++) {
    threads.emplace_back([&] {
      if (limiter.acquire(OperationClass::MUTATION)) granted++;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(granted.load(), 3);
  EXPECT_EQ(limiter.waiting(OperationClass::MUTATION), 0u);
}

/*
 * Stop
 */

// NOLINTNEXTLINE
TEST(RateLimiter, StopWakesWaiters) {
  RateLimiter limiter(config(1, 60000, 1, 60000));
  ASSERT_TRUE(limiter.try_acquire(OperationClass::MUTATION));

  std::atomic<bool> result{true};
  std::thread waiter([&] { result = limiter.acquire(OperationClass::MUTATION); });
  while (limiter.waiting(OperationClass::MUTATION) == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  limiter.stop();
  waiter.join();
  EXPECT_FALSE(result.load());
  EXPECT_TRUE(limiter.stopped());
  EXPECT_FALSE(limiter.acquire(OperationClass::READ));

  limiter.stop();
  EXPECT_TRUE(limiter.stopped());
}

// NOLINTNEXTLINE
TEST(RateLimiter, ConcurrentStopsJoinOnce) {
  for (int round = 0; round < 20; round++) {
    RateLimiter limiter(config(1, 60000, 1, 60000));
    std::vector<std::thread> stoppers;
    for (int t = 0; t < 8; t++) {
      stoppers.emplace_back([&] {
        limiter.stop();
        EXPECT_TRUE(limiter.stopped());
      });
    }
    for (auto& t : stoppers) t.join();
    EXPECT_FALSE(limiter.try_acquire(OperationClass::READ));
  }
}

// NOLINTNEXTLINE
TEST(RateLimiter, SharedInstanceIsIdempotent) {
  RateLimiter::stop_shared();
  auto first = RateLimiter::ensure_started();
  auto second = RateLimiter::ensure_started(config(1, 1, 1, 1));
  EXPECT_EQ(first, second);
  EXPECT_EQ(RateLimiter::shared(), first);
  EXPECT_EQ(first->config().mutation.burst, 3);

  RateLimiter::stop_shared();
  EXPECT_TRUE(first->stopped());
  RateLimiter::stop_shared();

  auto restarted = RateLimiter::ensure_started();
  EXPECT_NE(restarted, first);
  EXPECT_FALSE(restarted->stopped());
  RateLimiter::stop_shared();
}

// NOLINTNEXTLINE
TEST(RateLimiter, ConfigFromJson) {
  auto c = RateLimiterConfig::from_json(
      nlohmann::json::parse(R"({"mutation": {"burst": 5}, "read": {"refill_ms": 0}})"));
  EXPECT_EQ(c.mutation.burst, 5);
  EXPECT_EQ(c.mutation.refill_interval_ms, 1000);
  EXPECT_EQ(c.read.burst, 10);
  EXPECT_EQ(c.read.refill_interval_ms, 1);
}

}  // namespace
