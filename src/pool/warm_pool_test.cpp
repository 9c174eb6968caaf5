#include "pool/warm_pool.hpp"
#include "pool/memory_store.hpp"
#include "util/time.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using namespace sandpool::pool;  // NOLINT
using namespace sandpool::runtime;  // NOLINT

// In-process adapter recording every lifecycle call
class FakeAdapter : public SandboxAdapter {
 public:
  const char* name() const override { return "fake"; }

  CreateResult create(const SandboxSpec& spec) override {
    if (create_delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(create_delay_ms.load()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    specs.push_back(spec);
    CreateResult r;
    if (fail_create) {
      r.error = Error(ErrorKind::PROVIDER_ERROR, "quota");
      return r;
    }
    r.success = true;
    r.sandbox_id = "sb-" + std::to_string(++next_id_);
    r.metadata = {{"private_ip", "10.0.0." + std::to_string(next_id_)}};
    return r;
  }

  ExecResponse exec(const std::string&, const std::string&, const ExecOptions&) override {
    return {};
  }

  OpResult terminate(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    terminated.push_back(id);
    return OpResult::ok();
  }

  StatusResult status(const std::string&) override { return {true, SandboxStatus::RUNNING, {}}; }

  OpResult stop(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped.push_back(id);
    return OpResult::ok();
  }

  OpResult await_ready(const std::string&, const nlohmann::json&, const ReadyOptions&) override {
    if (fail_ready) return OpResult::fail(Error(ErrorKind::TIMEOUT, "health"));
    return OpResult::ok();
  }

  std::vector<std::string> terminated_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated;
  }

  size_t create_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return specs.size();
  }

  std::atomic<bool> fail_create{false};
  std::atomic<bool> fail_ready{false};
  std::atomic<int> create_delay_ms{0};
  std::vector<SandboxSpec> specs;
  std::vector<std::string> terminated;
  std::vector<std::string> stopped;

 private:
  std::mutex mutex_;
  int next_id_ = 0;
};

// Adds update() on top of FakeAdapter
class UpdatableAdapter : public FakeAdapter {
 public:
  OpResult update(const std::string& id, const SandboxSpec& spec) override {
    updated_id = id;
    updated_image = spec.image;
    return OpResult::ok();
  }
  std::string updated_id;
  std::string updated_image;
};

// Memory store whose count() is slow, widening the gap between the
// below-target check and the pending claim
class SlowCountStore : public MemoryStore {
 public:
  using MemoryStore::MemoryStore;
  size_t count(const std::string& partition_key) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return MemoryStore::count(partition_key);
  }
};

PoolConfig pool_config(std::vector<std::string> partitions, int target = 1) {
  PoolConfig c;
  c.partitions = std::move(partitions);
  c.target_per_partition = target;
  c.replenish_interval_ms = 60000;
  c.sandbox = {{"image", "img:1"}, {"env", {{"USER_VAR", "x"}, {"SANDPOOL_POOL", "overridden"}}}};
  return c;
}

class WarmPoolTest : public ::testing::Test {
 protected:
  void make_pool(PoolConfig config, std::shared_ptr<FakeAdapter> adapter = nullptr) {
    adapter_ = adapter ? adapter : std::make_shared<FakeAdapter>();
    store_ = std::make_shared<MemoryStore>(config.partitions);
    pool_ = std::make_unique<WarmPool>(std::move(config), adapter_, store_);
  }

  std::shared_ptr<FakeAdapter> adapter_;
  std::shared_ptr<MemoryStore> store_;
  std::unique_ptr<WarmPool> pool_;
};

/*
 * Replenish
 */

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, StartFillsEveryPartition) {
  make_pool(pool_config({"ams", "ord"}));
  ASSERT_TRUE(pool_->start());
  pool_->wait_idle();

  auto status = pool_->status();
  EXPECT_THAT(status.pool, ElementsAre(Pair("ams", 1u), Pair("ord", 1u)));
  EXPECT_EQ(status.pending, 0u);
  EXPECT_EQ(adapter_->stopped.size(), 2u);
  pool_->stop();
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ReplenishTopsUpToTarget) {
  make_pool(pool_config({"ams"}, 3));
  ASSERT_TRUE(store_->init());

  // One task per pass while the pending flag is held
  EXPECT_EQ(pool_->replenish(), 1);
  pool_->wait_idle();
  EXPECT_EQ(pool_->replenish(), 1);
  pool_->wait_idle();
  EXPECT_EQ(pool_->replenish(), 1);
  pool_->wait_idle();
  EXPECT_EQ(pool_->replenish(), 0);
  EXPECT_EQ(store_->count("ams"), 3u);
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, PendingPartitionIsSkipped) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(store_->init());
  store_->set_pending("ams", true);
  EXPECT_EQ(pool_->replenish(), 0);
  EXPECT_THAT(adapter_->specs, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, PoolsSharingStoreRefillOnce) {
  auto adapter = std::make_shared<FakeAdapter>();
  adapter->create_delay_ms = 200;
  auto store = std::make_shared<SlowCountStore>(std::vector<std::string>{"ams"});
  ASSERT_TRUE(store->init());
  WarmPool first(pool_config({"ams"}), adapter, store);
  WarmPool second(pool_config({"ams"}), adapter, store);

  std::atomic<int> started{0};
  std::thread a([&] { started += first.replenish(); });
  std::thread b([&] { started += second.replenish(); });
  a.join();
  b.join();
  first.wait_idle();
  second.wait_idle();

  EXPECT_EQ(started.load(), 1);
  EXPECT_EQ(adapter->create_calls(), 1u);
  EXPECT_EQ(store->count("ams"), 1u);
  EXPECT_FALSE(store->pending("ams"));
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, FailedCreateClearsPending) {
  auto adapter = std::make_shared<FakeAdapter>();
  adapter->fail_create = true;
  make_pool(pool_config({"ams"}), adapter);
  ASSERT_TRUE(store_->init());

  EXPECT_EQ(pool_->replenish(), 1);
  pool_->wait_idle();
  EXPECT_FALSE(store_->pending("ams"));
  EXPECT_EQ(store_->count("ams"), 0u);
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, UnhealthySandboxIsTerminated) {
  auto adapter = std::make_shared<FakeAdapter>();
  adapter->fail_ready = true;
  make_pool(pool_config({"ams"}), adapter);
  ASSERT_TRUE(store_->init());

  pool_->replenish();
  pool_->wait_idle();
  EXPECT_THAT(adapter_->terminated_ids(), ElementsAre("sb-1"));
  EXPECT_EQ(store_->count("ams"), 0u);
  EXPECT_FALSE(store_->pending("ams"));
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, SpecCarriesMarkersBeneathUserEnv) {
  make_pool(pool_config({"ams"}));
  auto spec = pool_->build_spec("ams");
  EXPECT_EQ(spec.image, "img:1");
  EXPECT_EQ(spec.region, "ams");
  EXPECT_EQ(spec.env["USER_VAR"], "x");
  EXPECT_EQ(spec.env["SANDPOOL_POOL"], "overridden");
  EXPECT_EQ(spec.env["SANDPOOL_POOL_PARTITION"], "ams");

  PoolConfig plain = pool_config({"img"});
  plain.sandbox = nlohmann::json::object();
  plain.partition_field = "image";
  make_pool(plain);
  spec = pool_->build_spec("python:3.12");
  EXPECT_EQ(spec.image, "python:3.12");
  EXPECT_EQ(spec.env["SANDPOOL_POOL"], "true");
}

/*
 * Checkout
 */

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, CheckoutWarmThenCold) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(store_->init());
  pool_->replenish();
  pool_->wait_idle();

  auto warm = pool_->checkout("ams");
  ASSERT_EQ(warm.status, CheckoutStatus::WARM);
  EXPECT_EQ(warm.sandbox.sandbox_id, "sb-1");
  EXPECT_EQ(warm.sandbox.partition, "ams");
  EXPECT_EQ(warm.sandbox.private_ip, "10.0.0.1");
  EXPECT_GT(warm.sandbox.created_at, 0);

  auto cold = pool_->checkout("ams");
  EXPECT_EQ(cold.status, CheckoutStatus::COLD);
  EXPECT_EQ(cold.error.kind, ErrorKind::POOL_EMPTY);
  EXPECT_STREQ(checkout_status_to_string(cold.status), "cold");
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, CheckoutTriggersBackgroundRefill) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(pool_->start());
  pool_->wait_idle();
  ASSERT_EQ(pool_->checkout("ams").status, CheckoutStatus::WARM);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (store_->count("ams") == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(store_->count("ams"), 1u);
  pool_->stop();
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ColdCheckoutRefillsImmediately) {
  auto adapter = std::make_shared<FakeAdapter>();
  adapter->fail_create = true;
  make_pool(pool_config({"ams"}), adapter);
  ASSERT_TRUE(pool_->start());
  pool_->wait_idle();
  ASSERT_EQ(store_->count("ams"), 0u);
  ASSERT_EQ(adapter->create_calls(), 1u);

  // The next interval tick is a minute away
  adapter->fail_create = false;
  EXPECT_EQ(pool_->checkout("ams").status, CheckoutStatus::COLD);
  pool_->wait_idle();
  EXPECT_EQ(adapter->create_calls(), 2u);
  EXPECT_EQ(store_->count("ams"), 1u);
  EXPECT_EQ(pool_->checkout("ams").status, CheckoutStatus::WARM);
  pool_->stop();
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ColdCheckoutOfUnknownPartitionDoesNotProvision) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(pool_->start());
  pool_->wait_idle();
  EXPECT_EQ(pool_->checkout("syd").status, CheckoutStatus::COLD);
  pool_->wait_idle();
  EXPECT_EQ(adapter_->create_calls(), 1u);
  pool_->stop();
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, StaleEntriesAreNotHandedOut) {
  PoolConfig config = pool_config({"ams"});
  config.max_age_ms = 1000;
  make_pool(config);
  ASSERT_TRUE(store_->init());

  PoolEntry old;
  old.id = "sb-old";
  old.partition_key = "ams";
  old.created_at = sandpool::util::now_ms() - 5000;
  store_->push(old);
  EXPECT_EQ(pool_->checkout("ams").status, CheckoutStatus::COLD);
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ClaimWithoutUpdateSupport) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(store_->init());
  pool_->replenish();
  pool_->wait_idle();

  SandboxSpec update;
  update.image = "img:2";
  auto claimed = pool_->claim("ams", update);
  EXPECT_EQ(claimed.status, CheckoutStatus::ERROR);
  EXPECT_EQ(claimed.error.kind, ErrorKind::NOT_IMPLEMENTED);
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ClaimUpdatesSandbox) {
  auto adapter = std::make_shared<UpdatableAdapter>();
  make_pool(pool_config({"ams"}), adapter);
  ASSERT_TRUE(store_->init());
  pool_->replenish();
  pool_->wait_idle();

  SandboxSpec update;
  update.image = "img:2";
  auto claimed = pool_->claim("ams", update);
  ASSERT_EQ(claimed.status, CheckoutStatus::WARM);
  EXPECT_EQ(adapter->updated_id, "sb-1");
  EXPECT_EQ(adapter->updated_image, "img:2");
}

/*
 * Partitions
 */

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, RegisterAndUnregister) {
  make_pool(pool_config({"ams"}));
  ASSERT_TRUE(store_->init());
  pool_->register_partition("ord");
  pool_->register_partition("ord");
  EXPECT_THAT(pool_->partitions(), ElementsAre("ams", "ord"));

  EXPECT_EQ(pool_->replenish(), 2);
  pool_->wait_idle();

  pool_->unregister_partition("ord", true);
  pool_->wait_idle();
  EXPECT_THAT(pool_->partitions(), ElementsAre("ams"));
  EXPECT_EQ(store_->count("ord"), 0u);
  EXPECT_EQ(adapter_->terminated_ids().size(), 1u);

  pool_->unregister_partition("ams");
  pool_->wait_idle();
  EXPECT_EQ(store_->count("ams"), 1u);
}

// NOLINTNEXTLINE
TEST_F(WarmPoolTest, ConfigFromJson) {
  auto config = PoolConfig::from_json(nlohmann::json::parse(R"({
    "partitions": ["ams", "ord"],
    "target_per_partition": 2,
    "max_age_ms": 1000,
    "stop_after_warm": false,
    "sandbox": {"image": "img:3"}
  })"));
  EXPECT_THAT(config.partitions, ElementsAre("ams", "ord"));
  EXPECT_EQ(config.target_per_partition, 2);
  EXPECT_EQ(config.max_age_ms, 1000);
  EXPECT_FALSE(config.stop_after_warm);
  EXPECT_EQ(config.sandbox["image"], "img:3");
  EXPECT_EQ(config.health_port, 4001);
}

}  // namespace
