#include "runtime/network_env.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Pair;
using ::testing::UnorderedElementsAre;
using namespace sandpool::runtime;  // NOLINT

// NOLINTNEXTLINE
TEST(NetworkEnv, NoProxyMeansNoNetwork) {
  EXPECT_THAT(build_network_env(ProxySpec{}),
              UnorderedElementsAre(Pair("SANDPOOL_NETWORK_MODE", "none")));
}

// NOLINTNEXTLINE
TEST(NetworkEnv, ProxyOnly) {
  ProxySpec proxy;
  proxy.ip = "172.17.0.1";
  EXPECT_THAT(build_network_env(proxy),
              UnorderedElementsAre(Pair("SANDPOOL_NETWORK_MODE", "proxy_only"),
                                   Pair("SANDPOOL_PROXY_IP", "172.17.0.1"),
                                   Pair("SANDPOOL_PROXY_PORT", "4000")));
}

// NOLINTNEXTLINE
TEST(NetworkEnv, NetworkVariablesOverrideUserEnv) {
  auto merged = merge_network_env({{"FOO", "bar"}, {"SANDPOOL_NETWORK_MODE", "host"}}, ProxySpec{});
  EXPECT_EQ(merged["FOO"], "bar");
  EXPECT_EQ(merged["SANDPOOL_NETWORK_MODE"], "none");
}

// NOLINTNEXTLINE
TEST(SandboxSpec, FromJson) {
  auto spec = SandboxSpec::from_json({
      {"image", "node:22-slim"},
      {"env", {{"A", "1"}, {"N", 5}}},
      {"ports", {4001, {{"host", 8080}, {"container", 80}}}},
      {"memory_mb", 512},
      {"proxy", {{"ip", "fdaa::3"}}},
      {"mounts", {{{"volume", "vol_1"}, {"path", "/data"}}}},
  });
  EXPECT_EQ(spec.image, "node:22-slim");
  EXPECT_EQ(spec.env["A"], "1");
  EXPECT_EQ(spec.env["N"], "5");
  ASSERT_EQ(spec.ports.size(), 2u);
  EXPECT_EQ(spec.ports[0].container_port, 4001);
  EXPECT_EQ(spec.ports[1].host_port, 8080);
  EXPECT_EQ(spec.memory_mb, 512);
  EXPECT_TRUE(spec.proxy.enabled());
  EXPECT_EQ(spec.proxy.port, 4000);
  EXPECT_EQ(spec.mounts.size(), 1u);
  EXPECT_TRUE(spec.auto_destroy);
}

// NOLINTNEXTLINE
TEST(SandboxSpec, ToJsonOmitsToken) {
  SandboxSpec spec;
  spec.image = "x";
  spec.api_token = "secret";
  EXPECT_FALSE(spec.to_json().contains("api_token"));
}

// NOLINTNEXTLINE
TEST(ErrorFormat, TextualForms) {
  EXPECT_EQ(Error(ErrorKind::EXIT_CODE, "", 3).to_string(), "exit_code(3)");
  EXPECT_EQ(Error(ErrorKind::API_ERROR, "boom", 500).to_string(), "api_error(500: boom)");
  EXPECT_EQ(Error(ErrorKind::INVALID_MOUNT, "{\"path\":\"/x\"}").to_string(),
            "invalid_mount({\"path\":\"/x\"})");
  EXPECT_EQ(Error(ErrorKind::POOL_EMPTY).to_string(), "pool_empty");
  EXPECT_FALSE(Error());
}

}  // namespace
