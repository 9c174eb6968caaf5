#include "util/process.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <chrono>
#include <thread>

namespace {

using ::testing::HasSubstr;
using sandpool::util::ProcessOptions;
using sandpool::util::run_process;

// NOLINTNEXTLINE
TEST(Process, CapturesStdoutAndStderrSeparately) {
  auto result = run_process({"sh", "-c", "echo out; echo err >&2; exit 3"});
  EXPECT_TRUE(result.started);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.stdout_data, "out\n");
  EXPECT_EQ(result.stderr_data, "err\n");
}

// NOLINTNEXTLINE
TEST(Process, FeedsStdin) {
  ProcessOptions opts;
  opts.stdin_data = "hello from stdin";
  auto result = run_process({"cat"}, opts);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.stdout_data, "hello from stdin");
}

// NOLINTNEXTLINE
TEST(Process, LargeStdinAndStdout) {
  ProcessOptions opts;
  opts.stdin_data = std::string(1 << 20, 'x');
  auto result = run_process({"cat"}, opts);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.stdout_data.size(), opts.stdin_data.size());
}

// NOLINTNEXTLINE
TEST(Process, TimeoutKillsChild) {
  ProcessOptions opts;
  opts.timeout_ms = 200;
  auto start = std::chrono::steady_clock::now();
  auto result = run_process({"sleep", "10"}, opts);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.ok());
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST(Process, MissingBinary) {
  auto result = run_process({"/nonexistent/sandpool-binary"});
  EXPECT_EQ(result.exit_code, 127);
  EXPECT_THAT(result.error, HasSubstr("failed to execute"));
}

// NOLINTNEXTLINE
TEST(Process, EmptyCommand) {
  auto result = run_process({});
  EXPECT_FALSE(result.started);
  EXPECT_FALSE(result.error.empty());
}

// NOLINTNEXTLINE
TEST(Process, ChildDoesNotInheritConcurrentPipes) {
  auto baseline = run_process({"ls", "/proc/self/fd"});
  ASSERT_TRUE(baseline.ok());

  std::thread busy([] { run_process({"sleep", "1"}); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  auto during = run_process({"ls", "/proc/self/fd"});
  busy.join();

  ASSERT_TRUE(during.ok());
  EXPECT_EQ(during.stdout_data, baseline.stdout_data);
}

}  // namespace
