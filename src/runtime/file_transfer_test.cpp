#include "runtime/file_transfer.hpp"
#include "util/process.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;
using namespace sandpool::runtime;  // NOLINT

namespace fs = std::filesystem;

// Exec against the local shell, the way a container would run it
ExecResponse local_exec(const std::string& command, const ExecOptions& opts) {
  sandpool::util::ProcessOptions popts;
  popts.timeout_ms = opts.timeout_ms;
  auto proc = sandpool::util::run_process({"sh", "-c", command}, popts);
  ExecResponse response;
  if (!proc.started || proc.timed_out) {
    response.error = Error(ErrorKind::TIMEOUT, proc.error);
    return response;
  }
  response.success = true;
  response.result.exit_code = proc.exit_code;
  response.result.stdout_data = proc.stdout_data;
  response.result.stderr_data = proc.stderr_data;
  return response;
}

ExecFn canned(int exit_code, std::string out, std::string err) {
  return [=](const std::string&, const ExecOptions&) {
    ExecResponse r;
    r.success = true;
    r.result = {exit_code, out, err};
    return r;
  };
}

class FileTransferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("sandpool_ft_" + std::to_string(::getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

// NOLINTNEXTLINE
TEST(FileTransferCommands, ReadCommandQuotesPath) {
  EXPECT_EQ(build_read_command("/tmp/a'b"), "base64 -w0 '/tmp/a'\\''b'");
}

// NOLINTNEXTLINE
TEST(FileTransferCommands, WriteCommandCreatesParentAndDecodes) {
  std::string cmd = build_write_command("/w/x.txt", "hi");
  EXPECT_THAT(cmd, StartsWith("mkdir -p \"$(dirname '/w/x.txt')\" && "));
  EXPECT_THAT(cmd, HasSubstr("echo 'aGk=' | base64 -d > '/w/x.txt'"));
}

// NOLINTNEXTLINE
TEST_F(FileTransferTest, BinaryRoundTripWithNulBytes) {
  std::string content("\x00\x01\x02 binary \xff\xfe\x00 end\n", 19);
  std::string path = (dir_ / "nested" / "deeper" / "it's a file.bin").string();

  auto written = transfer_write(local_exec, path, content, {});
  ASSERT_TRUE(written.success) << written.error.to_string();

  auto read = transfer_read(local_exec, path, {});
  ASSERT_TRUE(read.success) << read.error.to_string();
  EXPECT_EQ(read.content, content);

  std::ifstream in(path, std::ios::binary);
  std::string on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(on_disk, content);
}

// NOLINTNEXTLINE
TEST_F(FileTransferTest, HostilePathDoesNotInject) {
  std::string marker = (dir_ / "injected").string();
  std::string path = (dir_ / "x'; touch '").string() + marker + "'; echo '";

  transfer_write(local_exec, path, "data", {});
  EXPECT_FALSE(fs::exists(marker));
}

// NOLINTNEXTLINE
TEST_F(FileTransferTest, ReadMissingFileReportsStderr) {
  auto read = transfer_read(local_exec, (dir_ / "missing").string(), {});
  EXPECT_FALSE(read.success);
  EXPECT_EQ(read.error.kind, ErrorKind::COMMAND_FAILED);
  EXPECT_FALSE(read.error.message.empty());
}

// NOLINTNEXTLINE
TEST_F(FileTransferTest, WriteManyWritesInOrder) {
  std::vector<std::pair<std::string, std::string>> files = {
      {(dir_ / "a.txt").string(), "first"},
      {(dir_ / "sub" / "b.txt").string(), "second"},
  };
  auto result = transfer_write_many(local_exec, files, {});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(transfer_read(local_exec, files[1].first, {}).content, "second");
}

// NOLINTNEXTLINE
TEST(FileTransferErrors, ReadPrefersStderrThenStdoutThenNotFound) {
  auto r1 = transfer_read(canned(1, "out", "err"), "/f", {});
  EXPECT_EQ(r1.error.kind, ErrorKind::COMMAND_FAILED);
  EXPECT_EQ(r1.error.message, "err");

  auto r2 = transfer_read(canned(1, "out", ""), "/f", {});
  EXPECT_EQ(r2.error.kind, ErrorKind::COMMAND_FAILED);
  EXPECT_EQ(r2.error.message, "out");

  auto r3 = transfer_read(canned(1, "", ""), "/f", {});
  EXPECT_EQ(r3.error.kind, ErrorKind::FILE_NOT_FOUND);
}

// NOLINTNEXTLINE
TEST(FileTransferErrors, ReadInvalidBase64) {
  auto r = transfer_read(canned(0, "@@not-base64@@", ""), "/f", {});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::INVALID_BASE64);
}

// NOLINTNEXTLINE
TEST(FileTransferErrors, WriteExitCodeWithoutDiagnostics) {
  auto r = transfer_write(canned(2, "", ""), "/f", "x", {});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::EXIT_CODE);
  EXPECT_EQ(r.error.code, 2);
  EXPECT_EQ(r.error.to_string(), "exit_code(2)");
}

// NOLINTNEXTLINE
TEST(FileTransferErrors, WriteManyStopsAtFirstFailure) {
  int calls = 0;
  ExecFn exec = [&](const std::string&, const ExecOptions&) {
    calls++;
    ExecResponse r;
    r.success = true;
    r.result.exit_code = calls == 2 ? 1 : 0;
    r.result.stderr_data = calls == 2 ? "disk full" : "";
    return r;
  };

  auto result = transfer_write_many(exec, {{"/a", "1"}, {"/b", "2"}, {"/c", "3"}}, {});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.message, "disk full");
  EXPECT_EQ(calls, 2);
}

// NOLINTNEXTLINE
TEST(FileTransferErrors, ExecFailurePassesThrough) {
  ExecFn exec = [](const std::string&, const ExecOptions&) {
    ExecResponse r;
    r.error = Error(ErrorKind::TIMEOUT, "slow");
    return r;
  };
  EXPECT_EQ(transfer_read(exec, "/f", {}).error.kind, ErrorKind::TIMEOUT);
  EXPECT_EQ(transfer_write(exec, "/f", "x", {}).error.kind, ErrorKind::TIMEOUT);
}

}  // namespace
