#include "runtime/http_transport.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using namespace sandpool::runtime;  // NOLINT

namespace fs = std::filesystem;

// Stand-in curl: echoes its config on stdout, then a status trailer
class FakeCurl {
 public:
  explicit FakeCurl(const std::string& script_body) {
    path_ = fs::temp_directory_path() / ("sandpool_fake_curl_" + std::to_string(::getpid()) +
                                         "_" + std::to_string(counter_++));
    std::ofstream out(path_);
    out << "#!/bin/sh\n" << script_body;
    out.close();
    fs::permissions(path_, fs::perms::owner_all);
  }
  ~FakeCurl() { fs::remove(path_); }

  std::string path() const { return path_.string(); }

 private:
  static inline int counter_ = 0;
  fs::path path_;
};

// NOLINTNEXTLINE
TEST(CurlTransport, ConfigKeepsTokenOffCommandLine) {
  HttpRequest req;
  req.method = "POST";
  req.url = "https://api.example.test/v1/apps";
  req.headers["Authorization"] = "Bearer tok\"en";
  req.body = "{\"a\":\"b\\n\"}";
  req.timeout_ms = 30000;

  std::string cfg = CurlTransport::build_config(req);
  EXPECT_THAT(cfg, HasSubstr("request = \"POST\"\n"));
  EXPECT_THAT(cfg, HasSubstr("url = \"https://api.example.test/v1/apps\"\n"));
  EXPECT_THAT(cfg, HasSubstr("header = \"Authorization: Bearer tok\\\"en\"\n"));
  EXPECT_THAT(cfg, HasSubstr("data-raw = \"{\\\"a\\\":\\\"b\\\\n\\\"}\"\n"));
  EXPECT_THAT(cfg, HasSubstr("max-time = 30\n"));
}

// NOLINTNEXTLINE
TEST(CurlTransport, NoBodyWithoutDataLine) {
  HttpRequest req;
  req.url = "http://x";
  EXPECT_THAT(CurlTransport::build_config(req), Not(HasSubstr("data-raw")));
}

// NOLINTNEXTLINE
TEST(CurlTransport, ParsesBodyAndStatus) {
  FakeCurl curl("cat > /dev/null\nprintf '{\"ok\":true}\\n__SANDPOOL_HTTP_STATUS__:201'\n");
  CurlTransport transport(curl.path());

  HttpRequest req;
  req.url = "http://x";
  auto resp = transport.perform(req);
  ASSERT_TRUE(resp.success) << resp.error.to_string();
  EXPECT_EQ(resp.status, 201);
  EXPECT_EQ(resp.body, "{\"ok\":true}");
}

// NOLINTNEXTLINE
TEST(CurlTransport, TimeoutExitCode) {
  FakeCurl curl("cat > /dev/null\nexit 28\n");
  CurlTransport transport(curl.path());

  auto resp = transport.perform(HttpRequest{});
  EXPECT_FALSE(resp.success);
  EXPECT_EQ(resp.error.kind, ErrorKind::TIMEOUT);
}

// NOLINTNEXTLINE
TEST(CurlTransport, OtherFailuresAreTransportErrors) {
  FakeCurl curl("cat > /dev/null\necho 'could not resolve host' >&2\nexit 6\n");
  CurlTransport transport(curl.path());

  auto resp = transport.perform(HttpRequest{});
  EXPECT_FALSE(resp.success);
  EXPECT_EQ(resp.error.kind, ErrorKind::TRANSPORT_ERROR);
  EXPECT_THAT(resp.error.message, HasSubstr("could not resolve host"));
}

}  // namespace
