#include <gtest/gtest.h>
#include <tbproxy/config.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace tbproxy;
using json = nlohmann::json;

namespace {

// Unsets the variable on scope exit so tests do not leak into each other.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

private:
  const char *name_;
};

} // namespace

TEST(Config, EmptyObjectKeepsDefaults) {
  const Config c = config_from_json(json::object());
  EXPECT_EQ(c.port, 8000);
  EXPECT_EQ(c.rate_limit_requests, 100);
  EXPECT_EQ(c.rate_limit_window_seconds, 60);
  EXPECT_EQ(c.per_target_timeout_ms, 10000);
  EXPECT_EQ(c.max_body_bytes, 1024u * 1024u);
  EXPECT_FALSE(c.debug);
  EXPECT_TRUE(c.trust_forwarded_headers);
  EXPECT_TRUE(c.api_key.empty());
}

TEST(Config, FileValuesOverrideDefaults) {
  const Config c = config_from_json({{"port", 9100},
                                     {"debug", true},
                                     {"log_level", "debug"},
                                     {"rate_limit_requests", 5},
                                     {"rate_limit_window_seconds", 10},
                                     {"tb_host", "tb.internal"},
                                     {"tb_port", 9090},
                                     {"upload_concurrency", 16},
                                     {"per_target_timeout_ms", 2500}});
  EXPECT_EQ(c.port, 9100);
  EXPECT_TRUE(c.debug);
  EXPECT_EQ(c.log_level, "debug");

  const RateLimiterConfig rl = rate_limiter_config(c);
  EXPECT_EQ(rl.max_requests, 5);
  EXPECT_EQ(rl.window_seconds, 10);

  const ThingsBoardConfig tb = thingsboard_config(c);
  EXPECT_EQ(tb.host, "tb.internal");
  EXPECT_EQ(tb.port, 9090);
  EXPECT_EQ(tb.timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(tb.token_ttl, std::chrono::seconds(9000));

  const BulkUploadConfig bc = bulk_upload_config(c);
  EXPECT_EQ(bc.concurrency, 16u);
  EXPECT_EQ(bc.per_target_timeout, std::chrono::milliseconds(2500));
}

TEST(Config, InvalidValuesAreRejected) {
  EXPECT_THROW(config_from_json({{"port", 0}}), std::invalid_argument);
  EXPECT_THROW(config_from_json({{"port", 70000}}), std::invalid_argument);
  EXPECT_THROW(config_from_json({{"rate_limit_requests", 0}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"rate_limit_window_seconds", -1}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"per_target_timeout_ms", 0}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"log_level", "loud"}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"request_workers", 0}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json(json::array()), std::invalid_argument);
}

TEST(Config, NegativeCountsDoNotWrapAround) {
  EXPECT_THROW(config_from_json({{"http_threads", -1}}), std::invalid_argument);
  EXPECT_THROW(config_from_json({{"max_body_bytes", -5}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"upload_queue_capacity", -1}}),
               std::invalid_argument);
  EXPECT_THROW(config_from_json({{"rate_limit_max_identities", 0}}),
               std::invalid_argument);

  const Config c = config_from_json({{"max_body_bytes", 4096}});
  EXPECT_EQ(c.max_body_bytes, 4096u);
}

TEST(Config, WronglyTypedValueIsAnError) {
  EXPECT_THROW(config_from_json({{"port", "eighty"}}), json::exception);
}

TEST(Config, MissingFileGivesDefaults) {
  const Config c = load_config(::testing::TempDir() + "no-such-config.json");
  EXPECT_EQ(c.port, 8000);
  EXPECT_EQ(c.service_name, "tb-proxy");
}

TEST(Config, LoadsFileAndAppliesEnvironment) {
  const std::string path = ::testing::TempDir() + "tbproxy-config-test.json";
  {
    std::ofstream f(path);
    f << R"({"port": 8123, "api_key": "from-file", "tb_username": "file-user"})";
  }

  ScopedEnv key("API_KEY", "from-env");
  ScopedEnv pass("TB_PASSWORD", "env-pass");
  const Config c = load_config(path);
  std::remove(path.c_str());

  EXPECT_EQ(c.port, 8123);
  EXPECT_EQ(c.api_key, "from-env");
  EXPECT_EQ(c.tb_username, "file-user");
  EXPECT_EQ(c.tb_password, "env-pass");
}
