#include <cstdlib>

#include <gtest/gtest.h>

#include "webpubsub/config.hpp"
#include "webpubsub/observability.hpp"

namespace {

void ClearEnv() {
  for (const char* key : {"SERVER_PORT", "WEBHOOK_PATH", "WEBPUBSUB_HUB", "WEBHOOK_ALLOWED_ORIGINS",
                          "WEBPUBSUB_ACCESS_KEYS", "LOG_LEVEL", "REQUEST_TIMEOUT_SECONDS"}) {
    unsetenv(key);
  }
}

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }
};

}  // namespace

TEST_F(ConfigEnvTest, DefaultsWhenUnset) {
  auto cfg = webpubsub::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.webhook_path, "/api/webpubsub");
  EXPECT_TRUE(cfg.hub.empty());
  ASSERT_EQ(cfg.allowed_origins.size(), 1u);
  EXPECT_EQ(cfg.allowed_origins[0], "*");
  EXPECT_TRUE(cfg.access_keys.empty());
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.request_timeout_seconds, 30u);
}

TEST_F(ConfigEnvTest, ReadsListsFromEnvironment) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("WEBHOOK_ALLOWED_ORIGINS", " a.webpubsub.azure.com, ,b.webpubsub.azure.com ", 1);
  setenv("WEBPUBSUB_ACCESS_KEYS", "k1,k2", 1);
  setenv("LOG_LEVEL", "debug", 1);
  auto cfg = webpubsub::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  ASSERT_EQ(cfg.allowed_origins.size(), 2u);
  EXPECT_EQ(cfg.allowed_origins[0], "a.webpubsub.azure.com");
  EXPECT_EQ(cfg.allowed_origins[1], "b.webpubsub.azure.com");
  ASSERT_EQ(cfg.access_keys.size(), 2u);
  EXPECT_EQ(webpubsub::ParseLogLevel(cfg.log_level), webpubsub::LogLevel::kDebug);
}

TEST(LogLevelTest, UnknownLevelDefaultsToInfo) {
  EXPECT_EQ(webpubsub::ParseLogLevel("WARN"), webpubsub::LogLevel::kWarn);
  EXPECT_EQ(webpubsub::ParseLogLevel("verbose"), webpubsub::LogLevel::kInfo);
}
