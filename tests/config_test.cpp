#include "trending/core/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using trending::core::Config;
using trending::core::ErrorKind;
using trending::core::Transport;

class ConfigTest : public ::testing::Test {
protected:
  static constexpr const char *Vars[] = {
      "HOST",          "PORT",           "LOG_LEVEL",
      "LOG_DIR",       "REPORT_LOCALE",  "MCP_TRANSPORT",
      "GITHUB_BASE_URL", "RAW_CONTENT_BASE_URL", "HTTP_USER_AGENT"};

  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const auto *Name : Vars) {
      unsetenv(Name);
    }
  }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  auto Cfg = Config::load();
  ASSERT_TRUE(Cfg.has_value());
  EXPECT_EQ(Cfg->Host, "127.0.0.1");
  EXPECT_EQ(Cfg->Port, 3000);
  EXPECT_EQ(Cfg->LogLevel, "info");
  EXPECT_FALSE(Cfg->LogDir.has_value());
  EXPECT_EQ(Cfg->ReportLocale, "en");
  EXPECT_EQ(Cfg->McpTransport, Transport::Http);
  EXPECT_EQ(Cfg->GitHubBaseUrl, "https://github.com");
  EXPECT_EQ(Cfg->RawContentBaseUrl, "https://raw.githubusercontent.com");
}

TEST_F(ConfigTest, ReadsEnvironment) {
  setenv("HOST", "0.0.0.0", 1);
  setenv("PORT", "8080", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("LOG_DIR", "/tmp/trending-logs", 1);
  setenv("REPORT_LOCALE", "zh", 1);
  setenv("MCP_TRANSPORT", "stdio", 1);
  setenv("GITHUB_BASE_URL", "http://localhost:9000/", 1);

  auto Cfg = Config::load();
  ASSERT_TRUE(Cfg.has_value());
  EXPECT_EQ(Cfg->Host, "0.0.0.0");
  EXPECT_EQ(Cfg->Port, 8080);
  EXPECT_EQ(Cfg->LogLevel, "debug");
  EXPECT_EQ(Cfg->LogDir, "/tmp/trending-logs");
  EXPECT_EQ(Cfg->ReportLocale, "zh");
  EXPECT_EQ(Cfg->McpTransport, Transport::Stdio);
  EXPECT_EQ(Cfg->GitHubBaseUrl, "http://localhost:9000");
}

TEST_F(ConfigTest, RejectsBadPort) {
  for (const auto *Bad : {"0", "65536", "http", "80x", ""}) {
    setenv("PORT", Bad, 1);
    auto Cfg = Config::load();
    ASSERT_FALSE(Cfg.has_value()) << Bad;
    EXPECT_EQ(Cfg.error().Kind, ErrorKind::Validation);
  }
}

TEST_F(ConfigTest, RejectsUnknownChoices) {
  setenv("REPORT_LOCALE", "fr", 1);
  EXPECT_FALSE(Config::load().has_value());
  unsetenv("REPORT_LOCALE");

  setenv("MCP_TRANSPORT", "websocket", 1);
  EXPECT_FALSE(Config::load().has_value());
  unsetenv("MCP_TRANSPORT");

  setenv("LOG_LEVEL", "verbose", 1);
  EXPECT_FALSE(Config::load().has_value());
}
