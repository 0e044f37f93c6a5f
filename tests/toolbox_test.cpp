#include "trending/tools/toolbox.hpp"
#include "support/listing_fixture.hpp"
#include "support/stub_fetcher.hpp"

#include <gtest/gtest.h>

using namespace trending;

namespace {

bool contains(const std::string &Haystack, std::string_view Needle) {
  return Haystack.find(Needle) != std::string::npos;
}

std::chrono::system_clock::time_point fixedNow() {
  using namespace std::chrono;
  return sys_days{year{2024} / January / 1};
}

} // namespace

class ToolboxTest : public ::testing::Test {
protected:
  test::StubFetcher Fetcher;
  core::Config Config;
  tools::Toolbox Tools{Fetcher, Config, fixedNow};
};

TEST_F(ToolboxTest, InvalidWindowMakesNoRequest) {
  auto Text = Tools.getGithubTrending("yearly", "");
  EXPECT_EQ(Text,
            "❌ Error: since parameter must be one of: daily, weekly, monthly");
  EXPECT_TRUE(Fetcher.Calls.empty());
}

TEST_F(ToolboxTest, TrendingReportFromListingPage) {
  Fetcher.respond("https://github.com/trending/go?since=daily", 200,
                  test::listingPage({{.Owner = "gopher", .Repo = "fast",
                                      .Language = "Go"}}));
  auto Text = Tools.getGithubTrending("daily", "Go");
  EXPECT_TRUE(contains(Text, "📅 Retrieved on: 2024-01-01 Monday"));
  EXPECT_TRUE(contains(Text, "💻 Language: Go"));
  ASSERT_EQ(Fetcher.Calls.size(), 1u);
  EXPECT_EQ(Fetcher.Calls[0].Url, "https://github.com/trending/go?since=daily");
  EXPECT_TRUE(contains(Text, "1. gopher / fast"));
  EXPECT_TRUE(contains(Text, "🔥 Today: +1,024"));
}

TEST_F(ToolboxTest, ServerErrorReportNamesUrl) {
  Fetcher.respond("https://github.com/trending?since=daily", 500, "");
  auto Text = Tools.getGithubTrending("daily", "");
  EXPECT_TRUE(contains(Text, "Network request error"));
  EXPECT_TRUE(contains(Text, "https://github.com/trending?since=daily"));
  EXPECT_FALSE(contains(Text, "No trending projects found"));
}

TEST_F(ToolboxTest, EmptyRepositoryListMakesNoRequest) {
  auto Text = Tools.getRepositoryReadme({});
  EXPECT_EQ(Text.find('\n'), std::string::npos);
  EXPECT_TRUE(contains(Text, "cannot be empty"));
  EXPECT_TRUE(Fetcher.Calls.empty());
}

TEST_F(ToolboxTest, ReadmeReportCoversEveryRepository) {
  Fetcher.respond("https://raw.githubusercontent.com/octo/widget/refs/heads/"
                  "main/README.md",
                  200, "# Widget docs");
  auto Text = Tools.getRepositoryReadme({"octo/widget", "", "widget"});
  EXPECT_TRUE(contains(Text, "# Widget docs"));
  EXPECT_TRUE(contains(Text, "Invalid repository name format: widget"));
  EXPECT_EQ(Fetcher.Calls.size(), 1u);
}

TEST(ToolboxLocale, ChineseTruncationMarker) {
  test::StubFetcher Fetcher;
  core::Config Config;
  Config.ReportLocale = "zh";
  tools::Toolbox Tools{Fetcher, Config, fixedNow};
  EXPECT_EQ(Tools.locale(), report::Locale::Chinese);

  Fetcher.respond("https://raw.githubusercontent.com/big/doc/refs/heads/main/"
                  "README.md",
                  200, std::string(60'000, 'z'));
  auto Text = Tools.getRepositoryReadme({"big/doc"});
  EXPECT_TRUE(contains(Text, "[内容过长，已截断]"));
}

TEST(ToolboxLocale, ChineseInvalidWindowMessage) {
  test::StubFetcher Fetcher;
  core::Config Config;
  Config.ReportLocale = "zh";
  tools::Toolbox Tools{Fetcher, Config, fixedNow};

  EXPECT_EQ(Tools.getGithubTrending("hourly", ""),
            "❌ 错误：since参数必须是以下值之一: daily, weekly, monthly");
  EXPECT_TRUE(Fetcher.Calls.empty());
}
