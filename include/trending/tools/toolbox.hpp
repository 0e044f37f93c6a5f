#pragma once
#include "trending/core/config.hpp"
#include "trending/net/fetcher.hpp"
#include "trending/report/formatter.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::tools {

inline constexpr std::string_view TrendingToolName = "get_github_trending";
inline constexpr std::string_view ReadmeToolName = "get_repository_readme";

// The two tool operations. Both always return report text; no error,
// including an unexpected exception, escapes.
class Toolbox {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  Toolbox(net::HttpFetcher &Fetcher, const core::Config &Config);
  Toolbox(net::HttpFetcher &Fetcher, const core::Config &Config, Clock Now);

  std::string getGithubTrending(std::string_view Since,
                                std::string_view Language) const;

  std::string
  getRepositoryReadme(const std::vector<std::string> &Repositories) const;

  report::Locale locale() const { return Lang; }

private:
  net::HttpFetcher &Fetcher;
  std::string GitHubBaseUrl;
  std::string RawContentBaseUrl;
  report::Locale Lang;
  Clock Now;
};

} // namespace trending::tools
