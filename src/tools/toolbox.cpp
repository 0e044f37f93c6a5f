#include "trending/tools/toolbox.hpp"

#include "trending/core/logging.hpp"
#include "trending/readme/resolver.hpp"
#include "trending/scrape/parser.hpp"

#include <exception>
#include <spdlog/spdlog.h>

namespace trending::tools {

Toolbox::Toolbox(net::HttpFetcher &Fetcher, const core::Config &Config)
    : Toolbox(Fetcher, Config, [] { return std::chrono::system_clock::now(); }) {
}

Toolbox::Toolbox(net::HttpFetcher &Fetcher, const core::Config &Config,
                 Clock Now)
    : Fetcher(Fetcher), GitHubBaseUrl(Config.GitHubBaseUrl),
      RawContentBaseUrl(Config.RawContentBaseUrl),
      Lang(report::parseLocale(Config.ReportLocale)
               .value_or(report::Locale::English)),
      Now(std::move(Now)) {}

std::string Toolbox::getGithubTrending(std::string_view Since,
                                       std::string_view Language) const {
  auto Query = scrape::models::TrendingQuery::create(Since, Language);
  if (!Query) {
    core::logger("trending")->warn("Rejected trending query: {}",
                                   Query.error().Message);
    return report::formatInvalidSince(Lang);
  }

  scrape::TrendingPageParser Parser{Fetcher, GitHubBaseUrl};
  try {
    auto Page = Parser.parse(*Query);
    if (!Page) {
      core::logger("trending")->warn("Trending lookup failed ({}): {}",
                                     core::toString(Page.error().Kind),
                                     Page.error().Message);
    }
    return report::formatTrending(*Query, Page, Lang, Now());
  } catch (const std::exception &Err) {
    core::logger("trending")->error("Trending lookup failed: {}", Err.what());
    return report::formatProgramError(Err.what(), Parser.listingUrl(*Query),
                                      Lang);
  }
}

std::string Toolbox::getRepositoryReadme(
    const std::vector<std::string> &Repositories
) const {
  if (Repositories.empty()) {
    core::logger("readme")->warn("Rejected README lookup: empty repository list");
    return report::formatEmptyRepositoryList(Lang);
  }

  readme::ReadmeResolver Resolver{
      Fetcher,
      {
          .RawContentBaseUrl = RawContentBaseUrl,
          .TruncationMarker = std::string(report::labels(Lang).TruncationMarker),
      },
  };

  // Resolved one at a time so a failure in one repository is reported in
  // its own block and the rest still run.
  std::vector<readme::ReadmeLookupResult> Results;
  for (const auto &Repository : Repositories) {
    try {
      if (auto Result = Resolver.resolve(Repository)) {
        Results.push_back(std::move(*Result));
      }
    } catch (const std::exception &Err) {
      core::logger("readme")->error("README lookup for {} failed: {}",
                                    Repository, Err.what());
      Results.push_back({
          .Repository = Repository,
          .ErrorDetail = Err.what(),
      });
    }
  }
  return report::formatReadme(Results, Lang);
}

} // namespace trending::tools
