#include "trending/scrape/parser.hpp"

#include "trending/core/http.hpp"
#include "trending/core/logging.hpp"
#include "trending/core/text.hpp"
#include "trending/html/document.hpp"
#include "trending/scrape/extractor.hpp"

#include <format>
#include <spdlog/spdlog.h>

namespace trending::scrape {

static auto Log() { return core::logger("trending"); }

TrendingPageParser::TrendingPageParser(net::HttpFetcher &Fetcher,
                                       std::string SiteRoot)
    : Fetcher(Fetcher), SiteRoot(std::move(SiteRoot)) {}

std::string
TrendingPageParser::listingUrl(const models::TrendingQuery &Query) const {
  if (Query.Language.empty()) {
    return std::format("{}/trending?since={}", SiteRoot,
                       models::toString(Query.Window));
  }
  return std::format("{}/trending/{}?since={}", SiteRoot,
                     core::text::percentEncodeSegment(Query.Language),
                     models::toString(Query.Window));
}

auto TrendingPageParser::parse(const models::TrendingQuery &Query) const
    -> std::expected<models::TrendingPage, core::Error> {
  auto Url = listingUrl(Query);
  Log()->info("Fetching trending listing: {}", Url);

  auto Response = Fetcher.get(Url, ListingTimeout);
  if (!Response) {
    auto Err = Response.error();
    Err.Url = Url;
    return std::unexpected(std::move(Err));
  }

  if (!core::isSuccess(Response->StatusCode)) {
    Log()->error("GET {} returned HTTP {}", Url, Response->StatusCode);
    return std::unexpected(core::Error{
        .Message = std::format("HTTP {} from listing page", Response->StatusCode),
        .Kind = core::ErrorKind::HttpStatus,
        .Url = Url,
    });
  }

  return parseBody(Response->Body, Query, std::move(Url));
}

auto TrendingPageParser::parseBody(
    std::string_view Body, const models::TrendingQuery &Query, std::string Url
) const -> std::expected<models::TrendingPage, core::Error> {
  auto Document = html::Document::parse(Body);
  auto Fragments = Document.root().findAll(
      {.Tag = GUMBO_TAG_ARTICLE, .Class = "Box-row"}
  );

  if (Fragments.empty()) {
    Log()->warn("No project fragments found at {}", Url);
    return std::unexpected(core::Error{
        .Message = "no trending projects found",
        .Kind = core::ErrorKind::EmptyResult,
        .Url = std::move(Url),
    });
  }

  models::TrendingPage Page{
      .Url = std::move(Url),
      .FragmentCount = Fragments.size(),
  };
  Page.Entries.reserve(Fragments.size());

  for (std::size_t I = 0; I < Fragments.size(); ++I) {
    auto Rank = I + 1;
    auto Entry = extractEntry(Fragments[I], Query.Window, Rank, SiteRoot);
    if (!Entry) {
      Log()->debug("Skipping fragment {}: {}", Rank, Entry.error().Message);
      Page.Skipped.push_back({.Rank = Rank, .Reason = Entry.error().Message});
      continue;
    }
    Page.Entries.push_back(std::move(*Entry));
  }

  Log()->info("Parsed {} of {} trending fragments from {}",
              Page.Entries.size(), Page.FragmentCount, Page.Url);
  return Page;
}

} // namespace trending::scrape
