#pragma once
#include "trending/core/result.hpp"
#include "trending/net/fetcher.hpp"
#include "trending/scrape/models.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace trending::scrape {

inline constexpr std::chrono::seconds ListingTimeout{30};

class TrendingPageParser {
public:
  TrendingPageParser(net::HttpFetcher &Fetcher, std::string SiteRoot);

  std::string listingUrl(const models::TrendingQuery &Query) const;

  // Fetches and parses the listing. Errors: Transport, HttpStatus (non-2xx)
  // and EmptyResult (no project fragments), each carrying the URL.
  auto parse(const models::TrendingQuery &Query) const
      -> std::expected<models::TrendingPage, core::Error>;

  // Parses an already fetched listing body.
  auto parseBody(
      std::string_view Body, const models::TrendingQuery &Query, std::string Url
  ) const -> std::expected<models::TrendingPage, core::Error>;

private:
  net::HttpFetcher &Fetcher;
  std::string SiteRoot;
};

} // namespace trending::scrape
