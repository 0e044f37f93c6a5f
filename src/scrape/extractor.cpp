#include "trending/scrape/extractor.hpp"

#include "trending/core/logging.hpp"
#include "trending/core/text.hpp"

#include <exception>
#include <format>
#include <regex>
#include <spdlog/spdlog.h>
#include <vector>

namespace trending::scrape {

static auto Log() { return core::logger("trending"); }

namespace {

std::optional<std::string> nonEmpty(std::string Value) {
  if (Value.empty()) {
    return std::nullopt;
  }
  return Value;
}

std::optional<std::string> strippedTextOf(const html::Node &Fragment,
                                          const html::Selector &Match) {
  auto Found = Fragment.findFirst(Match);
  if (!Found) {
    return std::nullopt;
  }
  return nonEmpty(Found->strippedText());
}

std::optional<std::string> locateDescription(const html::Node &Fragment,
                                             models::Since) {
  return strippedTextOf(Fragment, {.Tag = GUMBO_TAG_P, .Class = "col-9"});
}

std::optional<std::string> locateLanguage(const html::Node &Fragment,
                                          models::Since) {
  return strippedTextOf(
      Fragment,
      {.Tag = GUMBO_TAG_SPAN,
       .AttributeName = "itemprop",
       .AttributeValue = "programmingLanguage"}
  );
}

std::optional<std::string> locateTotalStars(const html::Node &Fragment,
                                            models::Since) {
  return strippedTextOf(
      Fragment, {.Tag = GUMBO_TAG_A, .HrefSuffix = "/stargazers"}
  );
}

std::optional<std::string> locateTotalForks(const html::Node &Fragment,
                                            models::Since) {
  return strippedTextOf(Fragment, {.Tag = GUMBO_TAG_A, .HrefSuffix = "/forks"});
}

// The first span mentioning stars together with the requested window wins,
// even when no count can be read from it.
std::optional<std::string> locatePeriodStars(const html::Node &Fragment,
                                             models::Since Window) {
  auto Phrase = models::windowPhrase(Window);
  for (const auto &Span : Fragment.findAll({.Tag = GUMBO_TAG_SPAN})) {
    auto Label = Span.strippedText();
    auto Lowered = core::text::toLower(Label);
    if (Lowered.find("stars") == std::string::npos ||
        Lowered.find(Phrase) == std::string::npos) {
      continue;
    }
    return periodStarCount(Label);
  }
  return std::nullopt;
}

std::string resolveUrl(std::string_view SiteRoot, std::string_view Href) {
  if (Href.starts_with("http://") || Href.starts_with("https://")) {
    return std::string(Href);
  }
  if (!Href.starts_with('/')) {
    return std::format("{}/{}", SiteRoot, Href);
  }
  return std::format("{}{}", SiteRoot, Href);
}

const std::vector<FieldRule> &rules() {
  static const std::vector<FieldRule> Rules{
      {"description", &models::TrendingEntry::Description, locateDescription,
       models::NoDescription},
      {"language", &models::TrendingEntry::PrimaryLanguage, locateLanguage,
       models::UnknownLanguage},
      {"total_stars", &models::TrendingEntry::TotalStars, locateTotalStars,
       models::ZeroCount},
      {"total_forks", &models::TrendingEntry::TotalForks, locateTotalForks,
       models::ZeroCount},
      {"period_stars", &models::TrendingEntry::PeriodStars, locatePeriodStars,
       models::ZeroCount},
  };
  return Rules;
}

} // namespace

std::span<const FieldRule> optionalFieldRules() { return rules(); }

std::optional<std::string> periodStarCount(std::string_view Label) {
  static const std::regex CountPattern(
      R"((\d+[,\d]*)\s*stars?)", std::regex::icase
  );
  std::match_results<std::string_view::const_iterator> Match;
  if (!std::regex_search(Label.begin(), Label.end(), Match, CountPattern)) {
    return std::nullopt;
  }
  return Match[1].str();
}

auto extractEntry(
    const html::Node &Fragment,
    models::Since Window,
    std::size_t Rank,
    std::string_view SiteRoot
) -> std::expected<models::TrendingEntry, core::Error> {
  auto Heading = Fragment.findFirst({.Tag = GUMBO_TAG_H2, .Class = "h3"});
  if (!Heading) {
    return std::unexpected(core::Error{
        .Message = "title heading not found",
        .Kind = core::ErrorKind::Parse,
    });
  }
  auto Link = Heading->findFirst({.Tag = GUMBO_TAG_A});
  if (!Link) {
    return std::unexpected(core::Error{
        .Message = "title link not found",
        .Kind = core::ErrorKind::Parse,
    });
  }

  auto Title = core::text::collapseWhitespace(Link->text());
  auto Href = Link->attribute("href");
  if (Title.empty() || !Href || core::text::trim(*Href).empty()) {
    return std::unexpected(core::Error{
        .Message = "title link has no text or href",
        .Kind = core::ErrorKind::Parse,
    });
  }

  models::TrendingEntry Entry{
      .Rank = Rank,
      .Title = std::move(Title),
      .ProjectUrl = resolveUrl(SiteRoot, core::text::trim(*Href)),
  };

  for (const auto &Rule : rules()) {
    std::optional<std::string> Value;
    try {
      Value = Rule.Locate(Fragment, Window);
    } catch (const std::exception &Err) {
      Log()->debug("Entry {}: field '{}' lookup failed: {}", Rank, Rule.Name,
                   Err.what());
    }
    Entry.*Rule.Target =
        Value ? std::move(*Value) : std::string(Rule.Fallback);
  }

  return Entry;
}

} // namespace trending::scrape
