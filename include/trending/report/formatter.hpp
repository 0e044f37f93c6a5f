#pragma once
#include "trending/core/result.hpp"
#include "trending/readme/resolver.hpp"
#include "trending/scrape/models.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::report {

enum class Locale : uint8_t { English, Chinese };

std::optional<Locale> parseLocale(std::string_view Code);

struct Labels {
  // Trending report
  std::string_view TrendingHeader;
  std::string_view RetrievedOn;
  std::string_view TimeRange;
  std::string_view Language;
  std::string_view FoundProjects; // {} = fragment count
  std::string_view EntryLanguage;
  std::string_view TotalStars;
  std::string_view SkippedProject; // {} = rank, {} = reason
  std::array<std::string_view, 3> WindowNames;
  std::array<std::string_view, 7> Weekdays; // Monday first
  bool ChineseDate;
  std::string_view NoDescription;
  std::string_view UnknownLanguage;
  std::array<std::string_view, 3> TrendingNextSteps;

  // Trending errors
  std::string_view InvalidSince; // {} = accepted values
  std::string_view NoProjects;
  std::string_view NetworkError; // {} = detail
  std::string_view NetworkHint;
  std::string_view ProgramError; // {} = detail
  std::string_view RequestedUrl; // {} = url

  // README report
  std::string_view ReadmeHeader;
  std::string_view EmptyRepositories;
  std::string_view InvalidRepository; // {} = repository
  std::string_view CorrectFormat;
  std::string_view Retrieved; // {} = url
  std::string_view Repository; // {} = repository
  std::string_view NotFound;
  std::string_view TriedBranches; // {} = list
  std::string_view TriedFiles; // {} = list
  std::string_view NoReadable;
  std::string_view RepositoryError; // {} = repository, {} = detail
  std::string_view FailedToRetrieve; // {} = detail
  std::string_view TruncationMarker;
  std::array<std::string_view, 4> ReadmeNextSteps;
};

const Labels &labels(Locale Lang);

std::string formatDate(std::chrono::system_clock::time_point Now, Locale Lang);

std::string formatTrending(
    const scrape::models::TrendingQuery &Query,
    const std::expected<scrape::models::TrendingPage, core::Error> &Outcome,
    Locale Lang,
    std::chrono::system_clock::time_point Now
);

std::string formatInvalidSince(Locale Lang);
std::string formatProgramError(std::string_view Detail,
                               std::string_view Url,
                               Locale Lang);

std::string formatReadme(const std::vector<readme::ReadmeLookupResult> &Results,
                         Locale Lang);
std::string formatEmptyRepositoryList(Locale Lang);
std::string formatRepositoryError(std::string_view Repository,
                                  std::string_view Detail,
                                  Locale Lang);

} // namespace trending::report
