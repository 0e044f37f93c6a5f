#pragma once
#include "trending/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::scrape::models {

enum class Since : uint8_t { Daily, Weekly, Monthly };

inline constexpr std::array<std::string_view, 3> SinceValues{
    "daily", "weekly", "monthly"};

std::optional<Since> parseSince(std::string_view Value);
std::string_view toString(Since Value);
// Phrase the listing uses next to the period star count ("today", ...).
std::string_view windowPhrase(Since Value);

struct TrendingQuery {
  Since Window{Since::Daily};
  // Lower-cased, trimmed; empty means all languages.
  std::string Language;
  // Trimmed, as the caller wrote it.
  std::string DisplayLanguage;

  static auto create(std::string_view SinceValue, std::string_view Language)
      -> std::expected<TrendingQuery, core::Error>;
};

// Sentinels used when the listing omits a field.
inline constexpr std::string_view NoDescription = "No description";
inline constexpr std::string_view UnknownLanguage = "Unknown";
inline constexpr std::string_view ZeroCount = "0";

struct TrendingEntry {
  std::size_t Rank{0};
  std::string Title;
  std::string ProjectUrl;
  std::string Description{NoDescription};
  std::string PrimaryLanguage{UnknownLanguage};
  std::string TotalStars{ZeroCount};
  std::string TotalForks{ZeroCount};
  std::string PeriodStars{ZeroCount};
};

struct SkippedFragment {
  std::size_t Rank{0};
  std::string Reason;
};

struct TrendingPage {
  std::string Url;
  std::size_t FragmentCount{0};
  std::vector<TrendingEntry> Entries;
  std::vector<SkippedFragment> Skipped;
};

} // namespace trending::scrape::models
