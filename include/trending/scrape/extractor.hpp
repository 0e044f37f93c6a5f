#pragma once
#include "trending/core/result.hpp"
#include "trending/html/document.hpp"
#include "trending/scrape/models.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace trending::scrape {

// One optional field of a listing entry: where to find it and what to use
// when it is not there. Rules are evaluated independently of each other.
struct FieldRule {
  std::string_view Name;
  std::string models::TrendingEntry::*Target;
  std::function<std::optional<std::string>(const html::Node &, models::Since)>
      Locate;
  std::string_view Fallback;
};

std::span<const FieldRule> optionalFieldRules();

// Extracts one entry from an `article.Box-row` fragment. Fails with
// ErrorKind::Parse only when the title link is missing; every other field
// falls back to its default.
auto extractEntry(
    const html::Node &Fragment,
    models::Since Window,
    std::size_t Rank,
    std::string_view SiteRoot
) -> std::expected<models::TrendingEntry, core::Error>;

// Leading star count of a label such as "1,234 stars today".
std::optional<std::string> periodStarCount(std::string_view Label);

} // namespace trending::scrape
