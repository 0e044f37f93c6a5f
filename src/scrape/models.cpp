#include "trending/scrape/models.hpp"

#include "trending/core/text.hpp"

#include <format>

namespace trending::scrape::models {

std::optional<Since> parseSince(std::string_view Value) {
  if (Value == "daily") {
    return Since::Daily;
  }
  if (Value == "weekly") {
    return Since::Weekly;
  }
  if (Value == "monthly") {
    return Since::Monthly;
  }
  return std::nullopt;
}

std::string_view toString(Since Value) {
  switch (Value) {
  case Since::Daily:
    return "daily";
  case Since::Weekly:
    return "weekly";
  case Since::Monthly:
    return "monthly";
  }
  return "daily";
}

std::string_view windowPhrase(Since Value) {
  switch (Value) {
  case Since::Daily:
    return "today";
  case Since::Weekly:
    return "this week";
  case Since::Monthly:
    return "this month";
  }
  return "today";
}

auto TrendingQuery::create(std::string_view SinceValue, std::string_view Language)
    -> std::expected<TrendingQuery, core::Error> {
  auto Window = parseSince(SinceValue);
  if (!Window) {
    return std::unexpected(core::Error{
        .Message = std::format(
            "since parameter must be one of: {}, {}, {}", SinceValues[0],
            SinceValues[1], SinceValues[2]
        ),
        .Kind = core::ErrorKind::Validation,
    });
  }
  auto Trimmed = core::text::trim(Language);
  return TrendingQuery{
      .Window = *Window,
      .Language = core::text::toLower(Trimmed),
      .DisplayLanguage = std::string(Trimmed),
  };
}

} // namespace trending::scrape::models
