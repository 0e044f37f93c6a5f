#pragma once
#include <format>
#include <optional>
#include <string>
#include <vector>

namespace trending::test {

// Markup shaped like one `article.Box-row` of github.com/trending.
struct FragmentFixture {
  std::string Owner{"octo"};
  std::string Repo{"widget"};
  bool WithTitleLink{true};
  std::optional<std::string> Description{"A widget for everything"};
  std::optional<std::string> Language{"Python"};
  std::optional<std::string> Stars{"12,345"};
  std::optional<std::string> Forks{"1,234"};
  // Full label text, e.g. "1,024 stars today".
  std::optional<std::string> PeriodLabel{"1,024 stars today"};
};

inline std::string fragment(const FragmentFixture &Fixture) {
  std::string Html = "<article class=\"Box-row\">\n";
  Html += std::format(
      "  <div class=\"float-right d-flex\"><a href=\"/login?return_to=%2F{}%2F{}\" "
      "class=\"btn-sm btn\">Star</a></div>\n",
      Fixture.Owner, Fixture.Repo
  );
  if (Fixture.WithTitleLink) {
    Html += std::format(
        "  <h2 class=\"h3 lh-condensed\">\n"
        "    <a href=\"/{0}/{1}\" class=\"Link\">\n"
        "      <svg aria-hidden=\"true\" class=\"octicon octicon-repo\"></svg>\n"
        "      <span class=\"text-normal\">\n"
        "        {0} /\n"
        "      </span>\n"
        "\n"
        "      {1}\n"
        "    </a>\n"
        "  </h2>\n",
        Fixture.Owner, Fixture.Repo
    );
  } else {
    Html += "  <h2 class=\"h3 lh-condensed\">\n    <span>orphan</span>\n  </h2>\n";
  }
  if (Fixture.Description) {
    Html += std::format(
        "  <p class=\"col-9 color-fg-muted my-1 pr-4\">\n    {}\n  </p>\n",
        *Fixture.Description
    );
  }
  Html += "  <div class=\"f6 color-fg-muted mt-2\">\n";
  if (Fixture.Language) {
    Html += std::format(
        "    <span class=\"d-inline-block ml-0 mr-3\">\n"
        "      <span class=\"repo-language-color\"></span>\n"
        "      <span itemprop=\"programmingLanguage\">{}</span>\n"
        "    </span>\n",
        *Fixture.Language
    );
  }
  if (Fixture.Stars) {
    Html += std::format(
        "    <a href=\"/{}/{}/stargazers\" class=\"Link d-inline-block mr-3\">\n"
        "      <svg class=\"octicon octicon-star\"></svg>\n"
        "      {}\n"
        "    </a>\n",
        Fixture.Owner, Fixture.Repo, *Fixture.Stars
    );
  }
  if (Fixture.Forks) {
    Html += std::format(
        "    <a href=\"/{}/{}/forks\" class=\"Link d-inline-block mr-3\">\n"
        "      <svg class=\"octicon octicon-repo-forked\"></svg>\n"
        "      {}\n"
        "    </a>\n",
        Fixture.Owner, Fixture.Repo, *Fixture.Forks
    );
  }
  Html += "    <span class=\"d-inline-block mr-3\">\n"
          "      Built by\n"
          "      <a href=\"/someone\"><img class=\"avatar\" alt=\"@someone\"></a>\n"
          "    </span>\n";
  if (Fixture.PeriodLabel) {
    Html += std::format(
        "    <span class=\"d-inline-block float-sm-right\">\n"
        "      <svg class=\"octicon octicon-star\"></svg>\n"
        "      {}\n"
        "    </span>\n",
        *Fixture.PeriodLabel
    );
  }
  Html += "  </div>\n</article>\n";
  return Html;
}

inline std::string listingPage(const std::vector<FragmentFixture> &Fixtures) {
  std::string Html = "<!DOCTYPE html>\n<html><head><title>Trending</title></head>"
                     "<body><main><div class=\"Box\">\n";
  for (const auto &Fixture : Fixtures) {
    Html += fragment(Fixture);
  }
  Html += "</div></main></body></html>\n";
  return Html;
}

} // namespace trending::test
