#include "trending/report/formatter.hpp"

#include "trending/core/text.hpp"

#include <format>
#include <string>
#include <utility>

namespace trending::report {

namespace {

using scrape::models::TrendingEntry;
using scrape::models::TrendingPage;

constexpr Labels English{
    .TrendingHeader = "🌟 GitHub Trending Repositories",
    .RetrievedOn = "📅 Retrieved on: {}",
    .TimeRange = "⏰ Time Range: {}",
    .Language = "💻 Language: {}",
    .FoundProjects = "📊 Found {} trending projects",
    .EntryLanguage = "Language",
    .TotalStars = "Total Stars",
    .SkippedProject = "⚠️ Skipped project {}: {}",
    .WindowNames = {"Today", "This Week", "This Month"},
    .Weekdays = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
                 "Saturday", "Sunday"},
    .ChineseDate = false,
    .NoDescription = "No description",
    .UnknownLanguage = "Unknown",
    .TrendingNextSteps = {"💡 Suggested next steps:",
                          "1. Analyze GitHub trending project trends",
                          "2. If interested in specific projects, use "
                          "get_repository_readme tool to get detailed "
                          "documentation"},
    .InvalidSince = "❌ Error: since parameter must be one of: {}",
    .NoProjects = "❌ No trending projects found, possible page structure "
                  "change or network issue",
    .NetworkError = "❌ Network request error: {}",
    .NetworkHint = "Suggest checking network connection or retry later",
    .ProgramError = "❌ Program execution error: {}",
    .RequestedUrl = "Requested URL: {}",
    .ReadmeHeader = "📚 GitHub Repository README Documents",
    .EmptyRepositories = "❌ Error: repositories parameter cannot be empty, "
                         "please provide at least one repository name",
    .InvalidRepository = "❌ Invalid repository name format: {}",
    .CorrectFormat = "   Correct format should be: owner/repository-name",
    .Retrieved = "✅ Successfully retrieved (Source: {})",
    .Repository = "Repository: {}",
    .NotFound = "❌ README file not found",
    .TriedBranches = "   Tried branches: {}",
    .TriedFiles = "   Tried files: {}",
    .NoReadable = "README: No readable README file found",
    .RepositoryError = "❌ Error processing repository {}: {}",
    .FailedToRetrieve = "README: Failed to retrieve - {}",
    .TruncationMarker = "\n\n... [Content too long, truncated] ...",
    .ReadmeNextSteps = {"💡 Suggested next steps:",
                        "- 1. Analyze detailed information and technical "
                        "features of each project",
                        "- 2. If particularly interested in a project, further "
                        "study its implementation details",
                        "- 3. Summarize technical highlights and application "
                        "scenarios of the projects"},
};

constexpr Labels Chinese{
    .TrendingHeader = "🌟 GitHub Trending Repositories",
    .RetrievedOn = "📅 获取时间: {}",
    .TimeRange = "⏰ 时间范围: {}",
    .Language = "💻 编程语言: {}",
    .FoundProjects = "📊 共发现 {} 个热门项目",
    .EntryLanguage = "语言",
    .TotalStars = "总星数",
    .SkippedProject = "⚠️ 已跳过第 {} 个项目: {}",
    .WindowNames = {"今日", "本周", "本月"},
    .Weekdays = {"星期一", "星期二", "星期三", "星期四", "星期五", "星期六",
                 "星期日"},
    .ChineseDate = true,
    .NoDescription = "无描述",
    .UnknownLanguage = "未知",
    .TrendingNextSteps = {"💡 建议下一步操作：", "1. 分析GitHub热门项目趋势",
                          "2. 如有特别关注的项目，可使用 get_repository_readme "
                          "工具获取该项目详细文档"},
    .InvalidSince = "❌ 错误：since参数必须是以下值之一: {}",
    .NoProjects = "❌ 未找到任何trending项目，可能页面结构已更改或网络问题",
    .NetworkError = "❌ 网络请求错误: {}",
    .NetworkHint = "建议检查网络连接或稍后重试",
    .ProgramError = "❌ 程序执行错误: {}",
    .RequestedUrl = "请求URL: {}",
    .ReadmeHeader = "📚 GitHub Repository README Documents",
    .EmptyRepositories =
        "❌ 错误：repositories参数不能为空，请提供至少一个仓库名称",
    .InvalidRepository = "❌ 仓库名称格式错误: {}",
    .CorrectFormat = "   正确格式应为: owner/repository-name",
    .Retrieved = "✅ 成功获取 (来源: {})",
    .Repository = "仓库名称: {}",
    .NotFound = "❌ 未找到README文件",
    .TriedBranches = "   已尝试分支: {}",
    .TriedFiles = "   已尝试文件: {}",
    .NoReadable = "README: 未找到可读取的README文件",
    .RepositoryError = "❌ 处理仓库 {} 时出错: {}",
    .FailedToRetrieve = "README: 获取失败 - {}",
    .TruncationMarker = "\n\n... [内容过长，已截断] ...",
    .ReadmeNextSteps = {"💡 建议下一步操作：",
                        "- 1. 分析每个项目的详细信息和技术特点",
                        "- 2. 如果有特别感兴趣的项目，可以进一步研究其实现细节",
                        "- 3. 总结项目的技术亮点和应用场景"},
};

template <typename... Args>
std::string fill(std::string_view Pattern, const Args &...Values) {
  return std::vformat(Pattern, std::make_format_args(Values...));
}

template <std::size_t N>
std::string listOf(const std::array<std::string_view, N> &Items) {
  std::vector<std::string> Parts(Items.begin(), Items.end());
  return core::text::join(Parts, ", ");
}

std::string_view localized(const std::string &Value,
                           std::string_view Sentinel,
                           std::string_view Replacement) {
  return Value == Sentinel ? Replacement : std::string_view{Value};
}

std::string windowName(const Labels &L, scrape::models::Since Window) {
  return std::string(L.WindowNames[static_cast<std::size_t>(Window)]);
}

void appendEntry(std::vector<std::string> &Lines,
                 const TrendingEntry &Entry,
                 const Labels &L,
                 const std::string &Window) {
  Lines.push_back(std::format("{}. {}", Entry.Rank, Entry.Title));
  Lines.push_back(std::format("   🔗 {}", Entry.ProjectUrl));
  Lines.push_back(std::format(
      "   📝 {}",
      localized(Entry.Description, scrape::models::NoDescription,
                L.NoDescription)
  ));
  Lines.push_back(std::format(
      "   💻 {}: {} | ⭐ {}: {} | 🍴 Forks: {} | 🔥 {}: +{}", L.EntryLanguage,
      localized(Entry.PrimaryLanguage, scrape::models::UnknownLanguage,
                L.UnknownLanguage),
      L.TotalStars, Entry.TotalStars, Entry.TotalForks, Window,
      Entry.PeriodStars
  ));
}

std::string joinLines(const std::vector<std::string> &Lines) {
  return core::text::join(Lines, "\n");
}

} // namespace

std::optional<Locale> parseLocale(std::string_view Code) {
  if (Code == "en") {
    return Locale::English;
  }
  if (Code == "zh") {
    return Locale::Chinese;
  }
  return std::nullopt;
}

const Labels &labels(Locale Lang) {
  return Lang == Locale::Chinese ? Chinese : English;
}

std::string formatDate(std::chrono::system_clock::time_point Now, Locale Lang) {
  const auto &L = labels(Lang);
  auto Today = std::chrono::floor<std::chrono::days>(Now);
  std::chrono::year_month_day Date{Today};
  std::chrono::weekday Weekday{Today};
  // iso_encoding(): Monday = 1 ... Sunday = 7
  auto DayName = L.Weekdays[Weekday.iso_encoding() - 1];

  auto Year = static_cast<int>(Date.year());
  auto Month = static_cast<unsigned>(Date.month());
  auto Day = static_cast<unsigned>(Date.day());
  if (L.ChineseDate) {
    return std::format("{}年{:02}月{:02}日 {}", Year, Month, Day, DayName);
  }
  return std::format("{}-{:02}-{:02} {}", Year, Month, Day, DayName);
}

std::string formatInvalidSince(Locale Lang) {
  return fill(labels(Lang).InvalidSince, listOf(scrape::models::SinceValues));
}

std::string formatProgramError(std::string_view Detail,
                               std::string_view Url,
                               Locale Lang) {
  const auto &L = labels(Lang);
  std::vector<std::string> Lines{fill(L.ProgramError, Detail)};
  if (!Url.empty()) {
    Lines.push_back(fill(L.RequestedUrl, Url));
  }
  return joinLines(Lines);
}

std::string formatTrending(
    const scrape::models::TrendingQuery &Query,
    const std::expected<TrendingPage, core::Error> &Outcome,
    Locale Lang,
    std::chrono::system_clock::time_point Now
) {
  const auto &L = labels(Lang);

  if (!Outcome) {
    const auto &Err = Outcome.error();
    switch (Err.Kind) {
    case core::ErrorKind::Validation:
      return formatInvalidSince(Lang);
    case core::ErrorKind::EmptyResult:
      return joinLines(
          {std::string(L.NoProjects), fill(L.RequestedUrl, Err.Url)}
      );
    case core::ErrorKind::Transport:
    case core::ErrorKind::HttpStatus:
      return joinLines(
          {fill(L.NetworkError, Err.Message), fill(L.RequestedUrl, Err.Url),
           std::string(L.NetworkHint)}
      );
    case core::ErrorKind::Parse:
    case core::ErrorKind::Internal:
      return formatProgramError(Err.Message, Err.Url, Lang);
    }
    return formatProgramError(Err.Message, Err.Url, Lang);
  }

  const auto &Page = *Outcome;
  auto Window = windowName(L, Query.Window);

  std::vector<std::string> Lines;
  Lines.emplace_back(L.TrendingHeader);
  Lines.push_back(fill(L.RetrievedOn, formatDate(Now, Lang)));
  Lines.push_back(fill(L.TimeRange, Window));
  if (!Query.DisplayLanguage.empty()) {
    Lines.push_back(fill(L.Language, Query.DisplayLanguage));
  }
  Lines.push_back(fill(L.FoundProjects, Page.FragmentCount));
  Lines.emplace_back();

  auto Skipped = Page.Skipped.begin();
  for (const auto &Entry : Page.Entries) {
    while (Skipped != Page.Skipped.end() && Skipped->Rank < Entry.Rank) {
      Lines.push_back(fill(L.SkippedProject, Skipped->Rank, Skipped->Reason));
      ++Skipped;
    }
    appendEntry(Lines, Entry, L, Window);
  }
  for (; Skipped != Page.Skipped.end(); ++Skipped) {
    Lines.push_back(fill(L.SkippedProject, Skipped->Rank, Skipped->Reason));
  }

  Lines.emplace_back();
  for (auto Step : L.TrendingNextSteps) {
    Lines.emplace_back(Step);
  }
  return joinLines(Lines);
}

std::string formatEmptyRepositoryList(Locale Lang) {
  return std::string(labels(Lang).EmptyRepositories);
}

std::string formatRepositoryError(std::string_view Repository,
                                  std::string_view Detail,
                                  Locale Lang) {
  const auto &L = labels(Lang);
  return joinLines({fill(L.RepositoryError, Repository, Detail),
                    fill(L.Repository, Repository),
                    fill(L.FailedToRetrieve, Detail), "---"});
}

std::string formatReadme(const std::vector<readme::ReadmeLookupResult> &Results,
                         Locale Lang) {
  const auto &L = labels(Lang);
  std::vector<std::string> Lines{std::string(L.ReadmeHeader)};

  for (const auto &Result : Results) {
    if (Result.Found) {
      Lines.push_back(fill(L.Retrieved, Result.SourceLocation.value_or("")));
      Lines.push_back(fill(L.Repository, Result.Repository));
      Lines.emplace_back("README:");
      Lines.push_back(Result.Content.value_or(""));
      Lines.emplace_back("---\n\n");
      continue;
    }

    switch (Result.Reason) {
    case readme::Failure::InvalidFormat:
      Lines.push_back(fill(L.InvalidRepository, Result.Repository));
      Lines.emplace_back(L.CorrectFormat);
      Lines.emplace_back("---");
      Lines.emplace_back();
      break;
    case readme::Failure::Exhausted:
      Lines.emplace_back(L.NotFound);
      Lines.push_back(fill(L.TriedBranches, listOf(readme::Branches)));
      Lines.push_back(fill(L.TriedFiles, listOf(readme::Filenames)));
      Lines.push_back(fill(L.Repository, Result.Repository));
      Lines.emplace_back(L.NoReadable);
      Lines.emplace_back("---\n\n");
      break;
    case readme::Failure::None:
      Lines.push_back(formatRepositoryError(
          Result.Repository, Result.ErrorDetail.value_or(""), Lang
      ));
      break;
    }
  }

  for (auto Step : L.ReadmeNextSteps) {
    Lines.emplace_back(Step);
  }
  return joinLines(Lines);
}

} // namespace trending::report
