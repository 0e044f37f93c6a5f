#include "trending/readme/resolver.hpp"

#include "trending/core/http.hpp"
#include "trending/core/logging.hpp"
#include "trending/core/text.hpp"

#include <format>
#include <spdlog/spdlog.h>

namespace trending::readme {

static auto Log() { return core::logger("readme"); }

namespace {

template <std::size_t N>
std::string listOf(const std::array<std::string_view, N> &Items) {
  std::vector<std::string> Parts(Items.begin(), Items.end());
  return core::text::join(Parts, ", ");
}

} // namespace

ReadmeResolver::ReadmeResolver(net::HttpFetcher &Fetcher,
                               ResolverOptions Options)
    : Fetcher(Fetcher), Options(std::move(Options)) {}

std::string ReadmeResolver::candidateUrl(std::string_view Repository,
                                         std::string_view Branch,
                                         std::string_view Filename) const {
  return std::format("{}/{}/refs/heads/{}/{}", Options.RawContentBaseUrl,
                     Repository, Branch, Filename);
}

std::optional<ReadmeLookupResult>
ReadmeResolver::resolve(std::string_view Identifier) const {
  auto Repository = core::text::trim(Identifier);
  if (Repository.empty()) {
    return std::nullopt;
  }

  ReadmeLookupResult Result{.Repository = std::string(Repository)};

  if (Repository.find('/') == std::string_view::npos) {
    Log()->warn("Invalid repository name format: {}", Repository);
    Result.Reason = Failure::InvalidFormat;
    Result.ErrorDetail = std::format(
        "invalid repository name '{}', expected owner/repository-name",
        Repository
    );
    return Result;
  }

  for (auto Branch : Branches) {
    for (auto Filename : Filenames) {
      auto Url = candidateUrl(Repository, Branch, Filename);
      auto Response = Fetcher.get(Url, CandidateTimeout);
      if (!Response) {
        Log()->debug("Candidate {} unreachable: {}", Url,
                     Response.error().Message);
        continue;
      }
      if (Response->StatusCode !=
          static_cast<int>(core::HttpStatus::Ok)) {
        Log()->debug("Candidate {} answered HTTP {}", Url,
                     Response->StatusCode);
        continue;
      }

      Log()->info("README for {} found at {}", Repository, Url);
      Result.Found = true;
      Result.SourceLocation = std::move(Url);
      Result.Truncated =
          truncateContent(Response->Body, Options.TruncationMarker);
      Result.Content = std::move(Response->Body);
      return Result;
    }
  }

  Log()->warn("No README found for {}", Repository);
  Result.Reason = Failure::Exhausted;
  Result.ErrorDetail =
      std::format("README file not found; tried branches: {}; tried files: {}",
                  listOf(Branches), listOf(Filenames));
  return Result;
}

std::vector<ReadmeLookupResult>
ReadmeResolver::resolveAll(const std::vector<std::string> &Identifiers) const {
  std::vector<ReadmeLookupResult> Results;
  Results.reserve(Identifiers.size());
  for (const auto &Identifier : Identifiers) {
    if (auto Result = resolve(Identifier)) {
      Results.push_back(std::move(*Result));
    }
  }
  return Results;
}

bool truncateContent(std::string &Content, std::string_view Marker) {
  auto Cut = core::text::utf8PrefixBytes(Content, MaxContentChars);
  if (!Cut) {
    return false;
  }
  Content.resize(*Cut);
  Content += Marker;
  return true;
}

} // namespace trending::readme
