#pragma once
#include "trending/net/fetcher.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::readme {

// Probe order is part of the contract: every filename is tried on the first
// branch before the second branch is touched.
inline constexpr std::array<std::string_view, 2> Branches{"main", "master"};
inline constexpr std::array<std::string_view, 5> Filenames{
    "README.md", "readme.md", "Readme.md", "README.txt", "readme.txt"};

inline constexpr std::chrono::seconds CandidateTimeout{20};
inline constexpr std::size_t MaxContentChars = 50'000;
inline constexpr std::string_view DefaultTruncationMarker =
    "\n\n... [Content too long, truncated] ...";

enum class Failure : uint8_t { None, InvalidFormat, Exhausted };

struct ReadmeLookupResult {
  std::string Repository;
  bool Found{false};
  std::optional<std::string> SourceLocation;
  std::optional<std::string> Content;
  bool Truncated{false};
  std::optional<std::string> ErrorDetail;
  Failure Reason{Failure::None};
};

struct ResolverOptions {
  std::string RawContentBaseUrl{"https://raw.githubusercontent.com"};
  std::string TruncationMarker{DefaultTruncationMarker};
};

class ReadmeResolver {
public:
  ReadmeResolver(net::HttpFetcher &Fetcher, ResolverOptions Options);

  // nullopt for a blank identifier; such positions produce no result.
  std::optional<ReadmeLookupResult> resolve(std::string_view Identifier) const;

  // Sequential, in input order. A failed repository never stops the batch.
  std::vector<ReadmeLookupResult>
  resolveAll(const std::vector<std::string> &Identifiers) const;

  std::string candidateUrl(std::string_view Repository,
                           std::string_view Branch,
                           std::string_view Filename) const;

private:
  net::HttpFetcher &Fetcher;
  ResolverOptions Options;
};

// Cuts Content to MaxContentChars code points and appends Marker when it is
// longer. Returns whether it cut anything.
bool truncateContent(std::string &Content, std::string_view Marker);

} // namespace trending::readme
