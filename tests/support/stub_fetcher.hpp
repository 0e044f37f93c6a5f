#pragma once
#include "trending/net/fetcher.hpp"

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace trending::test {

// Answers from a URL table and records every request in order. URLs not in
// the table answer with DefaultStatus and an empty body.
class StubFetcher : public net::HttpFetcher {
public:
  struct Call {
    std::string Url;
    std::chrono::seconds Timeout;
  };

  void respond(std::string Url, int Status, std::string Body) {
    Responses[std::move(Url)] =
        net::FetchResponse{.StatusCode = Status, .Body = std::move(Body)};
  }

  void failTransport(std::string Url, std::string Message) {
    Failures[std::move(Url)] = std::move(Message);
  }

  auto get(std::string_view Url, std::chrono::seconds Timeout)
      -> std::expected<net::FetchResponse, core::Error> override {
    Calls.push_back({.Url = std::string(Url), .Timeout = Timeout});

    std::string Key{Url};
    if (auto Failure = Failures.find(Key); Failure != Failures.end()) {
      return std::unexpected(core::Error{
          .Message = Failure->second,
          .Kind = core::ErrorKind::Transport,
          .Url = Key,
      });
    }
    if (auto Hit = Responses.find(Key); Hit != Responses.end()) {
      return Hit->second;
    }
    return net::FetchResponse{.StatusCode = DefaultStatus};
  }

  std::vector<std::string> urls() const {
    std::vector<std::string> Urls;
    for (const auto &Each : Calls) {
      Urls.push_back(Each.Url);
    }
    return Urls;
  }

  int DefaultStatus = 404;
  std::vector<Call> Calls;

private:
  std::map<std::string, net::FetchResponse> Responses;
  std::map<std::string, std::string> Failures;
};

} // namespace trending::test
