#pragma once
#include "glaze/net/http_client.hpp"
#include "trending/core/config.hpp"
#include "trending/core/result.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace trending::net {

struct FetchResponse {
  int StatusCode{0};
  std::string Body;
};

// One bounded-timeout HTTP GET. Transport failures (DNS, connect, TLS,
// timeout) come back as ErrorKind::Transport; any HTTP status, including
// 4xx/5xx, is a successful fetch and is left to the caller to judge.
class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;

  virtual auto get(std::string_view Url, std::chrono::seconds Timeout)
      -> std::expected<FetchResponse, core::Error> = 0;
};

class GlazeFetcher final : public HttpFetcher {
public:
  using ClientFactory = std::function<
      std::expected<std::shared_ptr<glz::http_client>, core::Error>()>;
  using Headers = std::unordered_map<std::string, std::string>;

  static auto create(const core::Config &Config)
      -> std::expected<std::unique_ptr<GlazeFetcher>, core::Error>;

  // MakeClient supplies the replacement client after a request times out.
  GlazeFetcher(ClientFactory MakeClient,
               std::shared_ptr<glz::http_client> Client,
               Headers RequestHeaders);

  auto get(std::string_view Url, std::chrono::seconds Timeout)
      -> std::expected<FetchResponse, core::Error> override;

private:
  ClientFactory MakeClient;
  std::shared_ptr<glz::http_client> Client;
  Headers RequestHeaders;
};

} // namespace trending::net
