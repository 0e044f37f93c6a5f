#include "trending/net/fetcher.hpp"

#include "glaze/net/http_client.hpp"
#include "trending/core/logging.hpp"

#include <asio/ssl.hpp>
#include <format>
#include <future>
#include <spdlog/spdlog.h>
#include <system_error>

namespace trending::net {

static auto Log() { return core::logger("server"); }

static std::expected<std::shared_ptr<glz::http_client>, core::Error>
createClient() {
  auto Client = std::make_shared<glz::http_client>();

  auto Ok = Client->configure_system_ca_certificates();
  if (!Ok) {
    Log()->error("Error: Could not find CA certificates.");
    return std::unexpected(
        core::Error{.Message = "Error: Could not find CA certificates."}
    );
  }
  return Client;
}

auto GlazeFetcher::create(const core::Config &Config)
    -> std::expected<std::unique_ptr<GlazeFetcher>, core::Error> {
  auto Client = createClient();
  if (!Client) {
    return std::unexpected(Client.error());
  }

  Headers RequestHeaders = {
      {"Accept", "text/html,text/plain;q=0.9,*/*;q=0.8"},
      {"User-Agent", Config.UserAgent},
  };
  return std::make_unique<GlazeFetcher>(createClient, std::move(*Client),
                                        std::move(RequestHeaders));
}

GlazeFetcher::GlazeFetcher(ClientFactory MakeClient,
                           std::shared_ptr<glz::http_client> Client,
                           Headers RequestHeaders)
    : MakeClient(std::move(MakeClient)), Client(std::move(Client)),
      RequestHeaders(std::move(RequestHeaders)) {}

auto GlazeFetcher::get(std::string_view Url, std::chrono::seconds Timeout)
    -> std::expected<FetchResponse, core::Error> {
  if (!Client) {
    auto Fresh = MakeClient();
    if (!Fresh) {
      return std::unexpected(core::Error{
          .Message = Fresh.error().Message,
          .Kind = core::ErrorKind::Transport,
          .Url = std::string(Url),
      });
    }
    Client = std::move(*Fresh);
  }

  Log()->debug("Making HTTP GET request to: {} (timeout {}s)", Url,
               Timeout.count());

  auto Pending = Client->get_async(Url, RequestHeaders);
  if (Pending.wait_for(Timeout) != std::future_status::ready) {
    Log()->warn("GET {} timed out after {}s", Url, Timeout.count());
    // The client owns the io threads running the stalled request. Destroying
    // it stops them and closes the connection before this call returns.
    Client.reset();
    return std::unexpected(core::Error{
        .Message = std::format("request timed out after {}s", Timeout.count()),
        .Kind = core::ErrorKind::Transport,
        .Url = std::string(Url),
    });
  }

  auto Response = Pending.get();
  if (!Response) {
    Log()->warn("GET {} failed: {}", Url, Response.error().message());
    return std::unexpected(core::Error{
        .Message = Response.error().message(),
        .Kind = core::ErrorKind::Transport,
        .Url = std::string(Url),
    });
  }

  Log()->debug("GET {} -> {} ({} bytes)", Url, Response->status_code,
               Response->response_body.size());
  return FetchResponse{
      .StatusCode = static_cast<int>(Response->status_code),
      .Body = std::move(Response->response_body),
  };
}

} // namespace trending::net
