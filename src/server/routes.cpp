#include "trending/server/routes.hpp"

#include "trending/core/http.hpp"

#include <glaze/core/read.hpp>
#include <spdlog/spdlog.h>

namespace trending::server {

void registerCoreRoutes(glz::http_router &Router) {
  using enum core::HttpStatus;

  // Healthcheck endpoint
  Router.get("/health", [](const glz::request &, glz::response &Response) {
    spdlog::debug("GET /health - Running healthcheck");
    Response.status(static_cast<int>(Ok)).json({{"status", "healthy"}});
  });

  // Routes documentation endpoint
  Router.get("/routes", [](const glz::request &, glz::response &Response) {
    spdlog::debug("GET /routes - Listing all endpoints");
    Response.status(static_cast<int>(Ok))
        .json(
            {{"service", "GitHub Trending Analyzer"},
             {"version", "1.0.0"},
             {"endpoints",
              {{{"path", "/health"},
                {"method", "GET"},
                {"description", "Health check endpoint"}},
               {{"path", "/routes"},
                {"method", "GET"},
                {"description", "Lists all available API endpoints"}},
               {{"path", "/api/trending"},
                {"method", "POST"},
                {"description",
                 "Trending repositories report; body {since, language}"}},
               {{"path", "/api/readme"},
                {"method", "POST"},
                {"description", "README report; body {repositories}"}},
               {{"path", "/mcp"},
                {"method", "POST"},
                {"description", "Model Context Protocol JSON-RPC endpoint"}}}}}
        );
  });
}

void registerToolRoutes(glz::http_router &Router,
                        std::shared_ptr<const tools::Toolbox> Tools) {
  using enum core::HttpStatus;

  Router.post(
      "/trending", [Tools](const glz::request &Request, glz::response &Response) {
        TrendingRequestSchema Query;
        if (!Request.body.empty()) {
          if (auto JsonError = glz::read<core::JsonOpts>(Query, Request.body)) {
            spdlog::warn("POST /trending - Invalid JSON in request body");
            Response.status(static_cast<int>(BadRequest))
                .json({{"error", "Invalid JSON"}});
            return;
          }
        }

        spdlog::debug("POST /trending - since={} language={}",
                      Query.since.value_or("daily"),
                      Query.language.value_or(""));
        auto Report = Tools->getGithubTrending(Query.since.value_or("daily"),
                                               Query.language.value_or(""));
        Response.status(static_cast<int>(Ok))
            .json(ReportSchema{.report = std::move(Report)});
      }
  );

  Router.post(
      "/readme", [Tools](const glz::request &Request, glz::response &Response) {
        ReadmeRequestSchema Payload;
        if (auto JsonError = glz::read<core::JsonOpts>(Payload, Request.body)) {
          spdlog::warn("POST /readme - Invalid JSON in request body");
          Response.status(static_cast<int>(BadRequest))
              .json({{"error", "Invalid JSON: expected {\"repositories\": [...]}"}});
          return;
        }

        spdlog::debug("POST /readme - {} repositories",
                      Payload.repositories.size());
        auto Report = Tools->getRepositoryReadme(Payload.repositories);
        Response.status(static_cast<int>(Ok))
            .json(ReportSchema{.report = std::move(Report)});
      }
  );
}

void registerMcpRoutes(glz::http_router &Router,
                       std::shared_ptr<const mcp::Dispatcher> Dispatcher) {
  using enum core::HttpStatus;

  Router.post(
      "/mcp", [Dispatcher](const glz::request &Request, glz::response &Response) {
        auto Reply = Dispatcher->handle(Request.body);
        if (!Reply) {
          Response.status(static_cast<int>(Accepted));
          return;
        }
        Response.status(static_cast<int>(Ok))
            .header("Content-Type", "application/json")
            .body(*Reply);
      }
  );
}

} // namespace trending::server
