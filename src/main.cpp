#include <algorithm>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <glaze/net/http_router.hpp>
#include <glaze/net/http_server.hpp>
#include <iostream>
#include <memory>
#include <ranges>
#include <system_error>
#include <thread>
#include <vector>

#include "spdlog/spdlog.h"
#include "trending/core/config.hpp"
#include "trending/core/logging.hpp"
#include "trending/mcp/dispatcher.hpp"
#include "trending/net/fetcher.hpp"
#include "trending/server/middleware/logging.hpp"
#include "trending/server/routes.hpp"
#include "trending/tools/toolbox.hpp"

int main() {
  auto Config = trending::core::Config::load();
  if (!Config) {
    spdlog::error(Config.error().Message);
    return 1;
  }
  trending::core::setupLogging(*Config);

  spdlog::debug("Loaded config - Host: {}, Port: {}, Locale: {}", Config->Host,
                Config->Port, Config->ReportLocale);

  auto Fetcher = trending::net::GlazeFetcher::create(*Config);
  if (!Fetcher) {
    spdlog::error(Fetcher.error().Message);
    return 1;
  }

  auto Tools = std::make_shared<const trending::tools::Toolbox>(
      **Fetcher, *Config
  );
  auto Dispatcher = std::make_shared<const trending::mcp::Dispatcher>(*Tools);

  if (Config->McpTransport == trending::core::Transport::Stdio) {
    spdlog::info("GitHub Trending Analyzer serving MCP over stdio.");
    trending::mcp::runStdio(*Dispatcher, std::cin, std::cout);
    return 0;
  }

  auto IOContext = std::make_shared<asio::io_context>();
  auto Server{glz::http_server<false>(IOContext)};

  spdlog::info("🌟GitHub Trending Analyzer🌟");
  Server.bind(Config->Host, Config->Port);
  spdlog::info("Binding to Address: {}, Port: {}.", Config->Host, Config->Port);

  // Register Middleware
  Server.wrap(trending::server::middleware::createLoggingMiddleware());

  // Register Routes
  glz::http_router Router;
  spdlog::info("Registering routes:");
  trending::server::registerCoreRoutes(Router);
  trending::server::registerMcpRoutes(Router, Dispatcher);
  spdlog::info("ToolRoutes");
  glz::http_router ToolRouter;
  trending::server::registerToolRoutes(ToolRouter, Tools);

  // Mount the routers
  Server.mount("/", Router);
  Server.mount("/api", ToolRouter);

  // Start The Server (0 Worker Threads so we can run with ASIO shared IO
  // Context)
  Server.start(0);

  std::vector<std::thread> Threads;
  const size_t NumThreads = std::max(1u, std::thread::hardware_concurrency());
  Threads.reserve(NumThreads);

  spdlog::info("Server ready and listening on http://{}:{}", Config->Host,
               Config->Port);
  spdlog::info("Sharing {} threads.", NumThreads);

  asio::signal_set Signals(*IOContext, SIGINT, SIGTERM);
  Signals.async_wait([&](const std::error_code &, int) {
    spdlog::info("Shutdown signal received.");
    Server.stop();
    IOContext->stop();
  });

  for (auto _ : std::views::iota(0uz, NumThreads)) {
    Threads.emplace_back([IOContext]() { IOContext->run(); });
  }

  for (auto &Thread : Threads) {
    if (Thread.joinable()) {
      Thread.join();
    }
  }

  return 0;
}
