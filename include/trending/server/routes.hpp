#pragma once
#include "trending/mcp/dispatcher.hpp"
#include "trending/tools/toolbox.hpp"

#include <glaze/net/http_router.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trending::server {

struct TrendingRequestSchema {
  std::optional<std::string> since;
  std::optional<std::string> language;
};

struct ReadmeRequestSchema {
  std::vector<std::string> repositories;
};

struct ReportSchema {
  std::string report;
};

void registerCoreRoutes(glz::http_router &Router);

void registerToolRoutes(glz::http_router &Router,
                        std::shared_ptr<const tools::Toolbox> Tools);

void registerMcpRoutes(glz::http_router &Router,
                       std::shared_ptr<const mcp::Dispatcher> Dispatcher);

} // namespace trending::server
