#pragma once
#include "glaze/net/http.hpp"
#include "glaze/net/http_server.hpp"

#include "trending/core/logging.hpp"

#include <chrono>

namespace trending::server::middleware {

// Access log on the "server" logger. Client errors are logged at warn so a
// stream of malformed tool calls stands out.
inline auto createLoggingMiddleware() {
  return [](const glz::request &Request,
            glz::response &Response,
            const auto &Next) {
    auto Start = std::chrono::steady_clock::now();
    Next();
    auto Elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - Start
    );

    auto Level = Response.status_code >= 400 ? spdlog::level::warn
                                              : spdlog::level::info;
    core::logger("server")->log(
        Level, "[{}] {} {} {}ms ({} bytes in, {} bytes out)",
        glz::to_string(Request.method), Request.path, Response.status_code,
        Elapsed.count(), Request.body.size(), Response.response_body.size()
    );
  };
}

} // namespace trending::server::middleware
