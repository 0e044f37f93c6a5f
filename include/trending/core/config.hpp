#pragma once
#include "trending/core/result.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace trending::core {

enum class Transport : uint8_t { Http, Stdio };

struct Config {
  std::string Host{"127.0.0.1"};
  int Port = 3000;
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;
  std::string ReportLocale{"en"};
  Transport McpTransport{Transport::Http};
  std::string GitHubBaseUrl{"https://github.com"};
  std::string RawContentBaseUrl{"https://raw.githubusercontent.com"};
  std::string UserAgent{"github-trending-analyzer/1.0"};

  static std::expected<Config, Error> load() {
    Config Cfg;

    if (auto *HostEnv = std::getenv("HOST"); HostEnv != nullptr) {
      Cfg.Host = HostEnv;
    }

    if (auto *PortEnv = std::getenv("PORT"); PortEnv != nullptr) {
      std::string_view Value{PortEnv};
      int Port = 0;
      auto [Ptr, Ec] =
          std::from_chars(Value.data(), Value.data() + Value.size(), Port);
      if (Ec != std::errc{} || Ptr != Value.data() + Value.size() ||
          Port < 1 || Port > 65535) {
        return std::unexpected(Error{
            .Message = std::format("PORT must be 1-65535, got '{}'", Value),
            .Kind = ErrorKind::Validation,
        });
      }
      Cfg.Port = Port;
    }

    if (auto *LevelEnv = std::getenv("LOG_LEVEL"); LevelEnv != nullptr) {
      std::string_view Level{LevelEnv};
      if (Level != "trace" && Level != "debug" && Level != "info" &&
          Level != "warn" && Level != "error" && Level != "critical" &&
          Level != "off") {
        return std::unexpected(Error{
            .Message = std::format("Unknown LOG_LEVEL '{}'", Level),
            .Kind = ErrorKind::Validation,
        });
      }
      Cfg.LogLevel = Level;
    }

    if (auto *LogDirEnv = std::getenv("LOG_DIR");
        LogDirEnv != nullptr && *LogDirEnv != '\0') {
      Cfg.LogDir = LogDirEnv;
    }

    if (auto *LocaleEnv = std::getenv("REPORT_LOCALE"); LocaleEnv != nullptr) {
      std::string_view Locale{LocaleEnv};
      if (Locale != "en" && Locale != "zh") {
        return std::unexpected(Error{
            .Message =
                std::format("REPORT_LOCALE must be 'en' or 'zh', got '{}'", Locale),
            .Kind = ErrorKind::Validation,
        });
      }
      Cfg.ReportLocale = Locale;
    }

    if (auto *TransportEnv = std::getenv("MCP_TRANSPORT");
        TransportEnv != nullptr) {
      std::string_view Value{TransportEnv};
      if (Value == "http") {
        Cfg.McpTransport = Transport::Http;
      } else if (Value == "stdio") {
        Cfg.McpTransport = Transport::Stdio;
      } else {
        return std::unexpected(Error{
            .Message = std::format(
                "MCP_TRANSPORT must be 'http' or 'stdio', got '{}'", Value
            ),
            .Kind = ErrorKind::Validation,
        });
      }
    }

    if (auto *BaseEnv = std::getenv("GITHUB_BASE_URL"); BaseEnv != nullptr) {
      Cfg.GitHubBaseUrl = BaseEnv;
    }

    if (auto *RawEnv = std::getenv("RAW_CONTENT_BASE_URL"); RawEnv != nullptr) {
      Cfg.RawContentBaseUrl = RawEnv;
    }

    if (auto *AgentEnv = std::getenv("HTTP_USER_AGENT"); AgentEnv != nullptr) {
      Cfg.UserAgent = AgentEnv;
    }

    // Base URLs are joined with "/..." paths.
    while (Cfg.GitHubBaseUrl.ends_with('/')) {
      Cfg.GitHubBaseUrl.pop_back();
    }
    while (Cfg.RawContentBaseUrl.ends_with('/')) {
      Cfg.RawContentBaseUrl.pop_back();
    }

    return Cfg;
  }
};

} // namespace trending::core
