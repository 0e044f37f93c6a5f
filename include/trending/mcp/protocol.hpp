#pragma once
#include "glaze/glaze.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// JSON-RPC 2.0 / Model Context Protocol wire types. Member names are the
// wire names.
namespace trending::mcp::protocol {

inline constexpr std::string_view ProtocolVersion = "2024-11-05";

using RequestId = std::variant<int64_t, std::string>;

struct Request {
  std::string jsonrpc;
  std::optional<RequestId> id;
  std::string method;
  std::optional<glz::raw_json> params;
};

struct ToolArguments {
  std::optional<std::string> since;
  std::optional<std::string> language;
  std::optional<std::vector<std::string>> repositories;
};

struct ToolCallParams {
  std::string name;
  std::optional<ToolArguments> arguments;
};

struct ServerInfo {
  std::string name;
  std::string version;
};

struct ToolsCapability {
  bool listChanged{false};
};

struct ServerCapabilities {
  ToolsCapability tools;
};

struct InitializeResult {
  std::string protocolVersion;
  ServerCapabilities capabilities;
  ServerInfo serverInfo;
};

struct ItemsSchema {
  std::string type;
};

struct PropertySchema {
  std::string type;
  std::string description;
  std::optional<std::vector<std::string>> enumValues;
  std::optional<std::string> defaultValue;
  std::optional<ItemsSchema> items;
};

struct InputSchema {
  std::string type{"object"};
  std::map<std::string, PropertySchema> properties;
  std::vector<std::string> required;
};

struct ToolDescriptor {
  std::string name;
  std::string description;
  InputSchema inputSchema;
};

struct ToolsListResult {
  std::vector<ToolDescriptor> tools;
};

struct TextContent {
  std::string type{"text"};
  std::string text;
};

struct ToolCallResult {
  std::vector<TextContent> content;
  bool isError{false};
};

template <class T> struct Response {
  std::string jsonrpc{"2.0"};
  RequestId id;
  T result;
};

struct ErrorObject {
  int code{0};
  std::string message;
};

struct ErrorResponse {
  std::string jsonrpc{"2.0"};
  std::optional<RequestId> id;
  ErrorObject error;
};

namespace codes {
inline constexpr int ParseError = -32700;
inline constexpr int InvalidRequest = -32600;
inline constexpr int MethodNotFound = -32601;
inline constexpr int InvalidParams = -32602;
inline constexpr int InternalError = -32603;
} // namespace codes

} // namespace trending::mcp::protocol

// "enum" and "default" are keywords, so these keys are mapped by hand.
template <> struct glz::meta<trending::mcp::protocol::PropertySchema> {
  using T = trending::mcp::protocol::PropertySchema;
  static constexpr auto value = object(
      "type", &T::type,
      "description", &T::description,
      "enum", &T::enumValues,
      "default", &T::defaultValue,
      "items", &T::items
  );
};
