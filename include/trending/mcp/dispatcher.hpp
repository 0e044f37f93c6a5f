#pragma once
#include "trending/mcp/protocol.hpp"
#include "trending/tools/toolbox.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace trending::mcp {

inline constexpr std::string_view ServerName = "github-trending-analyzer";
inline constexpr std::string_view ServerVersion = "1.0.0";

class Dispatcher {
public:
  explicit Dispatcher(const tools::Toolbox &Tools);

  // Handles one JSON-RPC message. Notifications produce no reply.
  std::optional<std::string> handle(const std::string &Message) const;

  static protocol::ToolsListResult toolList();

private:
  std::string callTool(const protocol::RequestId &Id,
                       const std::optional<glz::raw_json> &Params) const;

  const tools::Toolbox &Tools;
};

// Line-delimited JSON-RPC over a stream pair; returns on end of input.
void runStdio(const Dispatcher &Handler, std::istream &In, std::ostream &Out);

} // namespace trending::mcp
