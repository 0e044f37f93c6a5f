#include "trending/mcp/dispatcher.hpp"

#include "trending/core/http.hpp"
#include "trending/core/logging.hpp"
#include "trending/scrape/models.hpp"

#include <glaze/json/read.hpp>
#include <glaze/json/write.hpp>
#include <istream>
#include <ostream>
#include <spdlog/spdlog.h>

namespace trending::mcp {

static auto Log() { return core::logger("mcp"); }

namespace {

template <class T> std::string serialize(const T &Value) {
  std::string Buffer;
  if (auto Ec = glz::write_json(Value, Buffer)) {
    Log()->error("Failed to serialize response: {}",
                 glz::format_error(Ec, Buffer));
    return R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"Internal error"}})";
  }
  return Buffer;
}

std::string errorReply(std::optional<protocol::RequestId> Id, int Code,
                       std::string Message) {
  protocol::ErrorResponse Reply{
      .id = std::move(Id),
      .error = {.code = Code, .message = std::move(Message)},
  };
  std::string Buffer;
  // JSON-RPC wants "id": null when the id could not be read.
  if (auto Ec = glz::write<glz::opts{.skip_null_members = false}>(Reply, Buffer)) {
    Log()->error("Failed to serialize error: {}", glz::format_error(Ec, Buffer));
    return R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"Internal error"}})";
  }
  return Buffer;
}

template <class T>
std::string resultReply(const protocol::RequestId &Id, T Result) {
  return serialize(protocol::Response<T>{.id = Id, .result = std::move(Result)});
}

std::vector<std::string> sinceChoices() {
  return {scrape::models::SinceValues.begin(),
          scrape::models::SinceValues.end()};
}

} // namespace

Dispatcher::Dispatcher(const tools::Toolbox &Tools) : Tools(Tools) {}

protocol::ToolsListResult Dispatcher::toolList() {
  protocol::ToolDescriptor Trending{
      .name = std::string(tools::TrendingToolName),
      .description =
          "Get GitHub trending repositories. Scrapes the GitHub trending page "
          "and returns project names, descriptions, programming languages, "
          "star counts and growth for the chosen time range.",
  };
  Trending.inputSchema.properties["since"] = {
      .type = "string",
      .description = "Time range: daily, weekly or monthly",
      .enumValues = sinceChoices(),
      .defaultValue = "daily",
  };
  Trending.inputSchema.properties["language"] = {
      .type = "string",
      .description =
          "Programming language filter, e.g. python, javascript, go. Empty "
          "for all languages",
      .defaultValue = "",
  };

  protocol::ToolDescriptor Readme{
      .name = std::string(tools::ReadmeToolName),
      .description =
          "Get the README documentation of GitHub repositories given as "
          "owner/repository-name.",
  };
  Readme.inputSchema.properties["repositories"] = {
      .type = "array",
      .description = "Repository names in the form owner/repository-name",
      .items = protocol::ItemsSchema{.type = "string"},
  };
  Readme.inputSchema.required = {"repositories"};

  return {.tools = {std::move(Trending), std::move(Readme)}};
}

std::optional<std::string> Dispatcher::handle(const std::string &Message) const {
  protocol::Request Request{};
  if (auto Ec = glz::read<core::LenientJsonOpts>(Request, Message)) {
    Log()->warn("Unparseable JSON-RPC message: {}",
                glz::format_error(Ec, Message));
    return errorReply(std::nullopt, protocol::codes::ParseError, "Parse error");
  }

  if (Request.jsonrpc != "2.0" || Request.method.empty()) {
    return errorReply(Request.id, protocol::codes::InvalidRequest,
                      "Invalid Request");
  }

  // Messages without an id are notifications and are never answered.
  if (!Request.id) {
    Log()->debug("Notification: {}", Request.method);
    return std::nullopt;
  }
  const auto &Id = *Request.id;
  Log()->debug("Request: {}", Request.method);

  if (Request.method == "initialize") {
    return resultReply(
        Id,
        protocol::InitializeResult{
            .protocolVersion = std::string(protocol::ProtocolVersion),
            .serverInfo = {.name = std::string(ServerName),
                           .version = std::string(ServerVersion)},
        }
    );
  }
  if (Request.method == "ping") {
    return resultReply(Id, std::map<std::string, std::string>{});
  }
  if (Request.method == "tools/list") {
    return resultReply(Id, toolList());
  }
  if (Request.method == "tools/call") {
    return callTool(Id, Request.params);
  }

  Log()->warn("Unknown method: {}", Request.method);
  return errorReply(Id, protocol::codes::MethodNotFound,
                    std::format("Method not found: {}", Request.method));
}

std::string
Dispatcher::callTool(const protocol::RequestId &Id,
                     const std::optional<glz::raw_json> &Params) const {
  if (!Params) {
    return errorReply(Id, protocol::codes::InvalidParams,
                      "tools/call requires params");
  }

  protocol::ToolCallParams Call{};
  if (auto Ec = glz::read<core::LenientJsonOpts>(Call, Params->str)) {
    return errorReply(Id, protocol::codes::InvalidParams,
                      std::format("Invalid tool call: {}",
                                  glz::format_error(Ec, Params->str)));
  }

  auto Arguments = Call.arguments.value_or(protocol::ToolArguments{});
  std::string Report;
  if (Call.name == tools::TrendingToolName) {
    Report = Tools.getGithubTrending(Arguments.since.value_or("daily"),
                                     Arguments.language.value_or(""));
  } else if (Call.name == tools::ReadmeToolName) {
    Report = Tools.getRepositoryReadme(
        Arguments.repositories.value_or(std::vector<std::string>{})
    );
  } else {
    return errorReply(Id, protocol::codes::InvalidParams,
                      std::format("Unknown tool: {}", Call.name));
  }

  Log()->info("Tool {} answered with {} bytes", Call.name, Report.size());
  return resultReply(
      Id, protocol::ToolCallResult{.content = {{.text = std::move(Report)}}}
  );
}

void runStdio(const Dispatcher &Handler, std::istream &In, std::ostream &Out) {
  std::string Line;
  while (std::getline(In, Line)) {
    if (Line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    if (auto Reply = Handler.handle(Line)) {
      Out << *Reply << '\n';
      Out.flush();
    }
  }
  Log()->info("stdin closed, stopping stdio transport");
}

} // namespace trending::mcp
