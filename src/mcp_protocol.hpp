#pragma once

#include "dispatcher.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace toolserver {

constexpr int kJsonRpcParseError = -32700;
constexpr int kJsonRpcInvalidRequest = -32600;
constexpr int kJsonRpcMethodNotFound = -32601;
constexpr int kJsonRpcInvalidParams = -32602;
constexpr int kJsonRpcInternalError = -32603;

struct McpReply {
  int status = 200;
  // Empty for notifications (answered with 202).
  std::string body;
};

// JSON-RPC 2.0 front end (initialize, tools/list, tools/call) over the same
// registry and dispatcher as the REST routes.
class McpProtocolHandler {
 public:
  McpProtocolHandler(const ToolRegistry* tools, RequestDispatcher* dispatcher);

  McpReply Process(const std::string& body);

  static nlohmann::ordered_json ServerInfo();

 private:
  nlohmann::ordered_json HandleInitialize() const;
  nlohmann::ordered_json HandleToolsList() const;
  // Returns null with *code and *err set when the call must be answered with
  // a JSON-RPC error instead of a result.
  nlohmann::ordered_json HandleToolsCall(const nlohmann::json& params, int* code, std::string* err);

  const ToolRegistry* tools_;
  RequestDispatcher* dispatcher_;
};

}  // namespace toolserver
