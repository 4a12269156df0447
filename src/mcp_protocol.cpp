#include "mcp_protocol.hpp"

#include "config.hpp"
#include "protocol.hpp"

#include <iostream>
#include <optional>

namespace toolserver {
namespace {

static nlohmann::ordered_json ToOrdered(const nlohmann::json& j) {
  return nlohmann::ordered_json::parse(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

static std::string MakeResponse(const nlohmann::ordered_json& id, nlohmann::ordered_json result) {
  nlohmann::ordered_json out;
  out["jsonrpc"] = "2.0";
  out["result"] = std::move(result);
  out["id"] = id;
  return DumpJson(out);
}

static std::string MakeErrorResponse(const nlohmann::ordered_json& id, int code, const std::string& message) {
  nlohmann::ordered_json out;
  out["jsonrpc"] = "2.0";
  out["error"] = {{"code", code}, {"message", message}};
  out["id"] = id;
  return DumpJson(out);
}

}  // namespace

McpProtocolHandler::McpProtocolHandler(const ToolRegistry* tools, RequestDispatcher* dispatcher)
    : tools_(tools), dispatcher_(dispatcher) {}

nlohmann::ordered_json McpProtocolHandler::ServerInfo() {
  nlohmann::ordered_json info;
  info["name"] = kServerName;
  info["version"] = kServerVersion;
  return info;
}

nlohmann::ordered_json McpProtocolHandler::HandleInitialize() const {
  nlohmann::ordered_json result;
  result["protocolVersion"] = kProtocolVersion;
  result["capabilities"] = {{"tools", nlohmann::ordered_json::object()}};
  result["serverInfo"] = ServerInfo();
  return result;
}

nlohmann::ordered_json McpProtocolHandler::HandleToolsList() const {
  return EncodeDiscovery(tools_ ? tools_->List() : std::vector<ToolDescriptor>{});
}

nlohmann::ordered_json McpProtocolHandler::HandleToolsCall(const nlohmann::json& params, int* code, std::string* err) {
  if (code) *code = kJsonRpcInvalidParams;
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    if (err) *err = "missing field: name";
    return nullptr;
  }
  ToolRequest req;
  req.tool_name = params["name"].get<std::string>();
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    if (!params["arguments"].is_object()) {
      if (err) *err = "field type mismatch: arguments";
      return nullptr;
    }
    req.raw_arguments = params["arguments"];
  }

  auto r = dispatcher_->Handle(req);
  // Unknown tools are a protocol error; every other failure is a tool result
  // flagged with isError.
  if (r.error_kind == ErrorKind::UnknownTool) {
    if (code) *code = kJsonRpcMethodNotFound;
    if (err) *err = r.error;
    return nullptr;
  }
  nlohmann::ordered_json item;
  item["type"] = "text";
  item["text"] = r.ok ? r.payload : r.error;
  nlohmann::ordered_json result;
  result["content"] = nlohmann::ordered_json::array({item});
  if (!r.ok) result["isError"] = true;
  return result;
}

McpReply McpProtocolHandler::Process(const std::string& body) {
  McpReply reply;
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    reply.body = MakeErrorResponse(nullptr, kJsonRpcParseError, "Parse error");
    return reply;
  }
  if (!j.is_object() || !j.contains("method") || !j["method"].is_string()) {
    nlohmann::ordered_json id = nullptr;
    if (j.is_object() && j.contains("id")) id = ToOrdered(j["id"]);
    reply.body = MakeErrorResponse(id, kJsonRpcInvalidRequest, "Invalid Request");
    return reply;
  }

  const auto method = j["method"].get<std::string>();
  const bool is_notification = !j.contains("id");
  const auto id = is_notification ? nlohmann::ordered_json(nullptr) : ToOrdered(j["id"]);
  static const nlohmann::json kNoParams = nlohmann::json::object();
  const auto& params = j.contains("params") ? j["params"] : kNoParams;

  std::cout << "[mcp] method=" << method << " id=" << (is_notification ? std::string("-") : DumpJson(id)) << "\n";

  if (is_notification) {
    // Notifications (notifications/initialized and friends) get no body.
    reply.status = 202;
    return reply;
  }

  if (method == "initialize") {
    reply.body = MakeResponse(id, HandleInitialize());
    return reply;
  }
  if (method == "ping") {
    reply.body = MakeResponse(id, nlohmann::ordered_json::object());
    return reply;
  }
  if (method == "tools/list") {
    reply.body = MakeResponse(id, HandleToolsList());
    return reply;
  }
  if (method == "tools/call") {
    if (!dispatcher_) {
      reply.body = MakeErrorResponse(id, kJsonRpcInternalError, "dispatcher unavailable");
      return reply;
    }
    int code = kJsonRpcInvalidParams;
    std::string err;
    auto result = HandleToolsCall(params, &code, &err);
    if (result.is_null()) {
      reply.body = MakeErrorResponse(id, code, err.empty() ? "Invalid params" : err);
      return reply;
    }
    reply.body = MakeResponse(id, std::move(result));
    return reply;
  }

  reply.body = MakeErrorResponse(id, kJsonRpcMethodNotFound, "Method not found: " + method);
  return reply;
}

}  // namespace toolserver
