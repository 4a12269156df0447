#pragma once

#include "dispatcher.hpp"
#include "execution_bridge.hpp"
#include "mcp_protocol.hpp"
#include "tooling.hpp"

#include <httplib.h>

#include <atomic>
#include <cstdint>

namespace toolserver {

struct RouterOptions {
  bool log_bodies = false;
};

// REST routes (/tools, /health, /status) and the JSON-RPC /mcp endpoint.
class ToolRouter {
 public:
  ToolRouter(const ToolRegistry* tools,
             RequestDispatcher* dispatcher,
             McpProtocolHandler* mcp,
             const ExecutionBridge* bridge,
             RouterOptions options = {});

  void Register(httplib::Server* server);

  uint64_t RequestCount() const { return request_count_.load(); }

 private:
  void HandleToolCall(const httplib::Request& req, httplib::Response& res, const std::string& path_tool_name);
  void LogRequest(const httplib::Request& req);

  const ToolRegistry* tools_;
  RequestDispatcher* dispatcher_;
  McpProtocolHandler* mcp_;
  const ExecutionBridge* bridge_;
  RouterOptions options_;
  std::atomic<uint64_t> request_count_{0};
};

// Makes sure every error response carries a JSON body and that exceptions
// escaping a handler become a 500 with the exception message only.
void InstallErrorHandlers(httplib::Server* server);

}  // namespace toolserver
