#include "http_router.hpp"

#include "config.hpp"
#include "log_util.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

namespace toolserver {
namespace {

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static void SendJson(httplib::Response* res, int status, const nlohmann::ordered_json& body) {
  res->status = status;
  res->set_content(DumpJson(body), "application/json");
}

static void SendMethodNotAllowed(const httplib::Request&, httplib::Response& res) {
  nlohmann::ordered_json j;
  j["error"] = "Method not allowed";
  SendJson(&res, 405, j);
}

}  // namespace

ToolRouter::ToolRouter(const ToolRegistry* tools,
                       RequestDispatcher* dispatcher,
                       McpProtocolHandler* mcp,
                       const ExecutionBridge* bridge,
                       RouterOptions options)
    : tools_(tools), dispatcher_(dispatcher), mcp_(mcp), bridge_(bridge), options_(options) {}

void ToolRouter::LogRequest(const httplib::Request& req) {
  request_count_++;
  std::cout << "[request] " << req.method << " " << req.path << " remote=" << req.remote_addr;
  if (options_.log_bodies && !req.body.empty()) {
    std::cout << " body=" << TruncateForLog(SanitizeBodyForLog(req.body), 2000);
  }
  std::cout << "\n";
}

void ToolRouter::HandleToolCall(const httplib::Request& req, httplib::Response& res, const std::string& path_tool_name) {
  std::string err;
  auto decoded = DecodeToolRequest(req.body, path_tool_name, &err);
  if (!decoded) {
    auto r = ToolResult::Err(ErrorKind::CodecError, err);
    std::cout << "[tool-result] tool=" << (path_tool_name.empty() ? "-" : path_tool_name)
              << " ok=0 kind=" << ErrorKindName(r.error_kind) << " error=" << r.error << "\n";
    return SendJson(&res, HttpStatusFor(r.error_kind), EncodeToolResult(r));
  }
  auto r = dispatcher_->Handle(*decoded);
  SendJson(&res, HttpStatusFor(r.error_kind), EncodeToolResult(r));
}

void ToolRouter::Register(httplib::Server* server) {
  server->Get("/tools", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, EncodeDiscovery(tools_ ? tools_->List() : std::vector<ToolDescriptor>{}));
  });

  server->Post("/tools", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    HandleToolCall(req, res, "");
  });

  server->Post(R"(/tools/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    HandleToolCall(req, res, req.matches[1].str());
  });

  server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    nlohmann::ordered_json j;
    j["status"] = "ok";
    j["server"] = kServerName;
    j["version"] = kServerVersion;
    j["unix_seconds"] = NowSeconds();
    SendJson(&res, 200, j);
  });

  server->Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::ordered_json j;
    j["requests"] = RequestCount();
    j["tools"] = tools_ ? tools_->Size() : 0;
    if (bridge_) {
      const auto b = bridge_->Stats();
      j["bridge"] = {{"submitted", b.submitted},
                     {"completed", b.completed},
                     {"failed", b.failed},
                     {"timed_out", b.timed_out},
                     {"rejected", b.rejected},
                     {"late_results", b.late_results},
                     {"pending", bridge_->Context() ? bridge_->Context()->Pending() : 0}};
    }
    if (dispatcher_) {
      const auto d = dispatcher_->Stats();
      j["dispatcher"] = {{"handled", d.handled},
                         {"ok", d.ok},
                         {"unknown_tool", d.unknown_tool},
                         {"validation_error", d.validation_error},
                         {"timeout", d.timeout},
                         {"execution_failure", d.execution_failure}};
    }
    SendJson(&res, 200, j);
  });

  server->Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto reply = mcp_->Process(req.body);
    res.status = reply.status;
    if (!reply.body.empty()) res.set_content(reply.body, "application/json");
  });

  server->Get("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto info = McpProtocolHandler::ServerInfo();
    info["protocolVersion"] = kProtocolVersion;
    info["status"] = "running";
    SendJson(&res, 200, info);
  });
  server->Put("/mcp", SendMethodNotAllowed);
  server->Delete("/mcp", SendMethodNotAllowed);
  server->Patch("/mcp", SendMethodNotAllowed);
}

void InstallErrorHandlers(httplib::Server* server) {
  server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] handler exception path=" << req.path << " error=" << message << "\n";
    SendJson(&res, 500, EncodeError("Error: " + message, ErrorKind::ToolExecutionFailure));
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "not found";
    } else if (res.status == 405) {
      message = "Method not allowed";
    } else if (res.status >= 500) {
      message = "internal server error";
    } else {
      message = "bad request";
    }
    nlohmann::ordered_json j;
    j["error"] = message;
    res.set_content(DumpJson(j), "application/json");
  });
}

}  // namespace toolserver
