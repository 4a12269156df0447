#include "config.hpp"
#include "dispatcher.hpp"
#include "execution_bridge.hpp"
#include "http_router.hpp"
#include "mcp_protocol.hpp"
#include "tooling.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/metadata_formatters.hpp"
#include "workspace.hpp"

#include <httplib.h>

#include <chrono>
#include <iostream>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);

  const auto cfg = toolserver::LoadConfigFromEnv();
  std::cout << "[config] host=" << cfg.listen.host << " port=" << cfg.listen.port
            << " http_threads=" << cfg.listen.threads << " tool_timeout_ms=" << cfg.tool_timeout_ms
            << " default_limit=" << cfg.default_limit << " max_limit=" << cfg.max_limit
            << " strict_arguments=" << (cfg.strict_arguments ? 1 : 0) << " log_bodies=" << (cfg.log_bodies ? 1 : 0)
            << " workspace_file=" << (cfg.workspace_file.empty() ? "-" : cfg.workspace_file) << "\n";

  // Declaration order matters: the mutation context is stopped (and destroyed)
  // before the tools and workspace its queued work may still reference.
  toolserver::Workspace workspace;
  if (!cfg.workspace_file.empty()) {
    std::string err;
    if (!toolserver::LoadWorkspaceSnapshot(cfg.workspace_file, &workspace, &err)) {
      std::cerr << "[workspace] failed to load " << cfg.workspace_file << ": " << err << "\n";
      return 1;
    }
  }
  std::cout << "[workspace] projects=" << workspace.Projects().size() << "\n";

  auto formatters = toolserver::BuildDefaultFormatters();

  toolserver::ToolRegistry registry;
  {
    std::string err;
    if (!toolserver::RegisterBuiltinTools(&registry, &workspace, &formatters, cfg, &err)) {
      std::cerr << "[registry] failed to register built-in tools: " << err << "\n";
      return 1;
    }
  }
  registry.Seal();

  toolserver::WorkQueueContext mutation_context;
  mutation_context.Start();

  toolserver::ExecutionBridge bridge(&mutation_context);
  toolserver::DispatcherOptions dispatch_opts;
  dispatch_opts.timeout = std::chrono::milliseconds(cfg.tool_timeout_ms);
  dispatch_opts.strict_arguments = cfg.strict_arguments;
  toolserver::RequestDispatcher dispatcher(&registry, &bridge, dispatch_opts);
  toolserver::McpProtocolHandler mcp(&registry, &dispatcher);

  toolserver::RouterOptions router_opts;
  router_opts.log_bodies = cfg.log_bodies;
  toolserver::ToolRouter router(&registry, &dispatcher, &mcp, &bridge, router_opts);

  httplib::Server server;
  const size_t http_threads = static_cast<size_t>(cfg.listen.threads);
  server.new_task_queue = [http_threads] { return new httplib::ThreadPool(http_threads); };
  router.Register(&server);
  toolserver::InstallErrorHandlers(&server);

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";

  mutation_context.Stop();
  return ok ? 0 : 1;
}
