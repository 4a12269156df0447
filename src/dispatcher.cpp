#include "dispatcher.hpp"

#include "log_util.hpp"

#include <iostream>
#include <utility>

namespace toolserver {
namespace {

static void LogToolCall(const ToolRequest& req) {
  std::cout << "[tool-call] tool=" << req.tool_name
            << " arguments=" << TruncateForLog(SanitizeJsonForLog(req.raw_arguments), 2000) << "\n";
}

static void LogToolResult(const ToolRequest& req, const ToolResult& r, int64_t elapsed_ms) {
  std::cout << "[tool-result] tool=" << req.tool_name << " ok=" << (r.ok ? 1 : 0)
            << " kind=" << ErrorKindName(r.error_kind) << " elapsed_ms=" << elapsed_ms;
  if (!r.ok) {
    std::cout << " error=" << TruncateForLog(r.error, 500)
              << " arguments=" << TruncateForLog(SanitizeJsonForLog(req.raw_arguments), 500);
  } else {
    std::cout << " bytes=" << r.payload.size();
  }
  std::cout << "\n";
}

}  // namespace

RequestDispatcher::RequestDispatcher(const ToolRegistry* tools, ExecutionBridge* bridge, DispatcherOptions options)
    : tools_(tools), bridge_(bridge), options_(options) {}

ToolResult RequestDispatcher::Record(ToolResult r) {
  handled_++;
  switch (r.error_kind) {
    case ErrorKind::None:
      ok_++;
      break;
    case ErrorKind::UnknownTool:
      unknown_tool_++;
      break;
    case ErrorKind::ValidationError:
    case ErrorKind::CodecError:
      validation_error_++;
      break;
    case ErrorKind::Timeout:
      timeout_++;
      break;
    case ErrorKind::ToolExecutionFailure:
      execution_failure_++;
      break;
  }
  return r;
}

ToolResult RequestDispatcher::Handle(const ToolRequest& request) {
  LogToolCall(request);

  auto* tool = tools_ ? tools_->Resolve(request.tool_name) : nullptr;
  const auto* descriptor = tools_ ? tools_->Descriptor(request.tool_name) : nullptr;
  if (!tool || !descriptor) {
    auto r = ToolResult::Err(ErrorKind::UnknownTool, "unknown tool: " + request.tool_name);
    LogToolResult(request, r, 0);
    return Record(std::move(r));
  }

  ParamError perr;
  ExtractOptions extract_options;
  extract_options.reject_unrecognized = options_.strict_arguments;
  auto params = ExtractParams(descriptor->input_schema, request.raw_arguments, &perr, extract_options);
  if (!params) {
    auto r = ToolResult::Err(ErrorKind::ValidationError, perr.Message(), perr.field);
    LogToolResult(request, r, 0);
    return Record(std::move(r));
  }

  if (!bridge_) {
    auto r = ToolResult::Err(ErrorKind::Timeout, "mutation context unavailable");
    LogToolResult(request, r, 0);
    return Record(std::move(r));
  }

  auto outcome = bridge_->Run([tool, p = std::move(*params)]() { return tool->Execute(p); }, options_.timeout);

  ToolResult r;
  switch (outcome.state) {
    case InvocationState::Completed:
      r = ToolResult::Ok(std::move(outcome.value), descriptor->result_type);
      break;
    case InvocationState::Failed:
      r = ToolResult::Err(ErrorKind::ToolExecutionFailure, outcome.error);
      break;
    case InvocationState::TimedOut:
    case InvocationState::Rejected:
      r = ToolResult::Err(ErrorKind::Timeout, outcome.error);
      break;
  }
  LogToolResult(request, r, outcome.elapsed_ms);
  return Record(std::move(r));
}

DispatcherStats RequestDispatcher::Stats() const {
  DispatcherStats s;
  s.handled = handled_.load();
  s.ok = ok_.load();
  s.unknown_tool = unknown_tool_.load();
  s.validation_error = validation_error_.load();
  s.timeout = timeout_.load();
  s.execution_failure = execution_failure_.load();
  return s;
}

}  // namespace toolserver
