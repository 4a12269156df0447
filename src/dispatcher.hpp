#pragma once

#include "execution_bridge.hpp"
#include "params.hpp"
#include "tooling.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace toolserver {

struct DispatcherOptions {
  std::chrono::milliseconds timeout{5000};
  bool strict_arguments = false;
};

struct DispatcherStats {
  uint64_t handled = 0;
  uint64_t ok = 0;
  uint64_t unknown_tool = 0;
  uint64_t validation_error = 0;
  uint64_t timeout = 0;
  uint64_t execution_failure = 0;
};

// Resolves, validates and runs one tool call. Every path returns a
// well-formed ToolResult; nothing thrown by a tool crosses Handle().
class RequestDispatcher {
 public:
  RequestDispatcher(const ToolRegistry* tools, ExecutionBridge* bridge, DispatcherOptions options = {});

  ToolResult Handle(const ToolRequest& request);

  DispatcherStats Stats() const;
  const ToolRegistry* Tools() const { return tools_; }

 private:
  ToolResult Record(ToolResult r);

  const ToolRegistry* tools_;
  ExecutionBridge* bridge_;
  DispatcherOptions options_;

  std::atomic<uint64_t> handled_{0};
  std::atomic<uint64_t> ok_{0};
  std::atomic<uint64_t> unknown_tool_{0};
  std::atomic<uint64_t> validation_error_{0};
  std::atomic<uint64_t> timeout_{0};
  std::atomic<uint64_t> execution_failure_{0};
};

}  // namespace toolserver
