#pragma once

#include "schema.hpp"
#include "tools/tool.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolserver {

struct ToolDescriptor {
  std::string name;
  std::string description;
  SchemaNode input_schema;
  ContentType result_type = ContentType::Markdown;
};

enum class ErrorKind { None, UnknownTool, ValidationError, Timeout, ToolExecutionFailure, CodecError };

const char* ErrorKindName(ErrorKind kind);

struct ToolRequest {
  std::string tool_name;
  nlohmann::json raw_arguments = nlohmann::json::object();
};

struct ToolResult {
  bool ok = true;
  std::string payload;
  ContentType content_type = ContentType::Markdown;
  ErrorKind error_kind = ErrorKind::None;
  // "Error: <message>" for failures.
  std::string error;
  // Field name for validation failures.
  std::string field;

  static ToolResult Ok(std::string payload, ContentType content_type);
  static ToolResult Err(ErrorKind kind, const std::string& message, std::string field = {});
};

// Filled during startup, then sealed. Once sealed nothing is added or removed,
// so Resolve/List/Descriptor take no lock and returned pointers stay valid for
// the registry's lifetime.
class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  bool Register(std::unique_ptr<ITool> tool, std::string* err);
  void Seal();
  bool Sealed() const { return sealed_.load(std::memory_order_acquire); }

  ITool* Resolve(const std::string& name) const;
  const ToolDescriptor* Descriptor(const std::string& name) const;
  std::vector<ToolDescriptor> List() const;
  size_t Size() const { return entries_.size(); }

 private:
  struct Entry {
    ToolDescriptor descriptor;
    std::unique_ptr<ITool> tool;
  };

  const Entry* Find(const std::string& name) const;

  std::atomic<bool> sealed_{false};
  std::vector<std::unique_ptr<Entry>> entries_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace toolserver
