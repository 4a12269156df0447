#include "tooling.hpp"

#include <iostream>
#include <utility>

namespace toolserver {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "none";
    case ErrorKind::UnknownTool:
      return "unknown_tool";
    case ErrorKind::ValidationError:
      return "validation_error";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::ToolExecutionFailure:
      return "tool_execution_failure";
    case ErrorKind::CodecError:
      return "codec_error";
  }
  return "unknown";
}

ToolResult ToolResult::Ok(std::string payload, ContentType content_type) {
  ToolResult r;
  r.ok = true;
  r.payload = std::move(payload);
  r.content_type = content_type;
  return r;
}

ToolResult ToolResult::Err(ErrorKind kind, const std::string& message, std::string field) {
  ToolResult r;
  r.ok = false;
  r.error_kind = kind;
  r.error = "Error: " + (message.empty() ? std::string("unknown error") : message);
  r.field = std::move(field);
  return r;
}

bool ToolRegistry::Register(std::unique_ptr<ITool> tool, std::string* err) {
  if (Sealed()) {
    if (err) *err = "registry is sealed";
    return false;
  }
  if (!tool) {
    if (err) *err = "null tool";
    return false;
  }

  auto entry = std::make_unique<Entry>();
  entry->descriptor.name = tool->Name();
  entry->descriptor.description = tool->Description();
  entry->descriptor.input_schema = tool->InputSchema();
  entry->descriptor.result_type = tool->ResultType();
  const auto& name = entry->descriptor.name;

  if (name.empty()) {
    if (err) *err = "tool name is empty";
    return false;
  }
  if (index_.find(name) != index_.end()) {
    if (err) *err = "duplicate tool name: " + name;
    return false;
  }
  if (entry->descriptor.input_schema.type != SchemaType::Object) {
    if (err) *err = name + ": input schema must be an object";
    return false;
  }
  std::string schema_err;
  if (!ValidateSchema(entry->descriptor.input_schema, &schema_err)) {
    if (err) *err = name + ": invalid input schema: " + schema_err;
    return false;
  }

  entry->tool = std::move(tool);
  index_[name] = entries_.size();
  entries_.push_back(std::move(entry));
  std::cout << "[registry] registered tool=" << entries_.back()->descriptor.name << "\n";
  return true;
}

void ToolRegistry::Seal() {
  if (sealed_.exchange(true, std::memory_order_acq_rel)) return;
  std::cout << "[registry] sealed tools=" << entries_.size() << "\n";
}

const ToolRegistry::Entry* ToolRegistry::Find(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return nullptr;
  return entries_[it->second].get();
}

ITool* ToolRegistry::Resolve(const std::string& name) const {
  const auto* e = Find(name);
  return e ? e->tool.get() : nullptr;
}

const ToolDescriptor* ToolRegistry::Descriptor(const std::string& name) const {
  const auto* e = Find(name);
  return e ? &e->descriptor : nullptr;
}

std::vector<ToolDescriptor> ToolRegistry::List() const {
  std::vector<ToolDescriptor> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e->descriptor);
  return out;
}

}  // namespace toolserver
