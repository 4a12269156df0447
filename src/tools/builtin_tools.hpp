#pragma once

#include "config.hpp"
#include "tooling.hpp"
#include "tools/metadata_formatters.hpp"
#include "tools/tool.hpp"
#include "workspace.hpp"

#include <string>

namespace toolserver {

struct ToolLimits {
  int default_limit = 100;
  int max_limit = 1000;

  // Non-positive requests get the default; anything above the maximum is clamped.
  int Clamp(int64_t requested) const;
};

class GetServerVersionTool : public ITool {
 public:
  std::string Name() const override { return "get_server_version"; }
  std::string Description() const override;
  SchemaNode InputSchema() const override;
  std::string Execute(const ParamMap& params) override;
};

class ListProjectsTool : public ITool {
 public:
  explicit ListProjectsTool(Workspace* workspace) : workspace_(workspace) {}

  std::string Name() const override { return "list_projects"; }
  std::string Description() const override;
  SchemaNode InputSchema() const override;
  ContentType ResultType() const override { return ContentType::Json; }
  std::string Execute(const ParamMap& params) override;

 private:
  Workspace* workspace_;
};

class RevalidateProjectTool : public ITool {
 public:
  explicit RevalidateProjectTool(Workspace* workspace) : workspace_(workspace) {}

  std::string Name() const override { return "revalidate_project"; }
  std::string Description() const override;
  SchemaNode InputSchema() const override;
  ContentType ResultType() const override { return ContentType::Json; }
  std::string Execute(const ParamMap& params) override;

 private:
  Workspace* workspace_;
};

class ListMetadataObjectsTool : public ITool {
 public:
  ListMetadataObjectsTool(Workspace* workspace, ToolLimits limits) : workspace_(workspace), limits_(limits) {}

  std::string Name() const override { return "list_metadata_objects"; }
  std::string Description() const override;
  SchemaNode InputSchema() const override;
  std::string Execute(const ParamMap& params) override;

 private:
  Workspace* workspace_;
  ToolLimits limits_;
};

class GetMetadataDetailsTool : public ITool {
 public:
  GetMetadataDetailsTool(Workspace* workspace, const FormatterRegistry* formatters)
      : workspace_(workspace), formatters_(formatters) {}

  std::string Name() const override { return "get_metadata_details"; }
  std::string Description() const override;
  SchemaNode InputSchema() const override;
  std::string Execute(const ParamMap& params) override;

 private:
  Workspace* workspace_;
  const FormatterRegistry* formatters_;
};

// Looks up an open project or throws ToolError.
const Project& RequireOpenProject(const Workspace& workspace, const std::string& name);

// Registers every built-in tool. The workspace and formatters must outlive
// the registry.
bool RegisterBuiltinTools(ToolRegistry* registry,
                          Workspace* workspace,
                          const FormatterRegistry* formatters,
                          const ServerConfig& cfg,
                          std::string* err);

}  // namespace toolserver
