#include "tools/builtin_tools.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>

namespace toolserver {

int ToolLimits::Clamp(int64_t requested) const {
  if (requested <= 0) return default_limit;
  if (requested > max_limit) return max_limit;
  return static_cast<int>(requested);
}

const Project& RequireOpenProject(const Workspace& workspace, const std::string& name) {
  const auto* p = workspace.FindProject(name);
  if (!p) throw ToolError("project not found: " + name);
  if (!p->open) throw ToolError("project is closed: " + name);
  return *p;
}

std::string GetServerVersionTool::Description() const {
  return "Return the tool server name, version and supported protocol version.";
}

SchemaNode GetServerVersionTool::InputSchema() const {
  return SchemaBuilder::Object().Build();
}

std::string GetServerVersionTool::Execute(const ParamMap&) {
  std::ostringstream oss;
  oss << "# " << kServerName << "\n\n";
  oss << "| Property | Value |\n";
  oss << "|---|---|\n";
  oss << "| Version | " << kServerVersion << " |\n";
  oss << "| Protocol | " << kProtocolVersion << " |\n";
  return oss.str();
}

std::string ListProjectsTool::Description() const {
  return "List all workspace projects with properties (name, path, open state, description, natures, revision).";
}

SchemaNode ListProjectsTool::InputSchema() const {
  return SchemaBuilder::Object().Build();
}

std::string ListProjectsTool::Execute(const ParamMap&) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& p : workspace_->Projects()) {
    nlohmann::ordered_json item;
    item["name"] = p.name;
    item["path"] = p.path;
    item["open"] = p.open;
    if (!p.description.empty()) item["description"] = p.description;
    if (!p.natures.empty()) item["natures"] = p.natures;
    item["revision"] = p.revision;
    out.push_back(std::move(item));
  }
  return out.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string RevalidateProjectTool::Description() const {
  return "Revalidate a project. Bumps the project revision and returns the new value.";
}

SchemaNode RevalidateProjectTool::InputSchema() const {
  return SchemaBuilder::Object().StringProperty("projectName", "Project name (required)", true).Build();
}

std::string RevalidateProjectTool::Execute(const ParamMap& params) {
  const auto name = params.GetString("projectName");
  RequireOpenProject(*workspace_, name);
  auto* p = workspace_->FindProject(name);
  p->revision++;
  nlohmann::ordered_json out;
  out["project"] = p->name;
  out["revision"] = p->revision;
  return out.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

bool RegisterBuiltinTools(ToolRegistry* registry,
                          Workspace* workspace,
                          const FormatterRegistry* formatters,
                          const ServerConfig& cfg,
                          std::string* err) {
  ToolLimits limits;
  limits.default_limit = cfg.default_limit;
  limits.max_limit = cfg.max_limit;

  if (!registry->Register(std::make_unique<GetServerVersionTool>(), err)) return false;
  if (!registry->Register(std::make_unique<ListProjectsTool>(workspace), err)) return false;
  if (!registry->Register(std::make_unique<ListMetadataObjectsTool>(workspace, limits), err)) return false;
  if (!registry->Register(std::make_unique<GetMetadataDetailsTool>(workspace, formatters), err)) return false;
  if (!registry->Register(std::make_unique<RevalidateProjectTool>(workspace), err)) return false;
  return true;
}

}  // namespace toolserver
