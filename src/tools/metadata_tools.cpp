#include "tools/builtin_tools.hpp"

#include <cctype>
#include <sstream>

namespace toolserver {
namespace {

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

// Accepts both the singular tag ("Catalog") and the plural collection name
// ("Catalogs"), case-insensitively.
static bool MatchesMetadataType(const std::string& category, const std::string& filter) {
  if (filter.empty()) return true;
  const auto c = ToLower(category);
  const auto f = ToLower(filter);
  return c == f || c + "s" == f;
}

}  // namespace

std::string ListMetadataObjectsTool::Description() const {
  return "List metadata objects of a project as a markdown table. "
         "Optionally filter by metadata type (e.g. 'Catalog' or 'Catalogs').";
}

SchemaNode ListMetadataObjectsTool::InputSchema() const {
  return SchemaBuilder::Object()
      .StringProperty("projectName", "Project name (required)", true)
      .StringProperty("metadataType", "Filter by metadata type (e.g. 'Catalogs', 'Documents', 'CommonModules')")
      .IntegerProperty("limit", "Maximum number of results. Default: " + std::to_string(limits_.default_limit))
      .Build();
}

std::string ListMetadataObjectsTool::Execute(const ParamMap& params) {
  const auto& project = RequireOpenProject(*workspace_, params.GetString("projectName"));
  const auto filter = params.GetString("metadataType");
  const int limit = limits_.Clamp(params.GetInt("limit", 0));

  std::vector<const MetadataObject*> matched;
  for (const auto& o : project.objects) {
    if (MatchesMetadataType(o.category, filter)) matched.push_back(&o);
  }

  std::ostringstream oss;
  oss << "# Metadata objects: " << project.name << "\n\n";
  if (matched.empty()) {
    oss << "No metadata objects found";
    if (!filter.empty()) oss << " for type " << filter;
    oss << ".\n";
    return oss.str();
  }
  oss << "| FQN | Synonym |\n";
  oss << "|---|---|\n";
  size_t shown = 0;
  for (const auto* o : matched) {
    if (shown >= static_cast<size_t>(limit)) break;
    oss << "| " << EscapeMarkdownCell(o->Fqn()) << " | " << EscapeMarkdownCell(o->synonym) << " |\n";
    shown++;
  }
  oss << "\nShowing " << shown << " of " << matched.size() << " objects.\n";
  return oss.str();
}

std::string GetMetadataDetailsTool::Description() const {
  return "Get detailed properties of a metadata object. "
         "Returns basic info by default, or full details with 'full: true'.";
}

SchemaNode GetMetadataDetailsTool::InputSchema() const {
  return SchemaBuilder::Object()
      .StringProperty("projectName", "Project name (required)", true)
      .StringProperty("objectFqn", "Fully qualified name, e.g. 'Catalog.Products' (required)", true)
      .BooleanProperty("full", "Return all properties (true) or only key info (false). Default: false", false, false)
      .Build();
}

std::string GetMetadataDetailsTool::Execute(const ParamMap& params) {
  const auto& project = RequireOpenProject(*workspace_, params.GetString("projectName"));
  const auto fqn = params.GetString("objectFqn");
  const auto dot = fqn.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= fqn.size()) {
    throw ToolError("invalid objectFqn: " + fqn + " (expected Type.Name)");
  }
  const auto* object = project.FindObject(fqn.substr(0, dot), fqn.substr(dot + 1));
  if (!object) throw ToolError("metadata object not found: " + fqn);
  return formatters_->Format(*object, params.GetBool("full"));
}

}  // namespace toolserver
