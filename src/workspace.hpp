#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace toolserver {

struct MetadataAttribute {
  std::string name;
  std::string type;
};

struct MetadataObject {
  // Category tag used to pick a formatter: "Catalog", "Document", "CommonModule", ...
  std::string category;
  std::string name;
  std::string synonym;
  std::string comment;
  std::vector<MetadataAttribute> attributes;
  std::vector<std::string> tabular_sections;
  std::vector<std::string> forms;
  // Free-form category specific properties, in insertion order.
  std::vector<std::pair<std::string, std::string>> properties;

  std::string Fqn() const { return category + "." + name; }
};

struct Project {
  std::string name;
  std::string path;
  bool open = true;
  std::string description;
  std::vector<std::string> natures;
  int64_t revision = 0;
  std::vector<MetadataObject> objects;

  const MetadataObject* FindObject(const std::string& category, const std::string& name) const;
};

// The host project model. Not synchronized: every access goes through the
// mutation context.
class Workspace {
 public:
  const std::vector<Project>& Projects() const { return projects_; }
  Project* FindProject(const std::string& name);
  const Project* FindProject(const std::string& name) const;
  bool AddProject(Project project, std::string* err);
  bool Empty() const { return projects_.empty(); }

 private:
  std::vector<Project> projects_;
};

bool ParseWorkspaceSnapshot(const nlohmann::json& j, Workspace* out, std::string* err);
bool LoadWorkspaceSnapshot(const std::string& path, Workspace* out, std::string* err);

}  // namespace toolserver
