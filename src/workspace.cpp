#include "workspace.hpp"

#include <fstream>
#include <sstream>

namespace toolserver {
namespace {

static std::string GetStr(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static std::vector<std::string> GetStrArray(const nlohmann::json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& it : j[key]) {
    if (it.is_string()) out.push_back(it.get<std::string>());
  }
  return out;
}

static bool ParseObject(const nlohmann::json& j, MetadataObject* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "metadata object must be a json object";
    return false;
  }
  out->category = GetStr(j, "type");
  out->name = GetStr(j, "name");
  if (out->category.empty() || out->name.empty()) {
    if (err) *err = "metadata object requires type and name";
    return false;
  }
  out->synonym = GetStr(j, "synonym");
  out->comment = GetStr(j, "comment");
  if (j.contains("attributes") && j["attributes"].is_array()) {
    for (const auto& a : j["attributes"]) {
      if (a.is_string()) {
        out->attributes.push_back({a.get<std::string>(), ""});
      } else if (a.is_object()) {
        out->attributes.push_back({GetStr(a, "name"), GetStr(a, "type")});
      }
    }
  }
  out->tabular_sections = GetStrArray(j, "tabularSections");
  out->forms = GetStrArray(j, "forms");
  if (j.contains("properties") && j["properties"].is_object()) {
    for (const auto& [k, v] : j["properties"].items()) {
      out->properties.emplace_back(k, v.is_string() ? v.get<std::string>() : v.dump());
    }
  }
  return true;
}

}  // namespace

const MetadataObject* Project::FindObject(const std::string& category, const std::string& name) const {
  for (const auto& o : objects) {
    if (o.category == category && o.name == name) return &o;
  }
  return nullptr;
}

Project* Workspace::FindProject(const std::string& name) {
  for (auto& p : projects_) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

const Project* Workspace::FindProject(const std::string& name) const {
  for (const auto& p : projects_) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

bool Workspace::AddProject(Project project, std::string* err) {
  if (project.name.empty()) {
    if (err) *err = "project name is empty";
    return false;
  }
  if (FindProject(project.name)) {
    if (err) *err = "duplicate project: " + project.name;
    return false;
  }
  projects_.push_back(std::move(project));
  return true;
}

bool ParseWorkspaceSnapshot(const nlohmann::json& j, Workspace* out, std::string* err) {
  if (!out) return false;
  if (!j.is_object() || !j.contains("projects") || !j["projects"].is_array()) {
    if (err) *err = "snapshot must be an object with a projects array";
    return false;
  }
  Workspace ws;
  for (const auto& pj : j["projects"]) {
    if (!pj.is_object()) {
      if (err) *err = "project entry must be a json object";
      return false;
    }
    Project p;
    p.name = GetStr(pj, "name");
    p.path = GetStr(pj, "path");
    p.description = GetStr(pj, "description");
    if (pj.contains("open") && pj["open"].is_boolean()) p.open = pj["open"].get<bool>();
    p.natures = GetStrArray(pj, "natures");
    if (pj.contains("objects") && pj["objects"].is_array()) {
      for (const auto& oj : pj["objects"]) {
        MetadataObject o;
        std::string obj_err;
        if (!ParseObject(oj, &o, &obj_err)) {
          if (err) *err = "project " + p.name + ": " + obj_err;
          return false;
        }
        p.objects.push_back(std::move(o));
      }
    }
    if (!ws.AddProject(std::move(p), err)) return false;
  }
  *out = std::move(ws);
  return true;
}

bool LoadWorkspaceSnapshot(const std::string& path, Workspace* out, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open workspace file: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  auto j = nlohmann::json::parse(ss.str(), nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json in workspace file: " + path;
    return false;
  }
  return ParseWorkspaceSnapshot(j, out, err);
}

}  // namespace toolserver
