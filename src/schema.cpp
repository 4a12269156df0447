#include "schema.hpp"

#include <algorithm>
#include <unordered_set>

namespace toolserver {
namespace {

static bool DefaultMatchesType(SchemaType type, const nlohmann::json& v) {
  switch (type) {
    case SchemaType::String:
      return v.is_string();
    case SchemaType::Integer:
      return v.is_number_integer();
    case SchemaType::Boolean:
      return v.is_boolean();
    case SchemaType::Object:
      return v.is_object();
  }
  return false;
}

}  // namespace

const char* SchemaTypeName(SchemaType type) {
  switch (type) {
    case SchemaType::Object:
      return "object";
    case SchemaType::String:
      return "string";
    case SchemaType::Integer:
      return "integer";
    case SchemaType::Boolean:
      return "boolean";
  }
  return "unknown";
}

const SchemaNode* SchemaNode::FindProperty(const std::string& name) const {
  for (const auto& prop : properties) {
    if (prop.name == name) return &prop.node;
  }
  return nullptr;
}

bool SchemaNode::IsRequired(const std::string& name) const {
  return std::find(required.begin(), required.end(), name) != required.end();
}

bool ValidateSchema(const SchemaNode& node, std::string* err) {
  if (node.default_value && !DefaultMatchesType(node.type, *node.default_value)) {
    if (err) *err = std::string("default value does not match type ") + SchemaTypeName(node.type);
    return false;
  }
  if (node.type != SchemaType::Object) {
    if (!node.properties.empty() || !node.required.empty()) {
      if (err) *err = std::string("properties declared on non-object schema of type ") + SchemaTypeName(node.type);
      return false;
    }
    return true;
  }

  std::unordered_set<std::string> names;
  for (const auto& [name, prop] : node.properties) {
    if (name.empty()) {
      if (err) *err = "empty property name";
      return false;
    }
    if (!names.insert(name).second) {
      if (err) *err = "duplicate property: " + name;
      return false;
    }
    // The extractor only produces scalar values.
    if (prop.type == SchemaType::Object) {
      if (err) *err = "nested object property is not supported: " + name;
      return false;
    }
    std::string child_err;
    if (!ValidateSchema(prop, &child_err)) {
      if (err) *err = name + ": " + child_err;
      return false;
    }
  }
  for (const auto& name : node.required) {
    if (names.find(name) == names.end()) {
      if (err) *err = "required property is not declared: " + name;
      return false;
    }
  }
  return true;
}

nlohmann::ordered_json SchemaToJson(const SchemaNode& node) {
  nlohmann::ordered_json j;
  j["type"] = SchemaTypeName(node.type);
  if (!node.description.empty()) j["description"] = node.description;
  if (node.default_value) j["default"] = nlohmann::ordered_json::parse(node.default_value->dump());
  if (node.type == SchemaType::Object) {
    nlohmann::ordered_json props = nlohmann::ordered_json::object();
    for (const auto& prop : node.properties) props[prop.name] = SchemaToJson(prop.node);
    j["properties"] = std::move(props);
    j["required"] = node.required;
  }
  return j;
}

SchemaBuilder SchemaBuilder::Object() {
  return SchemaBuilder();
}

SchemaBuilder& SchemaBuilder::Description(std::string description) {
  root_.description = std::move(description);
  return *this;
}

SchemaBuilder& SchemaBuilder::AddProperty(const std::string& name, SchemaNode node, bool required) {
  root_.properties.push_back(SchemaProperty{name, std::move(node)});
  if (required) Required(name);
  return *this;
}

SchemaBuilder& SchemaBuilder::StringProperty(const std::string& name,
                                             std::string description,
                                             bool required,
                                             std::optional<std::string> default_value) {
  SchemaNode node;
  node.type = SchemaType::String;
  node.description = std::move(description);
  if (default_value) node.default_value = *default_value;
  return AddProperty(name, std::move(node), required);
}

SchemaBuilder& SchemaBuilder::IntegerProperty(const std::string& name,
                                              std::string description,
                                              bool required,
                                              std::optional<int64_t> default_value) {
  SchemaNode node;
  node.type = SchemaType::Integer;
  node.description = std::move(description);
  if (default_value) node.default_value = *default_value;
  return AddProperty(name, std::move(node), required);
}

SchemaBuilder& SchemaBuilder::BooleanProperty(const std::string& name,
                                              std::string description,
                                              bool required,
                                              std::optional<bool> default_value) {
  SchemaNode node;
  node.type = SchemaType::Boolean;
  node.description = std::move(description);
  if (default_value) node.default_value = *default_value;
  return AddProperty(name, std::move(node), required);
}

SchemaBuilder& SchemaBuilder::Required(const std::string& name) {
  if (!root_.IsRequired(name)) root_.required.push_back(name);
  return *this;
}

SchemaNode SchemaBuilder::Build() const {
  return root_;
}

}  // namespace toolserver
