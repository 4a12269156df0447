#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolserver {

enum class SchemaType { Object, String, Integer, Boolean };

const char* SchemaTypeName(SchemaType type);

struct SchemaProperty;

struct SchemaNode {
  SchemaType type = SchemaType::Object;
  std::string description;
  std::optional<nlohmann::json> default_value;

  // Object nodes only. Declaration order is kept for discovery output.
  std::vector<SchemaProperty> properties;
  std::vector<std::string> required;

  const SchemaNode* FindProperty(const std::string& name) const;
  bool IsRequired(const std::string& name) const;
};

struct SchemaProperty {
  std::string name;
  SchemaNode node;
};

// Checks that required names are declared, property names are unique,
// properties are scalar (string, integer, boolean) and defaults match their
// declared type.
bool ValidateSchema(const SchemaNode& node, std::string* err);

nlohmann::ordered_json SchemaToJson(const SchemaNode& node);

class SchemaBuilder {
 public:
  static SchemaBuilder Object();

  SchemaBuilder& Description(std::string description);
  SchemaBuilder& StringProperty(const std::string& name, std::string description, bool required = false,
                                std::optional<std::string> default_value = std::nullopt);
  SchemaBuilder& IntegerProperty(const std::string& name, std::string description, bool required = false,
                                 std::optional<int64_t> default_value = std::nullopt);
  SchemaBuilder& BooleanProperty(const std::string& name, std::string description, bool required = false,
                                 std::optional<bool> default_value = std::nullopt);
  SchemaBuilder& Required(const std::string& name);

  SchemaNode Build() const;

 private:
  SchemaBuilder& AddProperty(const std::string& name, SchemaNode node, bool required);

  SchemaNode root_;
};

}  // namespace toolserver
