#pragma once

#include "schema.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace toolserver {

using ParamValue = std::variant<std::string, int64_t, bool>;

class ParamMap {
 public:
  void Set(const std::string& name, ParamValue value);
  bool Has(const std::string& name) const;
  size_t Size() const { return values_.size(); }

  // Typed getters return the fallback when the name is absent or holds another type.
  std::string GetString(const std::string& name, const std::string& fallback = {}) const;
  int64_t GetInt(const std::string& name, int64_t fallback = 0) const;
  bool GetBool(const std::string& name, bool fallback = false) const;

  const std::map<std::string, ParamValue>& Values() const { return values_; }

 private:
  std::map<std::string, ParamValue> values_;
};

enum class ParamErrorKind { MissingRequired, TypeMismatch, Unrecognized };

struct ParamError {
  ParamErrorKind kind = ParamErrorKind::MissingRequired;
  std::string field;
  std::string expected;
  std::string actual;

  std::string Message() const;
};

struct ExtractOptions {
  bool reject_unrecognized = false;
};

const char* JsonTypeName(const nlohmann::json& v);

// Validates raw arguments against an object schema. Null or absent raw
// arguments count as an empty object.
std::optional<ParamMap> ExtractParams(const SchemaNode& schema,
                                      const nlohmann::json& raw_arguments,
                                      ParamError* err,
                                      const ExtractOptions& options = {});

}  // namespace toolserver
