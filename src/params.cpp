#include "params.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace toolserver {
namespace {

static std::optional<int64_t> ParseDecimal(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  long long n = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
  return static_cast<int64_t>(n);
}

static std::optional<ParamValue> Coerce(SchemaType type, const nlohmann::json& v) {
  switch (type) {
    case SchemaType::String:
      if (v.is_string()) return ParamValue(v.get<std::string>());
      return std::nullopt;
    case SchemaType::Integer:
      if (v.is_number_integer()) {
        if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          return std::nullopt;
        }
        return ParamValue(v.get<int64_t>());
      }
      if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d && d >= -9.2e18 && d <= 9.2e18) {
          return ParamValue(static_cast<int64_t>(d));
        }
        return std::nullopt;
      }
      if (v.is_string()) {
        if (auto n = ParseDecimal(v.get<std::string>())) return ParamValue(*n);
      }
      return std::nullopt;
    case SchemaType::Boolean:
      if (v.is_boolean()) return ParamValue(v.get<bool>());
      if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s == "true") return ParamValue(true);
        if (s == "false") return ParamValue(false);
      }
      return std::nullopt;
    case SchemaType::Object:
      return std::nullopt;
  }
  return std::nullopt;
}

static std::optional<ParamValue> FromDefault(SchemaType type, const nlohmann::json& def) {
  return Coerce(type, def);
}

static void SetError(ParamError* err, ParamErrorKind kind, std::string field, std::string expected, std::string actual) {
  if (!err) return;
  err->kind = kind;
  err->field = std::move(field);
  err->expected = std::move(expected);
  err->actual = std::move(actual);
}

}  // namespace

void ParamMap::Set(const std::string& name, ParamValue value) {
  values_[name] = std::move(value);
}

bool ParamMap::Has(const std::string& name) const {
  return values_.find(name) != values_.end();
}

std::string ParamMap::GetString(const std::string& name, const std::string& fallback) const {
  auto it = values_.find(name);
  if (it == values_.end()) return fallback;
  if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
  return fallback;
}

int64_t ParamMap::GetInt(const std::string& name, int64_t fallback) const {
  auto it = values_.find(name);
  if (it == values_.end()) return fallback;
  if (const auto* n = std::get_if<int64_t>(&it->second)) return *n;
  return fallback;
}

bool ParamMap::GetBool(const std::string& name, bool fallback) const {
  auto it = values_.find(name);
  if (it == values_.end()) return fallback;
  if (const auto* b = std::get_if<bool>(&it->second)) return *b;
  return fallback;
}

std::string ParamError::Message() const {
  switch (kind) {
    case ParamErrorKind::MissingRequired:
      return "missing required field: " + field;
    case ParamErrorKind::TypeMismatch:
      return "field type mismatch: " + field + " (expected " + expected + ", got " + actual + ")";
    case ParamErrorKind::Unrecognized:
      return "unrecognized field: " + field;
  }
  return "invalid arguments";
}

const char* JsonTypeName(const nlohmann::json& v) {
  if (v.is_null()) return "null";
  if (v.is_boolean()) return "boolean";
  if (v.is_number_integer()) return "integer";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_array()) return "array";
  if (v.is_object()) return "object";
  return "unknown";
}

std::optional<ParamMap> ExtractParams(const SchemaNode& schema,
                                      const nlohmann::json& raw_arguments,
                                      ParamError* err,
                                      const ExtractOptions& options) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  const nlohmann::json& args = raw_arguments.is_null() ? kEmpty : raw_arguments;
  if (!args.is_object()) {
    SetError(err, ParamErrorKind::TypeMismatch, "arguments", "object", JsonTypeName(args));
    return std::nullopt;
  }

  // Required fields are checked first so a missing one is reported even
  // when another field is also malformed.
  for (const auto& name : schema.required) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
      SetError(err, ParamErrorKind::MissingRequired, name, {}, {});
      return std::nullopt;
    }
  }

  ParamMap out;
  for (const auto& prop : schema.properties) {
    auto it = args.find(prop.name);
    if (it == args.end() || it->is_null()) {
      if (prop.node.default_value) {
        if (auto v = FromDefault(prop.node.type, *prop.node.default_value)) out.Set(prop.name, std::move(*v));
      }
      continue;
    }
    auto v = Coerce(prop.node.type, *it);
    if (!v) {
      SetError(err, ParamErrorKind::TypeMismatch, prop.name, SchemaTypeName(prop.node.type), JsonTypeName(*it));
      return std::nullopt;
    }
    out.Set(prop.name, std::move(*v));
  }

  if (options.reject_unrecognized) {
    for (const auto& item : args.items()) {
      if (!schema.FindProperty(item.key())) {
        SetError(err, ParamErrorKind::Unrecognized, item.key(), {}, {});
        return std::nullopt;
      }
    }
  }

  return out;
}

}  // namespace toolserver
