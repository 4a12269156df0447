#include "protocol.hpp"

#include "schema.hpp"

namespace toolserver {

const char* ContentTypeName(ContentType type) {
  switch (type) {
    case ContentType::Markdown:
      return "markdown";
    case ContentType::Json:
      return "json";
  }
  return "markdown";
}

std::optional<ToolRequest> DecodeToolRequest(const std::string& body, const std::string& path_tool_name, std::string* err) {
  ToolRequest req;
  req.tool_name = path_tool_name;

  bool blank = true;
  for (char c : body) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      blank = false;
      break;
    }
  }
  if (blank) {
    if (path_tool_name.empty()) {
      if (err) *err = "missing field: tool";
      return std::nullopt;
    }
    return req;
  }

  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json body";
    return std::nullopt;
  }
  if (!j.is_object()) {
    if (err) *err = "request body must be a json object";
    return std::nullopt;
  }

  if (j.contains("tool") && !j["tool"].is_null()) {
    if (!j["tool"].is_string()) {
      if (err) *err = "field type mismatch: tool";
      return std::nullopt;
    }
    auto body_name = j["tool"].get<std::string>();
    if (!path_tool_name.empty() && body_name != path_tool_name) {
      if (err) *err = "tool name mismatch: url names " + path_tool_name + ", body names " + body_name;
      return std::nullopt;
    }
    req.tool_name = std::move(body_name);
  }
  if (req.tool_name.empty()) {
    if (err) *err = "missing field: tool";
    return std::nullopt;
  }

  if (j.contains("arguments") && !j["arguments"].is_null()) {
    if (!j["arguments"].is_object()) {
      if (err) *err = "field type mismatch: arguments";
      return std::nullopt;
    }
    req.raw_arguments = j["arguments"];
  }
  return req;
}

nlohmann::ordered_json EncodeToolDescriptor(const ToolDescriptor& descriptor) {
  nlohmann::ordered_json item;
  item["name"] = descriptor.name;
  item["description"] = descriptor.description;
  item["inputSchema"] = SchemaToJson(descriptor.input_schema);
  return item;
}

nlohmann::ordered_json EncodeDiscovery(const std::vector<ToolDescriptor>& descriptors) {
  nlohmann::ordered_json out;
  out["tools"] = nlohmann::ordered_json::array();
  for (const auto& d : descriptors) out["tools"].push_back(EncodeToolDescriptor(d));
  return out;
}

nlohmann::ordered_json EncodeToolResult(const ToolResult& result) {
  if (!result.ok) {
    auto out = EncodeError(result.error, result.error_kind);
    if (!result.field.empty()) out["field"] = result.field;
    return out;
  }
  nlohmann::ordered_json out;
  out["content"] = result.payload;
  out["contentType"] = ContentTypeName(result.content_type);
  return out;
}

nlohmann::ordered_json EncodeError(const std::string& message, ErrorKind kind) {
  nlohmann::ordered_json out;
  out["error"] = message;
  out["kind"] = ErrorKindName(kind);
  return out;
}

int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return 200;
    case ErrorKind::ValidationError:
    case ErrorKind::CodecError:
      return 400;
    case ErrorKind::UnknownTool:
      return 404;
    case ErrorKind::Timeout:
      return 503;
    case ErrorKind::ToolExecutionFailure:
      return 500;
  }
  return 500;
}

std::string DumpJson(const nlohmann::ordered_json& j) {
  return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string EscapeJsonString(std::string_view s) {
  auto quoted = nlohmann::json(std::string(s)).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return quoted.substr(1, quoted.size() - 2);
}

bool UnescapeJsonString(std::string_view escaped, std::string* out) {
  std::string literal;
  literal.reserve(escaped.size() + 2);
  literal += '"';
  literal += escaped;
  literal += '"';
  auto j = nlohmann::json::parse(literal, nullptr, false);
  if (j.is_discarded() || !j.is_string()) return false;
  if (out) *out = j.get<std::string>();
  return true;
}

}  // namespace toolserver
