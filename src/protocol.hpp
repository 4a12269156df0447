#pragma once

#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolserver {

const char* ContentTypeName(ContentType type);

// Accepts {"arguments": {...}} with the tool name taken from the URL, or
// {"tool": "...", "arguments": {...}} when path_tool_name is empty. An empty
// body is allowed when the name comes from the URL.
std::optional<ToolRequest> DecodeToolRequest(const std::string& body, const std::string& path_tool_name, std::string* err);

nlohmann::ordered_json EncodeToolDescriptor(const ToolDescriptor& descriptor);
nlohmann::ordered_json EncodeDiscovery(const std::vector<ToolDescriptor>& descriptors);
nlohmann::ordered_json EncodeToolResult(const ToolResult& result);
nlohmann::ordered_json EncodeError(const std::string& message, ErrorKind kind);

int HttpStatusFor(ErrorKind kind);

std::string DumpJson(const nlohmann::ordered_json& j);

// Escapes the contents of a JSON string literal (no surrounding quotes).
// Input must be valid UTF-8: invalid bytes are replaced with U+FFFD, so only
// valid UTF-8 round-trips through UnescapeJsonString.
std::string EscapeJsonString(std::string_view s);
// Reverses EscapeJsonString. Returns false on a malformed escape sequence.
bool UnescapeJsonString(std::string_view escaped, std::string* out);

}  // namespace toolserver
