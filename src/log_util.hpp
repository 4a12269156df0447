#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace toolserver {

std::string TruncateForLog(std::string s, size_t max_chars);

// Drops credential-like keys at the top level and under "headers".
std::string SanitizeJsonForLog(const nlohmann::json& body);
std::string SanitizeBodyForLog(const std::string& body);

}  // namespace toolserver
