#include "log_util.hpp"

#include <cstring>

namespace toolserver {

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "password", "token"}) {
    if (j.contains(key)) j.erase(key);
  }
  if (j.contains("headers") && j["headers"].is_object()) {
    auto& h = j["headers"];
    for (const auto& key : {"authorization", "proxy-authorization", "api-key", "api_key", "x-api-key"}) {
      if (h.contains(key)) h.erase(key);
    }
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  return SanitizeJsonForLog(j);
}

}  // namespace toolserver
