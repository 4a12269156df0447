#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace toolserver {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::optional<int> ParseInt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return std::nullopt;
  if (n > INT32_MAX || n < INT32_MIN) return std::nullopt;
  return static_cast<int>(n);
}

// Keeps *out untouched when the variable is unset, malformed or out of range.
static void ReadIntInRange(const char* name, int min_value, int max_value, int* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  auto n = ParseInt(raw);
  if (!n || *n < min_value || *n > max_value) {
    std::cout << "[config] ignoring " << name << "=" << raw << " (expected integer in [" << min_value << ", "
              << max_value << "]) keeping=" << *out << "\n";
    return;
  }
  *out = *n;
}

static void ReadBool(const char* name, bool* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  bool b = false;
  if (!TryParseBool(raw, &b)) {
    std::cout << "[config] ignoring " << name << "=" << raw << " (expected boolean)\n";
    return;
  }
  *out = b;
}

}  // namespace

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

ServerConfig LoadConfigFromEnv() {
  ServerConfig cfg;

  if (auto host = GetEnvStr("IDE_TOOL_SERVER_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  ReadIntInRange("IDE_TOOL_SERVER_LISTEN_PORT", 1024, 65535, &cfg.listen.port);
  ReadIntInRange("IDE_TOOL_SERVER_HTTP_THREADS", 1, 256, &cfg.listen.threads);

  ReadIntInRange("IDE_TOOL_SERVER_TOOL_TIMEOUT_MS", 1, 10 * 60 * 1000, &cfg.tool_timeout_ms);
  ReadIntInRange("IDE_TOOL_SERVER_DEFAULT_LIMIT", 1, 10000, &cfg.default_limit);
  ReadIntInRange("IDE_TOOL_SERVER_MAX_LIMIT", 1, 100000, &cfg.max_limit);
  if (cfg.default_limit > cfg.max_limit) {
    std::cout << "[config] default_limit=" << cfg.default_limit << " exceeds max_limit=" << cfg.max_limit
              << ", clamping\n";
    cfg.default_limit = cfg.max_limit;
  }

  if (auto file = GetEnvStr("IDE_TOOL_SERVER_WORKSPACE_FILE"); !file.empty()) cfg.workspace_file = file;
  ReadBool("IDE_TOOL_SERVER_STRICT_ARGUMENTS", &cfg.strict_arguments);
  ReadBool("IDE_TOOL_SERVER_LOG_BODIES", &cfg.log_bodies);

  return cfg;
}

}  // namespace toolserver
