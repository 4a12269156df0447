#pragma once

#include <string>

namespace toolserver {

constexpr const char* kServerName = "ide-tool-server";
constexpr const char* kServerVersion = "1.0.0";
constexpr const char* kProtocolVersion = "2025-03-26";

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 8765;
  int threads = 8;
};

struct ServerConfig {
  HttpListenConfig listen;
  int tool_timeout_ms = 5000;
  int default_limit = 100;
  int max_limit = 1000;
  std::string workspace_file;
  bool strict_arguments = false;
  bool log_bodies = false;
};

ServerConfig LoadConfigFromEnv();

bool TryParseBool(const std::string& s, bool* out);

}  // namespace toolserver
