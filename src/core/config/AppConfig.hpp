#pragma once
#include <string>

struct AppConfig {
  std::string dbPath;
  std::string logDir;
  int         maxRetries = 5;
  std::string syncTool;
  std::string remoteShell;
  int         port = 8080;
  std::string apiKey;   // empty = auth disabled
  std::string logLevel;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads DTS_* variables; malformed numbers fall back to the defaults.
AppConfig loadConfig();
