#include "AppConfig.hpp"
#include <cstdlib>
#include <string>

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int env_int_or(const char* key, int defval, int minval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    int v = std::stoi(raw, &used);
    if (used != raw.size() || v < minval) return defval;
    return v;
  } catch (const std::exception&) {
    return defval;
  }
}

AppConfig loadConfig() {
  AppConfig c;
  c.dbPath      = get_env_or("DTS_DB_PATH", "data/transfer-ledger.db");
  c.logDir      = get_env_or("DTS_LOG_DIR", "data/logs");
  c.maxRetries  = env_int_or("DTS_MAX_RETRIES", 5, 1);
  c.syncTool    = get_env_or("DTS_SYNC_TOOL", "rsync");
  c.remoteShell = get_env_or("DTS_REMOTE_SHELL", "ssh");
  c.port        = env_int_or("DTS_PORT", 8080, 1);
  c.apiKey      = get_env_or("DTS_API_KEY", "");
  c.logLevel    = get_env_or("DTS_LOG_LEVEL", "info");
  return c;
}
