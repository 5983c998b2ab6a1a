#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>

#include "RunJson.hpp"
#include "core/ledger/RunLedger.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void send_json(httplib::Response& res, const json& body) {
  res.status = 200;
  res.set_content(body.dump(), "application/json");
}

// -------- server --------

namespace dts {

bool run_http_server(RunLedger& ledger,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /runs?run_id=<id>&status=<SUCCESS|FAILED|PROCESSING>&limit=<n>
  // Most recently updated first.
  svr.Get("/runs", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;

    RunFilter f;
    const std::string runId = param_or(req, "run_id");
    if (!runId.empty()) f.run_id = runId;

    const std::string status = param_or(req, "status");
    if (!status.empty()) {
      f.status = parseRunStatus(status);
      if (!f.status) {
        res.status = 400; res.set_content("unknown status: " + status, "text/plain"); return;
      }
    }

    const std::string limit = param_or(req, "limit");
    if (!limit.empty()) {
      try { f.limit = std::stoi(limit); }
      catch (const std::exception&) { res.status = 400; res.set_content("invalid limit", "text/plain"); return; }
    }

    try {
      send_json(res, to_json(ledger.query(f)));
    } catch (const std::exception& e) {
      spdlog::error("query failed: {}", e.what());
      res.status = 500;
      res.set_content("query failed", "text/plain");
    }
  });

  svr.Get(R"(/runs/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      auto run = ledger.get(req.matches[1]);
      if (!run) { res.status = 404; res.set_content("no such run", "text/plain"); return; }
      json out = to_json(*run);
      out["file_count"] = ledger.countFiles(run->run_id);
      send_json(res, out);
    } catch (const std::exception& e) {
      spdlog::error("lookup failed: {}", e.what());
      res.status = 500;
      res.set_content("lookup failed", "text/plain");
    }
  });

  svr.Get(R"(/runs/([^/]+)/files)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      const std::string runId = req.matches[1];
      if (!ledger.getStatus(runId)) { res.status = 404; res.set_content("no such run", "text/plain"); return; }
      send_json(res, to_json(ledger.listFiles(runId)));
    } catch (const std::exception& e) {
      spdlog::error("file listing failed: {}", e.what());
      res.status = 500;
      res.set_content("file listing failed", "text/plain");
    }
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

} // namespace dts
