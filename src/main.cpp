// src/main.cpp
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/Errors.hpp"
#include "core/config/AppConfig.hpp"
#include "core/exec/CommandRunner.hpp"
#include "core/ledger/InitDb.hpp"
#include "core/ledger/RunLedger.hpp"
#include "core/sync/SyncInvoker.hpp"
#include "core/transfer/ArtifactStore.hpp"
#include "core/transfer/TransferOrchestrator.hpp"
#include "core/verify/Verifier.hpp"
#ifdef DTS_WITH_API
#include "services/api/HttpServer.hpp"
#endif
#include "services/report/StatusReport.hpp"

// ---------- helpers ----------

namespace {

// --name value pairs plus bare --switches. Positional words are kept in order.
struct Args {
  std::map<std::string, std::string> values;
  std::set<std::string>              switches;
  std::vector<std::string>           positional;

  std::string get(const std::string& k, const std::string& def = {}) const {
    auto it = values.find(k);
    return it == values.end() ? def : it->second;
  }
  bool has(const std::string& k) const { return values.count(k) > 0; }
  bool flag(const std::string& k) const { return switches.count(k) > 0; }
};

Args parse_args(int argc, char** argv, int from, const std::set<std::string>& switchNames) {
  Args a;
  for (int i = from; i < argc; ++i) {
    std::string tok = argv[i];
    if (tok.rfind("--", 0) != 0) { a.positional.push_back(tok); continue; }
    if (switchNames.count(tok)) { a.switches.insert(tok); continue; }
    if (i + 1 >= argc) throw ValidationError("missing value for " + tok);
    a.values[tok] = argv[++i];
  }
  return a;
}

int parse_positive(const std::string& what, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used == v.size() && n > 0) return n;
  } catch (const std::exception&) {
  }
  throw ValidationError(what + " must be a positive integer, got '" + v + "'");
}

RunStatus parse_state(const std::string& v) {
  auto s = parseRunStatus(v);
  if (!s) throw ValidationError("unknown status '" + v + "' (SUCCESS, FAILED or PROCESSING)");
  return *s;
}

std::shared_ptr<spdlog::logger> make_console_logger(const AppConfig& cfg) {
  auto logger = spdlog::stdout_color_mt("datasync");
  logger->set_pattern("%Y-%m-%d %H:%M:%S - %^%l%$ - %v");
  logger->set_level(spdlog::level::from_str(cfg.logLevel));
  spdlog::set_default_logger(logger);
  return logger;
}

void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init\n"
            << "      create/upgrade the SQLite ledger (DTS_DB_PATH)\n"
            << "  " << argv0 << " --transfer --source DIR --target DEST [--max-retries N]\n"
            << "      DEST is a local path or user@host:path\n"
            << "  " << argv0 << " --status [--run-id ID] [--state STATUS] [--limit N] [--header] [--print-ids]\n"
            << "  " << argv0 << " --ledger delete --run-id ID\n"
            << "  " << argv0 << " --ledger set-status --run-id ID --state STATUS\n"
            << "  " << argv0 << " --ledger import FILE.csv\n"
            << "  " << argv0 << " --serve       # read-only HTTP query server (DTS_PORT or 8080)\n";
}

int cmd_transfer(const AppConfig& cfg, const Args& a) {
  TransferRequest req;
  req.source_dir  = a.get("--source");
  req.destination = a.get("--target");
  req.max_retries = a.has("--max-retries") ? parse_positive("--max-retries", a.get("--max-retries"))
                                           : cfg.maxRetries;
  if (req.source_dir.empty() || req.destination.empty()) {
    throw ValidationError("--source and --target are required");
  }

  auto logger = make_console_logger(cfg);

  // Validate before the ledger is touched.
  resolve_request(req);

  initDatabase(cfg.dbPath);
  RunLedger ledger(cfg.dbPath);
  PosixCommandRunner runner;
  SyncInvoker sync(runner, cfg.syncTool);
  Verifier verifier(ledger, runner, logger, cfg.remoteShell);
  ArtifactStore artifacts(runner, cfg.syncTool);
  TransferOrchestrator orchestrator(ledger, sync, verifier, artifacts, logger, cfg.logDir);

  const TransferResult r = orchestrator.run(req);
  return r.exitCode();
}

int cmd_status(const AppConfig& cfg, const Args& a) {
  if (!std::filesystem::exists(cfg.dbPath)) {
    std::cout << "No database found.\n";
    return 0;
  }
  RunLedger ledger(cfg.dbPath);
  RunFilter f;
  if (a.has("--run-id")) f.run_id = a.get("--run-id");
  if (a.has("--state")) f.status = parse_state(a.get("--state"));
  if (a.has("--limit")) f.limit = parse_positive("--limit", a.get("--limit"));

  const auto runs = ledger.query(f);
  if (a.flag("--print-ids")) {
    dts::write_run_ids(std::cout, runs);
    return 0;
  }
  if (runs.empty()) {
    std::cout << "No results found!\n";
    return 0;
  }
  dts::write_status_csv(std::cout, runs, a.flag("--header"));
  return 0;
}

int cmd_ledger(const AppConfig& cfg, const Args& a) {
  if (a.positional.empty()) throw ValidationError("--ledger needs an operation");
  const std::string op = a.positional.front();

  initDatabase(cfg.dbPath);
  RunLedger ledger(cfg.dbPath);

  if (op == "delete") {
    const std::string id = a.get("--run-id");
    if (id.empty()) throw ValidationError("--run-id is required");
    if (!ledger.removeRun(id)) {
      std::cout << id << " does not exist.\n";
      return 1;
    }
    std::cout << id << " deleted.\n";
    return 0;
  }
  if (op == "set-status") {
    const std::string id = a.get("--run-id");
    if (id.empty()) throw ValidationError("--run-id is required");
    ledger.setStatus(id, parse_state(a.get("--state")));
    std::cout << "Updated record for run_id: " << id << "\n";
    return 0;
  }
  if (op == "import") {
    if (a.positional.size() < 2) throw ValidationError("--ledger import needs a CSV file");
    const int n = ledger.importRuns(a.positional[1]);
    std::cout << "Imported " << n << " run(s) from " << a.positional[1] << "\n";
    return 0;
  }
  throw ValidationError("unknown ledger operation: " + op);
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const AppConfig cfg = loadConfig();
    const std::string mode = argv[1];
    const Args args = parse_args(argc, argv, 2, {"--header", "--print-ids"});

    if (mode == "--init") {
      initDatabase(cfg.dbPath);
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }
    if (mode == "--transfer") return cmd_transfer(cfg, args);
    if (mode == "--status")   return cmd_status(cfg, args);
    if (mode == "--ledger")   return cmd_ledger(cfg, args);

#ifdef DTS_WITH_API
    if (mode == "--serve") {
      // Self-heal DB on startup (idempotent)
      initDatabase(cfg.dbPath);
      make_console_logger(cfg);
      RunLedger ledger(cfg.dbPath);
      return dts::run_http_server(ledger, cfg.port, cfg.apiKey) ? 0 : 2;
    }
#endif

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
