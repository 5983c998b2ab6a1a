// src/core/ledger/InitDb.cpp
#include "InitDb.hpp"
#include "core/Errors.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace {

constexpr const char* kSchema = R"SQL(
  CREATE TABLE IF NOT EXISTS run (
    run_id        TEXT PRIMARY KEY,
    status        TEXT NOT NULL,
    source_dir    TEXT NOT NULL,
    target_dir    TEXT NOT NULL,
    log_path      TEXT NOT NULL,
    manifest_path TEXT NOT NULL,
    created_at    INTEGER NOT NULL,
    updated_at    INTEGER NOT NULL
  );

  CREATE TABLE IF NOT EXISTS file_record (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    run_id              TEXT NOT NULL REFERENCES run(run_id),
    file_name           TEXT NOT NULL,
    full_path_at_target TEXT NOT NULL
  );

  CREATE INDEX IF NOT EXISTS idx_file_record_run
    ON file_record(run_id, file_name);
  CREATE INDEX IF NOT EXISTS idx_run_status
    ON run(status, updated_at);
)SQL";

constexpr int kSchemaVersion = 1;

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw LedgerError("SQLite exec failed: " + msg);
  }
}

} // namespace

bool initDatabase(const std::string& dbPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(
      dbPath.c_str(),
      &db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw LedgerError("Failed to open DB: " + msg);
  }

  try {
    // Pragmas: concurrency + durability + integrity
    execAll(db, "PRAGMA journal_mode=WAL;");
    execAll(db, "PRAGMA synchronous=NORMAL;");
    execAll(db, "PRAGMA foreign_keys=ON;");
    execAll(db, "PRAGMA busy_timeout=5000;");

    execAll(db, kSchema);
    execAll(db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");

    sqlite3_close(db);
    return true;
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}
