#include "RunLedger.hpp"
#include "core/Errors.hpp"
#include <ctime>
#include <fstream>
#include <sstream>
#include <utility>
#include <sqlite3.h>

namespace {

int64_t now_epoch() { return static_cast<int64_t>(std::time(nullptr)); }

class Connection {
public:
  explicit Connection(const std::string& path) {
    if (sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
      std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
      sqlite3_close(db_);
      throw LedgerError("failed to open ledger " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
      exec("PRAGMA foreign_keys=ON;");
    } catch (const LedgerError&) {
      sqlite3_close(db_);
      throw;
    }
  }
  ~Connection() { sqlite3_close(db_); }
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  sqlite3* get() const { return db_; }

  void exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw LedgerError(std::string("exec failed: ") + msg);
    }
  }

private:
  sqlite3* db_ = nullptr;
};

class Statement {
public:
  Statement(Connection& c, const char* sql) : db_(c.get()) {
    if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw LedgerError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }
  }
  ~Statement() { sqlite3_finalize(st_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }

  // true while rows remain
  bool next() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw LedgerError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  void run(const char* what) {
    if (sqlite3_step(st_) != SQLITE_DONE) {
      throw LedgerError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
    }
  }

  std::string text(int col) const {
    auto* p = sqlite3_column_text(st_, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }
  int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }

  int changes() const { return sqlite3_changes(db_); }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

RunStatus status_column(const Statement& st, int col) {
  const std::string s = st.text(col);
  auto parsed = parseRunStatus(s);
  if (!parsed) throw LedgerError("unknown status in ledger: " + s);
  return *parsed;
}

RunRecord read_run(const Statement& st) {
  RunRecord r;
  r.run_id        = st.text(0);
  r.status        = status_column(st, 1);
  r.source_dir    = st.text(2);
  r.target_dir    = st.text(3);
  r.log_path      = st.text(4);
  r.manifest_path = st.text(5);
  r.created_at    = st.int64(6);
  r.updated_at    = st.int64(7);
  return r;
}

constexpr const char* kRunColumns =
    "run_id, status, source_dir, target_dir, log_path, manifest_path, created_at, updated_at";

std::string trim(std::string s) {
  const char* ws = " \t\r\n\"";
  s.erase(0, s.find_first_not_of(ws));
  auto last = s.find_last_not_of(ws);
  s.erase(last == std::string::npos ? 0 : last + 1);
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) cols.push_back(trim(cell));
  return cols;
}

} // namespace

const char* toString(RunStatus s) {
  switch (s) {
    case RunStatus::Processing: return "PROCESSING";
    case RunStatus::Success:    return "SUCCESS";
    case RunStatus::Failed:     return "FAILED";
  }
  return "UNKNOWN";
}

std::optional<RunStatus> parseRunStatus(const std::string& s) {
  if (s == "PROCESSING") return RunStatus::Processing;
  if (s == "SUCCESS")    return RunStatus::Success;
  if (s == "FAILED")     return RunStatus::Failed;
  return std::nullopt;
}

RunLedger::RunLedger(std::string dbPath) : dbPath_(std::move(dbPath)) {}

std::optional<RunStatus> RunLedger::getStatus(const std::string& run_id) const {
  Connection c(dbPath_);
  Statement st(c, "SELECT status FROM run WHERE run_id = ?");
  st.bind(1, run_id);
  if (!st.next()) return std::nullopt;
  return status_column(st, 0);
}

std::optional<RunRecord> RunLedger::get(const std::string& run_id) const {
  Connection c(dbPath_);
  const std::string sql = std::string("SELECT ") + kRunColumns + " FROM run WHERE run_id = ?";
  Statement st(c, sql.c_str());
  st.bind(1, run_id);
  if (!st.next()) return std::nullopt;
  return read_run(st);
}

void RunLedger::createProcessing(const std::string& run_id,
                                 const std::string& source_dir,
                                 const std::string& target_dir,
                                 const std::string& log_path,
                                 const std::string& manifest_path) {
  Connection c(dbPath_);
  const char* sql = R"SQL(
    INSERT INTO run
      (run_id, status, source_dir, target_dir, log_path, manifest_path, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL";
  Statement st(c, sql);
  const int64_t now = now_epoch();
  int i = 1;
  st.bind(i++, run_id);
  st.bind(i++, std::string(toString(RunStatus::Processing)));
  st.bind(i++, source_dir);
  st.bind(i++, target_dir);
  st.bind(i++, log_path);
  st.bind(i++, manifest_path);
  st.bind(i++, now);
  st.bind(i++, now);
  st.run("createProcessing");
}

void RunLedger::reopenProcessing(const std::string& run_id,
                                 const std::string& source_dir,
                                 const std::string& target_dir,
                                 const std::string& log_path,
                                 const std::string& manifest_path) {
  Connection c(dbPath_);
  const char* sql = R"SQL(
    INSERT INTO run
      (run_id, status, source_dir, target_dir, log_path, manifest_path, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
    ON CONFLICT(run_id) DO UPDATE SET
      status        = excluded.status,
      log_path      = excluded.log_path,
      manifest_path = excluded.manifest_path,
      updated_at    = excluded.updated_at
  )SQL";
  Statement st(c, sql);
  const int64_t now = now_epoch();
  int i = 1;
  st.bind(i++, run_id);
  st.bind(i++, std::string(toString(RunStatus::Processing)));
  st.bind(i++, source_dir);
  st.bind(i++, target_dir);
  st.bind(i++, log_path);
  st.bind(i++, manifest_path);
  st.bind(i++, now);
  st.bind(i++, now);
  st.run("reopenProcessing");
}

void RunLedger::setStatus(const std::string& run_id, RunStatus status) {
  RunUpdate u;
  u.status = status;
  update(run_id, u);
}

void RunLedger::update(const std::string& run_id, const RunUpdate& u) {
  if (u.empty()) return;

  std::string sql = "UPDATE run SET updated_at = ?";
  if (u.status)        sql += ", status = ?";
  if (u.log_path)      sql += ", log_path = ?";
  if (u.manifest_path) sql += ", manifest_path = ?";
  sql += " WHERE run_id = ?";

  Connection c(dbPath_);
  Statement st(c, sql.c_str());
  int i = 1;
  st.bind(i++, now_epoch());
  if (u.status)        st.bind(i++, std::string(toString(*u.status)));
  if (u.log_path)      st.bind(i++, *u.log_path);
  if (u.manifest_path) st.bind(i++, *u.manifest_path);
  st.bind(i++, run_id);
  st.run("update");
  if (st.changes() == 0) throw LedgerError("no run record for " + run_id);
}

std::vector<RunRecord> RunLedger::query(const RunFilter& f) const {
  std::string sql = std::string("SELECT ") + kRunColumns + " FROM run";
  std::string where;
  if (f.run_id) where += "run_id = ?";
  if (f.status) where += std::string(where.empty() ? "" : " AND ") + "status = ?";
  if (!where.empty()) sql += " WHERE " + where;
  sql += " ORDER BY updated_at DESC, run_id";
  if (f.limit && *f.limit > 0) sql += " LIMIT ?";

  Connection c(dbPath_);
  Statement st(c, sql.c_str());
  int i = 1;
  if (f.run_id) st.bind(i++, *f.run_id);
  if (f.status) st.bind(i++, std::string(toString(*f.status)));
  if (f.limit && *f.limit > 0) st.bind(i++, static_cast<int64_t>(*f.limit));

  std::vector<RunRecord> out;
  while (st.next()) out.push_back(read_run(st));
  return out;
}

void RunLedger::addFileRecord(const FileRecord& r) {
  Connection c(dbPath_);
  Statement st(c, R"SQL(
    INSERT INTO file_record (run_id, file_name, full_path_at_target)
    VALUES (?,?,?)
  )SQL");
  st.bind(1, r.run_id);
  st.bind(2, r.file_name);
  st.bind(3, r.full_path_at_target);
  st.run("addFileRecord");
}

std::vector<FileRecord> RunLedger::listFiles(const std::string& run_id) const {
  Connection c(dbPath_);
  Statement st(c, R"SQL(
    SELECT run_id, file_name, full_path_at_target FROM file_record
    WHERE run_id = ? ORDER BY file_name
  )SQL");
  st.bind(1, run_id);
  std::vector<FileRecord> out;
  while (st.next()) out.push_back({st.text(0), st.text(1), st.text(2)});
  return out;
}

int64_t RunLedger::countFiles(const std::string& run_id) const {
  Connection c(dbPath_);
  Statement st(c, "SELECT COUNT(*) FROM file_record WHERE run_id = ?");
  st.bind(1, run_id);
  return st.next() ? st.int64(0) : 0;
}

bool RunLedger::removeRun(const std::string& run_id) {
  Connection c(dbPath_);
  c.exec("BEGIN IMMEDIATE;");
  try {
    {
      Statement files(c, "DELETE FROM file_record WHERE run_id = ?");
      files.bind(1, run_id);
      files.run("removeRun(file_record)");
    }
    Statement run(c, "DELETE FROM run WHERE run_id = ?");
    run.bind(1, run_id);
    run.run("removeRun(run)");
    const bool existed = run.changes() > 0;
    c.exec("COMMIT;");
    return existed;
  } catch (...) {
    sqlite3_exec(c.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

int RunLedger::importRuns(const std::string& csvPath) {
  std::ifstream in(csvPath);
  if (!in) throw LedgerError("cannot open " + csvPath);

  std::string line;
  if (!std::getline(in, line)) return 0;
  const auto header = split_csv_line(line);
  int idCol = -1;
  for (size_t k = 0; k < header.size(); ++k) {
    if (header[k] == "run_id") idCol = static_cast<int>(k);
  }
  if (idCol < 0) throw LedgerError(csvPath + ": no run_id column");

  Connection c(dbPath_);
  c.exec("BEGIN IMMEDIATE;");
  try {
    int imported = 0;
    const int64_t now = now_epoch();
    while (std::getline(in, line)) {
      const auto cols = split_csv_line(line);
      if (static_cast<int>(cols.size()) <= idCol || cols[idCol].empty()) continue;
      Statement st(c, R"SQL(
        INSERT INTO run
          (run_id, status, source_dir, target_dir, log_path, manifest_path, created_at, updated_at)
        VALUES (?, 'SUCCESS', 'NA', 'NA', 'NA', 'NA', ?, ?)
        ON CONFLICT(run_id) DO UPDATE SET status = 'SUCCESS', updated_at = excluded.updated_at
      )SQL");
      st.bind(1, cols[idCol]);
      st.bind(2, now);
      st.bind(3, now);
      st.run("importRuns");
      ++imported;
    }
    c.exec("COMMIT;");
    return imported;
  } catch (...) {
    sqlite3_exec(c.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}
