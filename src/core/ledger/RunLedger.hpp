#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Absence of a record is the implicit PENDING state.
enum class RunStatus { Processing, Success, Failed };

const char* toString(RunStatus s);
std::optional<RunStatus> parseRunStatus(const std::string& s);

struct RunRecord {
  std::string run_id;
  RunStatus   status = RunStatus::Processing;
  std::string source_dir;
  std::string target_dir;
  std::string log_path;
  std::string manifest_path;
  int64_t     created_at = 0;
  int64_t     updated_at = 0;
};

// Fields a caller may change after creation. run_id, source_dir, target_dir
// and created_at are immutable.
struct RunUpdate {
  std::optional<RunStatus>   status;
  std::optional<std::string> log_path;
  std::optional<std::string> manifest_path;

  bool empty() const { return !status && !log_path && !manifest_path; }
};

struct RunFilter {
  std::optional<std::string> run_id;
  std::optional<RunStatus>   status;
  std::optional<int>         limit;
};

struct FileRecord {
  std::string run_id;
  std::string file_name;
  std::string full_path_at_target;
};

// Durable record of transfer runs and the files confirmed at their targets.
// Every call opens its own connection and commits before returning; nothing
// is held open between calls. The database must have been created with
// initDatabase(). All failures throw LedgerError.
class RunLedger {
public:
  explicit RunLedger(std::string dbPath);

  const std::string& path() const { return dbPath_; }

  std::optional<RunStatus> getStatus(const std::string& run_id) const;
  std::optional<RunRecord> get(const std::string& run_id) const;

  // Inserts a new PROCESSING record; fails if run_id already exists.
  void createProcessing(const std::string& run_id,
                        const std::string& source_dir,
                        const std::string& target_dir,
                        const std::string& log_path,
                        const std::string& manifest_path);

  // FAILED -> PROCESSING for a re-invocation. Last writer wins on the
  // primary key: the row is inserted again if it vanished in between.
  void reopenProcessing(const std::string& run_id,
                        const std::string& source_dir,
                        const std::string& target_dir,
                        const std::string& log_path,
                        const std::string& manifest_path);

  void setStatus(const std::string& run_id, RunStatus status);
  void update(const std::string& run_id, const RunUpdate& u);

  // Ordered most recently updated first.
  std::vector<RunRecord> query(const RunFilter& f) const;

  void addFileRecord(const FileRecord& r);
  std::vector<FileRecord> listFiles(const std::string& run_id) const;
  int64_t countFiles(const std::string& run_id) const;

  // Administrative operations, never called by the transfer core.
  bool removeRun(const std::string& run_id);
  // CSV with a run_id column; each id becomes a SUCCESS run with NA paths.
  int importRuns(const std::string& csvPath);

private:
  std::string dbPath_;
};
