#pragma once
#include <string>
#include <string_view>
#include <vector>

class CommandRunner;
class RunLog;

enum class SyncMode {
  Fast,    // whole-file, in-place, skip files newer at the target
  Verify   // content checksum pass that repairs what Fast left partial
};

const char* toString(SyncMode m);

enum class SyncClass { Success, PartialFailure, HardFailure };

struct SyncOutcome {
  SyncMode    mode = SyncMode::Fast;
  int         exitCode = -1;
  std::string stdout_str;
  std::string stderr_str;
};

// Marker strings matched case-insensitively against sync tool output.
const std::vector<std::string>& failure_markers();
bool contains_failure_marker(std::string_view text);

// Exit code 0 with a clean output is Success; exit code 0 with a failure
// marker is PartialFailure; any other exit code is HardFailure.
SyncClass classify(const SyncOutcome& o);

struct AttemptOutcome {
  SyncOutcome fast;
  SyncOutcome verify;

  // Both passes exit 0 and neither output carries a failure marker.
  bool succeeded() const;
};

// Wraps the external sync tool. The tool copies sourceRoot (the directory
// itself, not just its contents) into targetRoot.
class SyncInvoker {
public:
  explicit SyncInvoker(CommandRunner& runner, std::string tool = "rsync");

  std::vector<std::string> command(const std::string& sourceRoot,
                                   const std::string& targetRoot,
                                   SyncMode mode) const;

  // Raw output goes to log (when given) before the outcome is returned.
  SyncOutcome invoke(const std::string& sourceRoot,
                     const std::string& targetRoot,
                     SyncMode mode,
                     RunLog* log);

  // Fast then Verify; both always run.
  AttemptOutcome invokePair(const std::string& sourceRoot,
                            const std::string& targetRoot,
                            RunLog* log);

private:
  CommandRunner& runner_;
  std::string    tool_;
};
