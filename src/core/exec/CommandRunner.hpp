#pragma once
#include <string>
#include <vector>

struct ProcessResult {
  int         exit_code = -1;
  std::string stdout_str;
  std::string stderr_str;
};

// Runs an external command to completion. Blocks the caller; there is no
// per-command timeout.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp with stdout and stderr captured separately. A command that
// cannot be started exits 127; one killed by a signal reports 128 + signo.
class PosixCommandRunner : public CommandRunner {
public:
  ProcessResult run(const std::vector<std::string>& argv) override;
};

std::string join_command(const std::vector<std::string>& argv);
