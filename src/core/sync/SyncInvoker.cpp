#include "SyncInvoker.hpp"
#include "core/exec/CommandRunner.hpp"
#include "core/transfer/RunLog.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

const char* toString(SyncMode m) {
  return m == SyncMode::Fast ? "fast" : "verify";
}

const std::vector<std::string>& failure_markers() {
  static const std::vector<std::string> k = {
    "rsync error:",
    "failed:",
    "error",
    "connection unexpectedly closed",
    "broken pipe",
  };
  return k;
}

bool contains_failure_marker(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& m : failure_markers()) {
    if (lower.find(m) != std::string::npos) return true;
  }
  return false;
}

SyncClass classify(const SyncOutcome& o) {
  if (o.exitCode != 0) return SyncClass::HardFailure;
  if (contains_failure_marker(o.stdout_str) || contains_failure_marker(o.stderr_str)) {
    return SyncClass::PartialFailure;
  }
  return SyncClass::Success;
}

bool AttemptOutcome::succeeded() const {
  return classify(fast) == SyncClass::Success && classify(verify) == SyncClass::Success;
}

SyncInvoker::SyncInvoker(CommandRunner& runner, std::string tool)
  : runner_(runner), tool_(std::move(tool)) {}

std::vector<std::string> SyncInvoker::command(const std::string& sourceRoot,
                                              const std::string& targetRoot,
                                              SyncMode mode) const {
  std::string src = sourceRoot;
  while (src.size() > 1 && src.back() == '/') src.pop_back();
  std::string dst = targetRoot;
  if (dst.empty() || dst.back() != '/') dst += '/';

  std::vector<std::string> argv = {tool_, "-a"};
  if (mode == SyncMode::Fast) {
    argv.insert(argv.end(), {"--whole-file", "--inplace", "--update"});
  } else {
    argv.insert(argv.end(), {"--checksum", "--partial"});
  }
  argv.push_back(src);
  argv.push_back(dst);
  return argv;
}

SyncOutcome SyncInvoker::invoke(const std::string& sourceRoot,
                                const std::string& targetRoot,
                                SyncMode mode,
                                RunLog* log) {
  const auto argv = command(sourceRoot, targetRoot, mode);
  if (log) log->line(std::string("Running ") + toString(mode) + " pass: " + join_command(argv));

  SyncOutcome out;
  out.mode = mode;
  try {
    ProcessResult r = runner_.run(argv);
    out.exitCode   = r.exit_code;
    out.stdout_str = std::move(r.stdout_str);
    out.stderr_str = std::move(r.stderr_str);
  } catch (const std::exception& e) {
    // could not even start the tool; counts as a failed pass
    out.exitCode   = -1;
    out.stderr_str = std::string("failed: ") + e.what();
  }

  if (log) {
    log->raw(out.stdout_str);
    log->raw(out.stderr_str);
    log->line(std::string(toString(mode)) + " pass exit code: " + std::to_string(out.exitCode));
  }
  return out;
}

AttemptOutcome SyncInvoker::invokePair(const std::string& sourceRoot,
                                       const std::string& targetRoot,
                                       RunLog* log) {
  AttemptOutcome a;
  a.fast   = invoke(sourceRoot, targetRoot, SyncMode::Fast, log);
  a.verify = invoke(sourceRoot, targetRoot, SyncMode::Verify, log);
  return a;
}
