#include "Verifier.hpp"
#include "core/exec/CommandRunner.hpp"
#include "core/ledger/RunLedger.hpp"
#include "core/sync/RemoteTarget.hpp"
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

std::string shell_quote_path(const std::string& path) {
  if (path.empty() || path[0] != '~') return shell_quote(path);
  const auto slash = path.find('/');
  const std::string head = path.substr(0, slash);
  for (char c : head.substr(1)) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
      return shell_quote(path);
    }
  }
  if (slash == std::string::npos || slash + 1 == path.size()) return head;
  return head + "/" + shell_quote(path.substr(slash + 1));
}

Verifier::Verifier(RunLedger& ledger,
                   CommandRunner& runner,
                   std::shared_ptr<spdlog::logger> logger,
                   std::string remoteShell)
  : ledger_(ledger), runner_(runner), log_(std::move(logger)), remoteShell_(std::move(remoteShell)) {}

std::map<std::string, std::string> Verifier::listLocal(const std::string& dir) const {
  std::map<std::string, std::string> out;
  if (!fs::is_directory(dir)) return out;
  DirectoryScanner::scan(dir, [&](const FileEntry& e) {
    out.emplace(e.relative_path, e.absolute_path);
  });
  return out;
}

std::map<std::string, std::string> Verifier::listRemote(const std::string& spec) const {
  auto remote = RemoteTarget::parse(spec);
  if (!remote) throw std::invalid_argument("not a remote specifier: " + spec);

  std::string root = remote->path;
  while (root.size() > 1 && root.back() == '/') root.pop_back();

  // Paths are listed relative to the run directory, so a root the remote
  // shell expands (~/...) still matches.
  const std::vector<std::string> argv = {
    remoteShell_, remote->login(),
    "cd " + shell_quote_path(root) + " && find . -type f"
  };
  ProcessResult r = runner_.run(argv);
  if (r.exit_code != 0) {
    throw std::runtime_error("remote listing failed (exit " + std::to_string(r.exit_code) + "): " +
                             r.stderr_str);
  }

  std::map<std::string, std::string> out;
  std::istringstream lines(r.stdout_str);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.compare(0, 2, "./") != 0 || line.size() == 2) continue;
    const std::string rel = line.substr(2);
    out.emplace(rel, remote->child(rel).spec());
  }
  return out;
}

ReconcileResult Verifier::reconcile(const std::string& run_id,
                                    const std::vector<FileEntry>& source,
                                    const std::string& targetRunDir,
                                    bool isRemote) {
  ReconcileResult res;

  std::map<std::string, std::string> present;
  try {
    present = isRemote ? listRemote(targetRunDir) : listLocal(targetRunDir);
  } catch (const std::exception& e) {
    res.listingError = e.what();
    log_->warn("{}: could not list {}: {}", run_id, targetRunDir, e.what());
  }

  std::set<std::string> known;
  for (const auto& r : ledger_.listFiles(run_id)) known.insert(r.file_name);

  // Only names that also exist in the source count; stray files already at
  // the destination are not evidence of this transfer.
  for (const auto& src : source) {
    auto it = present.find(src.relative_path);
    if (it == present.end() || known.count(src.relative_path)) continue;
    ledger_.addFileRecord({run_id, src.relative_path, it->second});
    known.insert(src.relative_path);
    ++res.recorded;
  }

  for (const auto& src : source) {
    if (!known.count(src.relative_path)) res.missing.insert(src.relative_path);
  }
  res.complete = res.missing.empty();

  log_->debug("{}: reconcile recorded {} new file(s), {} missing", run_id, res.recorded, res.missing.size());
  return res;
}
