#pragma once
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/scan/DirectoryScanner.hpp"

class RunLedger;
class CommandRunner;

struct ReconcileResult {
  bool                  complete = false;
  std::set<std::string> missing;        // source relative paths not found
  int                   recorded = 0;   // FileRecords added by this pass
  std::string           listingError;   // non-empty when the target could not be listed
};

// Confirms source files at the target independently of the sync tool and
// records each confirmed file once per run.
class Verifier {
public:
  Verifier(RunLedger& ledger,
           CommandRunner& runner,
           std::shared_ptr<spdlog::logger> logger,
           std::string remoteShell = "ssh");

  // targetRunDir is the run's own directory at the destination: a local path,
  // or a user@host:path specifier when isRemote is set.
  ReconcileResult reconcile(const std::string& run_id,
                            const std::vector<FileEntry>& source,
                            const std::string& targetRunDir,
                            bool isRemote);

  // relative path -> full path at the target. Throws on listing failure.
  std::map<std::string, std::string> listLocal(const std::string& dir) const;
  std::map<std::string, std::string> listRemote(const std::string& spec) const;

private:
  RunLedger&                      ledger_;
  CommandRunner&                  runner_;
  std::shared_ptr<spdlog::logger> log_;
  std::string                     remoteShell_;
};

// Single-quotes s for a POSIX shell.
std::string shell_quote(const std::string& s);

// Quotes a remote path but leaves a leading "~" or "~user" outside the quotes
// so the remote shell still expands it, as rsync does.
std::string shell_quote_path(const std::string& path);
