#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include "core/sync/RemoteTarget.hpp"

class RunLedger;
class SyncInvoker;
class Verifier;
class ArtifactStore;

struct TransferRequest {
  std::string source_dir;
  std::string destination;   // local path or user@host:path
  int         max_retries = 5;
};

enum class TransferDisposition {
  Succeeded,
  Failed,
  SkippedAlreadyDone,   // ledger already says SUCCESS
  SkippedInFlight       // ledger says PROCESSING; left alone
};

struct TransferResult {
  std::string         run_id;
  TransferDisposition disposition = TransferDisposition::Failed;
  int                 attempts = 0;
  int64_t             file_count = 0;
  std::string         log_path;
  std::string         manifest_path;

  // 0 unless the transfer ran and failed.
  int exitCode() const { return disposition == TransferDisposition::Failed ? 1 : 0; }
};

// Paths resolved from a request before any state changes.
struct ResolvedRequest {
  std::string                 run_id;
  std::string                 source_dir;    // absolute
  std::string                 destination;   // absolute path or remote spec
  std::string                 target_run_dir;
  std::optional<RemoteTarget> remote;
};

// Validates the request against the filesystem. Throws ValidationError for an
// unreadable source, an unwritable local destination or a malformed remote.
ResolvedRequest resolve_request(const TransferRequest& req);

// Drives one invocation for one run:
//   ledger check -> PROCESSING -> (fast + verify sync, reconcile) x attempts
//   -> SUCCESS | FAILED -> summary + manifest -> artifacts to the target.
// A run already SUCCESS or PROCESSING is left untouched.
class TransferOrchestrator {
public:
  TransferOrchestrator(RunLedger& ledger,
                       SyncInvoker& sync,
                       Verifier& verifier,
                       ArtifactStore& artifacts,
                       std::shared_ptr<spdlog::logger> logger,
                       std::string logDir);

  TransferResult run(const TransferRequest& req);

private:
  RunLedger&                      ledger_;
  SyncInvoker&                    sync_;
  Verifier&                       verifier_;
  ArtifactStore&                  artifacts_;
  std::shared_ptr<spdlog::logger> log_;
  std::string                     logDir_;
};
