#include "TransferOrchestrator.hpp"
#include "ArtifactStore.hpp"
#include "ManifestWriter.hpp"
#include "RunLog.hpp"
#include "core/Errors.hpp"
#include "core/exec/CommandRunner.hpp"
#include "core/ledger/RunLedger.hpp"
#include "core/scan/DirectoryScanner.hpp"
#include "core/scan/FileHash.hpp"
#include "core/sync/SyncInvoker.hpp"
#include "core/verify/Verifier.hpp"
#include <ctime>
#include <filesystem>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr size_t kMissingListed = 20;

fs::path strip_trailing_slash(fs::path p) {
  p = p.lexically_normal();
  if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
  return p;
}

void check_local_destination(const fs::path& dest) {
  std::error_code ec;
  if (fs::exists(dest, ec)) {
    if (!fs::is_directory(dest, ec)) throw ValidationError("destination is not a directory: " + dest.string());
    if (access(dest.c_str(), W_OK | X_OK) != 0) throw ValidationError("destination is not writable: " + dest.string());
    return;
  }
  // will be created; the nearest existing ancestor must accept it
  fs::path probe = dest.parent_path();
  while (!probe.empty() && !fs::exists(probe, ec)) {
    if (probe == probe.parent_path()) break;
    probe = probe.parent_path();
  }
  if (probe.empty() || !fs::is_directory(probe, ec) || access(probe.c_str(), W_OK | X_OK) != 0) {
    throw ValidationError("destination cannot be created: " + dest.string());
  }
}

} // namespace

ResolvedRequest resolve_request(const TransferRequest& req) {
  if (req.source_dir.empty()) throw ValidationError("source directory is required");
  if (req.destination.empty()) throw ValidationError("destination is required");

  ResolvedRequest r;
  const fs::path src = strip_trailing_slash(fs::absolute(req.source_dir));
  std::error_code ec;
  if (!fs::is_directory(src, ec)) throw ValidationError("source is not a directory: " + src.string());
  if (access(src.c_str(), R_OK | X_OK) != 0) throw ValidationError("source is not readable: " + src.string());
  r.source_dir = src.string();
  r.run_id = src.filename().string();
  if (r.run_id.empty() || r.run_id == "." || r.run_id == "..") {
    throw ValidationError("cannot derive a run id from " + src.string());
  }

  r.remote = RemoteTarget::parse(req.destination);
  if (r.remote) {
    r.destination    = r.remote->spec();
    r.target_run_dir = r.remote->child(r.run_id).spec();
  } else {
    const fs::path dest = strip_trailing_slash(fs::absolute(req.destination));
    check_local_destination(dest);
    if (dest / r.run_id == src) throw ValidationError("source and target are the same directory: " + src.string());
    r.destination    = dest.string();
    r.target_run_dir = (dest / r.run_id).string();
  }
  return r;
}

TransferOrchestrator::TransferOrchestrator(RunLedger& ledger,
                                           SyncInvoker& sync,
                                           Verifier& verifier,
                                           ArtifactStore& artifacts,
                                           std::shared_ptr<spdlog::logger> logger,
                                           std::string logDir)
  : ledger_(ledger), sync_(sync), verifier_(verifier), artifacts_(artifacts),
    log_(std::move(logger)), logDir_(std::move(logDir)) {}

TransferResult TransferOrchestrator::run(const TransferRequest& req) {
  if (req.max_retries < 1) throw ValidationError("max retries must be at least 1");
  const ResolvedRequest rr = resolve_request(req);
  const int maxAttempts = req.max_retries;

  TransferResult result;
  result.run_id = rr.run_id;

  const auto existing = ledger_.get(rr.run_id);
  if (existing && existing->status == RunStatus::Success) {
    log_->info("{} status SUCCESS, nothing to do", rr.run_id);
    result.disposition   = TransferDisposition::SkippedAlreadyDone;
    result.log_path      = existing->log_path;
    result.manifest_path = existing->manifest_path;
    return result;
  }
  if (existing && existing->status == RunStatus::Processing) {
    log_->warn("{} status PROCESSING, another invocation owns it (clear it by hand if that process died)",
               rr.run_id);
    result.disposition = TransferDisposition::SkippedInFlight;
    result.log_path    = existing->log_path;
    return result;
  }
  if (existing && existing->target_dir != rr.destination) {
    throw ValidationError(rr.run_id + " was previously sent to " + existing->target_dir +
                          ", not " + rr.destination);
  }

  // An unreadable subtree is an environment error: it must surface before the
  // ledger is touched.
  std::vector<FileEntry> files;
  try {
    files = DirectoryScanner::enumerate(rr.source_dir);
  } catch (const fs::filesystem_error& e) {
    throw ValidationError(std::string("cannot read source tree: ") + e.what());
  }
  uintmax_t totalBytes = 0;
  for (const auto& f : files) totalBytes += f.size;
  result.file_count = static_cast<int64_t>(files.size());

  const std::time_t started = std::time(nullptr);
  const std::string stamp = file_timestamp(started);
  const std::string logPath = (fs::path(logDir_) / (rr.run_id + "_" + stamp + ".log")).string();
  const std::string manifestPath = (fs::path(logDir_) / (rr.run_id + "_" + stamp + "_md5sum.tsv")).string();

  RunLog runLog(logPath);

  // PROCESSING is durable before anything at the destination changes.
  if (existing) {
    ledger_.reopenProcessing(rr.run_id, rr.source_dir, rr.destination, logPath, manifestPath);
  } else {
    ledger_.createProcessing(rr.run_id, rr.source_dir, rr.destination, logPath, manifestPath);
  }
  log_->info("{} PROCESSING: {} -> {}", rr.run_id, rr.source_dir, rr.target_run_dir);

  bool ok = false;
  try {
    runLog.line("Transfer started at: " + log_timestamp(started));
    runLog.line("Source: " + rr.source_dir + ", Target: " + rr.destination);
    runLog.line(fmt::format("Source directory size: {} bytes in {} file(s)", totalBytes, files.size()));
    runLog.line("Command: " + join_command(sync_.command(rr.source_dir, rr.destination, SyncMode::Fast)));
    runLog.line("Command: " + join_command(sync_.command(rr.source_dir, rr.destination, SyncMode::Verify)));

    if (!rr.remote) fs::create_directories(rr.destination);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
      result.attempts = attempt;
      runLog.line(fmt::format("Attempt {} of {} started", attempt, maxAttempts));

      const AttemptOutcome outcome = sync_.invokePair(rr.source_dir, rr.destination, &runLog);
      const ReconcileResult rec =
          verifier_.reconcile(rr.run_id, files, rr.target_run_dir, rr.remote.has_value());

      if (outcome.succeeded() && rec.complete) {
        runLog.line(fmt::format("Transfer completed successfully on attempt {}", attempt));
        ok = true;
        break;
      }

      if (!outcome.succeeded()) {
        runLog.line(fmt::format("Transfer failed on attempt {} (fast exit code: {}, verify exit code: {})",
                                attempt, outcome.fast.exitCode, outcome.verify.exitCode));
      } else {
        runLog.line(fmt::format("Sync reported success on attempt {} but {} file(s) are missing at the target",
                                attempt, rec.missing.size()));
        size_t shown = 0;
        for (const auto& name : rec.missing) {
          if (shown++ == kMissingListed) { runLog.line("  ..."); break; }
          runLog.line("  missing: " + name);
        }
      }
      if (!rec.listingError.empty()) runLog.line("Target listing failed: " + rec.listingError);
      if (attempt < maxAttempts) {
        log_->warn("{} transfer failed on attempt {}, retrying...", rr.run_id, attempt);
      }
    }
  } catch (const LedgerError&) {
    throw;
  } catch (const std::exception& e) {
    runLog.line(std::string("Transfer aborted: ") + e.what());
    ledger_.setStatus(rr.run_id, RunStatus::Failed);
    log_->error("{} transfer aborted: {}", rr.run_id, e.what());
    throw;
  }

  const RunStatus finalStatus = ok ? RunStatus::Success : RunStatus::Failed;
  ledger_.setStatus(rr.run_id, finalStatus);
  result.disposition = ok ? TransferDisposition::Succeeded : TransferDisposition::Failed;
  if (ok) {
    log_->info("{} transfer SUCCESS after {} attempt(s)", rr.run_id, result.attempts);
  } else {
    log_->error("{} transfer failed after {} attempts", rr.run_id, maxAttempts);
  }

  runLog.line(fmt::format("Transfer summary: run {} status {}, source {}, target {}, {} file(s), "
                          "{} confirmed at target, finished at {}",
                          rr.run_id, toString(finalStatus), rr.source_dir, rr.target_run_dir,
                          files.size(), ledger_.countFiles(rr.run_id), log_timestamp(std::time(nullptr))));

  bool manifestWritten = false;
  try {
    std::vector<ManifestEntry> entries;
    entries.reserve(files.size());
    for (const auto& f : files) {
      entries.push_back({md5_file_hex(f.absolute_path), f.absolute_path,
                         rr.target_run_dir + "/" + f.relative_path});
    }
    ManifestWriter::write(manifestPath, entries);
    manifestWritten = true;
    runLog.line(fmt::format("Manifest written: {} ({} row(s))", manifestPath, entries.size()));
  } catch (const std::exception& e) {
    log_->warn("{} manifest not written: {}", rr.run_id, e.what());
    runLog.line(std::string("WARNING: manifest not written: ") + e.what());
  }

  runLog.line("Moving run artifacts to " + rr.target_run_dir);
  runLog.close();

  std::vector<std::string> warnings;
  const Relocation logMove = artifacts_.relocate(logPath, rr.target_run_dir);
  if (!logMove.warning.empty()) warnings.push_back(logMove.warning);
  Relocation manifestMove;
  manifestMove.finalPath = manifestPath;
  if (manifestWritten) {
    manifestMove = artifacts_.relocate(manifestPath, rr.target_run_dir);
    if (!manifestMove.warning.empty()) warnings.push_back(manifestMove.warning);
  }

  for (const auto& w : warnings) log_->warn("{}: {}", rr.run_id, w);
  if (!logMove.moved && !warnings.empty()) {
    // the log stayed local, so the warnings can still go into it
    RunLog local(logPath);
    for (const auto& w : warnings) local.line("WARNING: " + w);
  }

  RunUpdate u;
  if (logMove.finalPath != logPath) u.log_path = logMove.finalPath;
  if (manifestMove.finalPath != manifestPath) u.manifest_path = manifestMove.finalPath;
  ledger_.update(rr.run_id, u);

  result.log_path      = logMove.finalPath;
  result.manifest_path = manifestMove.finalPath;
  return result;
}
