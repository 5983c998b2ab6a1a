#include "ArtifactStore.hpp"
#include "core/Errors.hpp"
#include "core/exec/CommandRunner.hpp"
#include "core/sync/RemoteTarget.hpp"
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

Relocation ArtifactStore::relocate(const std::string& localPath, const std::string& targetRunDir) {
  Relocation r;
  r.finalPath = localPath;

  std::optional<RemoteTarget> remote;
  try {
    remote = RemoteTarget::parse(targetRunDir);
  } catch (const ValidationError& e) {
    r.warning = e.what();
    return r;
  }

  std::error_code ec;
  if (!fs::exists(localPath, ec)) {
    r.warning = "artifact not found: " + localPath;
    return r;
  }
  const std::string name = fs::path(localPath).filename().string();

  if (remote) {
    const RemoteTarget dest = remote->child(name);
    const std::vector<std::string> argv = {syncTool_, "-a", localPath, dest.spec()};
    ProcessResult res;
    try {
      res = runner_.run(argv);
    } catch (const std::exception& e) {
      r.warning = "copy of " + localPath + " failed: " + e.what();
      return r;
    }
    if (res.exit_code != 0) {
      r.warning = "copy of " + localPath + " to " + dest.spec() + " failed (exit " +
                  std::to_string(res.exit_code) + ")";
      return r;
    }
    fs::remove(localPath, ec);
    if (ec) r.warning = "copied but could not remove local " + localPath + ": " + ec.message();
    r.finalPath = dest.spec();
    r.moved = true;
    return r;
  }

  fs::path dest = fs::path(targetRunDir) / name;
  fs::create_directories(targetRunDir, ec);
  if (ec) {
    r.warning = "cannot create " + targetRunDir + ": " + ec.message();
    return r;
  }
  // never replace an earlier run's artifact
  for (int n = 1; fs::exists(dest, ec); ++n) {
    const fs::path p(name);
    dest = fs::path(targetRunDir) / (p.stem().string() + "_" + std::to_string(n) + p.extension().string());
  }
  fs::rename(localPath, dest, ec);
  if (ec) {
    // different filesystem
    ec.clear();
    fs::copy_file(localPath, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      r.warning = "move of " + localPath + " to " + dest.string() + " failed: " + ec.message();
      return r;
    }
    fs::remove(localPath, ec);
    if (ec) r.warning = "copied but could not remove local " + localPath + ": " + ec.message();
  }
  r.finalPath = fs::weakly_canonical(dest, ec).string();
  if (ec || r.finalPath.empty()) r.finalPath = dest.string();
  r.moved = true;
  return r;
}
