#pragma once
#include <string>
#include <utility>

class CommandRunner;

struct Relocation {
  std::string finalPath;   // where the artifact lives now
  bool        moved = false;
  std::string warning;     // set when the artifact had to stay local
};

// Moves run artifacts (log, manifest) next to the transferred data.
class ArtifactStore {
public:
  ArtifactStore(CommandRunner& runner, std::string syncTool = "rsync")
    : runner_(runner), syncTool_(std::move(syncTool)) {}

  // targetRunDir is a local directory or a user@host:path run directory.
  // Local: rename into targetRunDir, copy+remove across filesystems.
  // Remote: copy with the sync tool, remove the local file only after the
  // copy succeeded. Never throws; on failure the file stays put.
  Relocation relocate(const std::string& localPath, const std::string& targetRunDir);

private:
  CommandRunner& runner_;
  std::string    syncTool_;
};
