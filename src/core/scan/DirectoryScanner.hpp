#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct FileEntry {
  std::string            relative_path;   // generic form, '/' separated
  std::string            absolute_path;
  uintmax_t              size = 0;
  std::optional<std::string> md5;          // only when hashing was requested
};

struct ScanOptions {
  bool withHash = false;
};

// Walks every regular file under a root. Symlinks and directories are not
// yielded and symlinked directories are not followed. Stateless: each call
// re-reads the filesystem. Order is whatever the filesystem returns.
class DirectoryScanner {
public:
  using Visitor = std::function<void(const FileEntry&)>;

  // Streams entries to visit one at a time. Throws std::filesystem_error if
  // root cannot be opened.
  static void scan(const std::string& root, const Visitor& visit, ScanOptions opts = {});

  static std::vector<FileEntry> enumerate(const std::string& root, ScanOptions opts = {});
};
