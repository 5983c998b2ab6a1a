#include "DirectoryScanner.hpp"
#include "FileHash.hpp"
#include <filesystem>

namespace fs = std::filesystem;

void DirectoryScanner::scan(const std::string& root, const Visitor& visit, ScanOptions opts) {
  const fs::path base = fs::absolute(root).lexically_normal();
  for (auto it = fs::recursive_directory_iterator(base); it != fs::recursive_directory_iterator(); ++it) {
    const auto& de = *it;
    if (de.is_symlink() || !de.is_regular_file()) continue;

    FileEntry e;
    e.absolute_path = de.path().string();
    e.relative_path = de.path().lexically_relative(base).generic_string();
    e.size          = de.file_size();
    if (opts.withHash) e.md5 = md5_file_hex(e.absolute_path);
    visit(e);
  }
}

std::vector<FileEntry> DirectoryScanner::enumerate(const std::string& root, ScanOptions opts) {
  std::vector<FileEntry> out;
  scan(root, [&](const FileEntry& e) { out.push_back(e); }, opts);
  return out;
}
