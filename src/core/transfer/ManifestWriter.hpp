#pragma once
#include <string>
#include <vector>

struct ManifestEntry {
  std::string md5;
  std::string source_path;
  std::string target_path;
};

// Tab-separated, header "source_md5\tsource_file_path\ttarget_file_path".
class ManifestWriter {
public:
  static constexpr const char* kHeader = "source_md5\tsource_file_path\ttarget_file_path";

  // Write-once: refuses to overwrite an existing file. Throws std::runtime_error.
  static void write(const std::string& path, const std::vector<ManifestEntry>& entries);
};
