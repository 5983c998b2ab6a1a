#include "ManifestWriter.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

void ManifestWriter::write(const std::string& path, const std::vector<ManifestEntry>& entries) {
  namespace fs = std::filesystem;
  if (fs::exists(path)) throw std::runtime_error("manifest already exists: " + path);
  const auto parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);

  std::ofstream os(path, std::ios::out | std::ios::trunc);
  if (!os) throw std::runtime_error("cannot create manifest: " + path);
  os << kHeader << '\n';
  for (const auto& e : entries) {
    os << e.md5 << '\t' << e.source_path << '\t' << e.target_path << '\n';
  }
  os.flush();
  if (!os) throw std::runtime_error("write failed for manifest: " + path);
}
