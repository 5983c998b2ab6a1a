#include "RunJson.hpp"

using nlohmann::json;

namespace dts {

json to_json(const RunRecord& r) {
  return {
    {"run_id", r.run_id},
    {"status", toString(r.status)},
    {"source_dir", r.source_dir},
    {"target_dir", r.target_dir},
    {"log_path", r.log_path},
    {"manifest_path", r.manifest_path},
    {"created_at", r.created_at},
    {"updated_at", r.updated_at}
  };
}

json to_json(const std::vector<RunRecord>& runs) {
  json arr = json::array();
  for (const auto& r : runs) arr.push_back(to_json(r));
  return arr;
}

json to_json(const std::vector<FileRecord>& files) {
  json arr = json::array();
  for (const auto& f : files) {
    arr.push_back({{"file_name", f.file_name}, {"full_path_at_target", f.full_path_at_target}});
  }
  return arr;
}

} // namespace dts
