#include "StatusReport.hpp"
#include "core/transfer/RunLog.hpp"
#include <string>

namespace {

std::string csv_field(const std::string& v) {
  if (v.find_first_of(",\"\n") == std::string::npos) return v;
  std::string out = "\"";
  for (char c : v) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

} // namespace

namespace dts {

void write_status_csv(std::ostream& os, const std::vector<RunRecord>& runs, bool header) {
  if (header) os << "run_id,created_at,updated_at,status,source_dir,target_dir\n";
  for (const auto& r : runs) {
    os << csv_field(r.run_id) << ','
       << log_timestamp(static_cast<std::time_t>(r.created_at)) << ','
       << log_timestamp(static_cast<std::time_t>(r.updated_at)) << ','
       << toString(r.status) << ','
       << csv_field(r.source_dir) << ','
       << csv_field(r.target_dir) << '\n';
  }
}

void write_run_ids(std::ostream& os, const std::vector<RunRecord>& runs) {
  for (const auto& r : runs) os << r.run_id << '\n';
}

} // namespace dts
