#pragma once
#include <ostream>
#include <vector>

#include "core/ledger/RunLedger.hpp"

namespace dts {

// CSV: run_id,created_at,updated_at,status,source_dir,target_dir
void write_status_csv(std::ostream& os, const std::vector<RunRecord>& runs, bool header);
// One run id per line, no header.
void write_run_ids(std::ostream& os, const std::vector<RunRecord>& runs);

} // namespace dts
