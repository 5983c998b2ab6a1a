#pragma once
#include <vector>
#include <nlohmann/json.hpp>

#include "core/ledger/RunLedger.hpp"

namespace dts {

nlohmann::json to_json(const RunRecord& r);
nlohmann::json to_json(const std::vector<RunRecord>& runs);
nlohmann::json to_json(const std::vector<FileRecord>& files);

} // namespace dts
