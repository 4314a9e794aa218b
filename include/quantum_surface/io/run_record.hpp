#pragma once

#include "quantum_surface/core/types.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quantum_surface::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

json run_record_to_json(const RunRecord& record);

// Throws IOError on missing or mistyped fields
RunRecord run_record_from_json(const json& j);

// beat_<NNNNNN>_<YYYY-MM-DD>.json
std::string run_record_filename(const RunRecord& record);

fs::path save_run_record(const RunRecord& record, const fs::path& dir);
RunRecord load_run_record(const fs::path& path);

// Every beat_*.json under dir, sorted by beat number
std::vector<RunRecord> load_run_records(const fs::path& dir);

} // namespace quantum_surface::io
