#pragma once

#include "quantum_surface/core/types.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quantum_surface::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Which run contributed which beat
struct SourceEntry {
    std::int64_t run_id = 0;
    int beat_number = 0;
    std::string backend_name;
    std::string timestamp_utc;
    std::string source;
};

struct SurfaceStatistics {
    double mean_height = 0.0;
    double height_variance = 0.0;
    double mean_error = 0.0;
    double max_error = 0.0;
    double min_error = 0.0;
};

struct SurfaceDocument {
    std::vector<SurfaceVertex> vertices;
    std::vector<SourceEntry> sources;
    int total_beats = 0;
    SurfaceStatistics statistics;
};

// Error figures come from qubit-bias vertices when present, otherwise from
// every vertex's quantum value.
SurfaceStatistics compute_statistics(const std::vector<SurfaceVertex>& vertices);

SourceEntry source_entry(const RunRecord& record);

json vertex_to_json(const SurfaceVertex& v);
SurfaceVertex vertex_from_json(const json& j);

json surface_document_to_json(const std::vector<SurfaceVertex>& vertices,
                              const std::vector<SourceEntry>& sources);
SurfaceDocument surface_document_from_json(const json& j);

void save_surface_document(const std::vector<SurfaceVertex>& vertices,
                           const std::vector<SourceEntry>& sources, const fs::path& path);
SurfaceDocument load_surface_document(const fs::path& path);

// Grid positions, colors and triangle indices for a renderer
json mesh_to_json(const ReconstructedMesh& mesh);

} // namespace quantum_surface::io
