#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/events.hpp"
#include "quantum_surface/core/types.hpp"
#include "quantum_surface/io/surface_document.hpp"
#include "quantum_surface/surface/reconstructor.hpp"
#include "quantum_surface/surface/vertex_set.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantum_surface::service {

/**
 * Read side handed to rendering collaborators: the latest run record and
 * the current reconstructed mesh. Completed runs are fed in with ingest();
 * both reads report "not yet available" until the first one arrives.
 */
class SurfaceService {
public:
    explicit SurfaceService(const config::Config& cfg, core::EventEmitter* events = nullptr,
                            std::string run_id = std::string());

    // Encodes the run (and its qubit-bias ring) into the vertex set.
    // Returns the number of vertices added.
    std::size_t ingest(const RunRecord& record);

    // Adds vertices loaded from a saved surface document
    std::size_t ingest_vertices(const std::vector<SurfaceVertex>& vertices,
                                const std::vector<io::SourceEntry>& sources);

    std::optional<RunRecord> latest_run() const;

    // nullptr before anything has been ingested
    std::shared_ptr<const ReconstructedMesh> current_mesh();

    io::json surface_document() const;
    std::vector<io::SourceEntry> sources() const;
    const surface::VertexSet& vertices() const { return vertices_; }
    int runs_ingested() const;

private:
    config::Config cfg_;
    core::EventEmitter* events_;
    std::string run_id_;

    surface::VertexSet vertices_;
    surface::ReconstructionCache cache_;

    mutable std::mutex mutex_;
    std::optional<RunRecord> latest_;
    std::vector<io::SourceEntry> sources_;
    int runs_ = 0;
};

} // namespace quantum_surface::service
