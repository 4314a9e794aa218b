#include "quantum_surface/service/surface_service.hpp"
#include "quantum_surface/surface/vertex_builder.hpp"

namespace quantum_surface::service {

SurfaceService::SurfaceService(const config::Config& cfg, core::EventEmitter* events, std::string run_id)
    : cfg_(cfg), events_(events), run_id_(std::move(run_id)), cache_(cfg.reconstruction) {}

std::size_t SurfaceService::ingest(const RunRecord& record) {
    const double time = static_cast<double>(record.beat_number);
    std::vector<SurfaceVertex> added =
        surface::encode_run(record.distribution, record.metrics, record.beat_number, cfg_, time);

    if (cfg_.reconstruction.include_bias_rings) {
        const double tp = surface::time_position(record.beat_number, surface::ring_slots(cfg_));
        auto ring = surface::qubit_bias_ring(record.distribution, record.beat_number, tp);
        added.insert(added.end(), ring.begin(), ring.end());
    }

    vertices_.add(added);

    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = record;
    sources_.push_back(io::source_entry(record));
    ++runs_;
    return added.size();
}

std::size_t SurfaceService::ingest_vertices(const std::vector<SurfaceVertex>& vertices,
                                            const std::vector<io::SourceEntry>& sources) {
    vertices_.add(vertices);

    std::lock_guard<std::mutex> lock(mutex_);
    sources_.insert(sources_.end(), sources.begin(), sources.end());
    ++runs_;
    return vertices.size();
}

std::optional<RunRecord> SurfaceService::latest_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::shared_ptr<const ReconstructedMesh> SurfaceService::current_mesh() {
    if (runs_ingested() == 0) {
        return nullptr;
    }

    const int misses_before = cache_.misses();
    auto mesh = cache_.get(vertices_);
    if (events_ && cache_.misses() != misses_before) {
        events_->surface_rebuilt(run_id_, mesh->source_vertex_count, mesh->resolution, mesh->degenerate);
        if (mesh->degenerate) {
            events_->warning(run_id_, "surface has no vertices; using default height and color");
        }
    }
    return mesh;
}

io::json SurfaceService::surface_document() const {
    auto snapshot = vertices_.snapshot();
    return io::surface_document_to_json(*snapshot, sources());
}

std::vector<io::SourceEntry> SurfaceService::sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_;
}

int SurfaceService::runs_ingested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
}

} // namespace quantum_surface::service
