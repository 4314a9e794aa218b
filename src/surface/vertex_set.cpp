#include "quantum_surface/surface/vertex_set.hpp"

namespace quantum_surface::surface {

VertexSet::VertexSet() : published_(std::make_shared<const std::vector<SurfaceVertex>>()) {}

std::uint64_t VertexSet::add(const std::vector<SurfaceVertex>& vertices) {
    std::lock_guard<std::mutex> lock(mutex_);
    vertices_.insert(vertices_.end(), vertices.begin(), vertices.end());
    ++runs_;
    return ++version_;
}

void VertexSet::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    vertices_.clear();
    runs_ = 0;
    ++version_;
}

VertexSet::Snapshot VertexSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (published_version_ != version_) {
        published_ = std::make_shared<const std::vector<SurfaceVertex>>(vertices_);
        published_version_ = version_;
    }
    return published_;
}

std::uint64_t VertexSet::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::size_t VertexSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vertices_.size();
}

int VertexSet::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
}

} // namespace quantum_surface::surface
