#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"
#include "quantum_surface/surface/vertex_set.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace quantum_surface::surface {

// sqrt(dtheta^2 + dphi^2) with dphi taken the short way around the circle
double angular_distance(const SphericalPosition& a, const SphericalPosition& b);

struct InterpolatedSample {
    double height = 0.0;
    Color color = kEmptySurfaceColor;
    bool exact = false;       // copied from a vertex within the match threshold
    bool degenerate = false;  // no vertices, default height and color
};

// Inverse-distance weighted height and color at (theta, phi), weights
// 1 / (d^2 + epsilon) over every vertex.
InterpolatedSample interpolate(const std::vector<SurfaceVertex>& vertices, const SphericalPosition& at,
                               const config::ReconstructionConfig& cfg);

// Triangle indices of a resolution x resolution lattice wrapped in phi.
// Shared per resolution; independent of the data.
std::shared_ptr<const std::vector<Triangle>> grid_triangles(int resolution);

ReconstructedMesh reconstruct(const std::vector<SurfaceVertex>& vertices,
                              const config::ReconstructionConfig& cfg);

/**
 * Last reconstruction keyed by (vertex set version, grid resolution).
 * Repeated calls between vertex additions return the same mesh instance.
 */
class ReconstructionCache {
public:
    explicit ReconstructionCache(config::ReconstructionConfig cfg);

    std::shared_ptr<const ReconstructedMesh> get(const VertexSet& vertices);
    void set_resolution(int resolution);

    int hits() const;
    int misses() const;

private:
    config::ReconstructionConfig cfg_;
    std::shared_ptr<const ReconstructedMesh> mesh_;
    std::uint64_t version_ = 0;
    int resolution_ = 0;
    int hits_ = 0;
    int misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace quantum_surface::surface
