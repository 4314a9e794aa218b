#include "quantum_surface/surface/reconstructor.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"
#include "quantum_surface/surface/vertex_builder.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <map>
#include <thread>

namespace quantum_surface::surface {

double angular_distance(const SphericalPosition& a, const SphericalPosition& b) {
    const double dtheta = a.theta - b.theta;
    const double dphi = core::wrapped_phi_distance(a.phi, b.phi);
    return std::sqrt(dtheta * dtheta + dphi * dphi);
}

InterpolatedSample interpolate(const std::vector<SurfaceVertex>& vertices, const SphericalPosition& at,
                               const config::ReconstructionConfig& cfg) {
    InterpolatedSample out;
    if (vertices.empty()) {
        out.degenerate = true;
        return out;
    }

    // Nearest vertex inside the threshold wins outright
    const SurfaceVertex* exact = nullptr;
    double exact_d = std::numeric_limits<double>::max();

    double w_sum = 0.0;
    double h_sum = 0.0;
    double r_sum = 0.0;
    double g_sum = 0.0;
    double b_sum = 0.0;

    for (const auto& v : vertices) {
        const double d = angular_distance(at, v.spherical);
        if (d < cfg.exact_match_threshold && d < exact_d) {
            exact = &v;
            exact_d = d;
        }
        const double w = 1.0 / (d * d + cfg.epsilon);
        w_sum += w;
        h_sum += w * v.height;
        r_sum += w * v.color.r;
        g_sum += w * v.color.g;
        b_sum += w * v.color.b;
    }

    if (exact) {
        out.height = exact->height;
        out.color = Color{exact->color.r, exact->color.g, exact->color.b, 1.0};
        out.exact = true;
        return out;
    }

    if (!(w_sum > 0.0)) {
        out.degenerate = true;
        return out;
    }

    out.height = h_sum / w_sum;
    out.color = Color{r_sum / w_sum, g_sum / w_sum, b_sum / w_sum, 1.0};
    return out;
}

std::shared_ptr<const std::vector<Triangle>> grid_triangles(int resolution) {
    static std::mutex cache_mutex;
    static std::map<int, std::shared_ptr<const std::vector<Triangle>>> cache;

    if (resolution < 2) {
        throw ValidationError("grid resolution must be >= 2");
    }

    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = cache.find(resolution);
    if (it != cache.end()) return it->second;

    const auto r = static_cast<std::uint32_t>(resolution);
    auto tris = std::make_shared<std::vector<Triangle>>();
    tris->reserve(static_cast<std::size_t>(2) * r * (r - 1));

    for (std::uint32_t i = 0; i + 1 < r; ++i) {
        for (std::uint32_t j = 0; j < r; ++j) {
            const std::uint32_t jn = (j + 1) % r;
            const std::uint32_t a = i * r + j;
            const std::uint32_t b = i * r + jn;
            const std::uint32_t c = (i + 1) * r + j;
            const std::uint32_t d = (i + 1) * r + jn;
            tris->push_back({a, c, b});
            tris->push_back({b, c, d});
        }
    }

    std::shared_ptr<const std::vector<Triangle>> shared = std::move(tris);
    cache.emplace(resolution, shared);
    return shared;
}

ReconstructedMesh reconstruct(const std::vector<SurfaceVertex>& vertices,
                              const config::ReconstructionConfig& cfg) {
    const int res = cfg.grid_resolution;
    if (res < 2) {
        throw ValidationError("reconstruction.grid_resolution must be >= 2");
    }

    ReconstructedMesh mesh;
    mesh.resolution = res;
    mesh.base_radius = cfg.base_radius;
    mesh.displacement_scale = cfg.displacement_scale;
    mesh.height = Matrix2Dd::Zero(res, res);
    mesh.red = Matrix2Dd::Constant(res, res, kEmptySurfaceColor.r);
    mesh.green = Matrix2Dd::Constant(res, res, kEmptySurfaceColor.g);
    mesh.blue = Matrix2Dd::Constant(res, res, kEmptySurfaceColor.b);
    mesh.positions.assign(static_cast<std::size_t>(res) * static_cast<std::size_t>(res), Vec3::Zero());
    mesh.triangles = grid_triangles(res);
    mesh.degenerate = vertices.empty();
    mesh.source_vertex_count = vertices.size();

    auto fill_row = [&](int i) {
        const double theta = mesh.theta_at(i);
        for (int j = 0; j < res; ++j) {
            const SphericalPosition at{theta, mesh.phi_at(j)};
            const InterpolatedSample s = interpolate(vertices, at, cfg);
            mesh.height(i, j) = s.height;
            mesh.red(i, j) = s.color.r;
            mesh.green(i, j) = s.color.g;
            mesh.blue(i, j) = s.color.b;
            mesh.positions[static_cast<std::size_t>(i) * static_cast<std::size_t>(res) +
                           static_cast<std::size_t>(j)] =
                unit_direction(at) * (cfg.base_radius + s.height * cfg.displacement_scale);
        }
    };

    const int workers_n = std::max(1, std::min(cfg.parallel_workers, res));
    if (workers_n > 1 && !vertices.empty()) {
        std::atomic<int> next_row{0};
        auto worker = [&]() {
            for (int i = next_row.fetch_add(1); i < res; i = next_row.fetch_add(1)) {
                fill_row(i);
            }
        };
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(workers_n));
        for (int w = 0; w < workers_n; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    } else {
        for (int i = 0; i < res; ++i) fill_row(i);
    }

    return mesh;
}

ReconstructionCache::ReconstructionCache(config::ReconstructionConfig cfg)
    : cfg_(std::move(cfg)), resolution_(cfg_.grid_resolution) {}

std::shared_ptr<const ReconstructedMesh> ReconstructionCache::get(const VertexSet& vertices) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Version and snapshot are read separately; a stale version only causes
    // one extra rebuild on the next call.
    const std::uint64_t version = vertices.version();
    if (mesh_ && version_ == version && mesh_->resolution == resolution_) {
        ++hits_;
        return mesh_;
    }

    config::ReconstructionConfig cfg = cfg_;
    cfg.grid_resolution = resolution_;
    auto snapshot = vertices.snapshot();
    auto mesh = std::make_shared<ReconstructedMesh>(reconstruct(*snapshot, cfg));
    mesh->source_version = version;

    mesh_ = std::move(mesh);
    version_ = version;
    ++misses_;
    return mesh_;
}

void ReconstructionCache::set_resolution(int resolution) {
    if (resolution < 2) {
        throw ValidationError("grid resolution must be >= 2");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    resolution_ = resolution;
}

int ReconstructionCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

int ReconstructionCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace quantum_surface::surface
