#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/surface/reconstructor.hpp"
#include "quantum_surface/surface/vertex_builder.hpp"
#include "quantum_surface/surface/vertex_set.hpp"

#include <cmath>
#include <set>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using quantum_surface::Color;
using quantum_surface::kEmptySurfaceColor;
using quantum_surface::kPi;
using quantum_surface::kTwoPi;
using quantum_surface::SphericalPosition;
using quantum_surface::SurfaceVertex;
namespace config = quantum_surface::config;
namespace surface = quantum_surface::surface;

namespace {

SurfaceVertex make_vertex(double theta, double phi, double height, Color color = {0.2, 0.4, 0.6, 1.0}) {
    SurfaceVertex v;
    v.spherical = {theta, phi};
    v.height = height;
    v.color = color;
    v.cartesian = surface::unit_direction(v.spherical) * (1.0 + height);
    return v;
}

} // namespace

TEST_CASE("angular_distance_wraps_longitude") {
    const double d = surface::angular_distance({1.0, 0.01}, {1.0, kTwoPi - 0.01});
    REQUIRE(d == Catch::Approx(0.02).epsilon(1e-9));

    const double straight = surface::angular_distance({0.5, 1.0}, {1.5, 1.0});
    REQUIRE(straight == Catch::Approx(1.0));
}

TEST_CASE("wraparound_neighbours_dominate_interpolation") {
    config::ReconstructionConfig cfg;
    const std::vector<SurfaceVertex> verts = {
        make_vertex(kPi / 2.0, kTwoPi - 0.01, 0.9),
        make_vertex(kPi / 2.0, kPi, -0.9),
    };
    const auto s = surface::interpolate(verts, {kPi / 2.0, 0.01}, cfg);
    REQUIRE_FALSE(s.exact);
    REQUIRE(s.height > 0.7);
}

TEST_CASE("single_vertex_round_trip_is_exact") {
    config::ReconstructionConfig cfg;
    cfg.grid_resolution = 17;

    // Sits exactly on grid node (4, 6)
    const double theta = kPi * 4.0 / 16.0;
    const double phi = kTwoPi * 6.0 / 17.0;
    const std::vector<SurfaceVertex> verts = {make_vertex(theta, phi, 0.37)};

    const auto direct = surface::interpolate(verts, {theta, phi}, cfg);
    REQUIRE(direct.exact);
    REQUIRE(direct.height == Catch::Approx(0.37));

    const auto mesh = surface::reconstruct(verts, cfg);
    REQUIRE(mesh.height(4, 6) == Catch::Approx(0.37));
    REQUIRE(mesh.red(4, 6) == Catch::Approx(0.2));
    REQUIRE_FALSE(mesh.degenerate);

    const auto& p = mesh.positions[4 * 17 + 6];
    REQUIRE(p.norm() == Catch::Approx(cfg.base_radius + 0.37 * cfg.displacement_scale));
}

TEST_CASE("nearest_vertex_wins_exact_match") {
    config::ReconstructionConfig cfg;
    cfg.exact_match_threshold = 0.01;
    const std::vector<SurfaceVertex> verts = {
        make_vertex(1.0, 1.005, 0.1),
        make_vertex(1.0, 1.001, 0.8),
    };
    const auto s = surface::interpolate(verts, {1.0, 1.0}, cfg);
    REQUIRE(s.exact);
    REQUIRE(s.height == Catch::Approx(0.8));
}

TEST_CASE("idw_weights_follow_inverse_square") {
    config::ReconstructionConfig cfg;
    cfg.epsilon = 0.1;
    const std::vector<SurfaceVertex> verts = {
        make_vertex(1.0, 1.0, 1.0),
        make_vertex(2.0, 1.0, 0.0),
    };
    const auto s = surface::interpolate(verts, {1.25, 1.0}, cfg);
    const double w1 = 1.0 / (0.25 * 0.25 + 0.1);
    const double w2 = 1.0 / (0.75 * 0.75 + 0.1);
    REQUIRE(s.height == Catch::Approx(w1 / (w1 + w2)));
}

TEST_CASE("empty_vertex_set_is_degenerate_not_nan") {
    config::ReconstructionConfig cfg;
    cfg.grid_resolution = 8;
    const auto mesh = surface::reconstruct({}, cfg);
    REQUIRE(mesh.degenerate);
    for (int i = 0; i < 8; ++i) {
        for (int j = 0; j < 8; ++j) {
            REQUIRE(mesh.height(i, j) == 0.0);
            REQUIRE(mesh.red(i, j) == kEmptySurfaceColor.r);
            REQUIRE(mesh.blue(i, j) == kEmptySurfaceColor.b);
        }
    }
    REQUIRE(mesh.positions[0].norm() == Catch::Approx(cfg.base_radius));
}

TEST_CASE("grid_triangles_cached_per_resolution") {
    const auto a = surface::grid_triangles(10);
    const auto b = surface::grid_triangles(10);
    REQUIRE(a.get() == b.get());
    REQUIRE(a->size() == static_cast<std::size_t>(2 * 10 * 9));

    std::set<std::uint32_t> used;
    for (const auto& t : *a) {
        for (auto idx : t) {
            REQUIRE(idx < 100u);
            used.insert(idx);
        }
    }
    REQUIRE(used.size() == 100);

    const auto c = surface::grid_triangles(12);
    REQUIRE(c.get() != a.get());
    REQUIRE_THROWS_AS(surface::grid_triangles(1), quantum_surface::ValidationError);
}

TEST_CASE("parallel_rows_match_serial") {
    config::ReconstructionConfig serial;
    serial.grid_resolution = 24;
    config::ReconstructionConfig parallel = serial;
    parallel.parallel_workers = 4;

    std::vector<SurfaceVertex> verts;
    for (int k = 0; k < 30; ++k) {
        verts.push_back(make_vertex(kPi * (k + 0.5) / 30.0, std::fmod(k * 2.39996, kTwoPi),
                                    std::sin(k * 0.7) * 0.5));
    }
    const auto a = surface::reconstruct(verts, serial);
    const auto b = surface::reconstruct(verts, parallel);
    REQUIRE(a.height.isApprox(b.height));
    REQUIRE(a.red.isApprox(b.red));
}

TEST_CASE("reconstruction_cache_keys_on_version_and_resolution") {
    config::ReconstructionConfig cfg;
    cfg.grid_resolution = 8;
    surface::ReconstructionCache cache(cfg);
    surface::VertexSet set;

    set.add({make_vertex(1.0, 1.0, 0.5)});
    const auto m1 = cache.get(set);
    const auto m2 = cache.get(set);
    REQUIRE(m1.get() == m2.get());
    REQUIRE(cache.hits() == 1);
    REQUIRE(cache.misses() == 1);

    set.add({make_vertex(2.0, 3.0, -0.5)});
    const auto m3 = cache.get(set);
    REQUIRE(m3.get() != m1.get());
    REQUIRE(m3->source_version == set.version());
    REQUIRE(m3->source_vertex_count == 2);

    cache.set_resolution(12);
    const auto m4 = cache.get(set);
    REQUIRE(m4->resolution == 12);
    REQUIRE(cache.misses() == 3);
}

TEST_CASE("vertex_set_snapshots_are_immutable") {
    surface::VertexSet set;
    REQUIRE(set.version() == 0);
    auto before = set.snapshot();
    set.add({make_vertex(1.0, 1.0, 0.1), make_vertex(1.2, 1.0, 0.2)});
    REQUIRE(before->empty());
    REQUIRE(set.size() == 2);
    REQUIRE(set.run_count() == 1);
    REQUIRE(set.version() == 1);

    set.clear();
    REQUIRE(set.size() == 0);
    REQUIRE(set.version() == 2);
}

TEST_CASE("vertex_set_publishes_one_snapshot_per_version") {
    surface::VertexSet set;
    for (int run = 0; run < 50; ++run) {
        set.add({make_vertex(1.0, 0.01 * run, 0.1), make_vertex(1.5, 0.01 * run, 0.2)});
    }
    REQUIRE(set.size() == 100);
    REQUIRE(set.run_count() == 50);

    const auto first = set.snapshot();
    REQUIRE(first->size() == 100);
    REQUIRE((*first)[98].spherical.phi == Catch::Approx(0.49));
    REQUIRE((*first)[99].height == Catch::Approx(0.2));
    REQUIRE(set.snapshot().get() == first.get());

    set.add({make_vertex(2.0, 3.0, -0.3)});
    const auto second = set.snapshot();
    REQUIRE(second.get() != first.get());
    REQUIRE(first->size() == 100);
    REQUIRE(second->size() == 101);
    REQUIRE(second->back().height == Catch::Approx(-0.3));
}
