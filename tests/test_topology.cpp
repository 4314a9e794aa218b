#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/topology/topology_mapper.hpp"

#include <cmath>
#include <numeric>
#include <random>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using quantum_surface::kPi;
using quantum_surface::kTwoPi;
using quantum_surface::MalformedDistribution;
using quantum_surface::MeasurementDistribution;
namespace config = quantum_surface::config;
namespace topology = quantum_surface::topology;

namespace {

int allocated(const std::vector<topology::PatternAllocation>& alloc) {
    int sum = 0;
    for (const auto& a : alloc) sum += a.points;
    return sum;
}

std::vector<config::PlacementStrategy> all_strategies() {
    return {config::UniformPlacement{}, config::SpiralPlacement{2.0},
            config::ClusteredPlacement{4, 0.5}, config::HarmonicPlacement{}};
}

} // namespace

TEST_CASE("allocation_sums_to_total_points") {
    MeasurementDistribution d;
    d.counts = {{"000", 897}, {"100", 55}, {"010", 37}, {"001", 18}, {"110", 10}};
    for (int total : {1, 2, 7, 100, 512, 1017}) {
        const auto alloc = topology::allocate_points(d, total);
        REQUIRE(allocated(alloc) == total);
        REQUIRE(alloc.front().bit_pattern == "000");
    }
}

TEST_CASE("allocation_randomized_distributions") {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> count(0, 50);
    std::uniform_int_distribution<int> budget(1, 600);

    for (int trial = 0; trial < 200; ++trial) {
        MeasurementDistribution d;
        for (int v = 0; v < 16; ++v) {
            std::string pattern;
            for (int b = 3; b >= 0; --b) pattern += ((v >> b) & 1) ? '1' : '0';
            d.counts[pattern] = count(rng);
        }
        d.counts["0000"] += 1;
        const int total = budget(rng);
        const auto alloc = topology::allocate_points(d, total);
        REQUIRE(allocated(alloc) == total);
        for (const auto& a : alloc) REQUIRE(a.points >= 0);
    }
}

TEST_CASE("allocation_single_pattern_takes_everything") {
    MeasurementDistribution d;
    d.counts = {{"11", 1024}};
    const auto alloc = topology::allocate_points(d, 64);
    REQUIRE(alloc.size() == 1);
    REQUIRE(alloc[0].points == 64);
    REQUIRE(alloc[0].probability == 1.0);
}

TEST_CASE("allocation_rejects_zero_shots") {
    MeasurementDistribution d;
    d.counts = {{"0", 0}};
    REQUIRE_THROWS_AS(topology::allocate_points(d, 10), MalformedDistribution);
}

TEST_CASE("point_budget_clamps") {
    REQUIRE(topology::point_budget(1024, 512) == 512);
    REQUIRE(topology::point_budget(100, 512) == 100);
    REQUIRE(topology::point_budget(0, 512) == 1);
}

TEST_CASE("placement_is_deterministic_and_in_range") {
    MeasurementDistribution d;
    d.counts = {{"000", 700}, {"111", 200}, {"101", 124}};

    for (const auto& strategy : all_strategies()) {
        const auto a = topology::place(d, strategy, 0.68, 1.0, 256);
        const auto b = topology::place(d, strategy, 0.68, 1.0, 256);
        REQUIRE(a.size() == 256);
        REQUIRE(b.size() == 256);
        for (std::size_t i = 0; i < a.size(); ++i) {
            REQUIRE(a[i].spherical.theta == b[i].spherical.theta);
            REQUIRE(a[i].spherical.phi == b[i].spherical.phi);
            REQUIRE(a[i].radius == b[i].radius);
            REQUIRE(a[i].bit_pattern == b[i].bit_pattern);

            REQUIRE(a[i].spherical.theta >= 0.0);
            REQUIRE(a[i].spherical.theta <= kPi);
            REQUIRE(a[i].spherical.phi >= 0.0);
            REQUIRE(a[i].spherical.phi < kTwoPi);
        }
    }
}

TEST_CASE("radius_factors_follow_strategy") {
    auto u = topology::place_point(config::UniformPlacement{}, 3, 10, 0.5, 0.2, 2.0);
    REQUIRE(u.radius == Catch::Approx(2.0 * 0.9));

    auto s = topology::place_point(config::SpiralPlacement{}, 3, 10, 0.5, 0.2, 2.0);
    REQUIRE(s.radius == Catch::Approx(2.0 * 0.95));

    auto h = topology::place_point(config::HarmonicPlacement{}, 3, 10, 0.5, 0.2, 2.0);
    REQUIRE(h.radius == Catch::Approx(2.0 * 0.88));
}

TEST_CASE("uniform_theta_follows_even_area_rule") {
    auto first = topology::place_point(config::UniformPlacement{}, 0, 4, 1.0, 1.0, 1.0);
    REQUIRE(first.spherical.theta == Catch::Approx(kPi));
    auto mid = topology::place_point(config::UniformPlacement{}, 2, 4, 1.0, 1.0, 1.0);
    REQUIRE(mid.spherical.theta == Catch::Approx(kPi / 2.0));
}

TEST_CASE("clustered_tighter_with_higher_probability") {
    const config::ClusteredPlacement c{3, 0.6};
    auto certain = topology::place_point(c, 0, 30, 1.0, 1.0, 1.0);
    REQUIRE(certain.spherical.theta == Catch::Approx(kPi / 2.0));
    REQUIRE(certain.spherical.phi == Catch::Approx(0.0).margin(1e-12));

    auto loose = topology::place_point(c, 4, 30, 0.1, 1.0, 1.0);
    auto tight = topology::place_point(c, 4, 30, 0.9, 1.0, 1.0);
    const double center = kTwoPi / 3.0;
    REQUIRE(std::abs(tight.spherical.phi - center) + std::abs(tight.spherical.theta - kPi / 2.0) <
            std::abs(loose.spherical.phi - center) + std::abs(loose.spherical.theta - kPi / 2.0));
}

TEST_CASE("place_point_rejects_out_of_range_index") {
    REQUIRE_THROWS_AS(topology::place_point(config::UniformPlacement{}, 5, 5, 0.5, 0.5, 1.0),
                      quantum_surface::ValidationError);
}
