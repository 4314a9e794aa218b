#include "quantum_surface/topology/topology_mapper.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace quantum_surface::topology {

namespace {

// 2pi * (1 - 1/phi), about 137.5 degrees
constexpr double kGoldenAngle = kTwoPi * (1.0 - 1.0 / kGoldenRatio);

double clamp_unit(double x) {
    return std::max(-1.0, std::min(1.0, x));
}

struct PointPlacer {
    int index;
    int total;
    double probability;
    double coherence;
    double radius;

    PlacedPoint operator()(const config::UniformPlacement&) const {
        const double i = static_cast<double>(index);
        const double n = static_cast<double>(total);
        PlacedPoint p;
        p.spherical.theta = std::acos(clamp_unit(2.0 * i / n - 1.0));
        p.spherical.phi = kTwoPi * core::fract(i * kGoldenRatio);
        p.radius = radius * (0.8 + 0.2 * probability);
        return p;
    }

    PlacedPoint operator()(const config::SpiralPlacement& s) const {
        const double i = static_cast<double>(index);
        const double n = static_cast<double>(total);
        PlacedPoint p;
        p.spherical.theta = std::acos(clamp_unit(1.0 - 2.0 * (i + 0.5) / n));
        p.spherical.phi = kTwoPi * core::fract(i * s.turns / kGoldenRatio);
        p.radius = radius * (0.9 + 0.1 * probability);
        return p;
    }

    PlacedPoint operator()(const config::ClusteredPlacement& c) const {
        const int k = std::max(1, c.cluster_count);
        const int cluster = index % k;
        const int member = index / k;
        const int members = (total - cluster + k - 1) / k;

        const double center_phi = kTwoPi * static_cast<double>(cluster) / static_cast<double>(k);
        const double offset = c.spread * (1.0 - probability) *
                              std::sqrt((static_cast<double>(member) + 0.5) / static_cast<double>(members));
        const double angle = static_cast<double>(member) * kGoldenAngle;

        PlacedPoint p;
        p.spherical.theta = std::max(0.0, std::min(kPi, 0.5 * kPi + offset * std::sin(angle)));
        p.spherical.phi = core::wrap_two_pi(center_phi + offset * std::cos(angle));
        p.radius = radius;
        return p;
    }

    PlacedPoint operator()(const config::HarmonicPlacement&) const {
        int l = static_cast<int>(std::floor(std::sqrt(static_cast<double>(index))));
        while ((l + 1) * (l + 1) <= index) ++l;
        while (l * l > index) --l;
        const int m = index - l * l - l;  // in [-l, l]

        int l_max = static_cast<int>(std::floor(std::sqrt(static_cast<double>(total - 1))));
        while ((l_max + 1) * (l_max + 1) <= total - 1) ++l_max;
        while (l_max * l_max > total - 1) --l_max;

        PlacedPoint p;
        p.spherical.theta = kPi * (static_cast<double>(l) + 0.5) / static_cast<double>(l_max + 1);
        p.spherical.phi = kTwoPi * static_cast<double>(m + l) / static_cast<double>(2 * l + 1);
        p.radius = radius * (0.85 + 0.15 * coherence);
        return p;
    }
};

} // namespace

int point_budget(std::int64_t total_shots, int max_points) {
    const std::int64_t cap = std::max(1, max_points);
    return static_cast<int>(std::max<std::int64_t>(1, std::min(total_shots, cap)));
}

std::vector<PatternAllocation> allocate_points(const MeasurementDistribution& dist,
                                               int total_points) {
    const std::int64_t total = dist.total_shots();
    if (total <= 0) {
        throw MalformedDistribution("cannot allocate points for zero total shots");
    }
    if (total_points < 0) {
        throw ValidationError("total_points must be >= 0");
    }

    std::vector<PatternAllocation> alloc;
    for (const auto& [pattern, count] : dist.counts) {
        if (count <= 0) continue;
        alloc.push_back({pattern, static_cast<double>(count) / static_cast<double>(total), 0});
    }
    std::sort(alloc.begin(), alloc.end(), [](const PatternAllocation& a, const PatternAllocation& b) {
        if (a.probability != b.probability) return a.probability > b.probability;
        return a.bit_pattern < b.bit_pattern;
    });

    long long assigned = 0;
    for (auto& a : alloc) {
        a.points = static_cast<int>(std::llround(a.probability * static_cast<double>(total_points)));
        assigned += a.points;
    }

    long long remainder = static_cast<long long>(total_points) - assigned;
    if (remainder > 0 && !alloc.empty()) {
        alloc.front().points += static_cast<int>(remainder);
    }
    for (auto& a : alloc) {
        if (remainder >= 0) break;
        const long long take = std::min<long long>(a.points, -remainder);
        a.points -= static_cast<int>(take);
        remainder += take;
    }

    return alloc;
}

PlacedPoint place_point(const config::PlacementStrategy& strategy, int index, int total_points,
                        double probability, double coherence, double radius) {
    if (total_points < 1 || index < 0 || index >= total_points) {
        throw ValidationError("point index " + std::to_string(index) + " outside [0," +
                              std::to_string(total_points) + ")");
    }
    return std::visit(PointPlacer{index, total_points, probability, coherence, radius}, strategy);
}

std::vector<PlacedPoint> place(const MeasurementDistribution& dist,
                               const config::PlacementStrategy& strategy, double coherence,
                               double radius, int total_points) {
    std::vector<PlacedPoint> points;
    const auto alloc = allocate_points(dist, total_points);
    points.reserve(static_cast<std::size_t>(total_points));

    int index = 0;
    for (const auto& a : alloc) {
        for (int k = 0; k < a.points; ++k) {
            PlacedPoint p = place_point(strategy, index, total_points, a.probability, coherence, radius);
            p.bit_pattern = a.bit_pattern;
            p.probability = a.probability;
            points.push_back(std::move(p));
            ++index;
        }
    }
    return points;
}

std::vector<PlacedPoint> place(const MeasurementDistribution& dist,
                               const config::TopologyConfig& cfg, double coherence) {
    return place(dist, cfg.strategy, coherence, cfg.radius,
                 point_budget(dist.total_shots(), cfg.max_points));
}

} // namespace quantum_surface::topology
