#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

#include <string>
#include <vector>

namespace quantum_surface::topology {

struct PatternAllocation {
    std::string bit_pattern;
    double probability = 0.0;
    int points = 0;
};

struct PlacedPoint {
    std::string bit_pattern;
    SphericalPosition spherical;
    double radius = 1.0;  // strategy radius factor times the configured radius
    double probability = 0.0;
};

// clamp(total_shots, 1, max_points)
int point_budget(std::int64_t total_shots, int max_points);

// Points per pattern, ordered by descending probability (ties by pattern).
// Each pattern gets round(p * total_points); the rounding remainder goes to
// the most probable pattern, and a deficit larger than its share is taken
// from the next patterns in order. The result always sums to total_points.
std::vector<PatternAllocation> allocate_points(const MeasurementDistribution& dist,
                                               int total_points);

// Position of point `index` of `total_points`; pure and deterministic.
PlacedPoint place_point(const config::PlacementStrategy& strategy, int index, int total_points,
                        double probability, double coherence, double radius);

std::vector<PlacedPoint> place(const MeasurementDistribution& dist,
                               const config::PlacementStrategy& strategy, double coherence,
                               double radius, int total_points);

// Budget from cfg.max_points and the distribution's shot count.
std::vector<PlacedPoint> place(const MeasurementDistribution& dist,
                               const config::TopologyConfig& cfg, double coherence);

} // namespace quantum_surface::topology
