#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

#include <cstdint>
#include <vector>

namespace quantum_surface::surface {

// Unit vector for (theta, phi); theta measured from +z.
Vec3 unit_direction(const SphericalPosition& pos);

// Topology -> color -> modulation for one run. `time` drives the
// time-varying hue and the modulator; the same inputs give the same vertices.
std::vector<SurfaceVertex> encode_run(const MeasurementDistribution& dist, const RunMetrics& metrics,
                                      std::int64_t run_id, const config::Config& cfg, double time);

// Longitude slots per budget period, one per scheduled beat.
int ring_slots(const config::Config& cfg);

// Position in [0, 1) of a beat along the period ring.
double time_position(int beat_number, int slots);

// One vertex per qubit at longitude 2pi * time_position, height from the
// qubit's bias toward 0 or 1.
std::vector<SurfaceVertex> qubit_bias_ring(const MeasurementDistribution& dist, std::int64_t run_id,
                                           double time_position);

} // namespace quantum_surface::surface
