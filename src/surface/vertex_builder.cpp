#include "quantum_surface/surface/vertex_builder.hpp"
#include "quantum_surface/color/color_encoder.hpp"
#include "quantum_surface/core/utils.hpp"
#include "quantum_surface/metrics/metrics.hpp"
#include "quantum_surface/modulation/modulator.hpp"
#include "quantum_surface/topology/topology_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace quantum_surface::surface {

namespace {

constexpr double kBiasHeightGain = 20.0;
constexpr double kBiasRadialScale = 0.1;

// Blue for an unbiased qubit through to red for a fully biased one
Color bias_color(double height) {
    const double t = 0.5 * (height + 1.0);
    const double hue = (1.0 - t) * (2.0 / 3.0);
    return color::hsl_to_rgb(hue, 0.8, 0.5);
}

} // namespace

Vec3 unit_direction(const SphericalPosition& pos) {
    const double st = std::sin(pos.theta);
    return Vec3(st * std::cos(pos.phi), st * std::sin(pos.phi), std::cos(pos.theta));
}

std::vector<SurfaceVertex> encode_run(const MeasurementDistribution& dist, const RunMetrics& metrics,
                                      std::int64_t run_id, const config::Config& cfg, double time) {
    metrics::validate_distribution(dist);

    const double coherence = metrics.coherence_estimate;
    const auto points = topology::place(dist, cfg.topology, coherence);
    const config::ColorConfig color_cfg = color::at_time(cfg.color, time);

    std::vector<SurfaceVertex> vertices;
    vertices.reserve(points.size());

    for (const auto& p : points) {
        const auto mod = modulation::modulate(p.spherical, time, cfg.modulation, coherence);

        SurfaceVertex v;
        v.spherical = p.spherical;
        const double radius = p.radius * mod.scale;
        v.height = radius - 1.0;
        v.cartesian = unit_direction(p.spherical) * radius;
        v.color = color::color_for(p.bit_pattern, p.probability, coherence, color_cfg);
        v.color.a = mod.alpha;
        v.glow = mod.glow;
        v.u = p.spherical.phi / kTwoPi;
        v.v = p.spherical.theta / kPi;
        v.source_run_id = run_id;
        v.bit_pattern = p.bit_pattern;
        v.probability = p.probability;
        v.origin = VertexOrigin::ENCODED_POINT;
        vertices.push_back(std::move(v));
    }

    return vertices;
}

int ring_slots(const config::Config& cfg) {
    const double period_seconds = static_cast<double>(cfg.budget.period_days) * 86400.0;
    const double slots = std::ceil(period_seconds / cfg.scheduler.interval_seconds);
    return static_cast<int>(std::max(1.0, std::min(slots, 1.0e6)));
}

double time_position(int beat_number, int slots) {
    if (slots < 1) return 0.0;
    const int slot = ((beat_number % slots) + slots) % slots;
    return static_cast<double>(slot) / static_cast<double>(slots);
}

std::vector<SurfaceVertex> qubit_bias_ring(const MeasurementDistribution& dist, std::int64_t run_id,
                                           double time_position) {
    metrics::validate_distribution(dist);

    const auto bias = metrics::qubit_bias(dist);
    const int n = static_cast<int>(bias.size());
    const double phi = core::wrap_two_pi(kTwoPi * time_position);

    std::vector<SurfaceVertex> vertices;
    vertices.reserve(bias.size());

    for (int q = 0; q < n; ++q) {
        SurfaceVertex v;
        v.spherical.theta = kPi * static_cast<double>(q + 1) / static_cast<double>(n + 1);
        v.spherical.phi = phi;
        const double b = bias[static_cast<std::size_t>(q)];
        v.height = std::max(-1.0, std::min(1.0, b * kBiasHeightGain - 1.0));
        v.cartesian = unit_direction(v.spherical) * (1.0 + kBiasRadialScale * v.height);
        v.color = bias_color(v.height);
        v.u = core::fract(time_position);
        v.v = v.spherical.theta / kPi;
        v.source_run_id = run_id;
        v.bit_pattern = "q" + std::to_string(q);
        v.error_rate = b;
        v.origin = VertexOrigin::QUBIT_BIAS;
        vertices.push_back(std::move(v));
    }

    return vertices;
}

} // namespace quantum_surface::surface
