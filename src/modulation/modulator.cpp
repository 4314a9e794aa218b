#include "quantum_surface/modulation/modulator.hpp"

#include <algorithm>
#include <cmath>

namespace quantum_surface::modulation {

namespace {

struct GlowVisitor {
    const SphericalPosition& pos;
    double time;
    double coherence;

    double operator()(const config::NoGlow&) const { return 0.0; }

    double operator()(const config::TravelingWaveGlow& g) const {
        return 0.5 * (1.0 + std::sin(g.k * pos.theta - time * g.speed));
    }

    double operator()(const config::HighFrequencyGlow& g) const {
        return std::fabs(std::sin(g.k * pos.theta) * std::cos(g.k * pos.phi));
    }

    double operator()(const config::PulseGlow& g) const {
        return 0.5 * (1.0 + std::sin(time * g.rate)) * coherence;
    }
};

} // namespace

double resonance_scale(const SphericalPosition& pos, const config::ResonanceConfig& cfg) {
    if (!cfg.enabled) return 1.0;
    const double a = std::fabs(cfg.amplitude);
    const double term = a * std::cos(cfg.l * pos.theta) * std::cos(cfg.m * pos.phi);
    return std::max(1.0 - a, std::min(1.0 + a, 1.0 + term));
}

double glow_intensity(const SphericalPosition& pos, double time, const config::GlowPattern& pattern,
                      double coherence) {
    const double c = std::max(0.0, std::min(1.0, coherence));
    const double g = std::visit(GlowVisitor{pos, time, c}, pattern);
    return std::max(0.0, std::min(1.0, g));
}

double temporal_alpha(const SphericalPosition& pos, double time, bool temporal_sync) {
    if (!temporal_sync) return 1.0;
    return 0.7 + 0.3 * std::sin(time + pos.theta * 2.0);
}

Modulation modulate(const SphericalPosition& pos, double time, const config::ModulationConfig& cfg,
                    double coherence) {
    Modulation m;
    m.scale = resonance_scale(pos, cfg.resonance);
    m.alpha = temporal_alpha(pos, time, cfg.temporal_sync);
    m.glow = glow_intensity(pos, time, cfg.glow, coherence);
    return m;
}

} // namespace quantum_surface::modulation
