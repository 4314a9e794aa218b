#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

namespace quantum_surface::modulation {

struct Modulation {
    double scale = 1.0;  // radial scale, within [1 - amplitude, 1 + amplitude]
    double alpha = 1.0;
    double glow = 0.0;   // glow intensity in [0, 1]
};

double resonance_scale(const SphericalPosition& pos, const config::ResonanceConfig& cfg);

double glow_intensity(const SphericalPosition& pos, double time, const config::GlowPattern& pattern,
                      double coherence);

double temporal_alpha(const SphericalPosition& pos, double time, bool temporal_sync);

// Pure function of position, time and configuration. Callers animate by
// calling again with the same config and an advanced time.
Modulation modulate(const SphericalPosition& pos, double time, const config::ModulationConfig& cfg,
                    double coherence = 1.0);

} // namespace quantum_surface::modulation
