#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

#include <string>

namespace quantum_surface::color {

// Integer value of a binary pattern, accumulated in double precision so
// patterns wider than 64 bits still map monotonically.
double pattern_value(const std::string& bit_pattern);

// Hue in [0, 1)
double hue_for(const std::string& bit_pattern, double probability,
               const config::HueStrategy& strategy, double hue_offset);

double saturation_for(double probability, double saturation_base);

double lightness_for(double probability, double coherence, const config::ColorConfig& cfg);

// Standard piecewise HSL -> RGB, all channels in [0, 1]
Color hsl_to_rgb(double h, double s, double l);

Color color_for(const std::string& bit_pattern, double probability, double coherence,
                const config::ColorConfig& cfg);

// Copy of cfg with the time-varying strategy advanced to `time`; other
// strategies are returned unchanged.
config::ColorConfig at_time(const config::ColorConfig& cfg, double time);

} // namespace quantum_surface::color
