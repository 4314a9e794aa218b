#include "quantum_surface/color/color_encoder.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace quantum_surface::color {

namespace {

constexpr double kEntropyEpsilon = 1e-12;
constexpr double kGoldenHueDegrees = 137.5;

double clamp01(double x) {
    return std::max(0.0, std::min(1.0, x));
}

struct HueVisitor {
    const std::string& bit_pattern;
    double probability;

    double operator()(const config::ByValueHue&) const {
        const double max_value = std::pow(2.0, static_cast<double>(bit_pattern.size())) - 1.0;
        return max_value > 0.0 ? pattern_value(bit_pattern) / max_value : 0.0;
    }

    double operator()(const config::HarmonicHue&) const {
        const double degrees = std::fmod(pattern_value(bit_pattern) * kGoldenHueDegrees, 360.0);
        return degrees / 360.0;
    }

    double operator()(const config::EntropyWeightedHue&) const {
        const double contribution = -probability * std::log2(probability + kEntropyEpsilon);
        return 0.6 - 0.6 * contribution;
    }

    double operator()(const config::TimeVaryingHue& tv) const {
        const double span = std::pow(2.0, static_cast<double>(bit_pattern.size()));
        return pattern_value(bit_pattern) / span + tv.time * tv.rate;
    }
};

double hue_to_channel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 0.5) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

} // namespace

double pattern_value(const std::string& bit_pattern) {
    double v = 0.0;
    for (char c : bit_pattern) {
        v = v * 2.0 + (c == '1' ? 1.0 : 0.0);
    }
    return v;
}

double hue_for(const std::string& bit_pattern, double probability,
               const config::HueStrategy& strategy, double hue_offset) {
    const double raw = std::visit(HueVisitor{bit_pattern, probability}, strategy);
    return core::fract(raw + hue_offset);
}

double saturation_for(double probability, double saturation_base) {
    return clamp01(saturation_base + (1.0 - saturation_base) * clamp01(probability));
}

double lightness_for(double probability, double coherence, const config::ColorConfig& cfg) {
    switch (cfg.brightness_mode) {
        case config::BrightnessMode::COHERENCE:
            return clamp01(cfg.lightness_base + cfg.lightness_range * clamp01(coherence));
        case config::BrightnessMode::PROBABILITY:
            return clamp01(cfg.lightness_base + cfg.lightness_range * clamp01(probability));
        case config::BrightnessMode::FIXED:
        default:
            return clamp01(cfg.fixed_lightness);
    }
}

Color hsl_to_rgb(double h, double s, double l) {
    if (s <= 0.0) {
        return Color{l, l, l, 1.0};
    }
    const double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
    const double p = 2.0 * l - q;
    return Color{
        clamp01(hue_to_channel(p, q, h + 1.0 / 3.0)),
        clamp01(hue_to_channel(p, q, h)),
        clamp01(hue_to_channel(p, q, h - 1.0 / 3.0)),
        1.0
    };
}

Color color_for(const std::string& bit_pattern, double probability, double coherence,
                const config::ColorConfig& cfg) {
    const double h = hue_for(bit_pattern, probability, cfg.strategy, cfg.hue_offset);
    const double s = saturation_for(probability, cfg.saturation_base);
    const double l = lightness_for(probability, coherence, cfg);
    return hsl_to_rgb(h, s, l);
}

config::ColorConfig at_time(const config::ColorConfig& cfg, double time) {
    config::ColorConfig out = cfg;
    if (auto* tv = std::get_if<config::TimeVaryingHue>(&out.strategy)) {
        tv->time = time;
    }
    return out;
}

} // namespace quantum_surface::color
