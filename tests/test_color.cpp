#include "quantum_surface/color/color_encoder.hpp"

#include <cstring>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using quantum_surface::Color;
namespace color = quantum_surface::color;
namespace config = quantum_surface::config;

namespace {

bool bytes_equal(const Color& a, const Color& b) {
    return std::memcmp(&a, &b, sizeof(Color)) == 0;
}

} // namespace

TEST_CASE("color_is_deterministic_for_every_strategy") {
    const config::HueStrategy strategies[] = {config::ByValueHue{}, config::HarmonicHue{},
                                              config::EntropyWeightedHue{},
                                              config::TimeVaryingHue{12.5, 0.05}};
    for (const auto& s : strategies) {
        config::ColorConfig cfg;
        cfg.strategy = s;
        cfg.hue_offset = 0.3;
        const Color a = color::color_for("10110", 0.37, 0.82, cfg);
        const Color b = color::color_for("10110", 0.37, 0.82, cfg);
        REQUIRE(bytes_equal(a, b));
    }
}

TEST_CASE("hue_by_value_spans_pattern_range") {
    REQUIRE(color::hue_for("000", 0.5, config::ByValueHue{}, 0.0) == Catch::Approx(0.0));
    REQUIRE(color::hue_for("011", 0.5, config::ByValueHue{}, 0.0) == Catch::Approx(3.0 / 7.0));
    // 1.0 wraps to 0
    REQUIRE(color::hue_for("111", 0.5, config::ByValueHue{}, 0.0) == Catch::Approx(0.0));
    REQUIRE(color::hue_for("011", 0.5, config::ByValueHue{}, 0.75) ==
            Catch::Approx(3.0 / 7.0 + 0.75 - 1.0));
}

TEST_CASE("hue_harmonic_steps_golden_angle") {
    REQUIRE(color::hue_for("001", 0.5, config::HarmonicHue{}, 0.0) == Catch::Approx(137.5 / 360.0));
    REQUIRE(color::hue_for("011", 0.5, config::HarmonicHue{}, 0.0) ==
            Catch::Approx((3.0 * 137.5 - 360.0) / 360.0));
}

TEST_CASE("hue_entropy_weighted_and_time_varying") {
    REQUIRE(color::hue_for("0", 1.0, config::EntropyWeightedHue{}, 0.0) ==
            Catch::Approx(0.6).margin(1e-9));
    REQUIRE(color::hue_for("0", 0.5, config::EntropyWeightedHue{}, 0.0) == Catch::Approx(0.3));

    const config::TimeVaryingHue tv{2.0, 0.1};
    REQUIRE(color::hue_for("10", 0.5, tv, 0.0) == Catch::Approx(0.7));

    config::ColorConfig cfg;
    cfg.strategy = config::TimeVaryingHue{0.0, 0.1};
    const auto advanced = color::at_time(cfg, 2.0);
    REQUIRE(std::get<config::TimeVaryingHue>(advanced.strategy).time == 2.0);

    config::ColorConfig fixed;
    fixed.strategy = config::HarmonicHue{};
    REQUIRE(std::holds_alternative<config::HarmonicHue>(color::at_time(fixed, 5.0).strategy));
}

TEST_CASE("saturation_and_lightness_modes") {
    REQUIRE(color::saturation_for(0.0, 0.7) == Catch::Approx(0.7));
    REQUIRE(color::saturation_for(1.0, 0.7) == Catch::Approx(1.0));
    REQUIRE(color::saturation_for(0.5, 0.7) == Catch::Approx(0.85));

    config::ColorConfig cfg;
    cfg.brightness_mode = config::BrightnessMode::COHERENCE;
    REQUIRE(color::lightness_for(0.1, 0.5, cfg) == Catch::Approx(0.5));
    cfg.brightness_mode = config::BrightnessMode::PROBABILITY;
    REQUIRE(color::lightness_for(0.1, 0.5, cfg) == Catch::Approx(0.34));
    cfg.brightness_mode = config::BrightnessMode::FIXED;
    REQUIRE(color::lightness_for(0.1, 0.5, cfg) == Catch::Approx(0.5));
}

TEST_CASE("hsl_to_rgb_primaries") {
    const Color red = color::hsl_to_rgb(0.0, 1.0, 0.5);
    REQUIRE(red.r == Catch::Approx(1.0));
    REQUIRE(red.g == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(red.b == Catch::Approx(0.0).margin(1e-12));

    const Color green = color::hsl_to_rgb(1.0 / 3.0, 1.0, 0.5);
    REQUIRE(green.g == Catch::Approx(1.0));
    REQUIRE(green.r == Catch::Approx(0.0).margin(1e-12));

    const Color blue = color::hsl_to_rgb(2.0 / 3.0, 1.0, 0.5);
    REQUIRE(blue.b == Catch::Approx(1.0));

    const Color grey = color::hsl_to_rgb(0.4, 0.0, 0.25);
    REQUIRE(grey.r == 0.25);
    REQUIRE(grey.g == 0.25);
    REQUIRE(grey.b == 0.25);
}

TEST_CASE("pattern_value_handles_wide_patterns") {
    REQUIRE(color::pattern_value("1011") == 11.0);
    const std::string wide(80, '1');
    const double h = color::hue_for(wide, 0.5, config::ByValueHue{}, 0.0);
    REQUIRE(h >= 0.0);
    REQUIRE(h < 1.0);
}
