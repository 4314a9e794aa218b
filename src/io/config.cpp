#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace quantum_surface::config {

static std::string normalize_name(const std::string& raw) {
    std::string name = core::to_lower(core::trim(raw));
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

static PlacementStrategy parse_placement(const YAML::Node& t) {
    const std::string name = t["strategy"] ? normalize_name(t["strategy"].as<std::string>())
                                           : std::string("uniform_probability");
    if (name == "uniform_probability" || name == "uniform") {
        return UniformPlacement{};
    }
    if (name == "spiral") {
        SpiralPlacement s;
        if (t["spiral_turns"]) s.turns = t["spiral_turns"].as<double>();
        return s;
    }
    if (name == "clustered") {
        ClusteredPlacement c;
        if (t["cluster_count"]) c.cluster_count = t["cluster_count"].as<int>();
        if (t["cluster_spread"]) c.spread = t["cluster_spread"].as<double>();
        return c;
    }
    if (name == "harmonic") {
        return HarmonicPlacement{};
    }
    throw ConfigError("unknown topology.strategy '" + name + "'");
}

static HueStrategy parse_hue(const YAML::Node& c) {
    const std::string name = c["strategy"] ? normalize_name(c["strategy"].as<std::string>())
                                           : std::string("by_value");
    if (name == "by_value") return ByValueHue{};
    if (name == "harmonic") return HarmonicHue{};
    if (name == "entropy_weighted") return EntropyWeightedHue{};
    if (name == "time_varying") {
        TimeVaryingHue tv;
        if (c["time_rate"]) tv.rate = c["time_rate"].as<double>();
        return tv;
    }
    throw ConfigError("unknown color.strategy '" + name + "'");
}

static BrightnessMode parse_brightness(const std::string& raw) {
    const std::string name = normalize_name(raw);
    if (name == "coherence") return BrightnessMode::COHERENCE;
    if (name == "probability") return BrightnessMode::PROBABILITY;
    if (name == "fixed") return BrightnessMode::FIXED;
    throw ConfigError("unknown color.brightness_mode '" + name + "'");
}

static GlowPattern parse_glow(const YAML::Node& g) {
    const std::string name = g["pattern"] ? normalize_name(g["pattern"].as<std::string>())
                                          : std::string("none");
    if (name == "none") return NoGlow{};
    if (name == "traveling_wave") {
        TravelingWaveGlow tw;
        if (g["k"]) tw.k = g["k"].as<double>();
        if (g["speed"]) tw.speed = g["speed"].as<double>();
        return tw;
    }
    if (name == "high_frequency") {
        HighFrequencyGlow hf;
        if (g["k"]) hf.k = g["k"].as<double>();
        return hf;
    }
    if (name == "pulse") {
        PulseGlow p;
        if (g["rate"]) p.rate = g["rate"].as<double>();
        return p;
    }
    throw ConfigError("unknown modulation.glow.pattern '" + name + "'");
}

std::string placement_strategy_name(const PlacementStrategy& strategy) {
    if (std::holds_alternative<SpiralPlacement>(strategy)) return "spiral";
    if (std::holds_alternative<ClusteredPlacement>(strategy)) return "clustered";
    if (std::holds_alternative<HarmonicPlacement>(strategy)) return "harmonic";
    return "uniform_probability";
}

std::string hue_strategy_name(const HueStrategy& strategy) {
    if (std::holds_alternative<HarmonicHue>(strategy)) return "harmonic";
    if (std::holds_alternative<EntropyWeightedHue>(strategy)) return "entropy_weighted";
    if (std::holds_alternative<TimeVaryingHue>(strategy)) return "time_varying";
    return "by_value";
}

std::string glow_pattern_name(const GlowPattern& pattern) {
    if (std::holds_alternative<TravelingWaveGlow>(pattern)) return "traveling_wave";
    if (std::holds_alternative<HighFrequencyGlow>(pattern)) return "high_frequency";
    if (std::holds_alternative<PulseGlow>(pattern)) return "pulse";
    return "none";
}

std::string brightness_mode_to_string(BrightnessMode mode) {
    switch (mode) {
        case BrightnessMode::COHERENCE: return "coherence";
        case BrightnessMode::PROBABILITY: return "probability";
        case BrightnessMode::FIXED: return "fixed";
        default: return "unknown";
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["budget"]) {
            auto b = node["budget"];
            if (b["period_quota_seconds"]) cfg.budget.period_quota_seconds = b["period_quota_seconds"].as<double>();
            if (b["period_days"]) cfg.budget.period_days = b["period_days"].as<int>();
        }

        if (node["scheduler"]) {
            auto s = node["scheduler"];
            if (s["interval_seconds"]) cfg.scheduler.interval_seconds = s["interval_seconds"].as<double>();
            if (s["estimated_seconds_per_beat"]) {
                cfg.scheduler.estimated_seconds_per_beat = s["estimated_seconds_per_beat"].as<double>();
            }
            if (s["safety_margin_seconds"]) cfg.scheduler.safety_margin_seconds = s["safety_margin_seconds"].as<double>();
            if (s["max_retries"]) cfg.scheduler.max_retries = s["max_retries"].as<int>();
            if (s["retry_backoff_seconds"]) cfg.scheduler.retry_backoff_seconds = s["retry_backoff_seconds"].as<double>();
            if (s["poll_interval_seconds"]) cfg.scheduler.poll_interval_seconds = s["poll_interval_seconds"].as<double>();
            if (s["execution_timeout_seconds"]) {
                cfg.scheduler.execution_timeout_seconds = s["execution_timeout_seconds"].as<double>();
            }
            if (s["backend_rotation"]) {
                cfg.scheduler.backend_rotation = s["backend_rotation"].as<std::vector<std::string>>();
            }
        }

        if (node["circuit"]) {
            auto c = node["circuit"];
            if (c["num_qubits"]) cfg.circuit.num_qubits = c["num_qubits"].as<int>();
            if (c["shots"]) cfg.circuit.shots = c["shots"].as<int>();
            if (c["optimization_level"]) cfg.circuit.optimization_level = c["optimization_level"].as<int>();
        }

        if (node["metrics"]) {
            auto m = node["metrics"];
            if (m["top_n"]) cfg.metrics.top_n = m["top_n"].as<int>();
        }

        if (node["topology"]) {
            auto t = node["topology"];
            cfg.topology.strategy = parse_placement(t);
            if (t["max_points"]) cfg.topology.max_points = t["max_points"].as<int>();
            if (t["radius"]) cfg.topology.radius = t["radius"].as<double>();
        }

        if (node["color"]) {
            auto c = node["color"];
            cfg.color.strategy = parse_hue(c);
            if (c["hue_offset"]) cfg.color.hue_offset = c["hue_offset"].as<double>();
            if (c["saturation_base"]) cfg.color.saturation_base = c["saturation_base"].as<double>();
            if (c["brightness_mode"]) cfg.color.brightness_mode = parse_brightness(c["brightness_mode"].as<std::string>());
            if (c["lightness_base"]) cfg.color.lightness_base = c["lightness_base"].as<double>();
            if (c["lightness_range"]) cfg.color.lightness_range = c["lightness_range"].as<double>();
            if (c["fixed_lightness"]) cfg.color.fixed_lightness = c["fixed_lightness"].as<double>();
        }

        if (node["modulation"]) {
            auto m = node["modulation"];
            if (m["resonance"]) {
                auto r = m["resonance"];
                if (r["enabled"]) cfg.modulation.resonance.enabled = r["enabled"].as<bool>();
                if (r["l"]) cfg.modulation.resonance.l = r["l"].as<int>();
                if (r["m"]) cfg.modulation.resonance.m = r["m"].as<int>();
                if (r["amplitude"]) cfg.modulation.resonance.amplitude = r["amplitude"].as<double>();
            }
            if (m["glow"]) cfg.modulation.glow = parse_glow(m["glow"]);
            if (m["temporal_sync"]) cfg.modulation.temporal_sync = m["temporal_sync"].as<bool>();
        }

        if (node["reconstruction"]) {
            auto r = node["reconstruction"];
            if (r["grid_resolution"]) cfg.reconstruction.grid_resolution = r["grid_resolution"].as<int>();
            if (r["base_radius"]) cfg.reconstruction.base_radius = r["base_radius"].as<double>();
            if (r["displacement_scale"]) cfg.reconstruction.displacement_scale = r["displacement_scale"].as<double>();
            if (r["epsilon"]) cfg.reconstruction.epsilon = r["epsilon"].as<double>();
            if (r["exact_match_threshold"]) {
                cfg.reconstruction.exact_match_threshold = r["exact_match_threshold"].as<double>();
            }
            if (r["include_bias_rings"]) cfg.reconstruction.include_bias_rings = r["include_bias_rings"].as<bool>();
            if (r["parallel_workers"]) cfg.reconstruction.parallel_workers = r["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["results_dir"]) cfg.output.results_dir = o["results_dir"].as<std::string>();
            if (o["surface_file"]) cfg.output.surface_file = o["surface_file"].as<std::string>();
            if (o["write_preview"]) cfg.output.write_preview = o["write_preview"].as<bool>();
            if (o["preview_file"]) cfg.output.preview_file = o["preview_file"].as<std::string>();
            if (o["events_file"]) cfg.output.events_file = o["events_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["budget"]["period_quota_seconds"] = budget.period_quota_seconds;
    node["budget"]["period_days"] = budget.period_days;

    node["scheduler"]["interval_seconds"] = scheduler.interval_seconds;
    node["scheduler"]["estimated_seconds_per_beat"] = scheduler.estimated_seconds_per_beat;
    node["scheduler"]["safety_margin_seconds"] = scheduler.safety_margin_seconds;
    node["scheduler"]["max_retries"] = scheduler.max_retries;
    node["scheduler"]["retry_backoff_seconds"] = scheduler.retry_backoff_seconds;
    node["scheduler"]["poll_interval_seconds"] = scheduler.poll_interval_seconds;
    node["scheduler"]["execution_timeout_seconds"] = scheduler.execution_timeout_seconds;
    node["scheduler"]["backend_rotation"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& name : scheduler.backend_rotation) {
        node["scheduler"]["backend_rotation"].push_back(name);
    }

    node["circuit"]["num_qubits"] = circuit.num_qubits;
    node["circuit"]["shots"] = circuit.shots;
    node["circuit"]["optimization_level"] = circuit.optimization_level;

    node["metrics"]["top_n"] = metrics.top_n;

    node["topology"]["strategy"] = placement_strategy_name(topology.strategy);
    if (const auto* s = std::get_if<SpiralPlacement>(&topology.strategy)) {
        node["topology"]["spiral_turns"] = s->turns;
    }
    if (const auto* c = std::get_if<ClusteredPlacement>(&topology.strategy)) {
        node["topology"]["cluster_count"] = c->cluster_count;
        node["topology"]["cluster_spread"] = c->spread;
    }
    node["topology"]["max_points"] = topology.max_points;
    node["topology"]["radius"] = topology.radius;

    node["color"]["strategy"] = hue_strategy_name(color.strategy);
    if (const auto* tv = std::get_if<TimeVaryingHue>(&color.strategy)) {
        node["color"]["time_rate"] = tv->rate;
    }
    node["color"]["hue_offset"] = color.hue_offset;
    node["color"]["saturation_base"] = color.saturation_base;
    node["color"]["brightness_mode"] = brightness_mode_to_string(color.brightness_mode);
    node["color"]["lightness_base"] = color.lightness_base;
    node["color"]["lightness_range"] = color.lightness_range;
    node["color"]["fixed_lightness"] = color.fixed_lightness;

    node["modulation"]["resonance"]["enabled"] = modulation.resonance.enabled;
    node["modulation"]["resonance"]["l"] = modulation.resonance.l;
    node["modulation"]["resonance"]["m"] = modulation.resonance.m;
    node["modulation"]["resonance"]["amplitude"] = modulation.resonance.amplitude;
    node["modulation"]["glow"]["pattern"] = glow_pattern_name(modulation.glow);
    if (const auto* tw = std::get_if<TravelingWaveGlow>(&modulation.glow)) {
        node["modulation"]["glow"]["k"] = tw->k;
        node["modulation"]["glow"]["speed"] = tw->speed;
    }
    if (const auto* hf = std::get_if<HighFrequencyGlow>(&modulation.glow)) {
        node["modulation"]["glow"]["k"] = hf->k;
    }
    if (const auto* p = std::get_if<PulseGlow>(&modulation.glow)) {
        node["modulation"]["glow"]["rate"] = p->rate;
    }
    node["modulation"]["temporal_sync"] = modulation.temporal_sync;

    node["reconstruction"]["grid_resolution"] = reconstruction.grid_resolution;
    node["reconstruction"]["base_radius"] = reconstruction.base_radius;
    node["reconstruction"]["displacement_scale"] = reconstruction.displacement_scale;
    node["reconstruction"]["epsilon"] = reconstruction.epsilon;
    node["reconstruction"]["exact_match_threshold"] = reconstruction.exact_match_threshold;
    node["reconstruction"]["include_bias_rings"] = reconstruction.include_bias_rings;
    node["reconstruction"]["parallel_workers"] = reconstruction.parallel_workers;

    node["output"]["results_dir"] = output.results_dir;
    node["output"]["surface_file"] = output.surface_file;
    node["output"]["write_preview"] = output.write_preview;
    node["output"]["preview_file"] = output.preview_file;
    node["output"]["events_file"] = output.events_file;

    return node;
}

void Config::validate() const {
    if (budget.period_quota_seconds <= 0) {
        throw ValidationError("budget.period_quota_seconds must be > 0");
    }
    if (budget.period_days < 1) {
        throw ValidationError("budget.period_days must be >= 1");
    }

    if (scheduler.interval_seconds <= 0) {
        throw ValidationError("scheduler.interval_seconds must be > 0");
    }
    if (scheduler.estimated_seconds_per_beat <= 0) {
        throw ValidationError("scheduler.estimated_seconds_per_beat must be > 0");
    }
    if (scheduler.safety_margin_seconds < 0) {
        throw ValidationError("scheduler.safety_margin_seconds must be >= 0");
    }
    if (scheduler.reservation_seconds() > budget.period_quota_seconds) {
        throw ValidationError(
            "scheduler.estimated_seconds_per_beat + safety_margin_seconds must not exceed budget.period_quota_seconds");
    }
    if (scheduler.max_retries < 0 || scheduler.max_retries > 10) {
        throw ValidationError("scheduler.max_retries must be in [0,10]");
    }
    if (scheduler.retry_backoff_seconds < 0) {
        throw ValidationError("scheduler.retry_backoff_seconds must be >= 0");
    }
    if (scheduler.poll_interval_seconds <= 0) {
        throw ValidationError("scheduler.poll_interval_seconds must be > 0");
    }
    if (scheduler.execution_timeout_seconds <= 0) {
        throw ValidationError("scheduler.execution_timeout_seconds must be > 0");
    }

    if (circuit.num_qubits < 1 || circuit.num_qubits > 32) {
        throw ValidationError("circuit.num_qubits must be in [1,32]");
    }
    if (circuit.shots < 1) {
        throw ValidationError("circuit.shots must be >= 1");
    }
    if (circuit.optimization_level < 0 || circuit.optimization_level > 3) {
        throw ValidationError("circuit.optimization_level must be in [0,3]");
    }

    if (metrics.top_n < 1) {
        throw ValidationError("metrics.top_n must be >= 1");
    }

    if (topology.max_points < 1) {
        throw ValidationError("topology.max_points must be >= 1");
    }
    if (topology.radius <= 0) {
        throw ValidationError("topology.radius must be > 0");
    }
    if (const auto* c = std::get_if<ClusteredPlacement>(&topology.strategy)) {
        if (c->cluster_count < 1) {
            throw ValidationError("topology.cluster_count must be >= 1");
        }
        if (c->spread < 0 || c->spread > 3.14159265358979323846) {
            throw ValidationError("topology.cluster_spread must be in [0,pi]");
        }
    }

    if (color.saturation_base < 0 || color.saturation_base > 1) {
        throw ValidationError("color.saturation_base must be in [0,1]");
    }
    if (color.lightness_base < 0 || color.lightness_base > 1) {
        throw ValidationError("color.lightness_base must be in [0,1]");
    }
    if (color.lightness_range < 0 || color.lightness_base + color.lightness_range > 1) {
        throw ValidationError("color.lightness_range must be >= 0 and lightness_base + lightness_range <= 1");
    }
    if (color.fixed_lightness < 0 || color.fixed_lightness > 1) {
        throw ValidationError("color.fixed_lightness must be in [0,1]");
    }

    if (modulation.resonance.amplitude < 0 || modulation.resonance.amplitude >= 1) {
        throw ValidationError("modulation.resonance.amplitude must be in [0,1)");
    }
    if (modulation.resonance.l < 0 || modulation.resonance.m < 0) {
        throw ValidationError("modulation.resonance.l and m must be >= 0");
    }

    if (reconstruction.grid_resolution < 2 || reconstruction.grid_resolution > 1024) {
        throw ValidationError("reconstruction.grid_resolution must be in [2,1024]");
    }
    if (reconstruction.base_radius <= 0) {
        throw ValidationError("reconstruction.base_radius must be > 0");
    }
    if (reconstruction.displacement_scale < 0) {
        throw ValidationError("reconstruction.displacement_scale must be >= 0");
    }
    if (reconstruction.epsilon <= 0) {
        throw ValidationError("reconstruction.epsilon must be > 0");
    }
    if (reconstruction.exact_match_threshold < 0) {
        throw ValidationError("reconstruction.exact_match_threshold must be >= 0");
    }
    if (reconstruction.parallel_workers < 1 || reconstruction.parallel_workers > 64) {
        throw ValidationError("reconstruction.parallel_workers must be in [1,64]");
    }

    if (output.results_dir.empty()) {
        throw ValidationError("output.results_dir must not be empty");
    }
    if (output.surface_file.empty()) {
        throw ValidationError("output.surface_file must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "budget": {
      "type": "object",
      "properties": {
        "period_quota_seconds": {"type": "number", "exclusiveMinimum": 0},
        "period_days": {"type": "integer", "minimum": 1}
      }
    },
    "scheduler": {
      "type": "object",
      "properties": {
        "interval_seconds": {"type": "number", "exclusiveMinimum": 0},
        "estimated_seconds_per_beat": {"type": "number", "exclusiveMinimum": 0},
        "safety_margin_seconds": {"type": "number", "minimum": 0},
        "max_retries": {"type": "integer", "minimum": 0, "maximum": 10},
        "retry_backoff_seconds": {"type": "number", "minimum": 0},
        "poll_interval_seconds": {"type": "number", "exclusiveMinimum": 0},
        "execution_timeout_seconds": {"type": "number", "exclusiveMinimum": 0},
        "backend_rotation": {"type": "array", "items": {"type": "string"}}
      }
    },
    "circuit": {
      "type": "object",
      "properties": {
        "num_qubits": {"type": "integer", "minimum": 1, "maximum": 32},
        "shots": {"type": "integer", "minimum": 1},
        "optimization_level": {"type": "integer", "minimum": 0, "maximum": 3}
      }
    },
    "metrics": {
      "type": "object",
      "properties": {
        "top_n": {"type": "integer", "minimum": 1}
      }
    },
    "topology": {
      "type": "object",
      "properties": {
        "strategy": {"type": "string", "enum": ["uniform_probability", "spiral", "clustered", "harmonic"]},
        "max_points": {"type": "integer", "minimum": 1},
        "radius": {"type": "number", "exclusiveMinimum": 0},
        "spiral_turns": {"type": "number"},
        "cluster_count": {"type": "integer", "minimum": 1},
        "cluster_spread": {"type": "number", "minimum": 0, "maximum": 3.14159}
      }
    },
    "color": {
      "type": "object",
      "properties": {
        "strategy": {"type": "string", "enum": ["by_value", "harmonic", "entropy_weighted", "time_varying"]},
        "hue_offset": {"type": "number"},
        "saturation_base": {"type": "number", "minimum": 0, "maximum": 1},
        "brightness_mode": {"type": "string", "enum": ["coherence", "probability", "fixed"]},
        "lightness_base": {"type": "number", "minimum": 0, "maximum": 1},
        "lightness_range": {"type": "number", "minimum": 0, "maximum": 1},
        "fixed_lightness": {"type": "number", "minimum": 0, "maximum": 1},
        "time_rate": {"type": "number"}
      }
    },
    "modulation": {
      "type": "object",
      "properties": {
        "resonance": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "l": {"type": "integer", "minimum": 0},
            "m": {"type": "integer", "minimum": 0},
            "amplitude": {"type": "number", "minimum": 0, "exclusiveMaximum": 1}
          }
        },
        "glow": {
          "type": "object",
          "properties": {
            "pattern": {"type": "string", "enum": ["none", "traveling_wave", "high_frequency", "pulse"]},
            "k": {"type": "number"},
            "speed": {"type": "number"},
            "rate": {"type": "number"}
          }
        },
        "temporal_sync": {"type": "boolean"}
      }
    },
    "reconstruction": {
      "type": "object",
      "properties": {
        "grid_resolution": {"type": "integer", "minimum": 2, "maximum": 1024},
        "base_radius": {"type": "number", "exclusiveMinimum": 0},
        "displacement_scale": {"type": "number", "minimum": 0},
        "epsilon": {"type": "number", "exclusiveMinimum": 0},
        "exact_match_threshold": {"type": "number", "minimum": 0},
        "include_bias_rings": {"type": "boolean"},
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "results_dir": {"type": "string", "minLength": 1},
        "surface_file": {"type": "string", "minLength": 1},
        "write_preview": {"type": "boolean"},
        "preview_file": {"type": "string"},
        "events_file": {"type": "string"}
      }
    }
  }
})";
}

} // namespace quantum_surface::config
