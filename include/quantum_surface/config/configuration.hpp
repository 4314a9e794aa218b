#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace quantum_surface::config {

namespace fs = std::filesystem;

struct BudgetConfig {
  double period_quota_seconds = 600.0;
  int period_days = 30;
};

struct SchedulerConfig {
  double interval_seconds = 3600.0;
  double estimated_seconds_per_beat = 0.8;
  double safety_margin_seconds = 0.03;
  int max_retries = 2;                   // retries after the first attempt
  double retry_backoff_seconds = 5.0;
  double poll_interval_seconds = 1.0;
  double execution_timeout_seconds = 600.0;
  std::vector<std::string> backend_rotation; // empty = single simulated backend

  double reservation_seconds() const {
    return estimated_seconds_per_beat + safety_margin_seconds;
  }
};

struct CircuitConfig {
  int num_qubits = 5;
  int shots = 1024;
  int optimization_level = 1;
};

struct MetricsConfig {
  int top_n = 5;
};

// Placement strategies
struct UniformPlacement {};
struct SpiralPlacement {
  double turns = 1.0;
};
struct ClusteredPlacement {
  int cluster_count = 5;
  double spread = 0.35;  // max angular offset (rad) of a zero-probability point
};
struct HarmonicPlacement {};

using PlacementStrategy =
    std::variant<UniformPlacement, SpiralPlacement, ClusteredPlacement, HarmonicPlacement>;

struct TopologyConfig {
  PlacementStrategy strategy = UniformPlacement{};
  int max_points = 512;
  double radius = 1.0;
};

// Hue strategies
struct ByValueHue {};
struct HarmonicHue {};
struct EntropyWeightedHue {};
struct TimeVaryingHue {
  double time = 0.0;
  double rate = 0.05;
};

using HueStrategy = std::variant<ByValueHue, HarmonicHue, EntropyWeightedHue, TimeVaryingHue>;

enum class BrightnessMode {
  COHERENCE,
  PROBABILITY,
  FIXED
};

struct ColorConfig {
  HueStrategy strategy = ByValueHue{};
  double hue_offset = 0.0;
  double saturation_base = 0.7;
  BrightnessMode brightness_mode = BrightnessMode::COHERENCE;
  double lightness_base = 0.3;
  double lightness_range = 0.4;
  double fixed_lightness = 0.5;
};

struct ResonanceConfig {
  bool enabled = false;
  int l = 2;
  int m = 3;
  double amplitude = 0.1;
};

// Glow patterns
struct NoGlow {};
struct TravelingWaveGlow {
  double k = 6.0;
  double speed = 1.0;
};
struct HighFrequencyGlow {
  double k = 8.0;
};
struct PulseGlow {
  double rate = 2.0;
};

using GlowPattern = std::variant<NoGlow, TravelingWaveGlow, HighFrequencyGlow, PulseGlow>;

struct ModulationConfig {
  ResonanceConfig resonance;
  GlowPattern glow = NoGlow{};
  bool temporal_sync = false;
};

struct ReconstructionConfig {
  int grid_resolution = 32;
  double base_radius = 0.8;
  double displacement_scale = 0.15;
  double epsilon = 0.1;                 // IDW weight 1 / (d^2 + epsilon)
  double exact_match_threshold = 0.001; // rad
  bool include_bias_rings = true;
  int parallel_workers = 1;             // row workers for grid interpolation
};

struct OutputConfig {
  std::string results_dir = "results";
  std::string surface_file = "surface.json";
  bool write_preview = false;
  std::string preview_file = "surface_preview.png";
  std::string events_file = "events.jsonl";
};

struct Config {
  BudgetConfig budget;
  SchedulerConfig scheduler;
  CircuitConfig circuit;
  MetricsConfig metrics;
  TopologyConfig topology;
  ColorConfig color;
  ModulationConfig modulation;
  ReconstructionConfig reconstruction;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string placement_strategy_name(const PlacementStrategy &strategy);
std::string hue_strategy_name(const HueStrategy &strategy);
std::string glow_pattern_name(const GlowPattern &pattern);
std::string brightness_mode_to_string(BrightnessMode mode);

std::string get_schema_json();

} // namespace quantum_surface::config
