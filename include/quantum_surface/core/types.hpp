#pragma once

#include <Eigen/Dense>
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quantum_surface {

// Grid types
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Vec3 = Eigen::Vector3d;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kGoldenRatio = 1.61803398874989484820;

// Measurement outcome counts, keyed by bit-pattern. std::map keeps the
// patterns in lexicographic order, which every tie-break below relies on.
struct MeasurementDistribution {
    std::map<std::string, std::int64_t> counts;

    std::int64_t total_shots() const {
        std::int64_t total = 0;
        for (const auto& [pattern, count] : counts) total += count;
        return total;
    }

    int num_qubits() const {
        return counts.empty() ? 0 : static_cast<int>(counts.begin()->first.size());
    }

    bool empty() const { return counts.empty(); }
};

struct TopState {
    std::string state;
    std::int64_t count = 0;
    double probability = 0.0;
};

struct RunMetrics {
    double coherence_estimate = 0.0;   // max(count) / total_shots
    double entropy_bits = 0.0;         // Shannon entropy, bits
    std::vector<TopState> top_states;  // descending count, ties lexicographic
    double execution_time_seconds = 0.0;
    std::string backend_identifier;
    std::string timestamp;             // ISO-8601 UTC
};

// One completed beat: what ran, where, what came back, and the budget after it.
struct RunRecord {
    int beat_number = 0;
    std::string timestamp_utc;
    std::string timestamp_local;
    std::string job_id;
    std::string source = "simulation";       // "simulation" | "real"
    std::string backend_family = "unknown";
    std::string backend_processor;
    int num_qubits = 0;
    int circuit_depth = 0;
    int shots = 0;
    MeasurementDistribution distribution;
    RunMetrics metrics;                      // carries backend, execution time, timestamp
    double normalized_entropy = 0.0;         // entropy_bits / num_qubits
    double budget_used_total = 0.0;
    double budget_remaining = 0.0;
};

struct SphericalPosition {
    double theta = 0.0;  // [0, pi], polar angle from +z
    double phi = 0.0;    // [0, 2pi), azimuth
};

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

inline bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

// Color of a surface that carries no measurement data
constexpr Color kEmptySurfaceColor{0.1, 0.1, 0.2, 0.5};

// Where a surface vertex came from
enum class VertexOrigin {
    ENCODED_POINT,  // topology -> color -> modulation pipeline
    QUBIT_BIAS      // per-qubit bias ring
};

inline std::string vertex_origin_to_string(VertexOrigin origin) {
    switch (origin) {
        case VertexOrigin::ENCODED_POINT: return "encoded_point";
        case VertexOrigin::QUBIT_BIAS: return "qubit_bias";
        default: return "unknown";
    }
}

inline VertexOrigin string_to_vertex_origin(const std::string& s) {
    if (s == "qubit_bias") return VertexOrigin::QUBIT_BIAS;
    return VertexOrigin::ENCODED_POINT;
}

// One sample on the sphere, immutable once created.
struct SurfaceVertex {
    SphericalPosition spherical;
    Vec3 cartesian = Vec3::Zero();  // unit-sphere relative
    double height = 0.0;            // signed radial displacement
    Color color;
    double glow = 0.0;
    double u = 0.0;
    double v = 0.0;
    std::int64_t source_run_id = 0;
    std::string bit_pattern;
    double probability = 0.0;
    double error_rate = 0.0;
    VertexOrigin origin = VertexOrigin::ENCODED_POINT;

    // Value reported as the vertex's quantum payload
    double quantum_value() const {
        return origin == VertexOrigin::QUBIT_BIAS ? error_rate : probability;
    }
};

using Triangle = std::array<std::uint32_t, 3>;

// Dense grid rebuilt from the accumulated vertices. Row i is theta_i,
// column j is phi_j; positions are stored row-major (i * resolution + j).
struct ReconstructedMesh {
    int resolution = 0;
    double base_radius = 1.0;
    double displacement_scale = 0.0;
    Matrix2Dd height;
    Matrix2Dd red;
    Matrix2Dd green;
    Matrix2Dd blue;
    std::vector<Vec3> positions;
    std::shared_ptr<const std::vector<Triangle>> triangles;
    bool degenerate = false;
    std::uint64_t source_version = 0;
    std::size_t source_vertex_count = 0;

    double theta_at(int i) const {
        return resolution > 1 ? kPi * static_cast<double>(i) / static_cast<double>(resolution - 1) : 0.0;
    }

    double phi_at(int j) const {
        return resolution > 0 ? kTwoPi * static_cast<double>(j) / static_cast<double>(resolution) : 0.0;
    }

    Color color_at(int i, int j) const {
        return Color{red(i, j), green(i, j), blue(i, j), 1.0};
    }
};

} // namespace quantum_surface
