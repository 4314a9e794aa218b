#include "quantum_surface/metrics/metrics.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace quantum_surface::metrics {

namespace {

struct KnownBackend {
    const char* family;
    const char* processor;
};

const std::map<std::string, KnownBackend>& known_backends() {
    static const std::map<std::string, KnownBackend> table = {
        // Eagle (127 qubits)
        {"ibm_brisbane", {"eagle", "r3"}},
        {"ibm_kyoto", {"eagle", "r3"}},
        {"ibm_osaka", {"eagle", "r3"}},
        {"ibm_sherbrooke", {"eagle", "r3"}},
        {"ibm_rensselaer", {"eagle", "r3"}},
        // Heron (133 qubits)
        {"ibm_fez", {"heron", "r1"}},
        {"ibm_torino", {"heron", "r1"}},
        {"ibm_marrakesh", {"heron", "r2"}},
        {"ibm_kawasaki", {"heron", "r2"}},
        // Falcon
        {"ibm_nazca", {"falcon", "r5.11"}},
        {"ibm_algiers", {"falcon", "r5.11"}},
        // Simulators
        {"statevector_sampler", {"simulator", ""}},
        {"aer_simulator", {"simulator", ""}},
        {"qasm_simulator", {"simulator", ""}},
    };
    return table;
}

} // namespace

void validate_distribution(const MeasurementDistribution& dist) {
    if (dist.counts.empty()) {
        throw MalformedDistribution("no bit-patterns observed");
    }

    const std::size_t width = dist.counts.begin()->first.size();
    if (width == 0) {
        throw MalformedDistribution("empty bit-pattern");
    }

    std::int64_t total = 0;
    for (const auto& [pattern, count] : dist.counts) {
        if (pattern.size() != width) {
            throw MalformedDistribution("pattern '" + pattern + "' has length " +
                                        std::to_string(pattern.size()) + ", expected " +
                                        std::to_string(width));
        }
        if (pattern.find_first_not_of("01") != std::string::npos) {
            throw MalformedDistribution("pattern '" + pattern + "' is not binary");
        }
        if (count < 0) {
            throw MalformedDistribution("pattern '" + pattern + "' has negative count");
        }
        total += count;
    }

    if (total <= 0) {
        throw MalformedDistribution("total shots is zero");
    }
}

double entropy_bits(const MeasurementDistribution& dist) {
    const double total = static_cast<double>(dist.total_shots());
    if (total <= 0.0) return 0.0;

    double h = 0.0;
    for (const auto& [pattern, count] : dist.counts) {
        if (count <= 0) continue;
        const double p = static_cast<double>(count) / total;
        h -= p * std::log2(p);
    }
    // -0.0 for a single pattern
    return h > 0.0 ? h : 0.0;
}

double coherence_estimate(const MeasurementDistribution& dist) {
    const std::int64_t total = dist.total_shots();
    if (total <= 0) return 0.0;

    std::int64_t max_count = 0;
    for (const auto& [pattern, count] : dist.counts) {
        max_count = std::max(max_count, count);
    }
    return static_cast<double>(max_count) / static_cast<double>(total);
}

std::vector<TopState> top_states(const MeasurementDistribution& dist, int top_n) {
    const double total = static_cast<double>(dist.total_shots());

    std::vector<TopState> states;
    states.reserve(dist.counts.size());
    for (const auto& [pattern, count] : dist.counts) {
        if (count <= 0) continue;
        states.push_back(TopState{pattern, count, total > 0.0 ? static_cast<double>(count) / total : 0.0});
    }

    std::sort(states.begin(), states.end(), [](const TopState& a, const TopState& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.state < b.state;
    });

    if (top_n >= 0 && states.size() > static_cast<std::size_t>(top_n)) {
        states.resize(static_cast<std::size_t>(top_n));
    }
    return states;
}

RunMetrics extract(const MeasurementDistribution& dist, int top_n) {
    validate_distribution(dist);

    RunMetrics m;
    m.coherence_estimate = coherence_estimate(dist);
    m.entropy_bits = entropy_bits(dist);
    m.top_states = top_states(dist, top_n);
    return m;
}

std::vector<double> qubit_bias(const MeasurementDistribution& dist) {
    const int n = dist.num_qubits();
    const double total = static_cast<double>(dist.total_shots());
    std::vector<double> bias(static_cast<std::size_t>(n), 0.0);
    if (n == 0 || total <= 0.0) return bias;

    for (int q = 0; q < n; ++q) {
        std::int64_t ones = 0;
        for (const auto& [pattern, count] : dist.counts) {
            const std::size_t qi = static_cast<std::size_t>(q);
            if (qi < pattern.size() && pattern[pattern.size() - 1 - qi] == '1') {
                ones += count;
            }
        }
        bias[static_cast<std::size_t>(q)] = std::fabs(0.5 - static_cast<double>(ones) / total);
    }
    return bias;
}

BackendClassification classify_backend(const std::string& backend_name) {
    const auto& table = known_backends();
    auto it = table.find(backend_name);
    if (it != table.end()) {
        const std::string family = it->second.family;
        return {family == "simulator" ? "simulation" : "real", family, it->second.processor};
    }

    const std::string lower = core::to_lower(backend_name);
    if (lower.find("simulator") != std::string::npos || lower.find("sampler") != std::string::npos) {
        return {"simulation", "simulator", ""};
    }
    if (core::starts_with(backend_name, "ibm_")) {
        return {"real", "unknown", ""};
    }
    return {"simulation", "unknown", ""};
}

} // namespace quantum_surface::metrics
