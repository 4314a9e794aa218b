#pragma once

#include "quantum_surface/core/types.hpp"

#include <string>
#include <vector>

namespace quantum_surface::metrics {

// Throws MalformedDistribution on empty counts, negative counts, zero total
// shots, unequal pattern lengths or characters other than '0'/'1'.
void validate_distribution(const MeasurementDistribution& dist);

// Shannon entropy in bits over patterns with non-zero count.
double entropy_bits(const MeasurementDistribution& dist);

// Probability mass of the most frequent pattern.
double coherence_estimate(const MeasurementDistribution& dist);

// Observed patterns, descending count, ties by ascending pattern, at most top_n.
std::vector<TopState> top_states(const MeasurementDistribution& dist, int top_n);

// Validates, then derives coherence, entropy and top states. Backend,
// timestamp and execution time are left for the caller to fill in.
RunMetrics extract(const MeasurementDistribution& dist, int top_n = 5);

// |0.5 - P(qubit q reads 1)| per qubit; qubit 0 is the right-most character.
std::vector<double> qubit_bias(const MeasurementDistribution& dist);

struct BackendClassification {
    std::string source;     // "simulation" | "real"
    std::string family;     // "eagle" | "heron" | "falcon" | "simulator" | "unknown"
    std::string processor;  // revision, e.g. "r3"; empty when unknown
};

BackendClassification classify_backend(const std::string& backend_name);

} // namespace quantum_surface::metrics
