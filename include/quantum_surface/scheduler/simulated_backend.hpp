#pragma once

#include "quantum_surface/scheduler/execution_backend.hpp"

#include <cstdint>
#include <string>

namespace quantum_surface::scheduler {

struct SimulatedBackendOptions {
    std::string name = "aer_simulator";
    std::uint64_t seed = 42;
    double billed_seconds = 0.8;   // processor time charged per completed job
    int polls_to_complete = 2;     // PENDING -> RUNNING -> ... -> terminal
    double failure_rate = 0.0;     // probability a job ends FAILED
};

/**
 * Local stand-in for a remote processor. Each qubit reads 1 with
 * probability sin^2(phase / 2), so early beats concentrate on the
 * all-zero pattern. Sampling is seeded from (seed, beat number), so a
 * given beat always yields the same counts.
 */
class SimulatedBackend : public ExecutionBackend {
public:
    explicit SimulatedBackend(SimulatedBackendOptions options = {});

    std::string name() const override;
    std::unique_ptr<ExecutionJob> submit(const CircuitRequest& request) override;

    int jobs_submitted() const { return submitted_; }

private:
    SimulatedBackendOptions options_;
    int submitted_ = 0;
};

// Seeded sample of the heartbeat circuit's measurement outcomes.
MeasurementDistribution simulate_counts(const CircuitRequest& request, std::uint64_t seed);

} // namespace quantum_surface::scheduler
