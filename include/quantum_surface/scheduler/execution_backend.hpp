#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace quantum_surface::scheduler {

enum class JobState {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    CANCELLED
};

inline std::string job_state_to_string(JobState state) {
    switch (state) {
        case JobState::PENDING: return "pending";
        case JobState::RUNNING: return "running";
        case JobState::SUCCEEDED: return "succeeded";
        case JobState::FAILED: return "failed";
        case JobState::TIMED_OUT: return "timed_out";
        case JobState::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

inline bool is_terminal(JobState state) {
    return state == JobState::SUCCEEDED || state == JobState::FAILED ||
           state == JobState::TIMED_OUT || state == JobState::CANCELLED;
}

// Heartbeat circuit: superposition, entanglement chain, one phase rotation
// per qubit, interference, measurement.
struct CircuitRequest {
    int beat_number = 0;
    int num_qubits = 5;
    int shots = 1024;
    int optimization_level = 1;
    std::vector<double> phases;  // rz angle per qubit

    int depth() const { return num_qubits + 3; }
};

// phase_q = (q + 1) * (beat + 1) * 0.1 mod 2pi
CircuitRequest heartbeat_circuit(int beat_number, const config::CircuitConfig& cfg);

/**
 * One submitted execution. Driven by poll(); every state after a terminal
 * one stays put. billed_seconds() is valid in any state, including after
 * a failure or cancellation.
 */
class ExecutionJob {
public:
    virtual ~ExecutionJob() = default;

    virtual std::string job_id() const = 0;
    virtual JobState poll() = 0;
    virtual JobState state() const = 0;
    virtual void cancel() = 0;
    virtual double billed_seconds() const = 0;

    // Counts of a SUCCEEDED job; throws ExecutionFailed otherwise
    virtual MeasurementDistribution result() const = 0;
    virtual std::string error_message() const = 0;
};

class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    virtual std::string name() const = 0;

    // Throws ExecutionFailed if the job cannot be submitted at all
    virtual std::unique_ptr<ExecutionJob> submit(const CircuitRequest& request) = 0;
};

} // namespace quantum_surface::scheduler
