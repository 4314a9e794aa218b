#include "quantum_surface/scheduler/simulated_backend.hpp"
#include "quantum_surface/core/errors.hpp"

#include <cmath>
#include <random>

namespace quantum_surface::scheduler {

namespace {

std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t salt) {
    // splitmix64 finalizer
    std::uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (salt + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

class SimulatedJob : public ExecutionJob {
public:
    SimulatedJob(std::string id, CircuitRequest request, const SimulatedBackendOptions& options,
                 bool will_fail)
        : id_(std::move(id)),
          request_(std::move(request)),
          options_(options),
          will_fail_(will_fail) {}

    std::string job_id() const override { return id_; }

    JobState poll() override {
        if (is_terminal(state_)) return state_;

        ++polls_;
        if (state_ == JobState::PENDING) {
            state_ = JobState::RUNNING;
        }
        if (polls_ >= options_.polls_to_complete) {
            billed_ = options_.billed_seconds;
            if (will_fail_) {
                state_ = JobState::FAILED;
                error_ = "simulated processor fault";
            } else {
                counts_ = simulate_counts(request_, options_.seed);
                state_ = JobState::SUCCEEDED;
            }
        }
        return state_;
    }

    JobState state() const override { return state_; }

    void cancel() override {
        if (is_terminal(state_)) return;
        // A running job has used part of its slot
        if (state_ == JobState::RUNNING && options_.polls_to_complete > 0) {
            billed_ = options_.billed_seconds * static_cast<double>(polls_) /
                      static_cast<double>(options_.polls_to_complete);
        }
        state_ = JobState::CANCELLED;
        error_ = "cancelled";
    }

    double billed_seconds() const override { return billed_; }

    MeasurementDistribution result() const override {
        if (state_ != JobState::SUCCEEDED) {
            throw ExecutionFailed("job " + id_ + " has no result (state " +
                                  job_state_to_string(state_) + ")");
        }
        return counts_;
    }

    std::string error_message() const override { return error_; }

private:
    std::string id_;
    CircuitRequest request_;
    SimulatedBackendOptions options_;
    bool will_fail_;
    JobState state_ = JobState::PENDING;
    int polls_ = 0;
    double billed_ = 0.0;
    MeasurementDistribution counts_;
    std::string error_;
};

} // namespace

CircuitRequest heartbeat_circuit(int beat_number, const config::CircuitConfig& cfg) {
    CircuitRequest req;
    req.beat_number = beat_number;
    req.num_qubits = cfg.num_qubits;
    req.shots = cfg.shots;
    req.optimization_level = cfg.optimization_level;
    req.phases.reserve(static_cast<std::size_t>(cfg.num_qubits));
    for (int q = 0; q < cfg.num_qubits; ++q) {
        const double phase = std::fmod(static_cast<double>(q + 1) * static_cast<double>(beat_number + 1) * 0.1,
                                       kTwoPi);
        req.phases.push_back(phase);
    }
    return req;
}

MeasurementDistribution simulate_counts(const CircuitRequest& request, std::uint64_t seed) {
    if (request.num_qubits < 1 || request.shots < 1) {
        throw ExecutionFailed("circuit needs at least one qubit and one shot");
    }

    std::mt19937_64 rng(mix_seed(seed, static_cast<std::uint64_t>(request.beat_number)));

    const int n = request.num_qubits;
    std::vector<std::bernoulli_distribution> qubits;
    qubits.reserve(static_cast<std::size_t>(n));
    for (int q = 0; q < n; ++q) {
        const double phase = q < static_cast<int>(request.phases.size()) ? request.phases[static_cast<std::size_t>(q)] : 0.0;
        const double s = std::sin(0.5 * phase);
        qubits.emplace_back(s * s);
    }

    MeasurementDistribution dist;
    std::string pattern(static_cast<std::size_t>(n), '0');
    for (int shot = 0; shot < request.shots; ++shot) {
        for (int q = 0; q < n; ++q) {
            // qubit 0 is the right-most character
            pattern[static_cast<std::size_t>(n - 1 - q)] = qubits[static_cast<std::size_t>(q)](rng) ? '1' : '0';
        }
        ++dist.counts[pattern];
    }
    return dist;
}

SimulatedBackend::SimulatedBackend(SimulatedBackendOptions options) : options_(std::move(options)) {
    if (options_.billed_seconds < 0.0) {
        throw ConfigError("simulated backend billed_seconds must be >= 0");
    }
    if (options_.failure_rate < 0.0 || options_.failure_rate > 1.0) {
        throw ConfigError("simulated backend failure_rate must be in [0,1]");
    }
}

std::string SimulatedBackend::name() const {
    return options_.name;
}

std::unique_ptr<ExecutionJob> SimulatedBackend::submit(const CircuitRequest& request) {
    const int job_index = submitted_++;
    std::mt19937_64 rng(mix_seed(options_.seed ^ 0x5eedULL, static_cast<std::uint64_t>(job_index)));
    std::bernoulli_distribution fails(options_.failure_rate);

    const std::string id = options_.name + "-" + std::to_string(request.beat_number) + "-" +
                           std::to_string(job_index);
    return std::make_unique<SimulatedJob>(id, request, options_, fails(rng));
}

} // namespace quantum_surface::scheduler
