#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/events.hpp"
#include "quantum_surface/core/types.hpp"
#include "quantum_surface/ledger/budget_ledger.hpp"
#include "quantum_surface/scheduler/execution_backend.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantum_surface::scheduler {

enum class TickStatus {
    NOT_DUE,
    BUSY,               // another tick holds the execution slot
    BUDGET_EXCEEDED,
    SUCCEEDED,
    RETRIES_EXHAUSTED,
    CANCELLED
};

inline std::string tick_status_to_string(TickStatus status) {
    switch (status) {
        case TickStatus::NOT_DUE: return "not_due";
        case TickStatus::BUSY: return "busy";
        case TickStatus::BUDGET_EXCEEDED: return "budget_exceeded";
        case TickStatus::SUCCEEDED: return "succeeded";
        case TickStatus::RETRIES_EXHAUSTED: return "retries_exhausted";
        case TickStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

struct TickOutcome {
    TickStatus status = TickStatus::NOT_DUE;
    std::optional<RunRecord> record;  // set only on SUCCEEDED
    TimePoint next_check;
    int attempts = 0;
    double billed_seconds = 0.0;      // committed across all attempts
    std::string message;
};

// Blocking wait between polls and retries; the scheduler advances its own
// notion of "now" by the same amount.
using SleepFn = std::function<void(double seconds)>;

void sleep_seconds(double seconds);

/**
 * Single-flight heartbeat scheduler.
 *
 * A beat is due on the first tick and then once interval_seconds have
 * passed since the previous trigger. Each attempt reserves
 * estimated_seconds_per_beat + safety_margin_seconds, runs one job to a
 * terminal state and commits the billed time whatever the outcome.
 * Failed attempts are retried up to max_retries times after a backoff.
 */
class Scheduler {
public:
    Scheduler(const config::Config& cfg, ledger::BudgetLedger& ledger,
              std::vector<std::shared_ptr<ExecutionBackend>> backends, core::EventEmitter& events,
              std::string run_id, SleepFn sleep = sleep_seconds);

    TickOutcome tick(TimePoint now);

    bool is_due(TimePoint now) const;
    TimePoint next_due(TimePoint now) const;

    // Cancels the in-flight job at its next poll; its billed time is still
    // committed. Safe to call from another thread.
    void request_cancel();

    // External stop flag (e.g. set from a signal handler). Unlike
    // request_cancel() it is never cleared by the scheduler and also stops
    // pending retries. The flag must outlive the scheduler.
    void set_stop_flag(const std::atomic<bool>* flag);

    int beats_completed() const;
    std::string next_backend() const;
    const std::string& run_id() const { return run_id_; }

private:
    struct AttemptResult {
        JobState state = JobState::FAILED;
        double billed_seconds = 0.0;
        double elapsed_seconds = 0.0;
        std::string job_id;
        std::string error;
        MeasurementDistribution counts;
    };

    AttemptResult run_attempt(ExecutionBackend& backend, const CircuitRequest& request, TimePoint& clock);
    RunRecord build_record(int beat_number, const ExecutionBackend& backend, const CircuitRequest& request,
                           const AttemptResult& attempt, const RunMetrics& metrics, TimePoint started,
                           TimePoint finished);
    void note_rollover(int rollovers_before, TimePoint now);
    bool cancel_pending() const;

    config::Config cfg_;
    ledger::BudgetLedger& ledger_;
    std::vector<std::shared_ptr<ExecutionBackend>> backends_;
    core::EventEmitter& events_;
    std::string run_id_;
    SleepFn sleep_;

    std::mutex run_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<TimePoint> last_trigger_;
    int beats_completed_ = 0;
    std::size_t rotation_index_ = 0;

    std::atomic<bool> cancel_requested_{false};
    const std::atomic<bool>* stop_flag_ = nullptr;
};

} // namespace quantum_surface::scheduler
