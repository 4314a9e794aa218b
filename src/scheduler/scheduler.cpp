#include "quantum_surface/scheduler/scheduler.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"
#include "quantum_surface/metrics/metrics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <sstream>
#include <thread>

namespace quantum_surface::scheduler {

namespace {

Clock::duration to_duration(double seconds) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace

void sleep_seconds(double seconds) {
    if (seconds > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

Scheduler::Scheduler(const config::Config& cfg, ledger::BudgetLedger& ledger,
                     std::vector<std::shared_ptr<ExecutionBackend>> backends, core::EventEmitter& events,
                     std::string run_id, SleepFn sleep)
    : cfg_(cfg),
      ledger_(ledger),
      backends_(std::move(backends)),
      events_(events),
      run_id_(std::move(run_id)),
      sleep_(std::move(sleep)) {
    if (backends_.empty()) {
        throw ConfigError("scheduler needs at least one execution backend");
    }
    for (const auto& b : backends_) {
        if (!b) throw ConfigError("scheduler backend must not be null");
    }
    if (!sleep_) {
        sleep_ = sleep_seconds;
    }
}

bool Scheduler::is_due(TimePoint now) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!last_trigger_) return true;
    return now >= *last_trigger_ + to_duration(cfg_.scheduler.interval_seconds);
}

TimePoint Scheduler::next_due(TimePoint now) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!last_trigger_) return now;
    return *last_trigger_ + to_duration(cfg_.scheduler.interval_seconds);
}

void Scheduler::request_cancel() {
    cancel_requested_.store(true);
}

void Scheduler::set_stop_flag(const std::atomic<bool>* flag) {
    stop_flag_ = flag;
}

bool Scheduler::cancel_pending() const {
    return cancel_requested_.load() || (stop_flag_ != nullptr && stop_flag_->load());
}

int Scheduler::beats_completed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return beats_completed_;
}

std::string Scheduler::next_backend() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return backends_[rotation_index_ % backends_.size()]->name();
}

void Scheduler::note_rollover(int rollovers_before, TimePoint now) {
    if (ledger_.rollover_count() == rollovers_before) return;
    const auto state = ledger_.state(now);
    events_.budget_rollover(run_id_, core::format_iso_utc(state.period_start),
                            core::format_iso_utc(state.period_end));
}

Scheduler::AttemptResult Scheduler::run_attempt(ExecutionBackend& backend, const CircuitRequest& request,
                                                TimePoint& clock) {
    AttemptResult res;

    std::unique_ptr<ExecutionJob> job;
    try {
        job = backend.submit(request);
    } catch (const std::exception& e) {
        res.state = JobState::FAILED;
        res.error = e.what();
        return res;
    }
    if (!job) {
        res.state = JobState::FAILED;
        res.error = "backend returned no job";
        return res;
    }
    res.job_id = job->job_id();

    const double timeout = cfg_.scheduler.execution_timeout_seconds;
    const double poll_interval = cfg_.scheduler.poll_interval_seconds;

    JobState state = JobState::PENDING;
    try {
        state = job->poll();
        while (!is_terminal(state)) {
            if (cancel_pending()) {
                job->cancel();
                state = JobState::CANCELLED;
                break;
            }
            if (res.elapsed_seconds >= timeout) {
                job->cancel();
                state = JobState::TIMED_OUT;
                break;
            }
            sleep_(poll_interval);
            clock += to_duration(poll_interval);
            res.elapsed_seconds += poll_interval;
            state = job->poll();
        }
    } catch (const std::exception& e) {
        // Any backend fault ends the attempt; the caller still commits
        state = JobState::FAILED;
        res.error = e.what();
    }

    res.state = state;
    try {
        res.billed_seconds = job->billed_seconds();
    } catch (const std::exception& e) {
        // Nothing measured; the full reservation is billed instead
        res.billed_seconds = cfg_.scheduler.reservation_seconds();
        res.state = JobState::FAILED;
        res.error = std::string("billing unavailable: ") + e.what();
        return res;
    }

    if (state == JobState::SUCCEEDED) {
        try {
            res.counts = job->result();
        } catch (const std::exception& e) {
            res.state = JobState::FAILED;
            res.error = e.what();
        }
    } else if (res.error.empty()) {
        if (state == JobState::TIMED_OUT) {
            std::ostringstream oss;
            oss << "no result after " << res.elapsed_seconds << " s";
            res.error = oss.str();
        } else {
            std::string message;
            try {
                message = job->error_message();
            } catch (const std::exception& e) {
                message = e.what();
            }
            res.error = message.empty() ? job_state_to_string(state) : message;
        }
    }

    return res;
}

RunRecord Scheduler::build_record(int beat_number, const ExecutionBackend& backend,
                                  const CircuitRequest& request, const AttemptResult& attempt,
                                  const RunMetrics& metrics, TimePoint started, TimePoint finished) {
    RunRecord rec;
    rec.beat_number = beat_number;
    rec.timestamp_utc = core::format_iso_utc(started);
    rec.timestamp_local = core::format_iso_local(started);
    rec.job_id = attempt.job_id;

    const auto cls = metrics::classify_backend(backend.name());
    rec.source = cls.source;
    rec.backend_family = cls.family;
    rec.backend_processor = cls.processor;

    rec.num_qubits = request.num_qubits;
    rec.circuit_depth = request.depth();
    rec.shots = request.shots;
    rec.distribution = attempt.counts;

    rec.metrics = metrics;
    rec.metrics.backend_identifier = backend.name();
    rec.metrics.execution_time_seconds = attempt.billed_seconds;
    rec.metrics.timestamp = rec.timestamp_utc;
    rec.normalized_entropy = request.num_qubits > 0
                                 ? metrics.entropy_bits / static_cast<double>(request.num_qubits)
                                 : 0.0;

    const auto state = ledger_.state(finished);
    rec.budget_used_total = state.consumed_seconds;
    rec.budget_remaining = state.remaining_seconds();
    return rec;
}

TickOutcome Scheduler::tick(TimePoint now) {
    TickOutcome outcome;

    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        outcome.status = TickStatus::BUSY;
        outcome.next_check = now;
        outcome.message = "execution already in flight";
        return outcome;
    }

    if (!is_due(now)) {
        outcome.status = TickStatus::NOT_DUE;
        outcome.next_check = next_due(now);
        return outcome;
    }

    if (stop_flag_ != nullptr && stop_flag_->load()) {
        outcome.status = TickStatus::CANCELLED;
        outcome.next_check = now;
        outcome.message = "stop requested";
        return outcome;
    }

    cancel_requested_.store(false);

    int beat_number = 0;
    std::shared_ptr<ExecutionBackend> backend;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_trigger_ = now;
        beat_number = beats_completed_;
        backend = backends_[rotation_index_ % backends_.size()];
    }
    outcome.next_check = now + to_duration(cfg_.scheduler.interval_seconds);

    const double per_attempt = cfg_.scheduler.reservation_seconds();

    int rollovers = ledger_.rollover_count();
    const auto budget = ledger_.state(now);
    note_rollover(rollovers, now);
    events_.beat_start(run_id_, beat_number, backend->name(), budget.remaining_seconds(),
                       ledger_.beats_remaining(cfg_.scheduler.estimated_seconds_per_beat, now));

    const CircuitRequest request = heartbeat_circuit(beat_number, cfg_.circuit);
    const int max_attempts = 1 + std::max(0, cfg_.scheduler.max_retries);
    TimePoint clock = now;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        rollovers = ledger_.rollover_count();
        const ledger::Reservation reservation = ledger_.reserve(per_attempt, clock);
        note_rollover(rollovers, clock);

        if (!reservation.approved) {
            events_.beat_skipped(run_id_, beat_number, "budget_exceeded",
                                 {{"attempt", attempt},
                                  {"requested_seconds", reservation.requested_seconds},
                                  {"consumed_seconds", reservation.consumed_seconds},
                                  {"remaining_seconds", reservation.remaining_seconds},
                                  {"next_check", core::format_iso_utc(outcome.next_check)}});
            outcome.status = TickStatus::BUDGET_EXCEEDED;
            outcome.message = "budget exceeded";
            return outcome;
        }

        events_.execution_attempt(run_id_, beat_number, attempt, backend->name(),
                                  reservation.approved_seconds);

        const TimePoint started = clock;
        AttemptResult result = run_attempt(*backend, request, clock);

        const ledger::CommitReceipt receipt = ledger_.commit(reservation, result.billed_seconds, clock);
        outcome.attempts = attempt;
        outcome.billed_seconds += result.billed_seconds;
        if (receipt.exceeded_reservation || receipt.unrecorded_seconds > 0.0) {
            events_.budget_overshoot(run_id_, reservation.approved_seconds, result.billed_seconds,
                                     std::max(result.billed_seconds - reservation.approved_seconds,
                                              receipt.unrecorded_seconds));
        }

        if (result.state == JobState::SUCCEEDED) {
            try {
                const RunMetrics m = metrics::extract(result.counts, cfg_.metrics.top_n);
                RunRecord rec = build_record(beat_number, *backend, request, result, m, started, clock);

                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    ++beats_completed_;
                    ++rotation_index_;
                }

                events_.beat_end(run_id_, beat_number,
                                 {{"backend", rec.metrics.backend_identifier},
                                  {"job_id", rec.job_id},
                                  {"attempts", attempt},
                                  {"execution_time_seconds", rec.metrics.execution_time_seconds},
                                  {"coherence", rec.metrics.coherence_estimate},
                                  {"entropy_bits", rec.metrics.entropy_bits},
                                  {"budget_used_total", rec.budget_used_total},
                                  {"budget_remaining", rec.budget_remaining}});

                outcome.status = TickStatus::SUCCEEDED;
                outcome.record = std::move(rec);
                return outcome;
            } catch (const MalformedDistribution& e) {
                events_.error(run_id_, std::string("backend ") + backend->name() + " returned " + e.what());
                result.state = JobState::FAILED;
                result.error = e.what();
            }
        }

        events_.execution_failed(run_id_, beat_number, attempt,
                                 job_state_to_string(result.state) + ": " + result.error,
                                 result.billed_seconds);

        if (result.state == JobState::CANCELLED && cancel_pending()) {
            outcome.status = TickStatus::CANCELLED;
            outcome.message = "cancelled on request";
            return outcome;
        }

        if (attempt < max_attempts) {
            sleep_(cfg_.scheduler.retry_backoff_seconds);
            clock += to_duration(cfg_.scheduler.retry_backoff_seconds);
            if (cancel_pending()) {
                outcome.status = TickStatus::CANCELLED;
                outcome.message = "cancelled on request";
                return outcome;
            }
        }
    }

    events_.retries_exhausted(run_id_, beat_number, max_attempts);
    outcome.status = TickStatus::RETRIES_EXHAUSTED;
    outcome.message = "retries exhausted";
    return outcome;
}

} // namespace quantum_surface::scheduler
