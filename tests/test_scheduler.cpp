#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/events.hpp"
#include "quantum_surface/ledger/budget_ledger.hpp"
#include "quantum_surface/scheduler/scheduler.hpp"
#include "quantum_surface/scheduler/simulated_backend.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using quantum_surface::Clock;
using quantum_surface::ExecutionFailed;
using quantum_surface::MeasurementDistribution;
using quantum_surface::TimePoint;
namespace config = quantum_surface::config;
namespace core = quantum_surface::core;
namespace ledger = quantum_surface::ledger;
namespace sched = quantum_surface::scheduler;

namespace {

enum class Behaviour { SUCCEED, FAIL, HANG, REJECT, GARBAGE, THROW };

struct Script {
    Behaviour behaviour = Behaviour::SUCCEED;
    double billed = 0.8;
};

class FakeJob : public sched::ExecutionJob {
public:
    FakeJob(std::string id, Script script) : id_(std::move(id)), script_(script) {}

    std::string job_id() const override { return id_; }

    sched::JobState poll() override {
        if (sched::is_terminal(state_)) return state_;
        ++polls_;
        switch (script_.behaviour) {
            case Behaviour::SUCCEED:
            case Behaviour::GARBAGE:
                state_ = sched::JobState::SUCCEEDED;
                billed_ = script_.billed;
                break;
            case Behaviour::FAIL:
                state_ = sched::JobState::FAILED;
                billed_ = script_.billed;
                break;
            case Behaviour::THROW:
                billed_ = script_.billed;
                throw std::runtime_error("transport reset");
            default:
                state_ = sched::JobState::RUNNING;
                billed_ = 0.1 * polls_;
                break;
        }
        return state_;
    }

    sched::JobState state() const override { return state_; }

    void cancel() override {
        if (!sched::is_terminal(state_)) state_ = sched::JobState::CANCELLED;
    }

    double billed_seconds() const override { return billed_; }

    MeasurementDistribution result() const override {
        if (state_ != sched::JobState::SUCCEEDED) throw ExecutionFailed("no result");
        MeasurementDistribution d;
        if (script_.behaviour == Behaviour::GARBAGE) {
            d.counts = {{"01", 3}, {"1", 4}};
        } else {
            d.counts = {{"00", 900}, {"01", 100}, {"11", 24}};
        }
        return d;
    }

    std::string error_message() const override {
        return state_ == sched::JobState::FAILED ? "scripted failure" : "";
    }

private:
    std::string id_;
    Script script_;
    sched::JobState state_ = sched::JobState::PENDING;
    int polls_ = 0;
    double billed_ = 0.0;
};

class FakeBackend : public sched::ExecutionBackend {
public:
    explicit FakeBackend(std::string name, std::deque<Script> script = {})
        : name_(std::move(name)), script_(std::move(script)) {}

    std::string name() const override { return name_; }

    std::unique_ptr<sched::ExecutionJob> submit(const sched::CircuitRequest& request) override {
        ++submitted;
        last_beat = request.beat_number;
        Script s;
        if (!script_.empty()) {
            s = script_.front();
            script_.pop_front();
        }
        if (s.behaviour == Behaviour::REJECT) {
            throw ExecutionFailed("queue rejected job");
        }
        return std::make_unique<FakeJob>(name_ + "-" + std::to_string(submitted), s);
    }

    int submitted = 0;
    int last_beat = -1;

private:
    std::string name_;
    std::deque<Script> script_;
};

TimePoint t0() {
    return TimePoint(std::chrono::hours(24 * 365 * 50));
}

config::Config test_config() {
    config::Config cfg;
    cfg.scheduler.interval_seconds = 3600.0;
    cfg.scheduler.estimated_seconds_per_beat = 0.8;
    cfg.scheduler.safety_margin_seconds = 0.03;
    cfg.scheduler.max_retries = 2;
    cfg.scheduler.retry_backoff_seconds = 5.0;
    cfg.scheduler.poll_interval_seconds = 1.0;
    cfg.scheduler.execution_timeout_seconds = 3.0;
    cfg.circuit.num_qubits = 2;
    return cfg;
}

std::size_t count_events(const std::string& log, const std::string& type) {
    const std::string needle = "\"type\":\"" + type + "\"";
    std::size_t n = 0;
    for (auto pos = log.find(needle); pos != std::string::npos; pos = log.find(needle, pos + 1)) ++n;
    return n;
}

struct Harness {
    explicit Harness(config::Config c, std::vector<std::shared_ptr<sched::ExecutionBackend>> backends)
        : cfg(std::move(c)),
          budget(cfg.budget, t0()),
          events(out),
          scheduler(cfg, budget, std::move(backends), events, "test-run",
                    [this](double s) { slept.push_back(s); }) {}

    config::Config cfg;
    ledger::BudgetLedger budget;
    std::ostringstream out;
    core::EventEmitter events;
    std::vector<double> slept;
    sched::Scheduler scheduler;
};

} // namespace

TEST_CASE("first_tick_runs_and_commits") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator");
    Harness h(test_config(), {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::SUCCEEDED);
    REQUIRE(out.record.has_value());
    REQUIRE(out.attempts == 1);

    const auto& rec = *out.record;
    REQUIRE(rec.beat_number == 0);
    REQUIRE(rec.metrics.backend_identifier == "fake_simulator");
    REQUIRE(rec.source == "simulation");
    REQUIRE(rec.shots == 1024);
    REQUIRE(rec.circuit_depth == 5);
    REQUIRE(rec.metrics.coherence_estimate == Catch::Approx(900.0 / 1024.0));
    REQUIRE(rec.metrics.execution_time_seconds == Catch::Approx(0.8));
    REQUIRE(rec.budget_used_total == Catch::Approx(0.8));
    REQUIRE(rec.budget_remaining == Catch::Approx(599.2));
    REQUIRE(rec.normalized_entropy == Catch::Approx(rec.metrics.entropy_bits / 2.0));

    REQUIRE(h.budget.consumed_seconds(t0()) == Catch::Approx(0.8));
    REQUIRE(h.budget.snapshot().reserved_seconds == 0.0);
    REQUIRE(count_events(h.out.str(), "beat_start") == 1);
    REQUIRE(count_events(h.out.str(), "beat_end") == 1);
}

TEST_CASE("not_due_until_interval_elapses") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator");
    Harness h(test_config(), {backend});

    REQUIRE(h.scheduler.tick(t0()).status == sched::TickStatus::SUCCEEDED);

    const auto early = h.scheduler.tick(t0() + std::chrono::minutes(59));
    REQUIRE(early.status == sched::TickStatus::NOT_DUE);
    REQUIRE(early.next_check == t0() + std::chrono::hours(1));
    REQUIRE(backend->submitted == 1);

    const auto due = h.scheduler.tick(t0() + std::chrono::hours(1));
    REQUIRE(due.status == sched::TickStatus::SUCCEEDED);
    REQUIRE(due.record->beat_number == 1);
    REQUIRE(h.scheduler.beats_completed() == 2);
}

TEST_CASE("failed_attempts_are_retried_and_billed") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator",
        std::deque<Script>{{Behaviour::FAIL, 0.5}, {Behaviour::REJECT, 0.0}, {Behaviour::SUCCEED, 0.8}});
    Harness h(test_config(), {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::SUCCEEDED);
    REQUIRE(out.attempts == 3);
    REQUIRE(out.billed_seconds == Catch::Approx(1.3));
    REQUIRE(h.budget.consumed_seconds(t0()) == Catch::Approx(1.3));
    REQUIRE(h.slept == std::vector<double>{5.0, 5.0});
    REQUIRE(count_events(h.out.str(), "execution_failed") == 2);
}

TEST_CASE("retries_exhausted_is_reported_not_fatal") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator",
        std::deque<Script>{{Behaviour::FAIL, 0.4}, {Behaviour::FAIL, 0.4}, {Behaviour::FAIL, 0.4}});
    Harness h(test_config(), {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::RETRIES_EXHAUSTED);
    REQUIRE_FALSE(out.record.has_value());
    REQUIRE(out.attempts == 3);
    REQUIRE(h.budget.consumed_seconds(t0()) == Catch::Approx(1.2));
    REQUIRE(h.scheduler.beats_completed() == 0);
    REQUIRE(count_events(h.out.str(), "retries_exhausted") == 1);

    // Next window tries again
    const auto next = h.scheduler.tick(t0() + std::chrono::hours(1));
    REQUIRE(next.status == sched::TickStatus::SUCCEEDED);
    REQUIRE(next.record->beat_number == 0);
}

TEST_CASE("budget_exceeded_skips_without_submitting") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator");
    auto cfg = test_config();
    cfg.budget.period_quota_seconds = 0.5;
    Harness h(cfg, {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::BUDGET_EXCEEDED);
    REQUIRE(out.next_check == t0() + std::chrono::hours(1));
    REQUIRE(backend->submitted == 0);
    REQUIRE(h.budget.consumed_seconds(t0()) == 0.0);
    REQUIRE(count_events(h.out.str(), "beat_skipped") == 1);
    REQUIRE(h.out.str().find("budget_exceeded") != std::string::npos);
}

TEST_CASE("timeout_cancels_and_commits_partial_time") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator",
        std::deque<Script>{{Behaviour::HANG, 0.0}, {Behaviour::HANG, 0.0}, {Behaviour::HANG, 0.0}});
    Harness h(test_config(), {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::RETRIES_EXHAUSTED);
    REQUIRE(out.billed_seconds > 0.0);
    REQUIRE(h.budget.consumed_seconds(t0() + std::chrono::minutes(5)) == Catch::Approx(out.billed_seconds));
    REQUIRE(h.out.str().find("timed_out") != std::string::npos);
}

TEST_CASE("cancel_request_stops_the_beat_and_commits") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator",
                                                 std::deque<Script>{{Behaviour::HANG, 0.0}});
    auto cfg = test_config();
    cfg.budget.period_quota_seconds = 600.0;
    ledger::BudgetLedger budget(cfg.budget, t0());
    std::ostringstream log;
    core::EventEmitter events(log);

    sched::Scheduler* self = nullptr;
    sched::Scheduler scheduler(cfg, budget, {backend}, events, "cancel-run", [&](double) {
        if (self) self->request_cancel();
    });
    self = &scheduler;

    const auto out = scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::CANCELLED);
    REQUIRE(out.attempts == 1);
    // Billed through the poll that followed the cancel request
    REQUIRE(out.billed_seconds == Catch::Approx(0.2));
    REQUIRE(budget.consumed_seconds(t0() + std::chrono::minutes(1)) == Catch::Approx(0.2));
    REQUIRE(budget.snapshot().reserved_seconds == 0.0);
}

TEST_CASE("backend_exception_is_a_failed_attempt_and_still_committed") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator",
        std::deque<Script>{{Behaviour::THROW, 0.5}, {Behaviour::THROW, 0.5}, {Behaviour::THROW, 0.5}});
    Harness h(test_config(), {backend});

    sched::TickOutcome out;
    REQUIRE_NOTHROW(out = h.scheduler.tick(t0()));
    REQUIRE(out.status == sched::TickStatus::RETRIES_EXHAUSTED);
    REQUIRE(out.attempts == 3);
    REQUIRE(out.billed_seconds == Catch::Approx(1.5));
    REQUIRE(h.budget.consumed_seconds(t0()) == Catch::Approx(1.5));
    REQUIRE(h.budget.snapshot().reserved_seconds == 0.0);
    REQUIRE(count_events(h.out.str(), "execution_failed") == 3);
    REQUIRE(h.out.str().find("transport reset") != std::string::npos);

    // Nothing is held back from the next period
    const TimePoint next_period = t0() + std::chrono::hours(24 * 32);
    const auto full = h.budget.reserve(h.cfg.budget.period_quota_seconds - 0.01, next_period);
    REQUIRE(full.approved);
}

TEST_CASE("stop_flag_cancels_in_flight_job") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator",
                                                 std::deque<Script>{{Behaviour::HANG, 0.0}});
    auto cfg = test_config();
    ledger::BudgetLedger budget(cfg.budget, t0());
    std::ostringstream log;
    core::EventEmitter events(log);

    std::atomic<bool> stop{false};
    sched::Scheduler scheduler(cfg, budget, {backend}, events, "stop-run", [&](double) { stop.store(true); });
    scheduler.set_stop_flag(&stop);

    const auto out = scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::CANCELLED);
    REQUIRE(out.attempts == 1);
    REQUIRE(out.billed_seconds == Catch::Approx(0.2));
    REQUIRE(budget.consumed_seconds(t0() + std::chrono::minutes(1)) == Catch::Approx(0.2));
    REQUIRE(budget.snapshot().reserved_seconds == 0.0);

    // The flag stays raised: later beats are not started
    const auto later = scheduler.tick(t0() + std::chrono::hours(2));
    REQUIRE(later.status == sched::TickStatus::CANCELLED);
    REQUIRE(backend->submitted == 1);
}

TEST_CASE("stop_flag_skips_pending_retries") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator",
        std::deque<Script>{{Behaviour::FAIL, 0.4}, {Behaviour::SUCCEED, 0.8}});
    auto cfg = test_config();
    ledger::BudgetLedger budget(cfg.budget, t0());
    std::ostringstream log;
    core::EventEmitter events(log);

    std::atomic<bool> stop{false};
    sched::Scheduler scheduler(cfg, budget, {backend}, events, "stop-run", [&](double) { stop.store(true); });
    scheduler.set_stop_flag(&stop);

    const auto out = scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::CANCELLED);
    REQUIRE(out.attempts == 1);
    REQUIRE(backend->submitted == 1);
    REQUIRE(budget.consumed_seconds(t0()) == Catch::Approx(0.4));
}

TEST_CASE("concurrent_tick_reports_busy") {
    auto backend = std::make_shared<FakeBackend>("fake_simulator",
                                                 std::deque<Script>{{Behaviour::HANG, 0.0}});
    auto cfg = test_config();
    cfg.scheduler.max_retries = 0;
    cfg.scheduler.execution_timeout_seconds = 1.0;
    ledger::BudgetLedger budget(cfg.budget, t0());
    std::ostringstream log;
    core::EventEmitter events(log);

    sched::Scheduler* self = nullptr;
    sched::TickStatus inner = sched::TickStatus::NOT_DUE;
    sched::Scheduler scheduler(cfg, budget, {backend}, events, "busy-run", [&](double) {
        std::thread other([&]() { inner = self->tick(t0() + std::chrono::hours(2)).status; });
        other.join();
    });
    self = &scheduler;

    scheduler.tick(t0());
    REQUIRE(inner == sched::TickStatus::BUSY);
    REQUIRE(backend->submitted == 1);
}

TEST_CASE("malformed_result_counts_as_failed_attempt") {
    auto backend = std::make_shared<FakeBackend>(
        "fake_simulator", std::deque<Script>{{Behaviour::GARBAGE, 0.3}, {Behaviour::SUCCEED, 0.8}});
    Harness h(test_config(), {backend});

    const auto out = h.scheduler.tick(t0());
    REQUIRE(out.status == sched::TickStatus::SUCCEEDED);
    REQUIRE(out.attempts == 2);
    REQUIRE(count_events(h.out.str(), "error") == 1);
    REQUIRE(h.budget.consumed_seconds(t0()) == Catch::Approx(1.1));
}

TEST_CASE("backends_rotate_one_per_successful_beat") {
    auto a = std::make_shared<FakeBackend>("ibm_brisbane",
                                           std::deque<Script>{{Behaviour::SUCCEED, 0.8}, {Behaviour::SUCCEED, 0.8}});
    auto b = std::make_shared<FakeBackend>("ibm_torino", std::deque<Script>{{Behaviour::FAIL, 0.2},
                                                                          {Behaviour::FAIL, 0.2},
                                                                          {Behaviour::FAIL, 0.2},
                                                                          {Behaviour::SUCCEED, 0.8}});
    Harness h(test_config(), {a, b});

    REQUIRE(h.scheduler.next_backend() == "ibm_brisbane");
    auto first = h.scheduler.tick(t0());
    REQUIRE(first.record->backend_family == "eagle");
    REQUIRE(first.record->source == "real");

    REQUIRE(h.scheduler.next_backend() == "ibm_torino");
    auto failed = h.scheduler.tick(t0() + std::chrono::hours(1));
    REQUIRE(failed.status == sched::TickStatus::RETRIES_EXHAUSTED);
    REQUIRE(h.scheduler.next_backend() == "ibm_torino");

    auto second = h.scheduler.tick(t0() + std::chrono::hours(2));
    REQUIRE(second.record->backend_family == "heron");
    REQUIRE(h.scheduler.next_backend() == "ibm_brisbane");
}

TEST_CASE("simulated_backend_is_seeded_and_deterministic") {
    config::CircuitConfig circuit;
    const auto req = sched::heartbeat_circuit(0, circuit);
    REQUIRE(req.phases.size() == 5);
    REQUIRE(req.phases[0] == Catch::Approx(0.1));

    const auto a = sched::simulate_counts(req, 42);
    const auto b = sched::simulate_counts(req, 42);
    REQUIRE(a.counts == b.counts);
    REQUIRE(a.total_shots() == 1024);
    REQUIRE(a.counts.count("00000") == 1);
    REQUIRE(a.counts.at("00000") > 800);

    sched::SimulatedBackend backend;
    auto job = backend.submit(req);
    REQUIRE(job->poll() == sched::JobState::RUNNING);
    REQUIRE(job->poll() == sched::JobState::SUCCEEDED);
    REQUIRE(job->billed_seconds() == Catch::Approx(0.8));
    REQUIRE(job->result().counts == a.counts);
}

TEST_CASE("scheduler_requires_a_backend") {
    auto cfg = test_config();
    ledger::BudgetLedger budget(cfg.budget, t0());
    std::ostringstream log;
    core::EventEmitter events(log);
    REQUIRE_THROWS_AS(sched::Scheduler(cfg, budget, {}, events, "x"), quantum_surface::ConfigError);
}
