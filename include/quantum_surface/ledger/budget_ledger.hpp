#pragma once

#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace quantum_surface::ledger {

struct BudgetState {
    double period_quota_seconds = 0.0;
    double consumed_seconds = 0.0;
    double reserved_seconds = 0.0;  // approved but not yet committed
    TimePoint period_start;
    TimePoint period_end;

    double remaining_seconds() const {
        double r = period_quota_seconds - consumed_seconds;
        return r > 0.0 ? r : 0.0;
    }
};

// Outcome of reserve(). A refusal is a normal value, not an error.
struct Reservation {
    bool approved = false;
    std::uint64_t id = 0;
    double requested_seconds = 0.0;
    double approved_seconds = 0.0;
    double consumed_seconds = 0.0;   // at decision time
    double remaining_seconds = 0.0;  // quota - consumed - outstanding, at decision time
    std::string reason;              // "budget_exceeded" on refusal
};

struct CommitReceipt {
    double charged_seconds = 0.0;     // added to consumed_seconds
    double unrecorded_seconds = 0.0;  // billed time beyond the quota ceiling
    bool exceeded_reservation = false;
    double consumed_seconds = 0.0;
    double remaining_seconds = 0.0;
};

/**
 * Hard-quota accounting of processor seconds over a fixed-length period.
 *
 * reserve() and commit() are serialized on one mutex, so two callers can
 * never both pass reserve() against the same consumed value. Approved but
 * uncommitted reservations count against the quota until committed.
 * Period rollover happens lazily on the first call at or after period_end.
 */
class BudgetLedger {
public:
    BudgetLedger(const config::BudgetConfig& cfg, TimePoint period_start);

    Reservation reserve(double requested_seconds, TimePoint now);

    // Must be called exactly once per approved reservation with the time
    // actually billed, including failed or cancelled executions.
    CommitReceipt commit(const Reservation& reservation, double actual_seconds, TimePoint now);

    BudgetState state(TimePoint now);
    BudgetState snapshot() const;

    double consumed_seconds(TimePoint now);
    double remaining_seconds(TimePoint now);
    long long beats_remaining(double per_beat_seconds, TimePoint now);

    int rollover_count() const;

private:
    void roll_over_locked(TimePoint now);
    double outstanding_locked() const;
    BudgetState state_locked() const;

    double quota_seconds_;
    Clock::duration period_length_;
    TimePoint period_start_;
    TimePoint period_end_;
    double consumed_seconds_ = 0.0;
    std::map<std::uint64_t, double> outstanding_;
    std::uint64_t next_id_ = 1;
    int rollovers_ = 0;
    mutable std::mutex mutex_;
};

} // namespace quantum_surface::ledger
