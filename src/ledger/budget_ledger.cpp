#include "quantum_surface/ledger/budget_ledger.hpp"
#include "quantum_surface/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace quantum_surface::ledger {

BudgetLedger::BudgetLedger(const config::BudgetConfig& cfg, TimePoint period_start)
    : quota_seconds_(cfg.period_quota_seconds),
      period_length_(std::chrono::duration_cast<Clock::duration>(
          std::chrono::hours(24) * cfg.period_days)),
      period_start_(period_start),
      period_end_(period_start + period_length_) {
    if (quota_seconds_ <= 0.0) {
        throw BudgetError("period quota must be > 0");
    }
    if (cfg.period_days < 1) {
        throw BudgetError("period length must be >= 1 day");
    }
}

void BudgetLedger::roll_over_locked(TimePoint now) {
    while (now >= period_end_) {
        period_start_ = period_end_;
        period_end_ = period_start_ + period_length_;
        consumed_seconds_ = 0.0;
        ++rollovers_;
    }
}

double BudgetLedger::outstanding_locked() const {
    double total = 0.0;
    for (const auto& [id, seconds] : outstanding_) total += seconds;
    return total;
}

BudgetState BudgetLedger::state_locked() const {
    BudgetState s;
    s.period_quota_seconds = quota_seconds_;
    s.consumed_seconds = consumed_seconds_;
    s.reserved_seconds = outstanding_locked();
    s.period_start = period_start_;
    s.period_end = period_end_;
    return s;
}

Reservation BudgetLedger::reserve(double requested_seconds, TimePoint now) {
    if (!(requested_seconds > 0.0) || !std::isfinite(requested_seconds)) {
        throw BudgetError("requested seconds must be a positive finite value");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    roll_over_locked(now);

    const double outstanding = outstanding_locked();

    Reservation r;
    r.requested_seconds = requested_seconds;
    r.consumed_seconds = consumed_seconds_;
    r.remaining_seconds = std::max(0.0, quota_seconds_ - consumed_seconds_ - outstanding);

    if (consumed_seconds_ + outstanding + requested_seconds > quota_seconds_) {
        r.approved = false;
        r.reason = "budget_exceeded";
        return r;
    }

    r.approved = true;
    r.id = next_id_++;
    r.approved_seconds = requested_seconds;
    outstanding_[r.id] = requested_seconds;
    return r;
}

CommitReceipt BudgetLedger::commit(const Reservation& reservation, double actual_seconds,
                                   TimePoint now) {
    if (!reservation.approved) {
        throw BudgetError("cannot commit a refused reservation");
    }
    if (actual_seconds < 0.0 || !std::isfinite(actual_seconds)) {
        throw BudgetError("actual seconds must be a non-negative finite value");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outstanding_.find(reservation.id);
    if (it == outstanding_.end()) {
        throw BudgetError("reservation " + std::to_string(reservation.id) +
                          " is unknown or already committed");
    }
    outstanding_.erase(it);
    roll_over_locked(now);

    CommitReceipt receipt;
    receipt.exceeded_reservation = actual_seconds > reservation.approved_seconds;

    // consumed_seconds never passes the quota; overrun is reported instead
    const double headroom = std::max(0.0, quota_seconds_ - consumed_seconds_);
    receipt.charged_seconds = std::min(actual_seconds, headroom);
    receipt.unrecorded_seconds = actual_seconds - receipt.charged_seconds;
    consumed_seconds_ += receipt.charged_seconds;

    receipt.consumed_seconds = consumed_seconds_;
    receipt.remaining_seconds = std::max(0.0, quota_seconds_ - consumed_seconds_);
    return receipt;
}

BudgetState BudgetLedger::state(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_over_locked(now);
    return state_locked();
}

BudgetState BudgetLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

double BudgetLedger::consumed_seconds(TimePoint now) {
    return state(now).consumed_seconds;
}

double BudgetLedger::remaining_seconds(TimePoint now) {
    return state(now).remaining_seconds();
}

long long BudgetLedger::beats_remaining(double per_beat_seconds, TimePoint now) {
    if (per_beat_seconds <= 0.0) {
        throw BudgetError("per-beat seconds must be > 0");
    }
    return static_cast<long long>(std::floor(remaining_seconds(now) / per_beat_seconds));
}

int BudgetLedger::rollover_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rollovers_;
}

} // namespace quantum_surface::ledger
