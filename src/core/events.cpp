#include "quantum_surface/core/events.hpp"
#include "quantum_surface/core/utils.hpp"

namespace quantum_surface::core {

EventEmitter::EventEmitter(std::ostream& out, std::ostream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();
    if (log_file_) {
        *log_file_ << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::scheduler_start(const std::string& run_id, const json& extra) {
    json event = base_event("scheduler_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::beat_start(const std::string& run_id, int beat_number,
                              const std::string& backend, double remaining_seconds,
                              long long beats_remaining) {
    json event = base_event("beat_start", run_id);
    event["beat_number"] = beat_number;
    event["backend"] = backend;
    event["remaining_seconds"] = remaining_seconds;
    event["beats_remaining"] = beats_remaining;
    emit(event);
}

void EventEmitter::beat_skipped(const std::string& run_id, int beat_number,
                                const std::string& reason, const json& extra) {
    json event = base_event("beat_skipped", run_id);
    event["beat_number"] = beat_number;
    event["reason"] = reason;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::beat_end(const std::string& run_id, int beat_number, const json& extra) {
    json event = base_event("beat_end", run_id);
    event["beat_number"] = beat_number;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::execution_attempt(const std::string& run_id, int beat_number, int attempt,
                                     const std::string& backend, double approved_seconds) {
    json event = base_event("execution_attempt", run_id);
    event["beat_number"] = beat_number;
    event["attempt"] = attempt;
    event["backend"] = backend;
    event["approved_seconds"] = approved_seconds;
    emit(event);
}

void EventEmitter::execution_failed(const std::string& run_id, int beat_number, int attempt,
                                    const std::string& reason, double billed_seconds) {
    json event = base_event("execution_failed", run_id);
    event["beat_number"] = beat_number;
    event["attempt"] = attempt;
    event["reason"] = reason;
    event["billed_seconds"] = billed_seconds;
    emit(event);
}

void EventEmitter::retries_exhausted(const std::string& run_id, int beat_number, int attempts) {
    json event = base_event("retries_exhausted", run_id);
    event["beat_number"] = beat_number;
    event["attempts"] = attempts;
    emit(event);
}

void EventEmitter::budget_rollover(const std::string& run_id, const std::string& period_start,
                                   const std::string& period_end) {
    json event = base_event("budget_rollover", run_id);
    event["period_start"] = period_start;
    event["period_end"] = period_end;
    emit(event);
}

void EventEmitter::budget_overshoot(const std::string& run_id, double approved_seconds,
                                    double actual_seconds, double overshoot_seconds) {
    json event = base_event("budget_overshoot", run_id);
    event["approved_seconds"] = approved_seconds;
    event["actual_seconds"] = actual_seconds;
    event["overshoot_seconds"] = overshoot_seconds;
    emit(event);
}

void EventEmitter::surface_rebuilt(const std::string& run_id, std::size_t vertex_count,
                                   int resolution, bool degenerate) {
    json event = base_event("surface_rebuilt", run_id);
    event["vertex_count"] = vertex_count;
    event["resolution"] = resolution;
    event["degenerate"] = degenerate;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace quantum_surface::core
