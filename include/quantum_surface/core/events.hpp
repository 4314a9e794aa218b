#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace quantum_surface::core {

using json = nlohmann::json;

/**
 * JSON-lines event log. Every event is one line carrying "type", "run_id"
 * and "ts" plus its own fields, written to the primary stream and mirrored
 * to an optional log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ostream* log_file = nullptr);

    void scheduler_start(const std::string& run_id, const json& extra);

    void beat_start(const std::string& run_id, int beat_number, const std::string& backend,
                    double remaining_seconds, long long beats_remaining);
    void beat_skipped(const std::string& run_id, int beat_number, const std::string& reason,
                      const json& extra);
    void beat_end(const std::string& run_id, int beat_number, const json& extra);

    void execution_attempt(const std::string& run_id, int beat_number, int attempt,
                           const std::string& backend, double approved_seconds);
    void execution_failed(const std::string& run_id, int beat_number, int attempt,
                          const std::string& reason, double billed_seconds);
    void retries_exhausted(const std::string& run_id, int beat_number, int attempts);

    void budget_rollover(const std::string& run_id, const std::string& period_start,
                         const std::string& period_end);
    void budget_overshoot(const std::string& run_id, double approved_seconds,
                          double actual_seconds, double overshoot_seconds);

    void surface_rebuilt(const std::string& run_id, std::size_t vertex_count, int resolution,
                         bool degenerate);

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

    void emit(const json& event);

private:
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ostream* log_file_;
    std::mutex mutex_;
};

} // namespace quantum_surface::core
