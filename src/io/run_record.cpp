#include "quantum_surface/io/run_record.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <cstdio>

namespace quantum_surface::io {

json run_record_to_json(const RunRecord& r) {
    json counts = json::object();
    for (const auto& [pattern, count] : r.distribution.counts) {
        counts[pattern] = count;
    }

    json top = json::array();
    for (const auto& s : r.metrics.top_states) {
        top.push_back({{"state", s.state}, {"count", s.count}, {"probability", s.probability}});
    }

    return {
        {"beat_number", r.beat_number},
        {"timestamp_utc", r.timestamp_utc},
        {"timestamp_local", r.timestamp_local},
        {"backend_name", r.metrics.backend_identifier},
        {"job_id", r.job_id},
        {"execution_time_seconds", r.metrics.execution_time_seconds},
        {"source", r.source},
        {"backend_family", r.backend_family},
        {"backend_processor", r.backend_processor},
        {"num_qubits", r.num_qubits},
        {"circuit_depth", r.circuit_depth},
        {"shots", r.shots},
        {"counts", counts},
        {"coherence_estimate", r.metrics.coherence_estimate},
        {"entropy", r.metrics.entropy_bits},
        {"normalized_entropy", r.normalized_entropy},
        {"top_states", top},
        {"budget_used_total", r.budget_used_total},
        {"budget_remaining", r.budget_remaining},
    };
}

RunRecord run_record_from_json(const json& j) {
    if (!j.is_object()) {
        throw IOError("run record must be a JSON object");
    }

    RunRecord r;
    try {
        r.beat_number = j.at("beat_number").get<int>();
        r.timestamp_utc = j.value("timestamp_utc", std::string());
        r.timestamp_local = j.value("timestamp_local", std::string());
        r.job_id = j.value("job_id", std::string());
        r.source = j.value("source", std::string("simulation"));
        r.backend_family = j.value("backend_family", std::string("unknown"));
        r.backend_processor = j.value("backend_processor", std::string());
        r.num_qubits = j.value("num_qubits", 0);
        r.circuit_depth = j.value("circuit_depth", 0);
        r.shots = j.value("shots", 0);

        for (const auto& [pattern, count] : j.at("counts").items()) {
            r.distribution.counts[pattern] = count.get<std::int64_t>();
        }

        r.metrics.backend_identifier = j.value("backend_name", std::string());
        r.metrics.execution_time_seconds = j.value("execution_time_seconds", 0.0);
        r.metrics.timestamp = r.timestamp_utc;
        r.metrics.coherence_estimate = j.value("coherence_estimate", 0.0);
        r.metrics.entropy_bits = j.value("entropy", 0.0);
        r.normalized_entropy = j.value("normalized_entropy", 0.0);

        if (j.contains("top_states")) {
            for (const auto& s : j.at("top_states")) {
                r.metrics.top_states.push_back(TopState{s.at("state").get<std::string>(),
                                                        s.at("count").get<std::int64_t>(),
                                                        s.at("probability").get<double>()});
            }
        }

        r.budget_used_total = j.value("budget_used_total", 0.0);
        r.budget_remaining = j.value("budget_remaining", 0.0);
    } catch (const json::exception& e) {
        throw IOError(std::string("malformed run record: ") + e.what());
    }

    if (r.num_qubits == 0) {
        r.num_qubits = r.distribution.num_qubits();
    }
    return r;
}

std::string run_record_filename(const RunRecord& record) {
    char beat[16];
    std::snprintf(beat, sizeof(beat), "%06d", record.beat_number);
    const std::string date = record.timestamp_utc.size() >= 10 ? record.timestamp_utc.substr(0, 10)
                                                               : std::string("undated");
    return std::string("beat_") + beat + "_" + date + ".json";
}

fs::path save_run_record(const RunRecord& record, const fs::path& dir) {
    const fs::path path = dir / run_record_filename(record);
    core::write_text(path, run_record_to_json(record).dump(2));
    return path;
}

RunRecord load_run_record(const fs::path& path) {
    const std::string text = core::read_text(path);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IOError("cannot parse " + path.string() + ": " + e.what());
    }
    return run_record_from_json(j);
}

std::vector<RunRecord> load_run_records(const fs::path& dir) {
    std::vector<RunRecord> records;
    for (const auto& path : core::list_files(dir, "beat_", ".json")) {
        records.push_back(load_run_record(path));
    }
    std::stable_sort(records.begin(), records.end(), [](const RunRecord& a, const RunRecord& b) {
        return a.beat_number < b.beat_number;
    });
    return records;
}

} // namespace quantum_surface::io
