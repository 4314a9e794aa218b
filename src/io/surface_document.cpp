#include "quantum_surface/io/surface_document.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/utils.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace quantum_surface::io {

SurfaceStatistics compute_statistics(const std::vector<SurfaceVertex>& vertices) {
    SurfaceStatistics s;
    if (vertices.empty()) return s;

    double sum = 0.0;
    for (const auto& v : vertices) sum += v.height;
    s.mean_height = sum / static_cast<double>(vertices.size());

    double var = 0.0;
    for (const auto& v : vertices) {
        const double d = v.height - s.mean_height;
        var += d * d;
    }
    s.height_variance = var / static_cast<double>(vertices.size());

    std::vector<double> errors;
    for (const auto& v : vertices) {
        if (v.origin == VertexOrigin::QUBIT_BIAS) errors.push_back(v.error_rate);
    }
    if (errors.empty()) {
        for (const auto& v : vertices) errors.push_back(v.quantum_value());
    }

    double esum = 0.0;
    s.max_error = -std::numeric_limits<double>::max();
    s.min_error = std::numeric_limits<double>::max();
    for (double e : errors) {
        esum += e;
        s.max_error = std::max(s.max_error, e);
        s.min_error = std::min(s.min_error, e);
    }
    s.mean_error = esum / static_cast<double>(errors.size());
    return s;
}

SourceEntry source_entry(const RunRecord& record) {
    SourceEntry e;
    e.run_id = record.beat_number;
    e.beat_number = record.beat_number;
    e.backend_name = record.metrics.backend_identifier;
    e.timestamp_utc = record.timestamp_utc;
    e.source = record.source;
    return e;
}

json vertex_to_json(const SurfaceVertex& v) {
    return {
        {"spherical", {{"theta", v.spherical.theta}, {"phi", v.spherical.phi}}},
        {"cartesian", {{"x", v.cartesian.x()}, {"y", v.cartesian.y()}, {"z", v.cartesian.z()}}},
        {"height", v.height},
        {"uv", {{"u", v.u}, {"v", v.v}}},
        {"color", {{"r", v.color.r}, {"g", v.color.g}, {"b", v.color.b}, {"a", v.color.a}}},
        {"glow", v.glow},
        {"origin", vertex_origin_to_string(v.origin)},
        {"bit_pattern", v.bit_pattern},
        {"probability", v.probability},
        {"error_rate", v.error_rate},
        {"quantum", {{"beat", v.source_run_id}, {"error_or_probability", v.quantum_value()}}},
    };
}

SurfaceVertex vertex_from_json(const json& j) {
    SurfaceVertex v;
    const auto& sph = j.at("spherical");
    v.spherical.theta = sph.at("theta").get<double>();
    v.spherical.phi = sph.at("phi").get<double>();

    const auto& c = j.at("cartesian");
    v.cartesian = Vec3(c.at("x").get<double>(), c.at("y").get<double>(), c.at("z").get<double>());
    v.height = j.at("height").get<double>();

    if (j.contains("uv")) {
        v.u = j["uv"].value("u", 0.0);
        v.v = j["uv"].value("v", 0.0);
    }
    if (j.contains("color")) {
        const auto& col = j["color"];
        v.color = Color{col.value("r", 0.0), col.value("g", 0.0), col.value("b", 0.0), col.value("a", 1.0)};
    }
    v.glow = j.value("glow", 0.0);
    v.origin = string_to_vertex_origin(j.value("origin", std::string("encoded_point")));
    v.bit_pattern = j.value("bit_pattern", std::string());

    const auto& q = j.at("quantum");
    v.source_run_id = q.at("beat").get<std::int64_t>();
    const double value = q.value("error_or_probability", 0.0);
    v.probability = j.value("probability", v.origin == VertexOrigin::QUBIT_BIAS ? 0.0 : value);
    v.error_rate = j.value("error_rate", v.origin == VertexOrigin::QUBIT_BIAS ? value : 0.0);
    return v;
}

json surface_document_to_json(const std::vector<SurfaceVertex>& vertices,
                              const std::vector<SourceEntry>& sources) {
    json verts = json::array();
    json positions = json::array();
    json uvs = json::array();
    json heights = json::array();

    Vec3 lo = Vec3::Constant(std::numeric_limits<double>::max());
    Vec3 hi = Vec3::Constant(-std::numeric_limits<double>::max());
    std::set<std::int64_t> beats;

    for (const auto& v : vertices) {
        verts.push_back(vertex_to_json(v));
        positions.push_back(v.cartesian.x());
        positions.push_back(v.cartesian.y());
        positions.push_back(v.cartesian.z());
        uvs.push_back(v.u);
        uvs.push_back(v.v);
        heights.push_back(v.height);
        lo = lo.cwiseMin(v.cartesian);
        hi = hi.cwiseMax(v.cartesian);
        beats.insert(v.source_run_id);
    }
    if (vertices.empty()) {
        lo.setZero();
        hi.setZero();
    }

    const SurfaceStatistics stats = compute_statistics(vertices);

    json src = json::array();
    for (const auto& s : sources) {
        src.push_back({
            {"run_id", s.run_id},
            {"beat_number", s.beat_number},
            {"backend_name", s.backend_name},
            {"timestamp_utc", s.timestamp_utc},
            {"source", s.source},
        });
    }

    return {
        {"type", "hypersphere_surface"},
        {"generated_at", core::get_iso_timestamp()},
        {"vertex_count", vertices.size()},
        {"total_beats", beats.size()},
        {"positions", positions},
        {"uvs", uvs},
        {"heights", heights},
        {"vertices", verts},
        {"bounds",
         {{"min", {lo.x(), lo.y(), lo.z()}}, {"max", {hi.x(), hi.y(), hi.z()}}}},
        {"statistics",
         {{"mean_height", stats.mean_height},
          {"height_variance", stats.height_variance},
          {"mean_error", stats.mean_error},
          {"max_error", stats.max_error},
          {"min_error", stats.min_error}}},
        {"source_data", src},
    };
}

SurfaceDocument surface_document_from_json(const json& j) {
    SurfaceDocument doc;
    try {
        if (j.value("type", std::string()) != "hypersphere_surface") {
            throw IOError("not a surface document (type '" + j.value("type", std::string()) + "')");
        }
        for (const auto& v : j.at("vertices")) {
            doc.vertices.push_back(vertex_from_json(v));
        }
        const std::size_t declared = j.at("vertex_count").get<std::size_t>();
        if (declared != doc.vertices.size()) {
            throw IOError("vertex_count " + std::to_string(declared) + " does not match " +
                          std::to_string(doc.vertices.size()) + " vertices");
        }
        doc.total_beats = j.value("total_beats", 0);
        if (j.contains("source_data")) {
            for (const auto& s : j.at("source_data")) {
                SourceEntry e;
                e.run_id = s.value("run_id", static_cast<std::int64_t>(0));
                e.beat_number = s.value("beat_number", 0);
                e.backend_name = s.value("backend_name", std::string());
                e.timestamp_utc = s.value("timestamp_utc", std::string());
                e.source = s.value("source", std::string());
                doc.sources.push_back(std::move(e));
            }
        }
    } catch (const json::exception& e) {
        throw IOError(std::string("malformed surface document: ") + e.what());
    }
    doc.statistics = compute_statistics(doc.vertices);
    return doc;
}

void save_surface_document(const std::vector<SurfaceVertex>& vertices,
                           const std::vector<SourceEntry>& sources, const fs::path& path) {
    core::write_text(path, surface_document_to_json(vertices, sources).dump(2));
}

SurfaceDocument load_surface_document(const fs::path& path) {
    const std::string text = core::read_text(path);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IOError("cannot parse " + path.string() + ": " + e.what());
    }
    return surface_document_from_json(j);
}

json mesh_to_json(const ReconstructedMesh& mesh) {
    json positions = json::array();
    json colors = json::array();
    json indices = json::array();

    for (const auto& p : mesh.positions) {
        positions.push_back(p.x());
        positions.push_back(p.y());
        positions.push_back(p.z());
    }
    for (int i = 0; i < mesh.resolution; ++i) {
        for (int j = 0; j < mesh.resolution; ++j) {
            colors.push_back(mesh.red(i, j));
            colors.push_back(mesh.green(i, j));
            colors.push_back(mesh.blue(i, j));
        }
    }
    if (mesh.triangles) {
        for (const auto& t : *mesh.triangles) {
            indices.push_back(t[0]);
            indices.push_back(t[1]);
            indices.push_back(t[2]);
        }
    }

    return {
        {"type", "reconstructed_mesh"},
        {"resolution", mesh.resolution},
        {"base_radius", mesh.base_radius},
        {"displacement_scale", mesh.displacement_scale},
        {"degenerate", mesh.degenerate},
        {"source_version", mesh.source_version},
        {"source_vertex_count", mesh.source_vertex_count},
        {"positions", positions},
        {"colors", colors},
        {"indices", indices},
    };
}

} // namespace quantum_surface::io
