#pragma once

#include "quantum_surface/core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace quantum_surface::surface {

/**
 * Vertices accumulated over a visualization session.
 *
 * add() appends to a private buffer and bumps the version, which is what
 * reconstruction caches key on. Readers take an immutable snapshot; it is
 * published on the first snapshot() after a change and shared until the
 * next one.
 */
class VertexSet {
public:
    using Snapshot = std::shared_ptr<const std::vector<SurfaceVertex>>;

    VertexSet();

    // Appends one run's vertices; returns the new version.
    std::uint64_t add(const std::vector<SurfaceVertex>& vertices);
    void clear();

    Snapshot snapshot() const;
    std::uint64_t version() const;
    std::size_t size() const;
    int run_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<SurfaceVertex> vertices_;
    mutable Snapshot published_;
    mutable std::uint64_t published_version_ = 0;
    std::uint64_t version_ = 0;
    int runs_ = 0;
};

} // namespace quantum_surface::surface
