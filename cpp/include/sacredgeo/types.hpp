#pragma once

#include <Eigen/Core>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sacredgeo {

using Vec3 = Eigen::Vector3d;
using Vec2 = Eigen::Vector2d;

using VertexIndex = uint32_t;
using Face = std::vector<VertexIndex>;
using Edge = std::pair<VertexIndex, VertexIndex>;

// Norms below this are treated as zero-length directions.
inline constexpr double NORMALIZE_EPSILON = 1e-12;

/**
 * Polyhedral mesh record handed to the renderer.
 *
 * Vertex insertion order is the index space. Faces are closed polygons of
 * three or more indices, edges are index pairs (not necessarily unique in
 * general, unique for everything this library emits). `radius` is the
 * nominal circumscribing radius after modulation and is descriptive only.
 *
 * `dual` is a one-way, shared, immutable reference used for display. Only
 * the octahedron populates it; a null pointer means "no dual available".
 */
struct Geometry {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    std::vector<Edge> edges;
    Vec3 center = Vec3::Zero();
    double radius = 1.0;
    std::shared_ptr<const Geometry> dual;

    bool has_dual() const noexcept { return dual != nullptr; }
    size_t vertex_count() const noexcept { return vertices.size(); }
    size_t face_count() const noexcept { return faces.size(); }
    size_t edge_count() const noexcept { return edges.size(); }
};

// Canonical key for the unordered pair {a, b}: (min << 32) | max.
inline constexpr uint64_t edge_key(VertexIndex a, VertexIndex b) noexcept {
    VertexIndex lo = a < b ? a : b;
    VertexIndex hi = a < b ? b : a;
    return (static_cast<uint64_t>(lo) << 32) | static_cast<uint64_t>(hi);
}

/**
 * Throws InvariantViolationError when a face or edge references a vertex
 * beyond `vertices`, a face has fewer than three indices, or the radius is
 * not a positive finite number.
 */
void validate_geometry(const Geometry& geometry);

/**
 * Walks each face's consecutive index pairs (wrapping around) and returns
 * the unique undirected edges in first-seen order, each stored as it was
 * first walked.
 */
std::vector<Edge> edges_from_faces(const std::vector<Face>& faces);

/**
 * Unit vector along `v`, or the zero vector when |v| is below
 * NORMALIZE_EPSILON or not finite. Never produces NaN.
 */
Vec3 safe_normalized(const Vec3& v) noexcept;

// =============================================================================
// Breath
// =============================================================================

enum class BreathPhase {
    Inhale,
    Hold,
    Exhale,
    Pause
};

const char* to_string(BreathPhase phase) noexcept;

struct BreathPattern {
    double inhale_count = 5.0;
    double hold_count = 0.0;
    double exhale_count = 5.0;
    double pause_count = 0.0;
    double total_cycle = 10.0;  // seconds
};

/**
 * Derived view of a breath cycle at one instant. Recomputed on every
 * query, never a store of truth.
 */
struct BreathState {
    BreathPattern pattern;
    BreathPhase phase = BreathPhase::Pause;
    double intensity = 0.0;   // [0, 1]
    double coherence = 0.0;   // [0, 1]
    double rhythm = 0.0;      // breaths per minute
    double timestamp = 0.0;   // seconds, the instant that was sampled
};

// =============================================================================
// Consciousness
// =============================================================================

/**
 * Descriptor produced by field synthesis and consumed for display.
 * Inputs to the generators only need `awareness_level`.
 */
struct ConsciousnessState {
    double awareness_level = 0.0;  // [0, 1]
    std::vector<std::string> integration_points;
    std::vector<std::string> expansion_vectors;
    std::vector<std::string> shadow_territories;
    std::vector<std::string> light_frequencies;
};

inline ConsciousnessState make_consciousness(double awareness_level) {
    ConsciousnessState state;
    state.awareness_level = awareness_level;
    return state;
}

using Color = std::array<double, 3>;

} // namespace sacredgeo
