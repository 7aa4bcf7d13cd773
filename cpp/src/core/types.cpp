#include "sacredgeo/types.hpp"
#include "sacredgeo/error.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

namespace sacredgeo {

void validate_geometry(const Geometry& geometry) {
    const size_t n = geometry.vertices.size();

    if (!(geometry.radius > 0.0) || !std::isfinite(geometry.radius)) {
        throw InvariantViolationError(
            "Geometry radius must be positive and finite, got " + std::to_string(geometry.radius),
            "validate_geometry");
    }

    for (size_t f = 0; f < geometry.faces.size(); ++f) {
        const Face& face = geometry.faces[f];
        if (face.size() < 3) {
            throw InvariantViolationError(
                "Face " + std::to_string(f) + " has " + std::to_string(face.size()) + " indices (need 3+)",
                "validate_geometry");
        }
        for (VertexIndex idx : face) {
            if (idx >= n) {
                throw InvariantViolationError(
                    "Face " + std::to_string(f) + " references vertex " + std::to_string(idx) +
                    " but only " + std::to_string(n) + " vertices exist",
                    "validate_geometry",
                    "Rebuild the face list after changing the vertex list");
            }
        }
    }

    for (size_t e = 0; e < geometry.edges.size(); ++e) {
        const Edge& edge = geometry.edges[e];
        if (edge.first >= n || edge.second >= n) {
            throw InvariantViolationError(
                "Edge " + std::to_string(e) + " (" + std::to_string(edge.first) + ", " +
                std::to_string(edge.second) + ") is out of range for " + std::to_string(n) + " vertices",
                "validate_geometry");
        }
    }
}

std::vector<Edge> edges_from_faces(const std::vector<Face>& faces) {
    std::vector<Edge> edges;
    std::unordered_set<uint64_t> seen;

    for (const Face& face : faces) {
        const size_t count = face.size();
        for (size_t i = 0; i < count; ++i) {
            VertexIndex a = face[i];
            VertexIndex b = face[(i + 1) % count];
            if (seen.insert(edge_key(a, b)).second) {
                edges.emplace_back(a, b);
            }
        }
    }
    return edges;
}

Vec3 safe_normalized(const Vec3& v) noexcept {
    const double norm = v.norm();
    if (!std::isfinite(norm) || norm < NORMALIZE_EPSILON) {
        return Vec3::Zero();
    }
    return v / norm;
}

const char* to_string(BreathPhase phase) noexcept {
    switch (phase) {
        case BreathPhase::Inhale: return "inhale";
        case BreathPhase::Hold:   return "hold";
        case BreathPhase::Exhale: return "exhale";
        case BreathPhase::Pause:  return "pause";
    }
    return "pause";
}

} // namespace sacredgeo
