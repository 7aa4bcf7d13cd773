/**
 * Platonic solid construction
 *
 * Coordinates are the textbook closed forms for a circumscribing radius r:
 *   tetrahedron  apex (0, r, 0), base ring at y = -r/3
 *   cube         (±r/√3, ±r/√3, ±r/√3)
 *   octahedron   (±r, 0, 0), (0, ±r, 0), (0, 0, ±r)
 *   dodecahedron cube corners plus (0, ±sφ, ±s/φ) and cyclic permutations, s = r/√3
 *   icosahedron  (0, ±s, ±sφ) and cyclic permutations, s = r/√(φ² + 1)
 * Faces wind counter-clockwise seen from outside.
 */

#include "sacredgeo/platonic.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/waves.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace sacredgeo {

const char* to_string(PlatonicKind kind) noexcept {
    switch (kind) {
        case PlatonicKind::Tetrahedron:  return "tetrahedron";
        case PlatonicKind::Cube:         return "cube";
        case PlatonicKind::Octahedron:   return "octahedron";
        case PlatonicKind::Dodecahedron: return "dodecahedron";
        case PlatonicKind::Icosahedron:  return "icosahedron";
    }
    return "tetrahedron";
}

void PlatonicSolidGenerator::check_radius(double radius) {
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw InvalidArgumentError("Solid radius must be positive and finite, got " +
                                   std::to_string(radius),
                                   "PlatonicSolidGenerator",
                                   "Pass a radius > 0");
    }
}

Geometry PlatonicSolidGenerator::assemble(std::vector<Vec3> vertices, std::vector<Face> faces,
                                          double radius) {
    Geometry g;
    g.edges = edges_from_faces(faces);
    g.vertices = std::move(vertices);
    g.faces = std::move(faces);
    g.center = Vec3::Zero();
    g.radius = radius;
    return g;
}

Geometry PlatonicSolidGenerator::tetrahedron(double radius, double awareness) {
    const double r = radius * modulation(awareness);
    check_radius(r);

    const double a = r * std::sqrt(8.0 / 9.0);
    const double c = r * std::sqrt(2.0 / 3.0);
    const double d = r * std::sqrt(2.0 / 9.0);
    const double low = -r / 3.0;

    std::vector<Vec3> vertices = {
        Vec3(0.0, r, 0.0),
        Vec3(-c, low, -d),
        Vec3(c, low, -d),
        Vec3(0.0, low, a),
    };

    std::vector<Face> faces = {
        {0, 2, 1},
        {0, 3, 2},
        {0, 1, 3},
        {1, 2, 3},
    };

    return assemble(std::move(vertices), std::move(faces), r);
}

Geometry PlatonicSolidGenerator::cube(double radius, double awareness) {
    const double r = radius * modulation(awareness);
    check_radius(r);
    const double s = r / std::sqrt(3.0);

    std::vector<Vec3> vertices = {
        Vec3(-s, -s, -s),
        Vec3(s, -s, -s),
        Vec3(s, s, -s),
        Vec3(-s, s, -s),
        Vec3(-s, -s, s),
        Vec3(s, -s, s),
        Vec3(s, s, s),
        Vec3(-s, s, s),
    };

    std::vector<Face> faces = {
        {0, 3, 2, 1},
        {4, 5, 6, 7},
        {0, 1, 5, 4},
        {2, 3, 7, 6},
        {0, 4, 7, 3},
        {1, 2, 6, 5},
    };

    return assemble(std::move(vertices), std::move(faces), r);
}

Geometry PlatonicSolidGenerator::octahedron(double radius, double awareness) {
    const double r = radius * modulation(awareness);
    check_radius(r);

    std::vector<Vec3> vertices = {
        Vec3(r, 0.0, 0.0),
        Vec3(-r, 0.0, 0.0),
        Vec3(0.0, r, 0.0),
        Vec3(0.0, -r, 0.0),
        Vec3(0.0, 0.0, r),
        Vec3(0.0, 0.0, -r),
    };

    std::vector<Face> faces = {
        {0, 2, 4},
        {0, 4, 3},
        {0, 3, 5},
        {0, 5, 2},
        {1, 4, 2},
        {1, 3, 4},
        {1, 5, 3},
        {1, 2, 5},
    };

    Geometry g = assemble(std::move(vertices), std::move(faces), r);
    g.dual = std::make_shared<const Geometry>(cube(radius, awareness));
    return g;
}

Geometry PlatonicSolidGenerator::dodecahedron(double radius, double awareness) {
    const double r = radius * modulation(awareness);
    check_radius(r);
    const double s = r / std::sqrt(3.0);
    const double big = s * PHI;
    const double small = s / PHI;

    std::vector<Vec3> vertices = {
        // cube corners
        Vec3(s, s, s),
        Vec3(s, s, -s),
        Vec3(s, -s, s),
        Vec3(s, -s, -s),
        Vec3(-s, s, s),
        Vec3(-s, s, -s),
        Vec3(-s, -s, s),
        Vec3(-s, -s, -s),
        // golden rectangles
        Vec3(0.0, big, small),
        Vec3(0.0, big, -small),
        Vec3(0.0, -big, small),
        Vec3(0.0, -big, -small),
        Vec3(small, 0.0, big),
        Vec3(small, 0.0, -big),
        Vec3(-small, 0.0, big),
        Vec3(-small, 0.0, -big),
        Vec3(big, small, 0.0),
        Vec3(big, -small, 0.0),
        Vec3(-big, small, 0.0),
        Vec3(-big, -small, 0.0),
    };

    std::vector<Face> faces = {
        {0, 12, 2, 17, 16},
        {1, 16, 17, 3, 13},
        {4, 18, 19, 6, 14},
        {5, 15, 7, 19, 18},
        {8, 0, 16, 1, 9},
        {10, 11, 3, 17, 2},
        {12, 14, 6, 10, 2},
        {13, 3, 11, 7, 15},
        {4, 14, 12, 0, 8},
        {5, 9, 1, 13, 15},
        {6, 19, 7, 11, 10},
        {8, 9, 5, 18, 4},
    };

    return assemble(std::move(vertices), std::move(faces), r);
}

Geometry PlatonicSolidGenerator::icosahedron(double radius, double awareness) {
    const double r = radius * modulation(awareness);
    check_radius(r);
    const double s = r / std::sqrt(PHI * PHI + 1.0);
    const double p = s * PHI;

    std::vector<Vec3> vertices = {
        Vec3(0.0, s, p),
        Vec3(0.0, s, -p),
        Vec3(0.0, -s, p),
        Vec3(0.0, -s, -p),
        Vec3(s, p, 0.0),
        Vec3(s, -p, 0.0),
        Vec3(-s, p, 0.0),
        Vec3(-s, -p, 0.0),
        Vec3(p, 0.0, s),
        Vec3(p, 0.0, -s),
        Vec3(-p, 0.0, s),
        Vec3(-p, 0.0, -s),
    };

    std::vector<Face> faces = {
        {0, 2, 8},   {0, 8, 4},   {0, 4, 6},   {0, 6, 10},  {0, 10, 2},
        {3, 11, 1},  {3, 7, 11},  {3, 5, 7},   {3, 9, 5},   {3, 1, 9},
        {2, 5, 8},   {8, 5, 9},   {8, 9, 4},   {4, 9, 1},   {4, 1, 6},
        {6, 1, 11},  {6, 11, 10}, {10, 11, 7}, {10, 7, 2},  {2, 7, 5},
    };

    return assemble(std::move(vertices), std::move(faces), r);
}

Geometry PlatonicSolidGenerator::make(PlatonicKind kind, double radius, double awareness) {
    switch (kind) {
        case PlatonicKind::Tetrahedron:  return tetrahedron(radius, awareness);
        case PlatonicKind::Cube:         return cube(radius, awareness);
        case PlatonicKind::Octahedron:   return octahedron(radius, awareness);
        case PlatonicKind::Dodecahedron: return dodecahedron(radius, awareness);
        case PlatonicKind::Icosahedron:  return icosahedron(radius, awareness);
    }
    SACREDGEO_THROW(ErrorCode::INTERNAL_ERROR, "Unhandled PlatonicKind");
}

// =============================================================================
// Chambers and breath modulation
// =============================================================================

Geometry octagonal_chamber(double radius, double awareness, bool nested) {
    SACREDGEO_CHECK_ARGUMENT(radius > 0.0 && std::isfinite(radius),
                             "Chamber radius must be positive and finite");

    const double modulation = PlatonicSolidGenerator::modulation(awareness);
    Geometry g;
    g.center = Vec3::Zero();
    g.radius = radius * modulation;

    for (int i = 0; i < 8; ++i) {
        const double angle = i * PI / 4.0;
        g.vertices.emplace_back(std::cos(angle) * radius * modulation,
                                std::sin(angle) * radius * modulation,
                                0.0);
    }

    if (!nested) {
        for (VertexIndex i = 0; i < 8; ++i) {
            g.edges.emplace_back(i, (i + 1) % 8);
        }
        return g;
    }

    const double inner_radius = radius / PHI;
    for (int i = 0; i < 8; ++i) {
        const double angle = i * PI / 4.0 + PI / 8.0;
        g.vertices.emplace_back(std::cos(angle) * inner_radius * modulation,
                                std::sin(angle) * inner_radius * modulation,
                                0.0);
    }
    g.vertices.emplace_back(0.0, 0.0, 0.0);
    const VertexIndex centre = 16;

    for (VertexIndex i = 0; i < 8; ++i) {
        const VertexIndex next = (i + 1) % 8;
        const VertexIndex inner = i + 8;
        const VertexIndex inner_next = next + 8;

        // outer edge with the inner vertex that sits between its endpoints
        g.faces.push_back({i, next, inner});
        // outer vertex bridging two consecutive inner vertices
        g.faces.push_back({next, inner_next, inner});
        // inner ring fan to the centre
        g.faces.push_back({inner, inner_next, centre});
    }

    for (VertexIndex i = 0; i < 8; ++i) {
        const VertexIndex next = (i + 1) % 8;
        g.edges.emplace_back(i, next);
        g.edges.emplace_back(i + 8, next + 8);
        g.edges.emplace_back(i, i + 8);
        g.edges.emplace_back(i + 8, centre);
    }

    return g;
}

Geometry modulate_with_breath(const Geometry& geometry, const BreathState& breath, double intensity) {
    validate_geometry(geometry);
    SACREDGEO_CHECK_ARGUMENT(intensity >= 0.0 && intensity < 1.0,
                             "Breath modulation intensity must lie in [0, 1)");

    const double coherence = std::clamp(breath.coherence, 0.0, 1.0);
    const double factor = 1.0 + std::sin(breath_phase_angle(breath)) * intensity * coherence;

    Geometry out = geometry;
    for (Vec3& vertex : out.vertices) {
        const double distance = vertex.norm();
        vertex = safe_normalized(vertex) * (distance * factor);
    }
    out.radius = geometry.radius * factor;
    return out;
}

} // namespace sacredgeo
