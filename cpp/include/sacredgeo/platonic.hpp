#pragma once

#include "sacredgeo/types.hpp"

namespace sacredgeo {

enum class PlatonicKind {
    Tetrahedron,
    Cube,
    Octahedron,
    Dodecahedron,
    Icosahedron
};

const char* to_string(PlatonicKind kind) noexcept;

/**
 * Closed-form convex polyhedra centred on the origin.
 *
 * Every constructor takes the circumscribing radius and an awareness level;
 * all coordinates (and the reported radius) are scaled by
 * 1 + awareness * 0.1. Edges are the unique face-boundary pairs.
 *
 * Throws InvalidArgumentError for a non-positive or non-finite radius.
 */
class PlatonicSolidGenerator {
public:
    static Geometry tetrahedron(double radius = 1.0, double awareness = 0.0);

    // Vertices at ±radius/√3 on each axis.
    static Geometry cube(double radius = 1.0, double awareness = 0.0);

    // Carries a cube of the same radius as its display-only dual.
    static Geometry octahedron(double radius = 1.0, double awareness = 0.0);

    // Cube corners plus three golden rectangles. No dual: building one here would recurse.
    static Geometry dodecahedron(double radius = 1.0, double awareness = 0.0);

    // Three orthogonal golden rectangles. No dual, same reason as the dodecahedron.
    static Geometry icosahedron(double radius = 1.0, double awareness = 0.0);

    static Geometry make(PlatonicKind kind, double radius = 1.0, double awareness = 0.0);

    static double modulation(double awareness) noexcept { return 1.0 + awareness * 0.1; }

private:
    static Geometry assemble(std::vector<Vec3> vertices, std::vector<Face> faces, double radius);
    static void check_radius(double radius);
};

/**
 * Flat octagonal floor plan in the z = 0 plane.
 *
 * Nested: 8 outer vertices, 8 inner vertices at radius/φ rotated by π/8,
 * and a centre vertex; 24 triangles and 32 edges. Otherwise only the outer
 * ring with 8 edges and no faces.
 */
Geometry octagonal_chamber(double radius = 5.0, double awareness = 0.0, bool nested = true);

/**
 * Scales every vertex radially by 1 + sin(breath angle) * intensity * coherence
 * and the radius by the same factor. Zero-length vertices stay at the origin.
 */
Geometry modulate_with_breath(const Geometry& geometry, const BreathState& breath,
                              double intensity = 0.1);

} // namespace sacredgeo
