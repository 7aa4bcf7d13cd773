/**
 * Fractal mesh refinement
 *
 * Two families of operation on a Geometry record:
 *   - midpoint subdivision (topology-changing, edge-map shared midpoints)
 *   - escape-time / angular vertex displacement (topology-preserving,
 *     except the Sierpinski mesh form)
 * Plus the scalar point displacements the archetype fractals sample.
 */

#include "sacredgeo/subdivision.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/logging.hpp"

#include <cmath>
#include <unordered_map>

namespace sacredgeo {

const char* to_string(FractalKind kind) noexcept {
    switch (kind) {
        case FractalKind::Mandelbrot: return "mandelbrot";
        case FractalKind::Julia:      return "julia";
        case FractalKind::Dragon:     return "dragon";
        case FractalKind::Sierpinski: return "sierpinski";
    }
    return "mandelbrot";
}

int escape_time_iterations(double zx, double zy, double cx, double cy, int max_iterations) noexcept {
    int iterations = 0;
    while (iterations < max_iterations && zx * zx + zy * zy < 4.0) {
        const double next_x = zx * zx - zy * zy + cx;
        zy = 2.0 * zx * zy + cy;
        zx = next_x;
        ++iterations;
    }
    return iterations;
}

namespace {

/**
 * Midpoint cache for one pass: each undirected edge gets exactly one new
 * vertex, appended to `vertices` the first time the edge is seen.
 */
class MidpointCache {
public:
    explicit MidpointCache(std::vector<Vec3>& vertices) : vertices_(vertices) {}

    template <typename Displace>
    VertexIndex get(VertexIndex a, VertexIndex b, Displace&& displace) {
        const uint64_t key = edge_key(a, b);
        auto it = index_.find(key);
        if (it != index_.end()) {
            return it->second;
        }
        Vec3 midpoint = (vertices_[a] + vertices_[b]) * 0.5;
        displace(midpoint);
        const auto index = static_cast<VertexIndex>(vertices_.size());
        vertices_.push_back(midpoint);
        index_.emplace(key, index);
        return index;
    }

    VertexIndex get(VertexIndex a, VertexIndex b) {
        return get(a, b, [](Vec3&) {});
    }

private:
    std::vector<Vec3>& vertices_;
    std::unordered_map<uint64_t, VertexIndex> index_;
};

Geometry with_topology(const Geometry& source, std::vector<Vec3> vertices, std::vector<Face> faces) {
    Geometry out;
    out.edges = edges_from_faces(faces);
    out.vertices = std::move(vertices);
    out.faces = std::move(faces);
    out.center = source.center;
    out.radius = source.radius;
    out.dual = source.dual;
    return out;
}

Geometry subdivide_pass(const Geometry& geometry, int level, std::optional<double> awareness) {
    std::vector<Vec3> vertices = geometry.vertices;
    std::vector<Face> faces;
    faces.reserve(geometry.faces.size() * 4);

    const double offset = awareness ? *awareness * 0.1 * std::sin(level * PHI) : 0.0;
    auto displace = [&](Vec3& midpoint) {
        if (awareness) {
            midpoint += safe_normalized(midpoint) * offset;
        }
    };

    MidpointCache midpoints(vertices);
    for (const Face& face : geometry.faces) {
        const size_t n = face.size();
        Face inner(n);
        for (size_t i = 0; i < n; ++i) {
            inner[i] = midpoints.get(face[i], face[(i + 1) % n], displace);
        }
        for (size_t i = 0; i < n; ++i) {
            faces.push_back({face[i], inner[i], inner[(i + n - 1) % n]});
        }
        faces.push_back(std::move(inner));
    }

    LOG_DEBUG(Subdivision, "Subdivision pass ", level, ": ", geometry.vertices.size(), " -> ",
              vertices.size(), " vertices, ", faces.size(), " faces");
    return with_topology(geometry, std::move(vertices), std::move(faces));
}

Geometry sierpinski_pass(const Geometry& geometry) {
    std::vector<Vec3> vertices = geometry.vertices;
    std::vector<Face> faces;
    faces.reserve(geometry.faces.size() * 3);

    MidpointCache midpoints(vertices);
    size_t passed_through = 0;
    for (const Face& face : geometry.faces) {
        if (face.size() != 3) {
            faces.push_back(face);
            ++passed_through;
            continue;
        }
        const VertexIndex a = face[0];
        const VertexIndex b = face[1];
        const VertexIndex c = face[2];
        const VertexIndex ab = midpoints.get(a, b);
        const VertexIndex bc = midpoints.get(b, c);
        const VertexIndex ca = midpoints.get(c, a);

        faces.push_back({a, ab, ca});
        faces.push_back({ab, b, bc});
        faces.push_back({ca, bc, c});
    }

    if (passed_through > 0) {
        LOG_DEBUG(Subdivision, "Sierpinski pass kept ", passed_through, " non-triangular faces");
    }
    return with_topology(geometry, std::move(vertices), std::move(faces));
}

Geometry escape_time_pass(const Geometry& geometry, double scale, int level, bool julia) {
    const int max_iterations = 8 + level * 2;
    const double weight = julia ? 0.15 : 0.1;

    Geometry out = geometry;
    for (Vec3& vertex : out.vertices) {
        const double x = vertex.x() * scale;
        const double y = vertex.y() * scale;
        const int iterations = julia
            ? escape_time_iterations(x, y, JULIA_CX, JULIA_CY, max_iterations)
            : escape_time_iterations(x, y, x, y, max_iterations);

        const double displacement =
            static_cast<double>(iterations) / max_iterations * scale * weight;
        vertex += safe_normalized(vertex) * displacement;
    }
    return out;
}

Geometry dragon_pass(const Geometry& geometry, double scale, int level) {
    Geometry out = geometry;
    const double count = static_cast<double>(out.vertices.size());
    const double bend = std::sin(level * PHI) * scale;

    for (size_t index = 0; index < out.vertices.size(); ++index) {
        const double angle = static_cast<double>(index) / count * TAU + bend;
        const double displacement = scale * 0.1 * std::sin(angle * 4.0);
        const Vec3 direction = safe_normalized(
            Vec3(std::cos(angle), std::sin(angle), std::sin(angle * PHI)));
        out.vertices[index] += direction * displacement;
    }
    return out;
}

Geometry fractal_pass(const Geometry& geometry, int level, FractalKind kind, double awareness) {
    const double scale = std::pow(PHI_INVERSE, level) * awareness;

    switch (kind) {
        case FractalKind::Mandelbrot: return escape_time_pass(geometry, scale, level, false);
        case FractalKind::Julia:      return escape_time_pass(geometry, scale, level, true);
        case FractalKind::Dragon:     return dragon_pass(geometry, scale, level);
        case FractalKind::Sierpinski: return sierpinski_pass(geometry);
    }
    SACREDGEO_THROW(ErrorCode::INTERNAL_ERROR, "Unhandled FractalKind");
}

} // anonymous namespace

// =============================================================================
// Mesh refinement
// =============================================================================

Geometry subdivide(const Geometry& geometry, int levels, std::optional<double> awareness) {
    validate_geometry(geometry);

    const double detail = awareness.value_or(0.5);
    const int passes = static_cast<int>(std::floor(levels * (0.5 + detail * 0.5)));

    Geometry current = geometry;
    for (int level = 0; level < passes; ++level) {
        current = subdivide_pass(current, level, awareness);
    }
    return current;
}

Geometry subdivide_once(const Geometry& geometry, int level, std::optional<double> awareness) {
    validate_geometry(geometry);
    return subdivide_pass(geometry, level, awareness);
}

Geometry fractal_subdivide(const Geometry& geometry, int levels, std::optional<double> awareness,
                           FractalKind kind) {
    validate_geometry(geometry);

    const double a = awareness.value_or(0.5);
    Geometry current = geometry;
    for (int level = 0; level < levels; ++level) {
        current = fractal_pass(current, level, kind, a);
    }
    LOG_DEBUG(Subdivision, "Fractal subdivision (", to_string(kind), ", ", levels, " levels): ",
              current.vertices.size(), " vertices");
    return current;
}

Geometry apply_fractal_pattern(const Geometry& geometry, int level, FractalKind kind,
                               double awareness) {
    validate_geometry(geometry);
    return fractal_pass(geometry, level, kind, awareness);
}

Geometry sierpinski_mesh(const Geometry& geometry) {
    validate_geometry(geometry);
    return sierpinski_pass(geometry);
}

// =============================================================================
// Point displacement
// =============================================================================

Vec3 mandelbrot_displacement(double x, double y, double z, double scale) noexcept {
    const int iterations = escape_time_iterations(x, y, x, y, POINT_DISPLACEMENT_ITERATIONS);
    const double d = static_cast<double>(iterations) / POINT_DISPLACEMENT_ITERATIONS * scale;
    return Vec3(d * std::cos(z), d * std::sin(z), d * std::sin(x + y));
}

Vec3 julia_displacement(double x, double y, double z, double scale) noexcept {
    const int iterations =
        escape_time_iterations(x, y, JULIA_CX, JULIA_CY, POINT_DISPLACEMENT_ITERATIONS);
    const double d = static_cast<double>(iterations) / POINT_DISPLACEMENT_ITERATIONS * scale;
    return Vec3(d * std::sin(z * PHI),
                d * std::cos(z * PHI),
                d * std::sin((x + y) * PHI_INVERSE));
}

Vec3 dragon_displacement(double x, double y, double z, double scale, double phase) noexcept {
    const double angle = std::atan2(y, x) + phase;
    const double radius = std::sqrt(x * x + y * y);
    const double d = scale * std::sin(angle * 4.0 + z);
    return Vec3(d * std::cos(angle + phase),
                d * std::sin(angle + phase),
                d * std::sin(radius + phase));
}

Vec3 sierpinski_displacement(double x, double y, double z, double scale) noexcept {
    double displacement = 0.0;
    double current = scale;
    double cell = 1.0;

    for (int i = 0; i < 3; ++i) {
        // Truncated remainder: negative cells give -1, which never counts as odd.
        const double parity = std::fmod(std::floor(x * cell), 2.0)
                            + std::fmod(std::floor(y * cell), 2.0)
                            + std::fmod(std::floor(z * cell), 2.0);
        if (std::fmod(parity, 2.0) == 1.0) {
            displacement += current;
        }
        current *= 0.5;
        cell *= 2.0;
    }

    return Vec3(displacement * std::cos(x + y),
                displacement * std::sin(y + z),
                displacement * std::sin(z + x));
}

Vec3 fractal_displacement(FractalKind kind, double x, double y, double z,
                          double scale, double phase) noexcept {
    switch (kind) {
        case FractalKind::Mandelbrot: return mandelbrot_displacement(x, y, z, scale);
        case FractalKind::Julia:      return julia_displacement(x, y, z, scale);
        case FractalKind::Dragon:     return dragon_displacement(x, y, z, scale, phase);
        case FractalKind::Sierpinski: return sierpinski_displacement(x, y, z, scale);
    }
    return Vec3::Zero();
}

} // namespace sacredgeo
