#pragma once

#include "sacredgeo/types.hpp"

#include <optional>

namespace sacredgeo {

enum class FractalKind {
    Mandelbrot,
    Julia,
    Dragon,
    Sierpinski
};

const char* to_string(FractalKind kind) noexcept;

/**
 * Escape-time count for z <- z^2 + c starting at (zx, zy).
 *
 * Stops as soon as |z|^2 >= 4 (checked before each step) or after
 * max_iterations steps, so the result is always in [0, max_iterations].
 * Non-finite input escapes immediately with 0.
 */
int escape_time_iterations(double zx, double zy, double cx, double cy, int max_iterations) noexcept;

// =============================================================================
// Mesh refinement
// =============================================================================

/**
 * Uniform midpoint subdivision.
 *
 * Runs floor(levels * (0.5 + 0.5 a)) passes, a = awareness or 0.5 when
 * no awareness is supplied. levels <= 0 returns an unchanged copy.
 * The input is validated first; center, radius and dual carry over.
 */
Geometry subdivide(const Geometry& geometry, int levels,
                   std::optional<double> awareness = std::nullopt);

/**
 * One pass. Every edge gets a single shared midpoint (keyed by edge_key);
 * an n-gon becomes n corner triangles (v_i, m_i, m_{i-1}) plus the inner
 * polygon of its midpoints, so triangles split four ways. With awareness
 * set, each new midpoint moves along its own direction by
 * awareness * 0.1 * sin(level * φ). Edges are rebuilt from the faces.
 */
Geometry subdivide_once(const Geometry& geometry, int level,
                        std::optional<double> awareness = std::nullopt);

/**
 * `levels` passes of apply_fractal_pattern (not awareness-scaled).
 * Awareness defaults to 0.5.
 */
Geometry fractal_subdivide(const Geometry& geometry, int levels,
                           std::optional<double> awareness = std::nullopt,
                           FractalKind kind = FractalKind::Mandelbrot);

/**
 * One fractal pass at `level` with scale = (1/φ)^level * awareness.
 *
 *   Mandelbrot  c = (x s, y s), offset iter/max * s * 0.1 along the vertex direction
 *   Julia       c = (-0.7269, 0.1889), offset iter/max * s * 0.15
 *   Dragon      angular offset by vertex index, s * 0.1 * sin(4 θ)
 *   Sierpinski  sierpinski_mesh(), scale unused
 *
 * max = 8 + 2 * level. Only Sierpinski changes topology.
 */
Geometry apply_fractal_pattern(const Geometry& geometry, int level, FractalKind kind,
                               double awareness);

/**
 * Replaces each triangle (a, b, c) with (a, m_ab, m_ca), (m_ab, b, m_bc)
 * and (m_ca, m_bc, c), leaving out the centre. Midpoints are shared
 * between neighbouring triangles. Faces with more than three corners pass
 * through unchanged.
 */
Geometry sierpinski_mesh(const Geometry& geometry);

// =============================================================================
// Point displacement (archetype fractals)
// =============================================================================

inline constexpr int POINT_DISPLACEMENT_ITERATIONS = 8;

// Mandelbrot count at (x, y) as fraction of 8 times scale, spread as (cos z, sin z, sin(x + y)).
Vec3 mandelbrot_displacement(double x, double y, double z, double scale) noexcept;

// Julia count from z0 = (x, y), spread as (sin zφ, cos zφ, sin((x + y)/φ)).
Vec3 julia_displacement(double x, double y, double z, double scale) noexcept;

/**
 * θ = atan2(y, x) + phase, magnitude scale * sin(4θ + z), direction
 * (cos(θ + phase), sin(θ + phase), sin(|(x, y)| + phase)).
 */
Vec3 dragon_displacement(double x, double y, double z, double scale, double phase) noexcept;

/**
 * Three-level parity of floor(coord * 2^i) mod 2 summed across x, y, z;
 * each odd level adds the current scale, which halves per level.
 */
Vec3 sierpinski_displacement(double x, double y, double z, double scale) noexcept;

// Exhaustive dispatch over the four displacement kinds; phase only matters for Dragon.
Vec3 fractal_displacement(FractalKind kind, double x, double y, double z,
                          double scale, double phase) noexcept;

} // namespace sacredgeo
