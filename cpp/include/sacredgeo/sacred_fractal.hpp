#pragma once

#include "sacredgeo/constants.hpp"
#include "sacredgeo/fields.hpp"
#include "sacredgeo/types.hpp"

#include <vector>

namespace sacredgeo {

// =============================================================================
// Planar point sets
// =============================================================================

/**
 * Phyllotaxis spiral in the plane. Point i sits at
 *   angle  = i * (τ / φ²) * (1 + 0.1 c)
 *   radius = √i * scale * (1 + 0.5 c)
 * Throws InvalidArgumentError for a negative point count.
 */
std::vector<Vec2> golden_spiral(int points, double scale = 1.0, double consciousness = 0.5);

struct TreeNode {
    double x = 0.0;
    double y = 0.0;
    int level = 0;
    double angle = 0.0;
};

inline constexpr int MAX_TREE_DEPTH = 16;

/**
 * Binary branching tree rooted at the origin, pointing up.
 *
 * Nodes are emitted depth-first (node, left subtree, right subtree), so a
 * tree of depth d has 2^d - 1 nodes. Each branch turns by (φ - 1) π c,
 * shrinks by F(l+1)/F(l+2) * (0.8 + 0.4 c) and is bent by
 * sin(breath_phase + 0.5 l) * 0.1 * c; children split at ± the pentagram
 * angle. Depth is clamped to [0, MAX_TREE_DEPTH].
 */
std::vector<TreeNode> fibonacci_tree(int depth, double consciousness = 0.5,
                                     double breath_phase = 0.0);

struct MandalaPoint {
    double x = 0.0;
    double y = 0.0;
    double intensity = 0.0;
    int layer = 0;
};

/**
 * Concentric rings. Layer l holds floor(8 (l + 1) (1 + a)) points at
 * radius (l + 1)/layers * radius * (0.9 + 0.2 a), rotated by
 * 0.1 * coherence * sin(τ * intensity); intensity fades outward.
 * Throws InvalidArgumentError for a negative layer count.
 */
std::vector<MandalaPoint> consciousness_mandala(double radius, int layers,
                                                const ConsciousnessState& consciousness,
                                                const BreathState& breath);

// =============================================================================
// Escape-time portal
// =============================================================================

/**
 * Mandelbrot sampler with breath-nudged c and smooth (log-log) escape
 * values, used for portal textures.
 */
class MandalaMandelbrot {
public:
    explicit MandalaMandelbrot(int max_iterations = 64, double escape_radius = 2.0);

    /**
     * c = (x, y) + 0.01 * consciousness * (cos phase, sin phase), z0 = 0.
     * Escaped points give (n + 1 - log2(log2 |z|^2)) / max * consciousness;
     * bounded points give consciousness.
     */
    double calculate(double x, double y, double consciousness = 0.5,
                     double breath_phase = 0.0) const noexcept;

    /**
     * Samples calculate() over a 4/zoom wide window around (center_x, center_y).
     * Throws InvalidArgumentError for a non-positive zoom or a zero-sized grid.
     */
    ScalarField portal_field(size_t width, size_t height,
                             const ConsciousnessState& consciousness,
                             const BreathState& breath,
                             double zoom = 1.0,
                             double center_x = JULIA_CX,
                             double center_y = JULIA_CY) const;

    int max_iterations() const noexcept { return max_iterations_; }
    double escape_radius() const noexcept { return escape_radius_; }

private:
    int max_iterations_;
    double escape_radius_;
};

} // namespace sacredgeo
