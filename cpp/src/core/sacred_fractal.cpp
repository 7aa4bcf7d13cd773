#include "sacredgeo/sacred_fractal.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/waves.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace sacredgeo {

std::vector<Vec2> golden_spiral(int points, double scale, double consciousness) {
    SACREDGEO_CHECK_ARGUMENT(points >= 0, "Spiral point count must be non-negative");

    std::vector<Vec2> result;
    result.reserve(static_cast<size_t>(points));

    const double turn = GOLDEN_ANGLE * (1.0 + consciousness * 0.1);
    const double spread = scale * (1.0 + consciousness * 0.5);
    for (int i = 0; i < points; ++i) {
        const double angle = i * turn;
        const double radius = std::sqrt(static_cast<double>(i)) * spread;
        result.emplace_back(std::cos(angle) * radius, std::sin(angle) * radius);
    }
    return result;
}

namespace {

struct TreeBuilder {
    int depth;
    double consciousness;
    double breath_phase;
    std::vector<TreeNode>& nodes;

    void branch(double x, double y, double angle, int level, double length) const {
        if (level >= depth) return;

        nodes.push_back({x, y, level, angle});

        const double ratio = static_cast<double>(FIBONACCI[level + 1]) /
                             static_cast<double>(FIBONACCI[level + 2]);
        const double turned = angle + PHI_INVERSE * PI * consciousness;
        const double next_length = length * ratio * (0.8 + consciousness * 0.4);
        const double bend = std::sin(breath_phase + level * 0.5) * 0.1 * consciousness;

        const double nx = x + std::cos(turned + bend) * next_length;
        const double ny = y + std::sin(turned + bend) * next_length;

        branch(nx, ny, turned + PENTAGRAM_ANGLE, level + 1, next_length);
        branch(nx, ny, turned - PENTAGRAM_ANGLE, level + 1, next_length);
    }
};

} // anonymous namespace

std::vector<TreeNode> fibonacci_tree(int depth, double consciousness, double breath_phase) {
    const int clamped = std::clamp(depth, 0, MAX_TREE_DEPTH);

    std::vector<TreeNode> nodes;
    nodes.reserve((size_t{1} << clamped) - 1);

    const TreeBuilder builder{clamped, consciousness, breath_phase, nodes};
    builder.branch(0.0, 0.0, PI / 2.0, 0, 1.0);
    return nodes;
}

std::vector<MandalaPoint> consciousness_mandala(double radius, int layers,
                                                const ConsciousnessState& consciousness,
                                                const BreathState& breath) {
    SACREDGEO_CHECK_ARGUMENT(layers >= 0, "Mandala layer count must be non-negative");

    const double awareness = consciousness.awareness_level;
    const double rotation = breath.coherence * std::sin(breath.intensity * TAU) * 0.1;

    std::vector<MandalaPoint> points;
    for (int layer = 0; layer < layers; ++layer) {
        const double layer_radius = radius * (layer + 1) / layers;
        const double ring_radius = layer_radius * (0.9 + awareness * 0.2);
        const int count = static_cast<int>(std::floor(8.0 * (layer + 1) * (1.0 + awareness)));
        const double intensity = awareness * (1.0 - static_cast<double>(layer) / layers) *
                                 (0.8 + breath.coherence * 0.4);

        for (int i = 0; i < count; ++i) {
            const double angle = static_cast<double>(i) / count * TAU + rotation;
            points.push_back({std::cos(angle) * ring_radius,
                              std::sin(angle) * ring_radius,
                              intensity,
                              layer});
        }
    }
    return points;
}

// =============================================================================
// MandalaMandelbrot
// =============================================================================

MandalaMandelbrot::MandalaMandelbrot(int max_iterations, double escape_radius)
    : max_iterations_(max_iterations), escape_radius_(escape_radius) {
    SACREDGEO_CHECK_ARGUMENT(max_iterations > 0, "Iteration cap must be positive");
    if (!(escape_radius > 0.0) || !std::isfinite(escape_radius)) {
        throw InvalidArgumentError("Escape radius must be positive, got " +
                                   std::to_string(escape_radius),
                                   "MandalaMandelbrot");
    }
}

double MandalaMandelbrot::calculate(double x, double y, double consciousness,
                                    double breath_phase) const noexcept {
    const double cx = x + std::cos(breath_phase) * 0.01 * consciousness;
    const double cy = y + std::sin(breath_phase) * 0.01 * consciousness;
    const double bound = escape_radius_ * escape_radius_;

    double zx = 0.0;
    double zy = 0.0;
    int iterations = 0;
    while (iterations < max_iterations_ && zx * zx + zy * zy < bound) {
        const double next_x = zx * zx - zy * zy + cx;
        zy = 2.0 * zx * zy + cy;
        zx = next_x;
        ++iterations;
    }

    if (iterations >= max_iterations_) {
        return consciousness;
    }

    // log2(log2 |z|^2) is undefined until |z|^2 > 1; small escape radii fall back to the raw count.
    const double magnitude = zx * zx + zy * zy;
    const double smoothed = magnitude > 1.0
        ? iterations + 1.0 - std::log2(std::log2(magnitude))
        : static_cast<double>(iterations);
    return smoothed / max_iterations_ * consciousness;
}

ScalarField MandalaMandelbrot::portal_field(size_t width, size_t height,
                                            const ConsciousnessState& consciousness,
                                            const BreathState& breath,
                                            double zoom,
                                            double center_x,
                                            double center_y) const {
    if (!(zoom > 0.0) || !std::isfinite(zoom)) {
        throw InvalidArgumentError("Portal zoom must be positive, got " + std::to_string(zoom),
                                   "MandalaMandelbrot::portal_field",
                                   "Pass a zoom > 0");
    }

    ScalarField field(width, height);
    const double phase = breath_phase_angle(breath);
    const double awareness = consciousness.awareness_level;
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);

    for (size_t y = 0; y < height; ++y) {
        const double fy = (static_cast<double>(y) / h - 0.5) * 4.0 / zoom + center_y;
        for (size_t x = 0; x < width; ++x) {
            const double fx = (static_cast<double>(x) / w - 0.5) * 4.0 / zoom + center_x;
            field.values[y * width + x] = static_cast<float>(calculate(fx, fy, awareness, phase));
        }
    }
    return field;
}

} // namespace sacredgeo
