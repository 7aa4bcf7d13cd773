/**
 * Noise and shader-style helpers
 *
 * minimal_noise is the shader one-liner
 *   abs(dot(sin(p.yzx*s), cos(p.xzz*s)) / s * .6)
 * evaluated on the CPU; everything else in the engine that wants a
 * deterministic texture builds on it.
 */

#include "sacredgeo/noise.hpp"
#include "sacredgeo/constants.hpp"

#include <algorithm>
#include <cmath>

namespace sacredgeo {

double minimal_noise(double x, double y, double z, double scale) noexcept {
    if (scale == 0.0 || !std::isfinite(scale)) {
        return 0.0;
    }

    const double sx = scale * x;
    const double sy = scale * y;
    const double sz = scale * z;

    // sin(p.yzx * s) . cos(p.xzz * s)
    const double dot = std::sin(sy) * std::cos(sx)
                     + std::sin(sz) * std::cos(sz)
                     + std::sin(sx) * std::cos(sz);

    return std::abs(dot / scale * 0.6);
}

double consciousness_noise(double x, double y, double z,
                           double awareness, double time) noexcept {
    // Recomputed every call: awareness may change between frames.
    const int octaves = static_cast<int>(std::floor(3.0 + awareness * 5.0));
    const double time_offset = (time + awareness * TAU) * 0.1;

    double noise = 0.0;
    double scale = 1.0;
    for (int i = 0; i < octaves; ++i) {
        noise += minimal_noise(x + time_offset,
                               y + time_offset * PHI,
                               z + time_offset * PHI_INVERSE,
                               scale) / scale;
        scale *= 2.0;
    }

    return noise * awareness;
}

double fbm(double x, double y, int octaves) noexcept {
    double value = 0.0;
    double amplitude = 0.5;
    double frequency = 1.0;

    for (int i = 0; i < octaves; ++i) {
        value += minimal_noise(x * frequency, y * frequency, 0.0, 1.0) * amplitude;
        amplitude *= 0.5;
        frequency *= 2.0;
    }
    return value;
}

Color hsv_to_rgb(double h, double s, double v) noexcept {
    const double c = v * s;
    const double x = c * (1.0 - std::abs(std::fmod(h * 6.0, 2.0) - 1.0));
    const double m = v - c;

    double r = 0.0, g = 0.0, b = 0.0;
    if (h < 1.0 / 6.0)      { r = c; g = x; b = 0; }
    else if (h < 2.0 / 6.0) { r = x; g = c; b = 0; }
    else if (h < 3.0 / 6.0) { r = 0; g = c; b = x; }
    else if (h < 4.0 / 6.0) { r = 0; g = x; b = c; }
    else if (h < 5.0 / 6.0) { r = x; g = 0; b = c; }
    else                    { r = c; g = 0; b = x; }

    return {r + m, g + m, b + m};
}

double smoothstep(double edge0, double edge1, double x) noexcept {
    if (edge1 == edge0) {
        return x < edge0 ? 0.0 : 1.0;
    }
    const double t = std::clamp((x - edge0) / (edge1 - edge0), 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

} // namespace sacredgeo
