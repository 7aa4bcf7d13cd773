#pragma once

#include "sacredgeo/types.hpp"

namespace sacredgeo {

/**
 * Cheap bounded pseudo-noise:
 *   |dot(sin(p.yzx * s), cos(p.xzz * s)) / s * 0.6|
 *
 * Non-negative, at most 1.8/s. Returns 0 for a zero or non-finite scale.
 */
double minimal_noise(double x, double y, double z, double scale = 1.0) noexcept;

/**
 * Awareness-modulated fractal sum of minimal_noise.
 *
 * Uses 3 + floor(awareness * 5) octaves at doubling scales. Each octave's
 * sample point is offset by (time + awareness * τ) * 0.1 along x, the same
 * times φ along y and times 1/φ along z. The sum is multiplied by awareness.
 */
double consciousness_noise(double x, double y, double z,
                           double awareness, double time = 0.0) noexcept;

// Fractal Brownian motion over minimal_noise (amplitude 0.5, halving; frequency doubling).
double fbm(double x, double y, int octaves = 4) noexcept;

// Hue/saturation/value in [0, 1] to linear RGB.
Color hsv_to_rgb(double h, double s, double v) noexcept;

// Hermite step; a degenerate edge pair behaves as a hard step at edge0.
double smoothstep(double edge0, double edge1, double x) noexcept;

inline double mix(double a, double b, double t) noexcept {
    return a * (1.0 - t) + b * t;
}

} // namespace sacredgeo
