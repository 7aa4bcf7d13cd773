#pragma once

#include "sacredgeo/types.hpp"
#include "sacredgeo/waves.hpp"

#include <cstddef>
#include <vector>

namespace sacredgeo {

/**
 * Row-major width x height grid of floats, ready for texture upload.
 * Sample (x, y) lives at values[y * width + x].
 */
struct ScalarField {
    size_t width = 0;
    size_t height = 0;
    std::vector<float> values;

    ScalarField() = default;
    ScalarField(size_t w, size_t h);

    // Bounds-checked; throws InvalidArgumentError outside the grid.
    float at(size_t x, size_t y) const;
    float& at(size_t x, size_t y);

    size_t size() const noexcept { return values.size(); }
    bool empty() const noexcept { return values.empty(); }
};

// width x height x depth grid, z-major: (x, y, z) at values[(z * height + y) * width + x].
struct VolumeField {
    size_t width = 0;
    size_t height = 0;
    size_t depth = 0;
    std::vector<float> values;

    VolumeField() = default;
    VolumeField(size_t w, size_t h, size_t d);

    float at(size_t x, size_t y, size_t z) const;

    size_t size() const noexcept { return values.size(); }
};

/**
 * consciousness_noise over [-1, 1)^2 with z = time, scaled by
 * 0.8 + 0.4 * sin(τ * breath.intensity) * breath.coherence.
 *
 * Throws InvalidArgumentError for a zero width or height.
 */
ScalarField generate_consciousness_field(size_t width, size_t height,
                                         const ConsciousnessState& consciousness,
                                         const BreathState& breath,
                                         double time = 0.0);

// ConsciousnessFieldWave::field_value_at over [-2, 2)^2 on the plane z.
ScalarField generate_wave_field(size_t width, size_t height,
                                const ConsciousnessFieldWave& wave,
                                double z, double time);

// FractalWave::consciousness_fractal over [-2, 2)^2, phase from breath_phase_angle().
ScalarField generate_fractal_wave_field(size_t width, size_t height,
                                        const FractalWave& wave,
                                        double time, double awareness,
                                        const BreathState& breath);

} // namespace sacredgeo
