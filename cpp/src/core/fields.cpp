#include "sacredgeo/fields.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/noise.hpp"

#include <cmath>
#include <string>

namespace sacredgeo {

ScalarField::ScalarField(size_t w, size_t h) : width(w), height(h) {
    if (w == 0 || h == 0) {
        throw InvalidArgumentError("Field dimensions must be non-zero, got " +
                                   std::to_string(w) + "x" + std::to_string(h),
                                   "ScalarField");
    }
    values.assign(w * h, 0.0f);
}

float ScalarField::at(size_t x, size_t y) const {
    SACREDGEO_CHECK_ARGUMENT(x < width && y < height, "Field sample outside the grid");
    return values[y * width + x];
}

float& ScalarField::at(size_t x, size_t y) {
    SACREDGEO_CHECK_ARGUMENT(x < width && y < height, "Field sample outside the grid");
    return values[y * width + x];
}

VolumeField::VolumeField(size_t w, size_t h, size_t d) : width(w), height(h), depth(d) {
    if (w == 0 || h == 0 || d == 0) {
        throw InvalidArgumentError("Volume dimensions must be non-zero, got " +
                                   std::to_string(w) + "x" + std::to_string(h) + "x" +
                                   std::to_string(d),
                                   "VolumeField");
    }
    values.assign(w * h * d, 0.0f);
}

float VolumeField::at(size_t x, size_t y, size_t z) const {
    SACREDGEO_CHECK_ARGUMENT(x < width && y < height && z < depth, "Volume sample outside the grid");
    return values[(z * height + y) * width + x];
}

namespace {

// Fills `field` with f(fx, fy), fx/fy spanning [-half_extent, half_extent).
template <typename Sample>
void fill_grid(ScalarField& field, double half_extent, Sample&& sample) {
    const double w = static_cast<double>(field.width);
    const double h = static_cast<double>(field.height);
    const double span = half_extent * 2.0;

    for (size_t y = 0; y < field.height; ++y) {
        const double fy = (static_cast<double>(y) / h - 0.5) * span;
        for (size_t x = 0; x < field.width; ++x) {
            const double fx = (static_cast<double>(x) / w - 0.5) * span;
            field.values[y * field.width + x] = static_cast<float>(sample(fx, fy));
        }
    }
}

} // anonymous namespace

ScalarField generate_consciousness_field(size_t width, size_t height,
                                         const ConsciousnessState& consciousness,
                                         const BreathState& breath,
                                         double time) {
    ScalarField field(width, height);
    const double awareness = consciousness.awareness_level;
    const double breath_mod = std::sin(breath.intensity * TAU) * breath.coherence;
    const double gain = 0.8 + breath_mod * 0.4;

    fill_grid(field, 1.0, [&](double fx, double fy) {
        return consciousness_noise(fx, fy, time, awareness, time) * gain;
    });
    return field;
}

ScalarField generate_wave_field(size_t width, size_t height,
                                const ConsciousnessFieldWave& wave,
                                double z, double time) {
    ScalarField field(width, height);
    fill_grid(field, 2.0, [&](double fx, double fy) {
        return wave.field_value_at(fx, fy, z, time);
    });
    return field;
}

ScalarField generate_fractal_wave_field(size_t width, size_t height,
                                        const FractalWave& wave,
                                        double time, double awareness,
                                        const BreathState& breath) {
    ScalarField field(width, height);
    const double phase = breath_phase_angle(breath);
    fill_grid(field, 2.0, [&](double fx, double fy) {
        return wave.consciousness_fractal(fx, fy, time, awareness, phase);
    });
    return field;
}

} // namespace sacredgeo
