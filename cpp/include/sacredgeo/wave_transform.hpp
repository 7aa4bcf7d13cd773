#pragma once

#include "sacredgeo/fields.hpp"
#include "sacredgeo/types.hpp"
#include "sacredgeo/waves.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sacredgeo {

// Proleptic Gregorian date; month and day are 1-based.
struct CalendarDate {
    int year = 2000;
    int month = 1;
    int day = 1;
};

struct GeoLocation {
    double latitude = 0.0;   // degrees
    double longitude = 0.0;  // degrees
};

struct UserWaveData {
    CalendarDate birth_date;
    std::optional<std::string> birth_time;     // "HH:MM"
    std::optional<GeoLocation> birth_location;
    std::optional<std::string> name;
    std::optional<int> life_path_number;       // overrides the date-derived value
};

struct WaveTransformation {
    double base_frequency = 0.0;
    std::vector<double> harmonics;
    double amplitude = 0.0;
    double phase = 0.0;        // [0, τ)
    double modulation = 1.0;
    std::vector<double> interference;
    double resonance = 0.0;    // (0, 1]
};

struct Portal {
    Vec3 position = Vec3::Zero();
    double scale = 0.0;
    double rotation = 0.0;
    double intensity = 0.0;
};

// =============================================================================
// Numerology helpers
// =============================================================================

// Throws InvalidArgumentError for an impossible month or day.
void validate_date(const CalendarDate& date);

int day_of_year(const CalendarDate& date);

// Digit sum of YYYYMMDD reduced to one digit, keeping master numbers 11, 22 and 33.
int life_path_number(const CalendarDate& date);

// Solfeggio/chakra/planetary frequency for a life path number; MI for anything unmapped.
double life_path_frequency(int life_path) noexcept;

// 528 + (Pythagorean letter sum mod 12) * 44. Non-letters count zero.
double name_frequency(std::string_view name) noexcept;

// 396 + (day of year mod 7) * 33.
double birth_frequency(const CalendarDate& date);

// Minutes since midnight for "HH:MM", or nullopt when it does not parse.
std::optional<int> parse_birth_time(std::string_view text) noexcept;

// =============================================================================
// Transformer
// =============================================================================

/**
 * Maps personal data onto wave parameters and applies them to geometry
 * and volume fields. Holds its own field and fractal waves; every method
 * is const and deterministic.
 */
class ConsciousnessWaveTransformer {
public:
    ConsciousnessWaveTransformer();

    /**
     * base frequency from the life path, harmonics base x {1, 2, 3, 5, 8},
     * amplitude 0.5 plus 0.2 (time), 0.2 (location), 0.1 (name), capped at 1,
     * phase from birth month and time, modulation from latitude/longitude,
     * five interference terms (three beats, two means) and the best
     * resonance against the Solfeggio set.
     *
     * An unparseable birth time is logged at WARN and ignored.
     */
    WaveTransformation transform_user_data(const UserWaveData& user) const;

    /**
     * Displaces each vertex along its direction by a primary wave plus the
     * harmonic stack, phased by breath and vertex index. Radius grows by
     * 1 + 0.3 * awareness * amplitude.
     */
    Geometry apply_wave_transformation(const Geometry& geometry,
                                       const WaveTransformation& transformation,
                                       const ConsciousnessState& consciousness,
                                       const BreathState& breath,
                                       double time = 0.0) const;

    /**
     * floor(3 + 7 a) portals on a wavy ring around `center`.
     * Throws InvalidArgumentError for a non-positive zoom.
     */
    std::vector<Portal> generate_fractal_portal(const Vec3& center,
                                                const WaveTransformation& transformation,
                                                const ConsciousnessState& consciousness,
                                                double zoom = 1.0) const;

    /**
     * Field wave times amplitude times awareness, plus 0.3 x the
     * consciousness fractal, all scaled by breath coherence, over [-2, 2)^3.
     */
    VolumeField generate_volume_field(size_t width, size_t height, size_t depth,
                                      const WaveTransformation& transformation,
                                      const ConsciousnessState& consciousness,
                                      const BreathState& breath,
                                      double time = 0.0) const;

private:
    ConsciousnessFieldWave field_wave_;
    FractalWave fractal_wave_;
};

} // namespace sacredgeo
