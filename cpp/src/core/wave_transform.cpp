/**
 * Personal data to wave parameters
 *
 * Numerology reduces a birth date and name to frequencies; those drive a
 * radial wave displacement of geometry, a ring of portal descriptors and
 * a 3D field volume.
 */

#include "sacredgeo/wave_transform.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>

namespace sacredgeo {

namespace {

bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept {
    static constexpr std::array<int, 12> DAYS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[static_cast<size_t>(month - 1)];
}

int digit_sum(int value) noexcept {
    int sum = 0;
    while (value > 0) {
        sum += value % 10;
        value /= 10;
    }
    return sum;
}

bool is_master_number(int value) noexcept {
    return value == 11 || value == 22 || value == 33;
}

// Pythagorean letter values: A=1 ... I=9, J=1 ... R=9, S=1 ... Z=8.
int letter_value(char c) noexcept {
    const int upper = std::toupper(static_cast<unsigned char>(c));
    if (upper < 'A' || upper > 'Z') return 0;
    return (upper - 'A') % 9 + 1;
}

Vec3 wave_displacement(const Vec3& vertex, const WaveTransformation& transformation,
                       double awareness_modulation, double phase, double time) {
    const double distance = vertex.norm();
    const double angle = std::atan2(vertex.y(), vertex.x());

    const ConsciousnessWave primary{transformation.amplitude * awareness_modulation,
                                    transformation.base_frequency * 0.001,
                                    transformation.phase + phase,
                                    0.0};
    const double primary_offset = primary.value(time + distance * 0.1);

    double harmonic_offset = 0.0;
    for (size_t index = 0; index < transformation.harmonics.size(); ++index) {
        const ConsciousnessWave harmonic{transformation.amplitude * 0.3 / (index + 1.0),
                                         transformation.harmonics[index] * 0.001,
                                         transformation.phase + angle,
                                         0.0};
        harmonic_offset += harmonic.value(time + distance * 0.05);
    }

    const double total = (primary_offset + harmonic_offset * 0.5) * 0.1;
    return safe_normalized(vertex) * total;
}

} // anonymous namespace

// =============================================================================
// Numerology helpers
// =============================================================================

void validate_date(const CalendarDate& date) {
    if (date.year < 1 || date.year > 9999) {
        throw InvalidArgumentError("Birth year out of range: " + std::to_string(date.year),
                                   "validate_date", "Use a year between 1 and 9999");
    }
    if (date.month < 1 || date.month > 12) {
        throw InvalidArgumentError("Birth month out of range: " + std::to_string(date.month),
                                   "validate_date");
    }
    if (date.day < 1 || date.day > days_in_month(date.year, date.month)) {
        throw InvalidArgumentError("Birth day out of range: " + std::to_string(date.day),
                                   "validate_date");
    }
}

int day_of_year(const CalendarDate& date) {
    validate_date(date);
    int day = date.day;
    for (int month = 1; month < date.month; ++month) {
        day += days_in_month(date.year, month);
    }
    return day;
}

int life_path_number(const CalendarDate& date) {
    validate_date(date);
    int sum = digit_sum(date.year) + digit_sum(date.month) + digit_sum(date.day);
    while (sum > 9 && !is_master_number(sum)) {
        sum = digit_sum(sum);
    }
    return sum;
}

double life_path_frequency(int life_path) noexcept {
    switch (life_path) {
        case 1:  return solfeggio::UT;
        case 2:  return solfeggio::RE;
        case 3:  return solfeggio::MI;
        case 4:  return solfeggio::FA;
        case 5:  return solfeggio::SOL;
        case 6:  return solfeggio::LA;
        case 7:  return solfeggio::SI;
        case 8:  return chakra::ROOT;
        case 9:  return chakra::CROWN;
        case 11: return planetary::EARTH;
        case 22: return planetary::MOON;
        case 33: return planetary::EARTH;
        default: return solfeggio::MI;
    }
}

double name_frequency(std::string_view name) noexcept {
    int sum = 0;
    for (char c : name) {
        sum += letter_value(c);
    }
    return 528.0 + (sum % 12) * 44.0;
}

double birth_frequency(const CalendarDate& date) {
    return 396.0 + (day_of_year(date) % 7) * 33.0;
}

std::optional<int> parse_birth_time(std::string_view text) noexcept {
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    int hours = 0;
    int minutes = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    auto [hours_end, hours_err] = std::from_chars(begin, begin + colon, hours);
    if (hours_err != std::errc() || hours_end != begin + colon) return std::nullopt;

    auto [minutes_end, minutes_err] = std::from_chars(begin + colon + 1, end, minutes);
    if (minutes_err != std::errc() || minutes_end != end) return std::nullopt;

    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) return std::nullopt;
    return hours * 60 + minutes;
}

// =============================================================================
// ConsciousnessWaveTransformer
// =============================================================================

ConsciousnessWaveTransformer::ConsciousnessWaveTransformer()
    : field_wave_(), fractal_wave_() {}

WaveTransformation ConsciousnessWaveTransformer::transform_user_data(const UserWaveData& user) const {
    validate_date(user.birth_date);

    const int life_path = user.life_path_number.value_or(life_path_number(user.birth_date));
    const double name_hz = user.name ? name_frequency(*user.name) : solfeggio::SOL;
    const double birth_hz = birth_frequency(user.birth_date);

    WaveTransformation t;
    t.base_frequency = life_path_frequency(life_path);

    t.harmonics.reserve(FIBONACCI_HARMONICS.size());
    for (int multiple : FIBONACCI_HARMONICS) {
        t.harmonics.push_back(t.base_frequency * multiple);
    }

    t.amplitude = 0.5;
    if (user.birth_time) t.amplitude += 0.2;
    if (user.birth_location) t.amplitude += 0.2;
    if (user.name) t.amplitude += 0.1;
    t.amplitude = std::min(1.0, t.amplitude);

    double phase = (user.birth_date.month - 1) / 12.0 * TAU;
    if (user.birth_time) {
        if (auto minutes = parse_birth_time(*user.birth_time)) {
            phase += *minutes / 1440.0 * TAU;
        } else {
            LOG_WARN(Transform, "Ignoring unparseable birth time '", *user.birth_time, "' (expected HH:MM)");
        }
    }
    t.phase = std::fmod(phase, TAU);

    t.modulation = 1.0;
    if (user.birth_location) {
        t.modulation += std::sin(user.birth_location->latitude / 90.0 * PI) * 0.1;
        t.modulation += std::cos(user.birth_location->longitude / 180.0 * PI) * 0.1;
    }

    t.interference = {
        std::abs(t.base_frequency - name_hz),
        std::abs(t.base_frequency - birth_hz),
        std::abs(name_hz - birth_hz),
        (t.base_frequency + name_hz) / 2.0,
        (t.base_frequency + birth_hz) / 2.0,
    };

    t.resonance = 0.0;
    for (double harmonic : t.harmonics) {
        for (const auto& named : solfeggio::ALL) {
            const double resonance = 1.0 / (1.0 + std::abs(harmonic - named.hz) / named.hz);
            t.resonance = std::max(t.resonance, resonance);
        }
    }

    LOG_DEBUG(Transform, "Wave transformation: life path ", life_path, ", base ", t.base_frequency,
              " Hz, resonance ", t.resonance);
    return t;
}

Geometry ConsciousnessWaveTransformer::apply_wave_transformation(
    const Geometry& geometry, const WaveTransformation& transformation,
    const ConsciousnessState& consciousness, const BreathState& breath, double time) const {
    validate_geometry(geometry);

    const double breath_angle = breath_phase_angle(breath);
    const double awareness_modulation = consciousness.awareness_level * transformation.amplitude;
    const double count = static_cast<double>(geometry.vertices.size());

    Geometry out = geometry;
    for (size_t index = 0; index < out.vertices.size(); ++index) {
        const double phase = breath_angle + static_cast<double>(index) / count * TAU;
        out.vertices[index] += wave_displacement(geometry.vertices[index], transformation,
                                                 awareness_modulation, phase, time);
    }
    out.radius = geometry.radius * (1.0 + awareness_modulation * 0.3);
    return out;
}

std::vector<Portal> ConsciousnessWaveTransformer::generate_fractal_portal(
    const Vec3& center, const WaveTransformation& transformation,
    const ConsciousnessState& consciousness, double zoom) const {
    if (!(zoom > 0.0) || !std::isfinite(zoom)) {
        throw InvalidArgumentError("Portal zoom must be positive, got " + std::to_string(zoom),
                                   "generate_fractal_portal", "Pass a zoom > 0");
    }

    const double awareness = consciousness.awareness_level;
    const int count = std::max(0, static_cast<int>(std::floor(3.0 + awareness * 7.0)));
    const double scale = (0.3 + awareness * 0.7) / std::sqrt(zoom);

    std::vector<Portal> portals;
    portals.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const double angle = static_cast<double>(i) / count * TAU;
        const double ring = 2.0 + std::sin(transformation.phase + angle);

        Portal portal;
        portal.position = center + Vec3(std::cos(angle) * ring,
                                        std::sin(angle) * ring,
                                        std::sin(angle * PHI + transformation.phase) * 0.5);
        portal.scale = scale;

        const auto& harmonics = transformation.harmonics;
        portal.rotation = harmonics.empty()
            ? 0.0
            : harmonics[static_cast<size_t>(i) % harmonics.size()] * 0.01;

        const auto& interference = transformation.interference;
        portal.intensity = interference.empty()
            ? 0.0
            : interference[static_cast<size_t>(i) % interference.size()] * awareness;

        portals.push_back(portal);
    }
    return portals;
}

VolumeField ConsciousnessWaveTransformer::generate_volume_field(
    size_t width, size_t height, size_t depth, const WaveTransformation& transformation,
    const ConsciousnessState& consciousness, const BreathState& breath, double time) const {
    VolumeField field(width, height, depth);

    const double phase = breath_phase_angle(breath);
    const double awareness = consciousness.awareness_level;
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);
    const double d = static_cast<double>(depth);

    for (size_t z = 0; z < depth; ++z) {
        const double fz = (static_cast<double>(z) / d - 0.5) * 4.0;
        for (size_t y = 0; y < height; ++y) {
            const double fy = (static_cast<double>(y) / h - 0.5) * 4.0;
            for (size_t x = 0; x < width; ++x) {
                const double fx = (static_cast<double>(x) / w - 0.5) * 4.0;

                const double wave = field_wave_.field_value_at(fx, fy, fz, time + phase) *
                                    transformation.amplitude * awareness;
                const double fractal =
                    fractal_wave_.consciousness_fractal(fx, fy, time, awareness, phase);

                field.values[(z * height + y) * width + x] =
                    static_cast<float>((wave + fractal * 0.3) * breath.coherence);
            }
        }
    }
    return field;
}

} // namespace sacredgeo
