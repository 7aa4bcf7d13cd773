/**
 * Wave synthesis
 *
 * Damped sinusoids, the breath-cycle sampler, the Fibonacci-harmonic field
 * wave and octave-accumulated fractal waves. All evaluation is closed form;
 * BreathWave's start time is the only state and it changes only through
 * update_pattern().
 */

#include "sacredgeo/waves.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <string>

namespace sacredgeo {

// =============================================================================
// ConsciousnessWave
// =============================================================================

double ConsciousnessWave::value(double t) const noexcept {
    const double omega = TAU * frequency;
    return amplitude * std::sin(omega * t + phase) * std::exp(-decay * t);
}

double ConsciousnessWave::derivative(double t) const noexcept {
    const double omega = TAU * frequency;
    const double arg = omega * t + phase;
    return amplitude * std::exp(-decay * t) * (omega * std::cos(arg) - decay * std::sin(arg));
}

double ConsciousnessWave::modulate_with(const ConsciousnessWave& other, double t) const noexcept {
    return value(t) * other.value(t);
}

double wave_interference(const std::vector<ConsciousnessWave>& waves, double t) noexcept {
    if (waves.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& wave : waves) {
        sum += wave.value(t);
    }
    return sum / static_cast<double>(waves.size());
}

// =============================================================================
// Breath
// =============================================================================

std::optional<BreathPattern> breath_pattern_from_name(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "coherent") return breath_patterns::COHERENT;
    if (lower == "box")      return breath_patterns::BOX;
    if (lower == "triangle") return breath_patterns::TRIANGLE;
    if (lower == "extended") return breath_patterns::EXTENDED;
    if (lower == "natural")  return breath_patterns::NATURAL;
    return std::nullopt;
}

double breath_phase_angle(BreathPhase phase, double intensity) noexcept {
    switch (phase) {
        case BreathPhase::Inhale: return intensity * PI;
        case BreathPhase::Hold:   return PI;
        case BreathPhase::Exhale: return PI + (1.0 - intensity) * PI;
        case BreathPhase::Pause:  return 0.0;
    }
    return 0.0;
}

double breath_phase_angle(const BreathState& breath) noexcept {
    return breath_phase_angle(breath.phase, breath.intensity);
}

BreathWave::BreathWave(const BreathPattern& pattern, double start_time)
    : pattern_(pattern)
    , wave_{1.0, 0.0, 0.0, 0.0}
    , start_time_(start_time) {
    validate_pattern(pattern_);
    wave_.frequency = 1.0 / pattern_.total_cycle;
}

void BreathWave::validate_pattern(const BreathPattern& pattern) {
    if (!(pattern.total_cycle > 0.0) || !std::isfinite(pattern.total_cycle)) {
        throw InvalidArgumentError("Breath cycle must be positive, got " +
                                   std::to_string(pattern.total_cycle),
                                   "BreathWave");
    }
    if (pattern.inhale_count < 0.0 || pattern.hold_count < 0.0 ||
        pattern.exhale_count < 0.0 || pattern.pause_count < 0.0) {
        throw InvalidArgumentError("Breath counts must be non-negative", "BreathWave");
    }
}

BreathState BreathWave::current_state(double now) const noexcept {
    const double total = pattern_.total_cycle;
    const double elapsed = now - start_time_;

    // Position inside the cycle in seconds, wrapped into [0, total).
    double cycle_time = std::fmod(elapsed, total);
    if (cycle_time < 0.0) cycle_time += total;

    const double inhale_end = pattern_.inhale_count;
    const double hold_end = inhale_end + pattern_.hold_count;
    const double exhale_end = hold_end + pattern_.exhale_count;

    BreathState state;
    state.pattern = pattern_;

    if (cycle_time < inhale_end) {
        state.phase = BreathPhase::Inhale;
        state.intensity = cycle_time / pattern_.inhale_count;
    } else if (cycle_time < hold_end) {
        state.phase = BreathPhase::Hold;
        state.intensity = 1.0;
    } else if (cycle_time < exhale_end) {
        state.phase = BreathPhase::Exhale;
        state.intensity = 1.0 - (cycle_time - hold_end) / pattern_.exhale_count;
    } else {
        state.phase = BreathPhase::Pause;
        state.intensity = 0.0;
    }

    state.coherence = std::abs(wave_.value(elapsed));
    state.rhythm = 60.0 / total;
    state.timestamp = now;
    return state;
}

double BreathWave::modulation(double elapsed) const noexcept {
    return wave_.value(elapsed);
}

void BreathWave::update_pattern(const BreathPattern& pattern, double now) {
    validate_pattern(pattern);
    pattern_ = pattern;
    wave_.frequency = 1.0 / pattern.total_cycle;
    start_time_ = now;
}

// =============================================================================
// ConsciousnessFieldWave
// =============================================================================

ConsciousnessFieldWave::ConsciousnessFieldWave(double base_frequency)
    : base_frequency_(base_frequency) {
    waves_.reserve(FIBONACCI_HARMONICS.size());
    for (size_t index = 0; index < FIBONACCI_HARMONICS.size(); ++index) {
        const double harmonic = static_cast<double>(FIBONACCI_HARMONICS[index]);
        ConsciousnessWave wave;
        wave.amplitude = 1.0 / harmonic;
        wave.frequency = base_frequency_ * harmonic;
        wave.phase = std::fmod(static_cast<double>(index) * PHI, TAU);
        wave.decay = 0.0;
        waves_.push_back(wave);
    }
}

double ConsciousnessFieldWave::field_value_at(double x, double y, double z, double t) const noexcept {
    const double spatial_phase = std::sqrt(x * x + y * y + z * z) * 0.1;

    double sum = 0.0;
    for (const auto& wave : waves_) {
        ConsciousnessWave shifted = wave;
        shifted.phase += spatial_phase;
        sum += shifted.value(t);
    }
    return sum / static_cast<double>(waves_.size());
}

ConsciousnessState ConsciousnessFieldWave::generate_consciousness_state(
    const std::vector<double>& field_values, double breath_coherence) const {
    ConsciousnessState state;

    if (!field_values.empty()) {
        double abs_sum = 0.0;
        for (double v : field_values) abs_sum += std::abs(v);
        const double mean_abs = abs_sum / static_cast<double>(field_values.size());
        state.awareness_level = std::min(mean_abs * breath_coherence, 1.0);
    }

    // Three strongest samples by magnitude; ties keep sample order.
    std::vector<size_t> order(field_values.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return std::abs(field_values[a]) > std::abs(field_values[b]);
    });
    for (size_t i = 0; i < order.size() && i < 3; ++i) {
        state.integration_points.push_back("Integration Point " + std::to_string(order[i] + 1));
    }

    for (double v : field_values) {
        if (v > 0.5) {
            state.expansion_vectors.push_back(
                "Expansion Vector " + std::to_string(state.expansion_vectors.size() + 1));
        }
        if (v < -0.3) {
            state.shadow_territories.push_back(
                "Shadow Territory " + std::to_string(state.shadow_territories.size() + 1));
        }
    }

    const double tolerance = 0.1 * breath_coherence;
    for (const auto& named : solfeggio::ALL) {
        const double normalized = named.hz / 1000.0;
        const bool resonant = std::any_of(field_values.begin(), field_values.end(),
                                          [&](double v) { return std::abs(v - normalized) < tolerance; });
        if (resonant) {
            state.light_frequencies.emplace_back(named.name);
        }
    }

    LOG_DEBUG(Waves, "Consciousness state from ", field_values.size(), " samples, awareness ",
              state.awareness_level);
    return state;
}

// =============================================================================
// FractalWave
// =============================================================================

FractalWave::FractalWave(int octaves, double lacunarity, double persistence)
    : octaves_(octaves), lacunarity_(lacunarity), persistence_(persistence) {
    SACREDGEO_CHECK_ARGUMENT(octaves >= 0, "Octave count must be non-negative");
}

double FractalWave::fractal_noise(double x, double y, double t) const noexcept {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;

    for (int i = 0; i < octaves_; ++i) {
        const ConsciousnessWave wave{amplitude, frequency, 0.0, 0.0};
        const double spatial = (x * frequency + y * frequency * PHI) * 0.01;
        value += wave.value(spatial + t) * amplitude;

        amplitude *= persistence_;
        frequency *= lacunarity_;
    }
    return value;
}

double FractalWave::consciousness_fractal(double x, double y, double t,
                                          double awareness, double breath_phase) const noexcept {
    const int octaves = static_cast<int>(std::floor(octaves_ * (0.5 + awareness * 0.5)));
    const double shifted_time = t + breath_phase * TAU;

    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;

    for (int i = 0; i < octaves; ++i) {
        const ConsciousnessWave wave{amplitude,
                                     frequency * (1.0 + awareness * 0.1),
                                     breath_phase * i,
                                     0.0};
        const double spatial = (x * frequency + y * frequency * PHI) * 0.01;
        value += wave.value(spatial + shifted_time) * amplitude;

        amplitude *= persistence_ * (0.8 + awareness * 0.4);
        frequency *= lacunarity_;
    }
    return value;
}

} // namespace sacredgeo
