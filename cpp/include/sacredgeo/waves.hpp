#pragma once

#include "sacredgeo/constants.hpp"
#include "sacredgeo/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sacredgeo {

/**
 * Damped sinusoid y(t) = A * sin(2π f t + φ) * e^(-d t).
 *
 * A plain value record: evaluation never mutates it.
 */
struct ConsciousnessWave {
    double amplitude = 1.0;
    double frequency = 1.0;
    double phase = 0.0;
    double decay = 0.0;

    double value(double t) const noexcept;

    /**
     * Closed-form dy/dt:
     *   A * e^(-d t) * (ω cos(ω t + φ) - d sin(ω t + φ)),  ω = 2π f
     */
    double derivative(double t) const noexcept;

    // Pointwise product of both waves at t (interference, not averaging).
    double modulate_with(const ConsciousnessWave& other, double t) const noexcept;
};

// Mean of the waves' values at t; 0 for an empty set.
double wave_interference(const std::vector<ConsciousnessWave>& waves, double t) noexcept;

// =============================================================================
// Breath
// =============================================================================

namespace breath_patterns {
inline constexpr BreathPattern COHERENT{5.0, 0.0, 5.0, 0.0, 10.0};
inline constexpr BreathPattern BOX{4.0, 4.0, 4.0, 4.0, 16.0};
inline constexpr BreathPattern TRIANGLE{4.0, 4.0, 4.0, 0.0, 12.0};
inline constexpr BreathPattern EXTENDED{4.0, 7.0, 8.0, 0.0, 19.0};
inline constexpr BreathPattern NATURAL{3.0, 1.0, 4.0, 1.0, 9.0};
} // namespace breath_patterns

// "coherent", "box", "triangle", "extended", "natural" (case-insensitive).
std::optional<BreathPattern> breath_pattern_from_name(std::string_view name);

/**
 * Breath phase to angle, shared by every breath-driven displacement:
 *   inhale -> intensity * π
 *   hold   -> π
 *   exhale -> π + (1 - intensity) * π
 *   pause  -> 0
 */
double breath_phase_angle(const BreathState& breath) noexcept;
double breath_phase_angle(BreathPhase phase, double intensity) noexcept;

/**
 * Breath cycle sampler.
 *
 * The only mutable state is the start time, owned here and supplied by the
 * caller; current_state(now) is a pure function of (pattern, start, now).
 * Each call site keeps its own instance.
 */
class BreathWave {
public:
    explicit BreathWave(const BreathPattern& pattern = breath_patterns::COHERENT,
                        double start_time = 0.0);

    BreathState current_state(double now) const noexcept;

    // Wave value at `elapsed` seconds into the breath (not an absolute time).
    double modulation(double elapsed) const noexcept;

    // Swaps the pattern and restarts the cycle at `now`.
    void update_pattern(const BreathPattern& pattern, double now);

    const BreathPattern& pattern() const noexcept { return pattern_; }
    const ConsciousnessWave& wave() const noexcept { return wave_; }
    double start_time() const noexcept { return start_time_; }

private:
    static void validate_pattern(const BreathPattern& pattern);

    BreathPattern pattern_;
    ConsciousnessWave wave_;
    double start_time_;
};

// =============================================================================
// Multi-harmonic field
// =============================================================================

/**
 * Five harmonics at {1, 2, 3, 5, 8} x base frequency, amplitude 1/h and
 * phase (index * φ) mod 2π.
 */
class ConsciousnessFieldWave {
public:
    explicit ConsciousnessFieldWave(double base_frequency = solfeggio::SOL);

    /**
     * Mean of all harmonics at time t, each phase-shifted by
     * 0.1 * |(x, y, z)| for radial propagation.
     */
    double field_value_at(double x, double y, double z, double t) const noexcept;

    /**
     * Summarises sampled field values:
     * - awareness = min(mean |v| * coherence, 1)
     * - integration points: the three largest |v| ("Integration Point <i+1>")
     * - expansion vectors: one label per v > 0.5
     * - shadow territories: one label per v < -0.3
     * - light frequencies: Solfeggio names whose hz/1000 lies within
     *   0.1 * coherence of some v
     */
    ConsciousnessState generate_consciousness_state(const std::vector<double>& field_values,
                                                    double breath_coherence) const;

    double base_frequency() const noexcept { return base_frequency_; }
    const std::vector<ConsciousnessWave>& harmonics() const noexcept { return waves_; }

private:
    double base_frequency_;
    std::vector<ConsciousnessWave> waves_;
};

// =============================================================================
// Fractal wave
// =============================================================================

class FractalWave {
public:
    explicit FractalWave(int octaves = 5, double lacunarity = 2.0, double persistence = 0.5);

    /**
     * Σ wave(A, f).value(s + t) * A over octaves, s = (x f + y f φ) * 0.01,
     * A *= persistence, f *= lacunarity.
     */
    double fractal_noise(double x, double y, double t) const noexcept;

    /**
     * Same accumulation over floor(octaves * (0.5 + 0.5 a)) octaves with
     * time shifted by breath_phase * τ, per-octave phase breath_phase * i,
     * frequency scaled by 1 + 0.1 a and persistence by 0.8 + 0.4 a.
     */
    double consciousness_fractal(double x, double y, double t,
                                 double awareness, double breath_phase) const noexcept;

    int octaves() const noexcept { return octaves_; }
    double lacunarity() const noexcept { return lacunarity_; }
    double persistence() const noexcept { return persistence_; }

private:
    int octaves_;
    double lacunarity_;
    double persistence_;
};

} // namespace sacredgeo
