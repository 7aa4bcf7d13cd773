#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace sacredgeo {

// =============================================================================
// Sacred mathematics
// =============================================================================

inline constexpr double PI = 3.14159265358979323846;
inline constexpr double TAU = 2.0 * PI;

// Golden ratio φ = (1 + √5) / 2 and its relatives
inline constexpr double SQRT5 = 2.23606797749978969640;
inline constexpr double PHI = (1.0 + SQRT5) / 2.0;
inline constexpr double PHI_INVERSE = PHI - 1.0;          // 1/φ = φ - 1
inline constexpr double PHI_SQUARED = PHI + 1.0;          // φ² = φ + 1

inline constexpr double PENTAGRAM_ANGLE = TAU / 5.0;

// 2π/φ², the golden angle in radians
inline constexpr double GOLDEN_ANGLE = TAU / (PHI * PHI);

inline constexpr std::array<uint32_t, 18> FIBONACCI = {
    0, 1, 1, 2, 3, 5, 8, 13, 21, 34, 55, 89, 144, 233, 377, 610, 987, 1597
};

// Harmonic multiples used by the multi-harmonic field wave
inline constexpr std::array<int, 5> FIBONACCI_HARMONICS = {1, 2, 3, 5, 8};

// Julia constant shared by mesh and archetype displacement
inline constexpr double JULIA_CX = -0.7269;
inline constexpr double JULIA_CY = 0.1889;

// =============================================================================
// Named frequencies (Hz)
// =============================================================================

struct NamedFrequency {
    std::string_view name;
    double hz;
};

namespace solfeggio {
inline constexpr double UT = 174.0;
inline constexpr double RE = 285.0;
inline constexpr double MI = 396.0;
inline constexpr double FA = 417.0;
inline constexpr double SOL = 528.0;
inline constexpr double LA = 639.0;
inline constexpr double TI = 741.0;
inline constexpr double DO = 852.0;
inline constexpr double SI = 963.0;

// Declaration order matters: light-frequency labels are reported in this order.
inline constexpr std::array<NamedFrequency, 9> ALL = {{
    {"UT", UT}, {"RE", RE}, {"MI", MI}, {"FA", FA}, {"SOL", SOL},
    {"LA", LA}, {"TI", TI}, {"DO", DO}, {"SI", SI},
}};
} // namespace solfeggio

namespace chakra {
inline constexpr double ROOT = 256.0;
inline constexpr double SACRAL = 288.0;
inline constexpr double SOLAR = 320.0;
inline constexpr double HEART = 341.3;
inline constexpr double THROAT = 384.0;
inline constexpr double THIRD_EYE = 426.7;
inline constexpr double CROWN = 480.0;
inline constexpr double SOUL_STAR = 512.0;
} // namespace chakra

namespace planetary {
inline constexpr double EARTH = 194.18;
inline constexpr double MOON = 210.42;
} // namespace planetary

} // namespace sacredgeo
