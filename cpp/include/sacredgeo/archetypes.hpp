#pragma once

#include "sacredgeo/platonic.hpp"
#include "sacredgeo/subdivision.hpp"
#include "sacredgeo/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace sacredgeo {

enum class Taxonomy {
    HumanDesign,
    Enneagram
};

enum class EnneagramCenter {
    Body,
    Heart,
    Head
};

/**
 * Table row ids. The integer value is the raw id accepted by
 * archetype_signature(int): 0-4 Human Design types, 5-13 Enneagram 1-9.
 */
enum class ArchetypeId : int {
    Manifestor = 0,
    Generator,
    ManifestingGenerator,
    Projector,
    Reflector,
    Enneagram1,
    Enneagram2,
    Enneagram3,
    Enneagram4,
    Enneagram5,
    Enneagram6,
    Enneagram7,
    Enneagram8,
    Enneagram9
};

inline constexpr size_t ARCHETYPE_COUNT = 14;
inline constexpr ArchetypeId DEFAULT_ARCHETYPE = ArchetypeId::Generator;

const char* to_string(Taxonomy taxonomy) noexcept;
const char* to_string(EnneagramCenter center) noexcept;

// Canonical lower-case name: "manifestor", ..., "enneagram-1", ...
const char* to_string(ArchetypeId id) noexcept;

struct ArchetypeSignature {
    ArchetypeId id = DEFAULT_ARCHETYPE;
    Taxonomy taxonomy = Taxonomy::HumanDesign;
    PlatonicKind base_solid = PlatonicKind::Cube;
    FractalKind fractal = FractalKind::Julia;
    double wave_frequency = 0.0;              // Hz
    Color color = {0.0, 0.0, 0.0};            // linear RGB
    double breath_modulation = 1.0;
    double awareness_amplification = 1.0;
    int fractal_depth = 3;

    // Enneagram rows only; Human Design rows leave these empty/zero.
    std::optional<EnneagramCenter> center;
    Vec3 integration_vector = Vec3::Zero();
    Vec3 disintegration_vector = Vec3::Zero();
};

// Rows in ArchetypeId order.
const std::array<ArchetypeSignature, ARCHETYPE_COUNT>& all_archetypes();

/**
 * Table lookups. Anything outside the table (an out-of-range enum value,
 * raw id or unrecognised name) resolves to the DEFAULT_ARCHETYPE row and
 * is logged at WARN.
 */
const ArchetypeSignature& archetype_signature(ArchetypeId id);
const ArchetypeSignature& archetype_signature(int raw_id);

// Case-insensitive; Enneagram types are "enneagram-<n>".
const ArchetypeSignature& archetype_signature(std::string_view name);

// Strict name parse, no fallback. Used to validate configuration.
std::optional<ArchetypeId> archetype_from_name(std::string_view name);

/**
 * Builds the row's base solid (radius 1, modulated by awareness) and
 * displaces every vertex i with the row's point fractal:
 *
 *   amp   = awareness * awareness_amplification
 *   phase = breath_phase_angle(breath) + i / n * τ
 *   p     = v + (sin(time * f * 0.001) * 0.1, sin(phase) * 0.05, cos(phase) * 0.05)
 *   v'    = v + fractal_displacement(kind, p, 0.1 * amp, phase)
 *
 * The radius grows by 1 + 0.2 * amp. Topology is untouched.
 */
Geometry generate_type_fractal(const ArchetypeSignature& signature,
                               const ConsciousnessState& consciousness,
                               const BreathState& breath,
                               double time = 0.0);

} // namespace sacredgeo
