/**
 * Archetype signature table
 *
 * Fourteen fixed rows from two taxonomies. Human Design rows pick their
 * fractal directly; Enneagram rows derive it from their centre
 * (body -> mandelbrot, heart -> julia, head -> dragon) and scale awareness
 * amplification with fractal depth.
 */

#include "sacredgeo/archetypes.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/logging.hpp"
#include "sacredgeo/waves.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace sacredgeo {

const char* to_string(Taxonomy taxonomy) noexcept {
    switch (taxonomy) {
        case Taxonomy::HumanDesign: return "human-design";
        case Taxonomy::Enneagram:   return "enneagram";
    }
    return "human-design";
}

const char* to_string(EnneagramCenter center) noexcept {
    switch (center) {
        case EnneagramCenter::Body:  return "body";
        case EnneagramCenter::Heart: return "heart";
        case EnneagramCenter::Head:  return "head";
    }
    return "body";
}

const char* to_string(ArchetypeId id) noexcept {
    switch (id) {
        case ArchetypeId::Manifestor:           return "manifestor";
        case ArchetypeId::Generator:            return "generator";
        case ArchetypeId::ManifestingGenerator: return "manifesting-generator";
        case ArchetypeId::Projector:            return "projector";
        case ArchetypeId::Reflector:            return "reflector";
        case ArchetypeId::Enneagram1:           return "enneagram-1";
        case ArchetypeId::Enneagram2:           return "enneagram-2";
        case ArchetypeId::Enneagram3:           return "enneagram-3";
        case ArchetypeId::Enneagram4:           return "enneagram-4";
        case ArchetypeId::Enneagram5:           return "enneagram-5";
        case ArchetypeId::Enneagram6:           return "enneagram-6";
        case ArchetypeId::Enneagram7:           return "enneagram-7";
        case ArchetypeId::Enneagram8:           return "enneagram-8";
        case ArchetypeId::Enneagram9:           return "enneagram-9";
    }
    return "generator";
}

namespace {

ArchetypeSignature human_design(ArchetypeId id, PlatonicKind solid, FractalKind fractal,
                                double frequency, Color color,
                                double breath_modulation, double amplification) {
    ArchetypeSignature s;
    s.id = id;
    s.taxonomy = Taxonomy::HumanDesign;
    s.base_solid = solid;
    s.fractal = fractal;
    s.wave_frequency = frequency;
    s.color = color;
    s.breath_modulation = breath_modulation;
    s.awareness_amplification = amplification;
    s.fractal_depth = 3;
    return s;
}

FractalKind fractal_for(EnneagramCenter center) noexcept {
    switch (center) {
        case EnneagramCenter::Body:  return FractalKind::Mandelbrot;
        case EnneagramCenter::Heart: return FractalKind::Julia;
        case EnneagramCenter::Head:  return FractalKind::Dragon;
    }
    return FractalKind::Mandelbrot;
}

ArchetypeSignature enneagram(ArchetypeId id, EnneagramCenter center, PlatonicKind solid,
                             int depth, double frequency, Color color,
                             const Vec3& integration, const Vec3& disintegration) {
    ArchetypeSignature s;
    s.id = id;
    s.taxonomy = Taxonomy::Enneagram;
    s.base_solid = solid;
    s.fractal = fractal_for(center);
    s.wave_frequency = frequency;
    s.color = color;
    s.breath_modulation = 1.0;
    s.awareness_amplification = 1.0 + depth * 0.1;
    s.fractal_depth = depth;
    s.center = center;
    s.integration_vector = integration;
    s.disintegration_vector = disintegration;
    return s;
}

std::array<ArchetypeSignature, ARCHETYPE_COUNT> build_table() {
    using A = ArchetypeId;
    using P = PlatonicKind;
    using F = FractalKind;
    using C = EnneagramCenter;

    return {{
        human_design(A::Manifestor, P::Tetrahedron, F::Mandelbrot, solfeggio::UT,
                     {1.0, 0.3, 0.2}, 1.2, 1.5),
        human_design(A::Generator, P::Cube, F::Julia, solfeggio::RE,
                     {0.8, 0.6, 0.2}, 1.0, 1.0),
        human_design(A::ManifestingGenerator, P::Octahedron, F::Dragon, solfeggio::MI,
                     {0.9, 0.4, 0.6}, 1.3, 1.2),
        human_design(A::Projector, P::Dodecahedron, F::Sierpinski, solfeggio::FA,
                     {0.4, 0.7, 0.9}, 0.8, 1.8),
        human_design(A::Reflector, P::Icosahedron, F::Julia, solfeggio::SOL,
                     {0.6, 0.9, 0.7}, 0.6, 2.0),

        // integration / disintegration arrows: 1->7/4, 2->4/8, 3->6/9, 4->1/2,
        // 5->8/7, 6->9/3, 7->5/1, 8->2/5, 9->3/6
        enneagram(A::Enneagram1, C::Body, P::Cube, 4, solfeggio::UT, {0.8, 0.2, 0.2},
                  Vec3(0.7, 0.7, 0.0), Vec3(0.4, 0.4, 0.4)),
        enneagram(A::Enneagram2, C::Heart, P::Octahedron, 3, solfeggio::RE, {0.9, 0.6, 0.3},
                  Vec3(0.4, 0.4, 0.8), Vec3(0.8, 0.2, 0.2)),
        enneagram(A::Enneagram3, C::Heart, P::Tetrahedron, 5, solfeggio::MI, {0.9, 0.9, 0.2},
                  Vec3(0.6, 0.6, 0.6), Vec3(0.9, 0.9, 0.9)),
        enneagram(A::Enneagram4, C::Heart, P::Icosahedron, 6, solfeggio::FA, {0.6, 0.3, 0.9},
                  Vec3(0.1, 0.9, 0.1), Vec3(0.2, 0.8, 0.8)),
        enneagram(A::Enneagram5, C::Head, P::Dodecahedron, 7, solfeggio::SOL, {0.2, 0.6, 0.8},
                  Vec3(0.8, 0.8, 0.2), Vec3(0.7, 0.7, 0.1)),
        enneagram(A::Enneagram6, C::Head, P::Octahedron, 3, solfeggio::LA, {0.4, 0.8, 0.4},
                  Vec3(0.9, 0.9, 0.9), Vec3(0.3, 0.9, 0.3)),
        enneagram(A::Enneagram7, C::Head, P::Tetrahedron, 8, solfeggio::SI, {0.9, 0.9, 0.9},
                  Vec3(0.5, 0.5, 1.0), Vec3(0.1, 0.9, 0.1)),
        enneagram(A::Enneagram8, C::Body, P::Cube, 4, chakra::ROOT, {0.1, 0.1, 0.1},
                  Vec3(0.2, 0.8, 0.2), Vec3(0.5, 0.5, 1.0)),
        enneagram(A::Enneagram9, C::Body, P::Icosahedron, 2, chakra::CROWN, {0.7, 0.9, 0.7},
                  Vec3(0.3, 0.9, 0.3), Vec3(0.6, 0.6, 0.6)),
    }};
}

std::string lowercase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const ArchetypeSignature& default_row() {
    return all_archetypes()[static_cast<size_t>(DEFAULT_ARCHETYPE)];
}

} // anonymous namespace

const std::array<ArchetypeSignature, ARCHETYPE_COUNT>& all_archetypes() {
    static const std::array<ArchetypeSignature, ARCHETYPE_COUNT> table = build_table();
    return table;
}

const ArchetypeSignature& archetype_signature(ArchetypeId id) {
    const int raw = static_cast<int>(id);
    if (raw < 0 || raw >= static_cast<int>(ARCHETYPE_COUNT)) {
        LOG_WARN(Archetypes, "Archetype id ", raw, " is not in the table, using ", to_string(DEFAULT_ARCHETYPE));
        return default_row();
    }
    return all_archetypes()[static_cast<size_t>(raw)];
}

const ArchetypeSignature& archetype_signature(int raw_id) {
    return archetype_signature(static_cast<ArchetypeId>(raw_id));
}

std::optional<ArchetypeId> archetype_from_name(std::string_view name) {
    const std::string lower = lowercase(name);
    for (const auto& row : all_archetypes()) {
        if (lower == to_string(row.id)) {
            return row.id;
        }
    }
    return std::nullopt;
}

const ArchetypeSignature& archetype_signature(std::string_view name) {
    if (auto id = archetype_from_name(name)) {
        return all_archetypes()[static_cast<size_t>(*id)];
    }
    LOG_WARN(Archetypes, "Unknown archetype '", std::string(name), "', using ", to_string(DEFAULT_ARCHETYPE));
    return default_row();
}

Geometry generate_type_fractal(const ArchetypeSignature& signature,
                               const ConsciousnessState& consciousness,
                               const BreathState& breath,
                               double time) {
    const double awareness = consciousness.awareness_level;
    Geometry geometry = PlatonicSolidGenerator::make(signature.base_solid, 1.0, awareness);

    const double breath_angle = breath_phase_angle(breath);
    const double time_offset = std::sin(time * signature.wave_frequency * 0.001) * 0.1;
    const double amplification = awareness * signature.awareness_amplification;
    const double scale = 0.1 * amplification;
    const double count = static_cast<double>(geometry.vertices.size());

    for (size_t index = 0; index < geometry.vertices.size(); ++index) {
        Vec3& vertex = geometry.vertices[index];
        const double phase = breath_angle + static_cast<double>(index) / count * TAU;
        const double x = vertex.x() + time_offset;
        const double y = vertex.y() + std::sin(phase) * 0.05;
        const double z = vertex.z() + std::cos(phase) * 0.05;
        vertex += fractal_displacement(signature.fractal, x, y, z, scale, phase);
    }

    geometry.radius *= 1.0 + amplification * 0.2;
    return geometry;
}

} // namespace sacredgeo
