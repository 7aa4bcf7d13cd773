// =============================================================================
// Archetype Tests
// =============================================================================

#include <gtest/gtest.h>
#include "sacredgeo/archetypes.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/waves.hpp"
#include <cmath>

using namespace sacredgeo;

class ArchetypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        breath_.phase = BreathPhase::Exhale;
        breath_.intensity = 0.4;
        breath_.coherence = 0.9;
    }
    void TearDown() override {}

    const ArchetypeSignature& generator_row() const {
        return all_archetypes()[static_cast<size_t>(ArchetypeId::Generator)];
    }

    // Per-vertex composition of generate_type_fractal, evaluated step by step.
    static Geometry composed(const ArchetypeSignature& signature, double awareness,
                             const BreathState& breath, double time) {
        Geometry g = PlatonicSolidGenerator::make(signature.base_solid, 1.0, awareness);
        const double breath_angle = breath_phase_angle(breath);
        const double time_offset = std::sin(time * signature.wave_frequency * 0.001) * 0.1;
        const double scale = 0.1 * awareness * signature.awareness_amplification;
        const double n = static_cast<double>(g.vertices.size());

        for (size_t i = 0; i < g.vertices.size(); ++i) {
            const Vec3 v = g.vertices[i];
            const double phase = breath_angle + static_cast<double>(i) / n * TAU;
            g.vertices[i] = v + fractal_displacement(signature.fractal,
                                                     v.x() + time_offset,
                                                     v.y() + std::sin(phase) * 0.05,
                                                     v.z() + std::cos(phase) * 0.05,
                                                     scale, phase);
        }
        return g;
    }

    static double total_distance(const Geometry& a, const Geometry& b) {
        double sum = 0.0;
        for (size_t i = 0; i < a.vertices.size(); ++i) {
            sum += (a.vertices[i] - b.vertices[i]).norm();
        }
        return sum;
    }

    BreathState breath_;
};

TEST_F(ArchetypesTest, TableIndexedById) {
    const auto& table = all_archetypes();
    ASSERT_EQ(table.size(), ARCHETYPE_COUNT);
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(static_cast<size_t>(table[i].id), i);
    }
}

TEST_F(ArchetypesTest, HumanDesignRows) {
    const ArchetypeSignature& manifestor = archetype_signature(ArchetypeId::Manifestor);
    EXPECT_EQ(manifestor.taxonomy, Taxonomy::HumanDesign);
    EXPECT_EQ(manifestor.base_solid, PlatonicKind::Tetrahedron);
    EXPECT_EQ(manifestor.fractal, FractalKind::Mandelbrot);
    EXPECT_DOUBLE_EQ(manifestor.wave_frequency, solfeggio::UT);
    EXPECT_DOUBLE_EQ(manifestor.awareness_amplification, 1.5);

    const ArchetypeSignature& projector = archetype_signature(ArchetypeId::Projector);
    EXPECT_EQ(projector.base_solid, PlatonicKind::Dodecahedron);
    EXPECT_EQ(projector.fractal, FractalKind::Sierpinski);
    EXPECT_DOUBLE_EQ(projector.breath_modulation, 0.8);

    for (size_t i = 0; i < 5; ++i) {
        const ArchetypeSignature& row = all_archetypes()[i];
        EXPECT_EQ(row.taxonomy, Taxonomy::HumanDesign);
        EXPECT_FALSE(row.center.has_value());
        EXPECT_EQ(row.fractal_depth, 3);
    }
}

TEST_F(ArchetypesTest, EnneagramFractalFollowsCenter) {
    for (size_t i = 5; i < ARCHETYPE_COUNT; ++i) {
        const ArchetypeSignature& row = all_archetypes()[i];
        EXPECT_EQ(row.taxonomy, Taxonomy::Enneagram);
        ASSERT_TRUE(row.center.has_value()) << to_string(row.id);

        switch (*row.center) {
            case EnneagramCenter::Body:  EXPECT_EQ(row.fractal, FractalKind::Mandelbrot); break;
            case EnneagramCenter::Heart: EXPECT_EQ(row.fractal, FractalKind::Julia); break;
            case EnneagramCenter::Head:  EXPECT_EQ(row.fractal, FractalKind::Dragon); break;
        }
        EXPECT_NEAR(row.awareness_amplification, 1.0 + row.fractal_depth * 0.1, 1e-12);
        EXPECT_DOUBLE_EQ(row.breath_modulation, 1.0);
    }
}

TEST_F(ArchetypesTest, EnneagramSpecificRows) {
    const ArchetypeSignature& five = archetype_signature(ArchetypeId::Enneagram5);
    EXPECT_EQ(five.center, EnneagramCenter::Head);
    EXPECT_EQ(five.base_solid, PlatonicKind::Dodecahedron);
    EXPECT_EQ(five.fractal_depth, 7);
    EXPECT_DOUBLE_EQ(five.wave_frequency, solfeggio::SOL);

    const ArchetypeSignature& one = archetype_signature(ArchetypeId::Enneagram1);
    EXPECT_TRUE(one.integration_vector.isApprox(Vec3(0.7, 0.7, 0.0)));
    EXPECT_TRUE(one.disintegration_vector.isApprox(Vec3(0.4, 0.4, 0.4)));

    EXPECT_DOUBLE_EQ(archetype_signature(ArchetypeId::Enneagram8).wave_frequency, chakra::ROOT);
    EXPECT_DOUBLE_EQ(archetype_signature(ArchetypeId::Enneagram9).wave_frequency, chakra::CROWN);
}

TEST_F(ArchetypesTest, UnknownIdFallsBackToGenerator) {
    EXPECT_EQ(&archetype_signature(99), &generator_row());
    EXPECT_EQ(&archetype_signature(-1), &generator_row());
    EXPECT_EQ(&archetype_signature(static_cast<ArchetypeId>(42)), &generator_row());
    EXPECT_EQ(&archetype_signature(std::string_view("unknown")), &generator_row());
}

TEST_F(ArchetypesTest, KnownIdsResolve) {
    EXPECT_EQ(archetype_signature(0).id, ArchetypeId::Manifestor);
    EXPECT_EQ(archetype_signature(13).id, ArchetypeId::Enneagram9);
}

TEST_F(ArchetypesTest, NameLookupIgnoresCase) {
    EXPECT_EQ(archetype_from_name("Manifesting-Generator"), ArchetypeId::ManifestingGenerator);
    EXPECT_EQ(archetype_from_name("ENNEAGRAM-7"), ArchetypeId::Enneagram7);
    EXPECT_EQ(archetype_signature(std::string_view("Reflector")).id, ArchetypeId::Reflector);

    EXPECT_FALSE(archetype_from_name("enneagram-10").has_value());
    EXPECT_FALSE(archetype_from_name("").has_value());
}

TEST_F(ArchetypesTest, EveryNameResolves) {
    for (const auto& row : all_archetypes()) {
        EXPECT_EQ(archetype_from_name(to_string(row.id)), row.id);
    }
}

TEST_F(ArchetypesTest, TaxonomyAndCenterNames) {
    EXPECT_STREQ(to_string(Taxonomy::HumanDesign), "human-design");
    EXPECT_STREQ(to_string(Taxonomy::Enneagram), "enneagram");
    EXPECT_STREQ(to_string(EnneagramCenter::Heart), "heart");
}

// =============================================================================
// Type fractal generation
// =============================================================================

TEST_F(ArchetypesTest, ZeroAwarenessLeavesBaseSolid) {
    const ArchetypeSignature& signature = archetype_signature(ArchetypeId::Manifestor);
    const Geometry base = PlatonicSolidGenerator::tetrahedron(1.0, 0.0);
    const Geometry g = generate_type_fractal(signature, make_consciousness(0.0), breath_, 3.0);

    ASSERT_EQ(g.vertex_count(), base.vertex_count());
    for (size_t i = 0; i < g.vertices.size(); ++i) {
        EXPECT_NEAR((g.vertices[i] - base.vertices[i]).norm(), 0.0, 1e-15);
    }
    EXPECT_DOUBLE_EQ(g.radius, base.radius);
    EXPECT_EQ(g.faces, base.faces);
}

TEST_F(ArchetypesTest, RadiusGrowsWithAmplification) {
    const ArchetypeSignature& signature = archetype_signature(ArchetypeId::Reflector);
    const Geometry g = generate_type_fractal(signature, make_consciousness(0.5), breath_);

    // icosahedron modulated to 1.05, then grown by 1 + 0.5 · 2.0 · 0.2
    EXPECT_NEAR(g.radius, 1.05 * 1.2, 1e-12);
    EXPECT_EQ(g.vertex_count(), 12u);
}

TEST_F(ArchetypesTest, EveryArchetypeProducesFiniteGeometry) {
    for (const auto& row : all_archetypes()) {
        const Geometry g = generate_type_fractal(row, make_consciousness(1.0), breath_, 12.5);
        const Geometry base = PlatonicSolidGenerator::make(row.base_solid, 1.0, 1.0);
        EXPECT_EQ(g.vertex_count(), base.vertex_count()) << to_string(row.id);
        EXPECT_EQ(g.face_count(), base.face_count()) << to_string(row.id);
        for (const Vec3& v : g.vertices) {
            EXPECT_TRUE(v.allFinite()) << to_string(row.id);
        }
        EXPECT_NO_THROW(validate_geometry(g));
    }
}

TEST_F(ArchetypesTest, DisplacementBoundedByScale) {
    const ArchetypeSignature& signature = archetype_signature(ArchetypeId::Enneagram7);
    const double awareness = 0.6;
    const Geometry base = PlatonicSolidGenerator::tetrahedron(1.0, awareness);
    const Geometry g = generate_type_fractal(signature, make_consciousness(awareness), breath_, 1.0);

    const double scale = 0.1 * awareness * signature.awareness_amplification;
    for (size_t i = 0; i < g.vertices.size(); ++i) {
        EXPECT_LE((g.vertices[i] - base.vertices[i]).norm(), scale * std::sqrt(2.0) + 1e-12);
    }
}

TEST_F(ArchetypesTest, VertexDisplacementUsesBreathPhaseAndTime) {
    const double awareness = 0.8;
    const double time = 1000.0;

    for (ArchetypeId id : {ArchetypeId::Manifestor, ArchetypeId::ManifestingGenerator}) {
        const ArchetypeSignature& signature = archetype_signature(id);
        const Geometry g = generate_type_fractal(signature, make_consciousness(awareness), breath_, time);
        const Geometry expected = composed(signature, awareness, breath_, time);

        ASSERT_EQ(g.vertex_count(), expected.vertex_count()) << to_string(id);
        for (size_t i = 0; i < g.vertices.size(); ++i) {
            EXPECT_NEAR((g.vertices[i] - expected.vertices[i]).norm(), 0.0, 1e-12)
                << to_string(id) << " vertex " << i;
        }
    }
}

TEST_F(ArchetypesTest, MandelbrotDisplacementFollowsBreathPhase) {
    const ArchetypeSignature& signature = archetype_signature(ArchetypeId::Manifestor);
    ASSERT_EQ(signature.fractal, FractalKind::Mandelbrot);

    BreathState inhale = breath_;
    inhale.phase = BreathPhase::Inhale;
    inhale.intensity = 0.5;

    const Geometry exhaling = generate_type_fractal(signature, make_consciousness(0.8), breath_, 1000.0);
    const Geometry inhaling = generate_type_fractal(signature, make_consciousness(0.8), inhale, 1000.0);
    EXPECT_GT(total_distance(exhaling, inhaling), 1e-6);
}

TEST_F(ArchetypesTest, DragonDisplacementFollowsBreathAndTime) {
    const ArchetypeSignature& signature = archetype_signature(ArchetypeId::ManifestingGenerator);
    ASSERT_EQ(signature.fractal, FractalKind::Dragon);
    const ConsciousnessState consciousness = make_consciousness(0.8);

    BreathState inhale = breath_;
    inhale.phase = BreathPhase::Inhale;
    inhale.intensity = 0.5;

    const Geometry reference = generate_type_fractal(signature, consciousness, breath_, 1000.0);
    const Geometry other_breath = generate_type_fractal(signature, consciousness, inhale, 1000.0);
    const Geometry other_time = generate_type_fractal(signature, consciousness, breath_, 0.0);

    EXPECT_GT(total_distance(reference, other_breath), 1e-6);
    EXPECT_GT(total_distance(reference, other_time), 1e-6);
}
