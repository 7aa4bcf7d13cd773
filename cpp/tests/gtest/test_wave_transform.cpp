// =============================================================================
// Wave Transformation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "sacredgeo/wave_transform.hpp"
#include "sacredgeo/constants.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/platonic.hpp"
#include <cmath>
#include <vector>

using namespace sacredgeo;

class WaveTransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        breath_.phase = BreathPhase::Inhale;
        breath_.intensity = 0.5;
        breath_.coherence = 0.7;
    }
    void TearDown() override {}

    static UserWaveData date_only(int year, int month, int day) {
        UserWaveData user;
        user.birth_date = CalendarDate{year, month, day};
        return user;
    }

    ConsciousnessWaveTransformer transformer_;
    BreathState breath_;
};

// =============================================================================
// Numerology helpers
// =============================================================================

TEST_F(WaveTransformTest, LifePathNumber) {
    EXPECT_EQ(life_path_number({1990, 7, 15}), 5);
    EXPECT_EQ(life_path_number({2000, 1, 1}), 4);
    EXPECT_EQ(life_path_number({2000, 1, 8}), 11);
    EXPECT_EQ(life_path_number({2009, 9, 2}), 22);
}

TEST_F(WaveTransformTest, LifePathFrequency) {
    EXPECT_DOUBLE_EQ(life_path_frequency(1), solfeggio::UT);
    EXPECT_DOUBLE_EQ(life_path_frequency(5), solfeggio::SOL);
    EXPECT_DOUBLE_EQ(life_path_frequency(8), chakra::ROOT);
    EXPECT_DOUBLE_EQ(life_path_frequency(11), planetary::EARTH);
    EXPECT_DOUBLE_EQ(life_path_frequency(22), planetary::MOON);
    EXPECT_DOUBLE_EQ(life_path_frequency(33), planetary::EARTH);
    EXPECT_DOUBLE_EQ(life_path_frequency(42), solfeggio::MI);
}

TEST_F(WaveTransformTest, NameFrequency) {
    EXPECT_DOUBLE_EQ(name_frequency("Ada"), 792.0);
    EXPECT_DOUBLE_EQ(name_frequency("a-d a"), 792.0);
    EXPECT_DOUBLE_EQ(name_frequency("J"), 572.0);
    EXPECT_DOUBLE_EQ(name_frequency(""), 528.0);
}

TEST_F(WaveTransformTest, DayOfYear) {
    EXPECT_EQ(day_of_year({2000, 1, 1}), 1);
    EXPECT_EQ(day_of_year({2000, 3, 1}), 61);
    EXPECT_EQ(day_of_year({2001, 3, 1}), 60);
    EXPECT_EQ(day_of_year({2000, 12, 31}), 366);
    EXPECT_DOUBLE_EQ(birth_frequency({2000, 1, 1}), 429.0);
}

TEST_F(WaveTransformTest, InvalidDatesThrow) {
    EXPECT_THROW(validate_date({2001, 2, 29}), InvalidArgumentError);
    EXPECT_THROW(validate_date({2000, 13, 1}), InvalidArgumentError);
    EXPECT_THROW(validate_date({2000, 4, 31}), InvalidArgumentError);
    EXPECT_THROW(validate_date({2000, 1, 0}), InvalidArgumentError);
    EXPECT_THROW(validate_date({0, 1, 1}), InvalidArgumentError);
    EXPECT_NO_THROW(validate_date({2000, 2, 29}));
    EXPECT_NO_THROW(validate_date({1900, 2, 28}));
    EXPECT_THROW(validate_date({1900, 2, 29}), InvalidArgumentError);
}

TEST_F(WaveTransformTest, ParseBirthTime) {
    EXPECT_EQ(parse_birth_time("14:30"), 870);
    EXPECT_EQ(parse_birth_time("00:00"), 0);
    EXPECT_EQ(parse_birth_time("7:05"), 425);
    EXPECT_EQ(parse_birth_time("23:59"), 1439);

    EXPECT_FALSE(parse_birth_time("24:00").has_value());
    EXPECT_FALSE(parse_birth_time("12:60").has_value());
    EXPECT_FALSE(parse_birth_time("1230").has_value());
    EXPECT_FALSE(parse_birth_time(":30").has_value());
    EXPECT_FALSE(parse_birth_time("12:").has_value());
    EXPECT_FALSE(parse_birth_time("ab:cd").has_value());
    EXPECT_FALSE(parse_birth_time("-1:30").has_value());
    EXPECT_FALSE(parse_birth_time("12:30pm").has_value());
}

// =============================================================================
// transform_user_data
// =============================================================================

TEST_F(WaveTransformTest, DateOnlyTransformation) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));

    EXPECT_DOUBLE_EQ(t.base_frequency, solfeggio::FA);
    const std::vector<double> harmonics = {417.0, 834.0, 1251.0, 2085.0, 3336.0};
    EXPECT_EQ(t.harmonics, harmonics);
    EXPECT_DOUBLE_EQ(t.amplitude, 0.5);
    EXPECT_DOUBLE_EQ(t.phase, 0.0);
    EXPECT_DOUBLE_EQ(t.modulation, 1.0);

    const std::vector<double> interference = {111.0, 12.0, 99.0, 472.5, 423.0};
    EXPECT_EQ(t.interference, interference);
    EXPECT_DOUBLE_EQ(t.resonance, 1.0);
}

TEST_F(WaveTransformTest, FullTransformation) {
    UserWaveData user = date_only(1990, 4, 10);
    user.birth_time = "06:00";
    user.birth_location = GeoLocation{0.0, 0.0};
    user.name = "Ada";

    const WaveTransformation t = transformer_.transform_user_data(user);
    EXPECT_NEAR(t.amplitude, 1.0, 1e-12);
    EXPECT_NEAR(t.phase, PI, 1e-12);
    EXPECT_NEAR(t.modulation, 1.1, 1e-12);
    EXPECT_DOUBLE_EQ(t.interference[0], std::abs(t.base_frequency - 792.0));
}

TEST_F(WaveTransformTest, LifePathOverride) {
    UserWaveData user = date_only(2000, 1, 1);
    user.life_path_number = 11;
    const WaveTransformation t = transformer_.transform_user_data(user);
    EXPECT_DOUBLE_EQ(t.base_frequency, planetary::EARTH);
    EXPECT_GT(t.resonance, 0.0);
    EXPECT_LE(t.resonance, 1.0);
}

TEST_F(WaveTransformTest, UnparseableTimeIgnored) {
    UserWaveData user = date_only(2000, 7, 1);
    user.birth_time = "noon";
    const WaveTransformation t = transformer_.transform_user_data(user);
    EXPECT_NEAR(t.amplitude, 0.7, 1e-12);
    EXPECT_NEAR(t.phase, 6.0 / 12.0 * TAU, 1e-12);
}

TEST_F(WaveTransformTest, PhaseWrapsIntoCycle) {
    UserWaveData user = date_only(2000, 12, 31);
    user.birth_time = "23:59";
    const WaveTransformation t = transformer_.transform_user_data(user);
    EXPECT_GE(t.phase, 0.0);
    EXPECT_LT(t.phase, TAU);
    EXPECT_NEAR(t.phase, (11.0 / 12.0 + 1439.0 / 1440.0 - 1.0) * TAU, 1e-12);
}

TEST_F(WaveTransformTest, InvalidBirthDateThrows) {
    EXPECT_THROW(transformer_.transform_user_data(date_only(2000, 2, 30)), InvalidArgumentError);
}

// =============================================================================
// Geometry, portals and volume
// =============================================================================

TEST_F(WaveTransformTest, ApplyTransformationScalesRadius) {
    const Geometry base = PlatonicSolidGenerator::dodecahedron(1.0);
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));
    const Geometry g = transformer_.apply_wave_transformation(base, t, make_consciousness(0.8),
                                                              breath_, 2.0);

    EXPECT_NEAR(g.radius, 1.0 + 0.3 * 0.8 * 0.5, 1e-12);
    EXPECT_EQ(g.vertex_count(), base.vertex_count());
    EXPECT_EQ(g.faces, base.faces);
    for (const Vec3& v : g.vertices) {
        EXPECT_TRUE(v.allFinite());
    }
}

TEST_F(WaveTransformTest, ApplyTransformationRejectsMalformedGeometry) {
    Geometry broken = PlatonicSolidGenerator::cube();
    broken.edges.emplace_back(0, 8);
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));
    EXPECT_THROW(transformer_.apply_wave_transformation(broken, t, make_consciousness(0.5), breath_),
                 InvariantViolationError);
}

TEST_F(WaveTransformTest, PortalCountFollowsAwareness) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));
    const Vec3 center = Vec3::Zero();
    EXPECT_EQ(transformer_.generate_fractal_portal(center, t, make_consciousness(0.0)).size(), 3u);
    EXPECT_EQ(transformer_.generate_fractal_portal(center, t, make_consciousness(0.5)).size(), 6u);
    EXPECT_EQ(transformer_.generate_fractal_portal(center, t, make_consciousness(1.0)).size(), 10u);
}

TEST_F(WaveTransformTest, PortalAttributes) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));
    const Vec3 center(1.0, 2.0, 3.0);
    const auto portals = transformer_.generate_fractal_portal(center, t, make_consciousness(1.0), 4.0);
    ASSERT_EQ(portals.size(), 10u);

    for (size_t i = 0; i < portals.size(); ++i) {
        EXPECT_DOUBLE_EQ(portals[i].scale, 0.5);
        EXPECT_DOUBLE_EQ(portals[i].rotation, t.harmonics[i % 5] * 0.01);
        EXPECT_DOUBLE_EQ(portals[i].intensity, t.interference[i % 5]);
    }

    // First portal sits on the +x axis of the ring; phase is 0 for a January date
    EXPECT_TRUE(portals[0].position.isApprox(Vec3(3.0, 2.0, 3.0)));
}

TEST_F(WaveTransformTest, PortalRejectsBadZoom) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(2000, 1, 1));
    EXPECT_THROW(transformer_.generate_fractal_portal(Vec3::Zero(), t, make_consciousness(0.5), 0.0),
                 InvalidArgumentError);
}

TEST_F(WaveTransformTest, VolumeFieldShape) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(1985, 10, 26));
    const VolumeField volume =
        transformer_.generate_volume_field(4, 3, 2, t, make_consciousness(0.6), breath_, 1.0);
    EXPECT_EQ(volume.width, 4u);
    EXPECT_EQ(volume.height, 3u);
    EXPECT_EQ(volume.depth, 2u);
    EXPECT_EQ(volume.size(), 24u);
    for (float v : volume.values) {
        EXPECT_TRUE(std::isfinite(v));
    }
}

TEST_F(WaveTransformTest, VolumeFieldSilentWithoutCoherence) {
    const WaveTransformation t = transformer_.transform_user_data(date_only(1985, 10, 26));
    breath_.coherence = 0.0;
    const VolumeField volume =
        transformer_.generate_volume_field(3, 3, 3, t, make_consciousness(0.6), breath_);
    for (float v : volume.values) {
        EXPECT_FLOAT_EQ(v, 0.0f);
    }
}
