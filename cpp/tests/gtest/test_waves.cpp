// =============================================================================
// Wave Synthesis Tests
// =============================================================================

#include <gtest/gtest.h>
#include "sacredgeo/waves.hpp"
#include "sacredgeo/error.hpp"
#include <cmath>
#include <string>
#include <vector>

using namespace sacredgeo;

class WavesTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// =============================================================================
// ConsciousnessWave
// =============================================================================

TEST_F(WavesTest, ValueAtQuarterPeriod) {
    const ConsciousnessWave wave{2.0, 1.0, 0.0, 0.0};
    EXPECT_NEAR(wave.value(0.25), 2.0, 1e-12);
    EXPECT_NEAR(wave.value(0.0), 0.0, 1e-12);
}

TEST_F(WavesTest, ValueDecays) {
    const ConsciousnessWave wave{2.0, 1.0, 0.0, 1.0};
    EXPECT_NEAR(wave.value(0.25), 2.0 * std::exp(-0.25), 1e-12);
}

TEST_F(WavesTest, DerivativeAtOrigin) {
    const ConsciousnessWave wave{1.0, 1.0, 0.0, 0.0};
    EXPECT_NEAR(wave.derivative(0.0), TAU, 1e-12);
}

TEST_F(WavesTest, DerivativeMatchesFiniteDifference) {
    const std::vector<ConsciousnessWave> waves = {
        {1.0, 1.0, 0.0, 0.0},
        {0.5, 3.0, 0.7, 0.2},
        {2.0, 0.25, -1.1, 1.5},
    };
    const double h = 1e-6;
    for (const auto& wave : waves) {
        for (double t : {0.0, 0.3, 1.7}) {
            const double numeric = (wave.value(t + h) - wave.value(t - h)) / (2.0 * h);
            EXPECT_NEAR(wave.derivative(t), numeric, 1e-5);
        }
    }
}

TEST_F(WavesTest, ModulateWithIsProduct) {
    const ConsciousnessWave a{1.0, 1.0, 0.3, 0.0};
    const ConsciousnessWave b{0.5, 2.0, 0.1, 0.1};
    for (double t : {0.1, 0.4, 0.9}) {
        EXPECT_NEAR(a.modulate_with(b, t), a.value(t) * b.value(t), 1e-15);
    }
}

TEST_F(WavesTest, InterferenceIsMean) {
    EXPECT_DOUBLE_EQ(wave_interference({}, 1.0), 0.0);

    const ConsciousnessWave a{2.0, 1.0, 0.0, 0.0};
    const ConsciousnessWave b{1.0, 1.0, 0.0, 0.0};
    EXPECT_NEAR(wave_interference({a, b}, 0.25), 1.5, 1e-12);
}

// =============================================================================
// ConsciousnessFieldWave
// =============================================================================

TEST_F(WavesTest, FieldWaveHarmonics) {
    const ConsciousnessFieldWave field(100.0);
    const auto& harmonics = field.harmonics();
    ASSERT_EQ(harmonics.size(), 5u);

    const double multiples[] = {1.0, 2.0, 3.0, 5.0, 8.0};
    for (size_t i = 0; i < harmonics.size(); ++i) {
        EXPECT_DOUBLE_EQ(harmonics[i].frequency, 100.0 * multiples[i]);
        EXPECT_DOUBLE_EQ(harmonics[i].amplitude, 1.0 / multiples[i]);
        EXPECT_NEAR(harmonics[i].phase, std::fmod(i * PHI, TAU), 1e-12);
        EXPECT_DOUBLE_EQ(harmonics[i].decay, 0.0);
    }
}

TEST_F(WavesTest, FieldValueAtOrigin) {
    const ConsciousnessFieldWave field;
    EXPECT_DOUBLE_EQ(field.base_frequency(), solfeggio::SOL);

    double expected = 0.0;
    for (const auto& wave : field.harmonics()) {
        expected += wave.amplitude * std::sin(wave.phase);
    }
    expected /= 5.0;
    EXPECT_NEAR(field.field_value_at(0.0, 0.0, 0.0, 0.0), expected, 1e-12);
}

TEST_F(WavesTest, ConsciousnessStateFromSamples) {
    const ConsciousnessFieldWave field;
    const ConsciousnessState state =
        field.generate_consciousness_state({0.9, -0.5, 0.1, 0.6, 0.0}, 1.0);

    EXPECT_NEAR(state.awareness_level, 0.42, 1e-12);

    const std::vector<std::string> integration = {
        "Integration Point 1", "Integration Point 4", "Integration Point 2"};
    EXPECT_EQ(state.integration_points, integration);

    EXPECT_EQ(state.expansion_vectors.size(), 2u);
    EXPECT_EQ(state.expansion_vectors.front(), "Expansion Vector 1");
    ASSERT_EQ(state.shadow_territories.size(), 1u);
    EXPECT_EQ(state.shadow_territories.front(), "Shadow Territory 1");

    const std::vector<std::string> light = {"UT", "SOL", "LA", "DO", "SI"};
    EXPECT_EQ(state.light_frequencies, light);
}

TEST_F(WavesTest, ConsciousnessStateEmptySamples) {
    const ConsciousnessFieldWave field;
    const ConsciousnessState state = field.generate_consciousness_state({}, 1.0);
    EXPECT_DOUBLE_EQ(state.awareness_level, 0.0);
    EXPECT_TRUE(state.integration_points.empty());
    EXPECT_TRUE(state.expansion_vectors.empty());
    EXPECT_TRUE(state.shadow_territories.empty());
    EXPECT_TRUE(state.light_frequencies.empty());
}

TEST_F(WavesTest, ConsciousnessStateAwarenessClamped) {
    const ConsciousnessFieldWave field;
    const ConsciousnessState state = field.generate_consciousness_state({5.0, -5.0}, 1.0);
    EXPECT_DOUBLE_EQ(state.awareness_level, 1.0);
}

TEST_F(WavesTest, ConsciousnessStateZeroCoherence) {
    const ConsciousnessFieldWave field;
    const ConsciousnessState state = field.generate_consciousness_state({0.528, 0.9}, 0.0);
    EXPECT_DOUBLE_EQ(state.awareness_level, 0.0);
    EXPECT_TRUE(state.light_frequencies.empty());
}

// =============================================================================
// FractalWave
// =============================================================================

TEST_F(WavesTest, FractalWaveDefaults) {
    const FractalWave wave;
    EXPECT_EQ(wave.octaves(), 5);
    EXPECT_DOUBLE_EQ(wave.lacunarity(), 2.0);
    EXPECT_DOUBLE_EQ(wave.persistence(), 0.5);
}

TEST_F(WavesTest, FractalWaveNegativeOctavesThrows) {
    EXPECT_THROW(FractalWave wave(-1), InvalidArgumentError);
}

TEST_F(WavesTest, FractalNoiseSingleOctave) {
    const FractalWave wave(1);
    EXPECT_NEAR(wave.fractal_noise(0.0, 0.0, 0.25), 1.0, 1e-12);
    EXPECT_NEAR(wave.fractal_noise(0.0, 0.0, 0.0), 0.0, 1e-12);
}

TEST_F(WavesTest, FractalNoiseNoOctaves) {
    const FractalWave wave(0);
    EXPECT_DOUBLE_EQ(wave.fractal_noise(1.0, 2.0, 3.0), 0.0);
    EXPECT_DOUBLE_EQ(wave.consciousness_fractal(1.0, 2.0, 3.0, 1.0, 0.5), 0.0);
}

TEST_F(WavesTest, ConsciousnessFractalUsesFewerOctavesAtLowAwareness) {
    // awareness 0 keeps floor(2 · 0.5) = 1 octave, equal to a 1-octave fractal_noise
    const FractalWave two(2);
    const FractalWave one(1);
    for (double t : {0.1, 0.35, 0.8}) {
        EXPECT_NEAR(two.consciousness_fractal(0.5, 0.25, t, 0.0, 0.0),
                    one.fractal_noise(0.5, 0.25, t), 1e-12);
    }
}
