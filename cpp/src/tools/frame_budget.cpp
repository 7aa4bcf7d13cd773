// =============================================================================
// sg_frame_budget - per-frame cost of the geometry pipeline
// =============================================================================
//
// Simulates a 60 Hz render loop: breath sample -> archetype fractal ->
// subdivision -> consciousness field, timing each frame.
//
// Usage:
//   sg_frame_budget [config-file]
//
// Configuration keys (env or file): engine.*, bench.frames, bench.budget_ms.
//
// =============================================================================

#include <algorithm>
#include <iostream>
#include <limits>
#include <string>

#include "sacredgeo/archetypes.hpp"
#include "sacredgeo/config.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/fields.hpp"
#include "sacredgeo/logging.hpp"
#include "sacredgeo/subdivision.hpp"
#include "sacredgeo/waves.hpp"
#include "timer.hpp"

using namespace sacredgeo;

namespace {

constexpr double FRAME_SECONDS = 1.0 / 60.0;

struct FrameStats {
    double min_ms = std::numeric_limits<double>::max();
    double max_ms = 0.0;
    double total_ms = 0.0;
    int frames = 0;

    void add(double ms) {
        min_ms = std::min(min_ms, ms);
        max_ms = std::max(max_ms, ms);
        total_ms += ms;
        ++frames;
    }

    double mean_ms() const { return frames > 0 ? total_ms / frames : 0.0; }
};

FrameStats run_frames(const EngineSettings& settings) {
    const ArchetypeSignature& signature = archetype_signature(settings.archetype);
    const BreathWave breath(settings.breath_pattern, 0.0);

    FrameStats stats;
    tools::Timer timer;
    size_t vertices = 0;
    double field_sum = 0.0;

    for (int frame = 0; frame < settings.bench_frames; ++frame) {
        const double now = frame * FRAME_SECONDS;
        {
            tools::ScopedTimer scoped(timer, "frame " + std::to_string(frame));

            const BreathState state = breath.current_state(now);
            const ConsciousnessState consciousness = make_consciousness(0.5 + 0.4 * state.intensity);

            Geometry geometry = generate_type_fractal(signature, consciousness, state, now);
            geometry = subdivide(geometry, settings.subdivision_levels, consciousness.awareness_level);

            const ScalarField field = generate_consciousness_field(
                settings.field_width, settings.field_height, consciousness, state, now);

            vertices = geometry.vertex_count();
            field_sum += field.values.front();
        }
        stats.add(timer.elapsed_ms());
    }

    LOG_DEBUG(Tools, "Last frame: ", vertices, " vertices, field checksum ", field_sum);
    return stats;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::string config_file = argc > 1 ? argv[1] : "sacredgeo.env";

    if (!init_config(config_file)) {
        std::cerr << "Configuration invalid, see log for details" << std::endl;
        return 1;
    }

    EngineSettings settings;
    try {
        settings = EngineSettings::from_config();
    } catch (const ConfigError& e) {
        LOG_ERROR(Tools, e.what());
        return 1;
    }

    LOG_INFO(Tools, "Running ", settings.bench_frames, " frames: archetype ", to_string(settings.archetype),
             ", ", settings.subdivision_levels, " subdivision levels, field ",
             settings.field_width, "x", settings.field_height);

    FrameStats stats;
    try {
        stats = run_frames(settings);
    } catch (const SacredGeoException& e) {
        LOG_ERROR(Tools, "Frame pipeline failed: ", e.what());
        return 1;
    }

    LOG_INFO(Tools, "Frame time over ", stats.frames, " frames: min ", stats.min_ms, " ms, mean ",
             stats.mean_ms(), " ms, max ", stats.max_ms, " ms");

    if (stats.mean_ms() > settings.budget_ms) {
        LOG_WARN(Tools, "Mean frame time ", stats.mean_ms(), " ms exceeds budget of ",
                 settings.budget_ms, " ms");
    }
    return 0;
}
