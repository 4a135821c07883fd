#pragma once

#include <umbra/math/geometry.hpp>
#include <umbra/scene/entity.hpp>
#include <umbra/scene/providers.hpp>
#include <umbra/vision/states.hpp>

#include <string>

namespace umbra::vision {

// The three channels combined into a visibility state
enum class VisibilitySignal : u8 {
    LineOfSight,
    Distance,
    Illumination
};

const char* to_string(VisibilitySignal signal) noexcept;

struct VisibilityEvaluation {
    VisibilityState state = VisibilityState::Observed;

    // Per-signal results; the line-of-sight signal is absent when it was skipped
    Option<VisibilityState> line_of_sight_signal;
    VisibilityState illumination_signal = VisibilityState::Observed;
    VisibilityState distance_signal = VisibilityState::Observed;
    VisibilitySignal deciding_signal = VisibilitySignal::LineOfSight;

    LightingBand lighting = LightingBand::Unknown;
    bool has_line_of_sight = true;
    double distance_feet = 0.0;

    EvaluationSource source = EvaluationSource::Native;
    std::string error;

    bool fallback_used() const noexcept { return source != EvaluationSource::Native; }
};

/**
 * @brief Determines how well an observer perceives a target.
 *
 * Combines a line-of-sight signal, an illumination signal and a
 * distance/special-sense signal; the least visible of the three wins. If the
 * spatial oracle fails the line-of-sight signal is skipped (lighting-only
 * fallback); if that fails too the target is reported as observed.
 */
class VisibilityCalculator {
public:
    /**
     * @brief Create a calculator reading walls and light from the given provider
     * @param spatial Line-of-sight and lighting oracle, must outlive the calculator
     * @param scale Map-unit to feet conversion for range checks
     */
    VisibilityCalculator(const scene::ISpatialQueryProvider& spatial, math::MapScale scale);

    /**
     * @brief Full evaluation with per-signal detail. Never throws.
     */
    VisibilityEvaluation evaluate(const scene::Entity& observer, const scene::Entity& target) const;

    /**
     * @brief Visibility state only. Never throws.
     */
    VisibilityState calculate(const scene::Entity& observer, const scene::Entity& target) const;

    /**
     * @brief Secondary tier: lighting and distance without line of sight.
     * @throws Whatever the lighting oracle throws
     */
    VisibilityEvaluation lighting_only(const scene::Entity& observer, const scene::Entity& target) const;

    /**
     * @brief Secondary tier wrapped so it never throws; defaults to observed.
     */
    VisibilityEvaluation evaluate_fallback(const scene::Entity& observer, const scene::Entity& target) const;

    // Availability flag consulted by the integration layer and recovery probes
    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    const math::MapScale& scale() const { return scale_; }

private:
    VisibilityEvaluation evaluate_native(const scene::Entity& observer, const scene::Entity& target) const;

    // Best state any non-visual sense in range can provide
    static VisibilityState sense_bridge(const scene::SenseProfile& senses, double distance_feet);

    static VisibilityState illumination_signal(const scene::SenseProfile& senses,
                                               LightingBand lighting,
                                               bool concealing_terrain,
                                               bool vision_blocked,
                                               double distance_feet);

    static VisibilityState distance_signal(const scene::SenseProfile& senses, double distance_feet);

    static void resolve(VisibilityEvaluation& evaluation);

    const scene::ISpatialQueryProvider& spatial_;
    math::MapScale scale_;
    bool enabled_ = true;
};

} // namespace umbra::vision
