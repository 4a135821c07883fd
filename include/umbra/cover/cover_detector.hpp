#pragma once

#include <umbra/core/config.hpp>
#include <umbra/cover/coverage_estimator.hpp>
#include <umbra/math/geometry.hpp>
#include <umbra/scene/providers.hpp>
#include <umbra/vision/states.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace umbra::cover {

struct DetectOptions {
    // The attacking entity, when cover is measured from a creature rather than a bare point
    const scene::Entity* observer = nullptr;

    // Answers whether a potential blocker is undetected by the observer.
    // Only consulted when CoverConfig::ignore_undetected is set.
    std::function<bool(const scene::Entity&)> is_undetected;
};

struct CoverEvaluation {
    vision::CoverState state = vision::CoverState::None;
    vision::CoverState wall_state = vision::CoverState::None;
    vision::CoverState entity_state = vision::CoverState::None;

    WallCoverage wall_coverage;
    std::vector<std::string> blockers;     // entities that were eligible to block

    vision::EvaluationSource source = vision::EvaluationSource::Native;
    std::string error;
    bool wall_collision = false;           // wall_state came from the collision test, not the estimator

    bool fallback_used() const noexcept { return source != vision::EvaluationSource::Native; }

    // Tier label for a heuristic result
    const char* fallback_tier() const noexcept {
        return wall_collision ? "wall-collision-fallback" : "walls-only-fallback";
    }
};

/**
 * @brief Computes the cover a target has against an observer.
 *
 * Walls are measured by coverage percentage through the estimator and
 * mapped to standard or greater cover by the configured thresholds.
 * Creatures standing between the two are classified by the configured
 * intersection mode. The stronger of the two results wins; walls that reach
 * a cover tier therefore always take precedence over weaker creature cover.
 *
 * detect() and evaluate() never throw. When the coverage estimate fails the
 * detector falls back to a plain wall collision test, which yields standard
 * cover whenever a wall crosses the line to the target.
 */
class CoverDetector {
public:
    CoverDetector(const scene::ISpatialQueryProvider& spatial,
                  const scene::ISceneInventory& inventory,
                  core::CoverConfig config,
                  math::MapScale scale,
                  std::unique_ptr<ICoverageEstimator> estimator = nullptr);

    vision::CoverState detect(const math::Point& origin, const scene::Entity& target,
                              const DetectOptions& options = {}) const;

    // Cover from one creature to another; the attacker's footprint is used for tactical lines
    vision::CoverState detect_between(const scene::Entity& attacker, const scene::Entity& target,
                                      DetectOptions options = {}) const;

    CoverEvaluation evaluate(const math::Point& origin, const scene::Entity& target,
                             const DetectOptions& options = {}) const;

    // Secondary tier only, never throws
    CoverEvaluation evaluate_fallback(const math::Point& origin, const scene::Entity& target) const;

    /**
     * @brief Standard cover if any cover-eligible wall crosses the lines to the target
     * @throws Whatever the spatial provider throws
     */
    vision::CoverState wall_collision_fallback(const math::Point& origin, const scene::Entity& target) const;

    // Maps a wall coverage percentage to a cover state using the thresholds
    vision::CoverState classify_coverage(double percent) const;

    // Entities that may block after the configured filters are applied
    std::vector<scene::Entity> eligible_blockers(const math::Point& origin,
                                                 const scene::Entity& target,
                                                 const DetectOptions& options) const;

    void set_estimator(std::unique_ptr<ICoverageEstimator> estimator);

    void set_enabled(bool enabled) { config_.enabled = enabled; }
    bool is_enabled() const { return config_.enabled; }

    const core::CoverConfig& config() const { return config_; }
    void set_config(const core::CoverConfig& config);

private:
    std::vector<scene::Wall> cover_walls(const math::Point& origin, const scene::Entity& target) const;

    vision::CoverState collision_state(const math::Point& origin, const scene::Entity& target,
                                       const std::vector<scene::Wall>& walls) const;

    vision::CoverState wall_overrides(const math::Point& origin, const scene::Entity& target,
                                      const std::vector<scene::Wall>& walls) const;

    vision::CoverState evaluate_entities(const math::Point& origin, const scene::Entity& target,
                                         const DetectOptions& options,
                                         const std::vector<scene::Entity>& blockers) const;

    // Intersection modes
    vision::CoverState size_heuristic_cover(const math::Point& origin, const scene::Entity& target,
                                            const DetectOptions& options,
                                            const std::vector<scene::Entity>& blockers) const;
    vision::CoverState side_coverage_cover(const math::Point& origin, const scene::Entity& target,
                                           const std::vector<scene::Entity>& blockers) const;
    vision::CoverState tactical_cover(const math::Point& origin, const scene::Entity& target,
                                      const DetectOptions& options,
                                      const std::vector<scene::Entity>& blockers) const;
    vision::CoverState sampled_height_cover(const math::Point& origin, const scene::Entity& target,
                                            const DetectOptions& options,
                                            const std::vector<scene::Entity>& blockers) const;

    bool line_crosses_blocker(const math::Segment& line, const math::Rect& rect) const;

    vision::CoverState cap(vision::CoverState state) const;

    const scene::ISpatialQueryProvider& spatial_;
    const scene::ISceneInventory& inventory_;
    core::CoverConfig config_;
    math::MapScale scale_;
    std::unique_ptr<ICoverageEstimator> estimator_;
};

} // namespace umbra::cover
