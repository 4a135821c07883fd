#include <umbra/cover/cover_detector.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace umbra::cover {

using vision::CoverState;

namespace {

    constexpr double ANY_MODE_MIN_FRACTION = 0.05;    // of blocker width
    constexpr double LENGTH10_MIN_PERCENT = 10.0;     // of blocker squares
    constexpr double CENTER_TOLERANCE_FRACTION = 0.02; // of a grid square

    // Side coverage tiers for the coverage intersection mode
    constexpr double SIDE_COVERAGE_GREATER = 75.0;
    constexpr double SIDE_COVERAGE_STANDARD = 50.0;
    constexpr double SIDE_COVERAGE_LESSER = 20.0;

    CoverState cover_from_blocked_count(int count) {
        if (count <= 0) return CoverState::None;
        if (count == 1) return CoverState::Lesser;
        if (count <= 3) return CoverState::Standard;
        return CoverState::Greater;
    }

    // A blocker at least two size steps above both creatures gives standard cover
    bool towers_over(const scene::Entity& blocker, int attacker_rank, int target_rank) {
        const int rank = scene::size_rank(blocker.size_category);
        return rank - attacker_rank >= 2 && rank - target_rank >= 2;
    }

    int attacker_rank(const DetectOptions& options) {
        return scene::size_rank(options.observer ? options.observer->size_category
                                                 : scene::SizeCategory::Medium);
    }

    double sight_height(const math::Point& origin, const scene::Entity& target) {
        return (origin.elevation + target.vertical_span().mid()) * 0.5;
    }

    std::string join_errors(const std::string& first, const std::string& second) {
        if (first.empty()) return second;
        if (second.empty()) return first;
        return first + "; " + second;
    }

} // namespace

CoverDetector::CoverDetector(const scene::ISpatialQueryProvider& spatial,
                             const scene::ISceneInventory& inventory,
                             core::CoverConfig config,
                             math::MapScale scale,
                             std::unique_ptr<ICoverageEstimator> estimator)
    : spatial_(spatial)
    , inventory_(inventory)
    , config_(config)
    , scale_(scale)
    , estimator_(std::move(estimator)) {
    if (!estimator_) {
        estimator_ = std::make_unique<SampledCoverageEstimator>(scale_.grid_size, config_.wall_samples);
    }
    LOG_INFO(Cover, "Cover detector created (mode {}, thresholds {}/{}, greater {})",
             core::to_string(config_.intersection_mode), config_.standard_threshold,
             config_.greater_threshold, config_.allow_greater ? "allowed" : "capped");
}

void CoverDetector::set_estimator(std::unique_ptr<ICoverageEstimator> estimator) {
    if (estimator) {
        estimator_ = std::move(estimator);
    } else {
        estimator_ = std::make_unique<SampledCoverageEstimator>(scale_.grid_size, config_.wall_samples);
    }
}

void CoverDetector::set_config(const core::CoverConfig& config) {
    const bool resample = config.wall_samples != config_.wall_samples;
    config_ = config;
    if (resample && dynamic_cast<SampledCoverageEstimator*>(estimator_.get()) != nullptr) {
        estimator_ = std::make_unique<SampledCoverageEstimator>(scale_.grid_size, config_.wall_samples);
    }
}

CoverState CoverDetector::detect(const math::Point& origin, const scene::Entity& target,
                                 const DetectOptions& options) const {
    return evaluate(origin, target, options).state;
}

CoverState CoverDetector::detect_between(const scene::Entity& attacker, const scene::Entity& target,
                                         DetectOptions options) const {
    if (attacker.id == target.id) {
        return CoverState::None;
    }
    options.observer = &attacker;
    return evaluate(attacker.center, target, options).state;
}

CoverEvaluation CoverDetector::evaluate(const math::Point& origin, const scene::Entity& target,
                                        const DetectOptions& options) const {
    if (options.observer && options.observer->id == target.id) {
        return CoverEvaluation{};
    }

    std::vector<scene::Wall> walls;
    try {
        walls = cover_walls(origin, target);
    } catch (const std::exception& e) {
        LOG_WARNING(Cover, "Wall query failed for target '{}': {}", target.id, e.what());
        CoverEvaluation fallback = evaluate_fallback(origin, target);
        fallback.error = join_errors(e.what(), fallback.error);
        return fallback;
    }

    CoverEvaluation evaluation;
    try {
        evaluation.wall_coverage = estimator_->estimate(origin, target, walls);
        evaluation.wall_state = vision::strongest(classify_coverage(evaluation.wall_coverage.percent),
                                                  wall_overrides(origin, target, walls));
    } catch (const std::exception& e) {
        LOG_WARNING(Cover, "Coverage estimate failed for target '{}': {}; using wall collision",
                    target.id, e.what());
        evaluation.source = vision::EvaluationSource::Heuristic;
        evaluation.error = e.what();
        evaluation.wall_state = collision_state(origin, target, walls);
        evaluation.wall_collision = true;
    }

    try {
        const auto blockers = eligible_blockers(origin, target, options);
        for (const auto& blocker : blockers) {
            evaluation.blockers.push_back(blocker.id);
        }
        evaluation.entity_state = evaluate_entities(origin, target, options, blockers);
    } catch (const std::exception& e) {
        LOG_WARNING(Cover, "Creature cover skipped for target '{}': {}", target.id, e.what());
        evaluation.source = vision::EvaluationSource::Heuristic;
        evaluation.error = join_errors(evaluation.error, e.what());
    }

    evaluation.state = cap(vision::strongest(evaluation.wall_state, evaluation.entity_state));

    LOG_DEBUG(Cover, "Cover of '{}': {} (walls {} at {:.1f}%, creatures {}, {})",
              target.id, vision::to_string(evaluation.state), vision::to_string(evaluation.wall_state),
              evaluation.wall_coverage.percent, vision::to_string(evaluation.entity_state),
              vision::to_string(evaluation.source));
    return evaluation;
}

CoverEvaluation CoverDetector::evaluate_fallback(const math::Point& origin, const scene::Entity& target) const {
    CoverEvaluation evaluation;
    evaluation.source = vision::EvaluationSource::Heuristic;
    evaluation.wall_collision = true;
    try {
        evaluation.wall_state = wall_collision_fallback(origin, target);
        evaluation.state = cap(evaluation.wall_state);
    } catch (const std::exception& e) {
        LOG_ERROR(Cover, "Wall collision fallback failed for target '{}': {}", target.id, e.what());
        evaluation.source = vision::EvaluationSource::Failed;
        evaluation.state = CoverState::None;
        evaluation.error = e.what();
    }
    return evaluation;
}

CoverState CoverDetector::wall_collision_fallback(const math::Point& origin, const scene::Entity& target) const {
    return collision_state(origin, target, cover_walls(origin, target));
}

CoverState CoverDetector::classify_coverage(double percent) const {
    if (percent <= 0.0) {
        return CoverState::None;
    }
    if (percent >= config_.greater_threshold) {
        return config_.allow_greater ? CoverState::Greater : CoverState::Standard;
    }
    if (percent >= config_.standard_threshold) {
        return CoverState::Standard;
    }
    return CoverState::None;
}

std::vector<scene::Entity> CoverDetector::eligible_blockers(const math::Point& origin,
                                                            const scene::Entity& target,
                                                            const DetectOptions& options) const {
    (void)origin;
    const scene::Entity* observer = options.observer;

    std::vector<scene::Entity> blockers;
    for (auto& entity : inventory_.entities()) {
        if (entity.id == target.id || (observer && entity.id == observer->id)) continue;
        if (entity.kind != scene::EntityKind::Creature || entity.hidden_from_scene) continue;
        if (config_.respect_ignore_flag && entity.never_provides_cover) continue;
        if (config_.ignore_dead && !entity.alive) continue;
        if (config_.ignore_allies && observer && !entity.alliance.empty() &&
            entity.alliance == observer->alliance) continue;
        if (entity.prone && !config_.prone_can_block) continue;
        if (config_.ignore_undetected && options.is_undetected && options.is_undetected(entity)) continue;

        blockers.push_back(std::move(entity));
    }
    return blockers;
}

std::vector<scene::Wall> CoverDetector::cover_walls(const math::Point& origin, const scene::Entity& target) const {
    const math::Rect bounds = math::Rect::merged(math::Rect::bounding(origin.xy(), origin.xy()),
                                                 target.footprint(scale_.grid_size)).expanded(1.0);
    const double z = sight_height(origin, target);

    std::vector<scene::Wall> walls = spatial_.walls_in(bounds);
    std::erase_if(walls, [&](const scene::Wall& wall) {
        return !wall.is_cover_candidate(origin.xy()) || !wall.spans_height(z);
    });
    return walls;
}

CoverState CoverDetector::collision_state(const math::Point& origin, const scene::Entity& target,
                                          const std::vector<scene::Wall>& walls) const {
    const auto corners = target.corners(scale_.grid_size);
    std::array<math::Segment, 5> rays = {
        math::Segment(origin.xy(), target.center.xy()),
        math::Segment(origin.xy(), corners[0]),
        math::Segment(origin.xy(), corners[1]),
        math::Segment(origin.xy(), corners[2]),
        math::Segment(origin.xy(), corners[3]),
    };

    for (const auto& wall : walls) {
        if (!wall.segment.is_finite() || wall.segment.is_degenerate()) {
            continue;
        }
        for (const auto& ray : rays) {
            if (math::segments_intersect(ray, wall.segment)) {
                return CoverState::Standard;
            }
        }
    }
    return CoverState::None;
}

CoverState CoverDetector::wall_overrides(const math::Point& origin, const scene::Entity& target,
                                         const std::vector<scene::Wall>& walls) const {
    const math::Segment line(origin.xy(), target.center.xy());
    CoverState state = CoverState::None;
    for (const auto& wall : walls) {
        if (wall.cover_override && wall.segment.is_finite() && !wall.segment.is_degenerate() &&
            math::segments_intersect(line, wall.segment)) {
            state = vision::strongest(state, *wall.cover_override);
        }
    }
    return state;
}

CoverState CoverDetector::evaluate_entities(const math::Point& origin, const scene::Entity& target,
                                            const DetectOptions& options,
                                            const std::vector<scene::Entity>& blockers) const {
    if (blockers.empty()) {
        return CoverState::None;
    }

    switch (config_.intersection_mode) {
        case core::IntersectionMode::Sampling3D:
            return sampled_height_cover(origin, target, options, blockers);
        case core::IntersectionMode::Tactical:
            return tactical_cover(origin, target, options, blockers);
        case core::IntersectionMode::Coverage:
            return side_coverage_cover(origin, target, blockers);
        case core::IntersectionMode::Any:
        case core::IntersectionMode::Length10:
        case core::IntersectionMode::Center:
            return size_heuristic_cover(origin, target, options, blockers);
    }
    return CoverState::None;
}

bool CoverDetector::line_crosses_blocker(const math::Segment& line, const math::Rect& rect) const {
    const double grid = scale_.grid_size;

    switch (config_.intersection_mode) {
        case core::IntersectionMode::Center: {
            const math::Vec2 center = rect.center();
            return math::distance_point_to_segment(center, line) <= grid * CENTER_TOLERANCE_FRACTION &&
                   math::point_between_on_segment(center, line);
        }
        case core::IntersectionMode::Any: {
            const double length = math::segment_rect_intersection_length(line, rect);
            return length > 0.0 && length > rect.width() * ANY_MODE_MIN_FRACTION;
        }
        case core::IntersectionMode::Length10: {
            const double length = math::segment_rect_intersection_length(line, rect);
            if (length <= 0.0) {
                return false;
            }
            // A diagonal through one square is the unit of "square equivalents"
            const double squares = std::max(1.0, std::round(rect.width() / grid) * std::round(rect.height() / grid));
            const double square_equivalent = length / (grid * std::sqrt(2.0));
            return square_equivalent / squares * 100.0 >= LENGTH10_MIN_PERCENT;
        }
        default:
            return math::segment_intersects_rect(line, rect);
    }
}

CoverState CoverDetector::size_heuristic_cover(const math::Point& origin, const scene::Entity& target,
                                               const DetectOptions& options,
                                               const std::vector<scene::Entity>& blockers) const {
    const math::Segment line(origin.xy(), target.center.xy());
    const double grid = scale_.grid_size;

    std::vector<const scene::Entity*> candidates;
    if (config_.intersection_mode == core::IntersectionMode::Center) {
        // Only the creature closest to the line can block
        const scene::Entity* nearest = nullptr;
        double nearest_distance = std::numeric_limits<double>::max();
        for (const auto& blocker : blockers) {
            const math::Rect rect = blocker.footprint(grid);
            if (!math::segment_intersects_rect(line, rect)) continue;
            const double d = math::distance_point_to_segment(rect.center(), line);
            if (d < nearest_distance) {
                nearest_distance = d;
                nearest = &blocker;
            }
        }
        if (nearest) {
            candidates.push_back(nearest);
        }
    } else {
        for (const auto& blocker : blockers) {
            candidates.push_back(&blocker);
        }
    }

    const int attacker = attacker_rank(options);
    const int defender = scene::size_rank(target.size_category);

    bool any = false;
    bool standard = false;
    for (const auto* blocker : candidates) {
        if (!line_crosses_blocker(line, blocker->footprint(grid))) continue;
        any = true;
        if (towers_over(*blocker, attacker, defender)) {
            standard = true;
        }
    }

    if (!any) return CoverState::None;
    return standard ? CoverState::Standard : CoverState::Lesser;
}

CoverState CoverDetector::side_coverage_cover(const math::Point& origin, const scene::Entity& target,
                                              const std::vector<scene::Entity>& blockers) const {
    const math::Segment line(origin.xy(), target.center.xy());

    double total = 0.0;
    for (const auto& blocker : blockers) {
        const math::Rect rect = blocker.footprint(scale_.grid_size);
        const double length = math::segment_rect_intersection_length(line, rect);
        if (length <= 0.0) continue;
        const double side = std::max({1.0, rect.width(), rect.height()});
        total += length / side * 100.0;
    }
    total = std::min(total, 100.0);

    if (total >= SIDE_COVERAGE_GREATER) return CoverState::Greater;
    if (total >= SIDE_COVERAGE_STANDARD) return CoverState::Standard;
    if (total >= SIDE_COVERAGE_LESSER) return CoverState::Lesser;
    return CoverState::None;
}

CoverState CoverDetector::tactical_cover(const math::Point& origin, const scene::Entity& target,
                                         const DetectOptions& options,
                                         const std::vector<scene::Entity>& blockers) const {
    const double grid = scale_.grid_size;

    std::array<math::Vec2, 4> attacker_corners;
    if (options.observer) {
        attacker_corners = options.observer->corners(grid);
    } else {
        attacker_corners.fill(origin.xy());
    }
    const auto target_corners = target.corners(grid);

    std::vector<math::Rect> rects;
    rects.reserve(blockers.size());
    for (const auto& blocker : blockers) {
        rects.push_back(blocker.footprint(grid));
    }

    // The attacker picks the corner that leaves the target the least cover
    CoverState best = CoverState::Greater;
    for (const auto& from : attacker_corners) {
        int blocked = 0;
        for (const auto& to : target_corners) {
            const math::Segment line(to, from);
            const bool hit = std::any_of(rects.begin(), rects.end(), [&](const math::Rect& rect) {
                return math::segment_rect_intersection_length(line, rect) > 0.0;
            });
            if (hit) {
                ++blocked;
            }
        }
        const CoverState corner = cover_from_blocked_count(blocked);
        if (vision::rank(corner) < vision::rank(best)) {
            best = corner;
        }
    }
    return best;
}

CoverState CoverDetector::sampled_height_cover(const math::Point& origin, const scene::Entity& target,
                                               const DetectOptions& options,
                                               const std::vector<scene::Entity>& blockers) const {
    const scene::VerticalSpan attacker_span = options.observer
        ? options.observer->vertical_span()
        : scene::VerticalSpan{origin.elevation,
                              origin.elevation + scene::size_height_feet(scene::SizeCategory::Medium)};
    const scene::VerticalSpan target_span = target.vertical_span();

    const double band_low = std::max(attacker_span.bottom, target_span.bottom);
    const double band_high = std::min(attacker_span.top, target_span.top);

    std::array<double, 3> slices;
    if (band_high > band_low) {
        const double height = band_high - band_low;
        slices = {band_low + 0.1 * height, (band_low + band_high) * 0.5, band_high - 0.1 * height};
    } else {
        // No shared height: interpolate between the two mid-heights
        const double from = attacker_span.mid();
        const double to = target_span.mid();
        slices = {from + 0.1 * (to - from), from + 0.5 * (to - from), from + 0.9 * (to - from)};
    }

    const math::Segment line(origin.xy(), target.center.xy());
    const int attacker = attacker_rank(options);
    const int defender = scene::size_rank(target.size_category);

    CoverState worst_slice = CoverState::None;
    for (double z : slices) {
        int count = 0;
        bool standard_by_size = false;
        for (const auto& blocker : blockers) {
            if (!blocker.vertical_span().overlaps(z)) continue;
            if (!math::segment_intersects_rect(line, blocker.footprint(scale_.grid_size))) continue;
            ++count;
            if (towers_over(blocker, attacker, defender)) {
                standard_by_size = true;
            }
        }

        CoverState slice = cover_from_blocked_count(count);
        if (standard_by_size && slice == CoverState::Lesser) {
            slice = CoverState::Standard;
        }
        worst_slice = vision::strongest(worst_slice, slice);
        if (worst_slice == CoverState::Greater) {
            break;
        }
    }
    return worst_slice;
}

CoverState CoverDetector::cap(CoverState state) const {
    if (!config_.allow_greater && state == CoverState::Greater) {
        return CoverState::Standard;
    }
    return state;
}

} // namespace umbra::cover
