#include <umbra/vision/visibility_calculator.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>

namespace umbra::vision {

const char* to_string(VisibilitySignal signal) noexcept {
    switch (signal) {
        case VisibilitySignal::LineOfSight: return "line-of-sight";
        case VisibilitySignal::Distance: return "distance";
        case VisibilitySignal::Illumination: return "illumination";
    }
    return "line-of-sight";
}

VisibilityCalculator::VisibilityCalculator(const scene::ISpatialQueryProvider& spatial, math::MapScale scale)
    : spatial_(spatial)
    , scale_(scale) {
    LOG_INFO(Visibility, "Visibility calculator created (grid {} units = {} ft)",
             scale_.grid_size, scale_.feet_per_square);
}

VisibilityEvaluation VisibilityCalculator::evaluate(const scene::Entity& observer,
                                                    const scene::Entity& target) const {
    try {
        return evaluate_native(observer, target);
    } catch (const std::exception& e) {
        LOG_WARNING(Visibility, "Line-of-sight oracle failed for {} -> {}: {}; using lighting-only fallback",
                    observer.id, target.id, e.what());
        VisibilityEvaluation fallback = evaluate_fallback(observer, target);
        if (fallback.error.empty()) {
            fallback.error = e.what();
        } else {
            fallback.error = std::string(e.what()) + "; " + fallback.error;
        }
        return fallback;
    }
}

VisibilityState VisibilityCalculator::calculate(const scene::Entity& observer,
                                                const scene::Entity& target) const {
    return evaluate(observer, target).state;
}

VisibilityEvaluation VisibilityCalculator::lighting_only(const scene::Entity& observer,
                                                         const scene::Entity& target) const {
    VisibilityEvaluation evaluation;
    evaluation.source = EvaluationSource::Heuristic;
    evaluation.distance_feet = scale_.distance_feet(observer.center, target.center);
    evaluation.lighting = spatial_.illumination_at(target.center);

    const bool terrain = spatial_.concealing_terrain_at(target.center);
    evaluation.illumination_signal = illumination_signal(observer.senses, evaluation.lighting, terrain,
                                                         false, evaluation.distance_feet);
    evaluation.distance_signal = distance_signal(observer.senses, evaluation.distance_feet);
    resolve(evaluation);
    return evaluation;
}

VisibilityEvaluation VisibilityCalculator::evaluate_fallback(const scene::Entity& observer,
                                                             const scene::Entity& target) const {
    try {
        return lighting_only(observer, target);
    } catch (const std::exception& e) {
        LOG_ERROR(Visibility, "Lighting-only fallback failed for {} -> {}: {}; defaulting to observed",
                  observer.id, target.id, e.what());
        VisibilityEvaluation evaluation;
        evaluation.source = EvaluationSource::Failed;
        evaluation.state = VisibilityState::Observed;
        evaluation.error = e.what();
        return evaluation;
    }
}

VisibilityEvaluation VisibilityCalculator::evaluate_native(const scene::Entity& observer,
                                                           const scene::Entity& target) const {
    VisibilityEvaluation evaluation;
    evaluation.distance_feet = scale_.distance_feet(observer.center, target.center);

    // Line of sight, tested at the height midway between the two creatures
    const math::Vec2 origin = observer.center.xy();
    const double sight_z = (observer.vertical_span().mid() + target.vertical_span().mid()) * 0.5;
    const math::Segment ray(origin, target.center.xy());

    bool wall_blocked = false;
    for (const auto& wall : spatial_.walls_along(ray)) {
        if (!wall.segment.is_finite()) {
            LOG_WARNING(Geometry, "Ignoring wall '{}' with non-finite coordinates", wall.id);
            continue;
        }
        if (wall.blocks_from(origin) && wall.spans_height(sight_z) &&
            math::segments_intersect(ray, wall.segment)) {
            wall_blocked = true;
            break;
        }
    }

    evaluation.has_line_of_sight = !wall_blocked;
    const bool vision_blocked = wall_blocked || observer.senses.blinded || target.invisible;
    evaluation.line_of_sight_signal = vision_blocked
        ? sense_bridge(observer.senses, evaluation.distance_feet)
        : VisibilityState::Observed;

    evaluation.lighting = spatial_.illumination_at(target.center);
    const bool terrain = spatial_.concealing_terrain_at(target.center);
    evaluation.illumination_signal = illumination_signal(observer.senses, evaluation.lighting, terrain,
                                                         vision_blocked, evaluation.distance_feet);
    evaluation.distance_signal = distance_signal(observer.senses, evaluation.distance_feet);

    resolve(evaluation);

    LOG_TRACE(Visibility, "{} -> {}: {} (los {}, light {}, range {}, decided by {})",
              observer.id, target.id, to_string(evaluation.state),
              to_string(*evaluation.line_of_sight_signal), to_string(evaluation.illumination_signal),
              to_string(evaluation.distance_signal), to_string(evaluation.deciding_signal));
    return evaluation;
}

VisibilityState VisibilityCalculator::sense_bridge(const scene::SenseProfile& senses, double distance_feet) {
    VisibilityState result = VisibilityState::Undetected;
    for (const auto& sense : senses.special_senses) {
        if (!sense.reaches(distance_feet)) {
            continue;
        }
        switch (sense.acuity) {
            case scene::SenseAcuity::Precise:
                result = best(result, VisibilityState::Observed);
                break;
            case scene::SenseAcuity::Imprecise:
                result = best(result, VisibilityState::Hidden);
                break;
            case scene::SenseAcuity::Vague:
                break;
        }
    }
    return result;
}

VisibilityState VisibilityCalculator::illumination_signal(const scene::SenseProfile& senses,
                                                          LightingBand lighting,
                                                          bool concealing_terrain,
                                                          bool vision_blocked,
                                                          double distance_feet) {
    // Light only matters to eyes; the line-of-sight signal covers blocked vision
    if (vision_blocked) {
        return VisibilityState::Observed;
    }

    VisibilityState state = VisibilityState::Observed;
    switch (lighting) {
        case LightingBand::Bright:
        case LightingBand::Unknown:
            break;
        case LightingBand::Dim:
            if (!senses.low_light_vision && !senses.sees_in_darkness_at(distance_feet)) {
                state = VisibilityState::Concealed;
            }
            break;
        case LightingBand::Darkness:
            if (!senses.sees_in_darkness_at(distance_feet)) {
                state = VisibilityState::Hidden;
            }
            break;
    }

    if (concealing_terrain || senses.dazzled) {
        state = worst(state, VisibilityState::Concealed);
    }

    if (sense_bridge(senses, distance_feet) == VisibilityState::Observed) {
        state = VisibilityState::Observed;
    }
    return state;
}

VisibilityState VisibilityCalculator::distance_signal(const scene::SenseProfile& senses, double distance_feet) {
    if (senses.vision_range_feet <= 0.0 || distance_feet <= senses.vision_range_feet) {
        return VisibilityState::Observed;
    }
    return sense_bridge(senses, distance_feet);
}

void VisibilityCalculator::resolve(VisibilityEvaluation& evaluation) {
    VisibilityState result = worst(evaluation.distance_signal, evaluation.illumination_signal);
    if (evaluation.line_of_sight_signal) {
        result = worst(result, *evaluation.line_of_sight_signal);
    }
    evaluation.state = result;

    // Ties go to the geometric signals
    if (evaluation.line_of_sight_signal && *evaluation.line_of_sight_signal == result) {
        evaluation.deciding_signal = VisibilitySignal::LineOfSight;
    } else if (evaluation.distance_signal == result) {
        evaluation.deciding_signal = VisibilitySignal::Distance;
    } else {
        evaluation.deciding_signal = VisibilitySignal::Illumination;
    }
}

} // namespace umbra::vision
