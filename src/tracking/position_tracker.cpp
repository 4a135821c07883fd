#include <umbra/tracking/position_tracker.hpp>
#include <umbra/core/log.hpp>

#include <cmath>
#include <format>
#include <stdexcept>

namespace umbra::tracking {

using integration::ResultSource;
using vision::CoverState;
using vision::VisibilityState;

const char* to_string(TransitionType type) noexcept {
    switch (type) {
        case TransitionType::Improved: return "improved";
        case TransitionType::Worsened: return "worsened";
        case TransitionType::Unchanged: return "unchanged";
    }
    return "unchanged";
}

std::vector<std::string> validate_position_snapshot(const PositionSnapshot& snapshot) {
    std::vector<std::string> errors;

    if (snapshot.combined.observer_id.empty()) {
        errors.push_back("observer id must not be empty");
    }
    if (snapshot.combined.target_id.empty()) {
        errors.push_back("target id must not be empty");
    }
    if (!std::isfinite(snapshot.distance_feet) || snapshot.distance_feet < 0.0) {
        errors.push_back("distance must be a non-negative finite number");
    }
    if (snapshot.stealth_bonus != vision::stealth_bonus(snapshot.combined.cover)) {
        errors.push_back(std::format("stealth bonus {} does not match {} cover", snapshot.stealth_bonus,
                                     vision::to_string(snapshot.combined.cover)));
    }
    if ((!snapshot.visibility_calculated || !snapshot.cover_calculated) && snapshot.system_errors.empty()) {
        errors.push_back("uncalculated snapshot must list its system errors");
    }
    if (snapshot.sequence == 0) {
        errors.push_back("sequence must be positive");
    }
    return errors;
}

PositionTracker::PositionTracker(const scene::ISceneInventory& inventory,
                                 integration::DualSystemIntegration& integration,
                                 integration::ErrorLedger& ledger,
                                 math::MapScale scale)
    : inventory_(inventory)
    , integration_(integration)
    , ledger_(ledger)
    , scale_(scale) {
}

std::map<std::string, PositionSnapshot> PositionTracker::capture_start_positions(
    const scene::Entity& actor, const std::vector<scene::Entity>& observers) {
    return capture_all(actor, observers, "start");
}

std::map<std::string, PositionSnapshot> PositionTracker::calculate_end_positions(
    const scene::Entity& actor, const std::vector<scene::Entity>& observers) {
    return capture_all(actor, observers, "end");
}

std::map<std::string, PositionSnapshot> PositionTracker::capture_start_positions(
    const std::string& actor_id, const std::vector<std::string>& observer_ids) {
    return capture_all(actor_id, observer_ids, "start");
}

std::map<std::string, PositionSnapshot> PositionTracker::calculate_end_positions(
    const std::string& actor_id, const std::vector<std::string>& observer_ids) {
    return capture_all(actor_id, observer_ids, "end");
}

std::map<std::string, PositionSnapshot> PositionTracker::capture_all(const scene::Entity& actor,
                                                                     const std::vector<scene::Entity>& observers,
                                                                     const char* phase) {
    std::map<std::string, PositionSnapshot> snapshots;
    for (const auto& observer : observers) {
        if (observer.id == actor.id) {
            continue;
        }
        snapshots[observer.id] = capture(actor, observer, phase);
    }
    LOG_DEBUG(Tracking, "Captured {} {} positions for '{}'", snapshots.size(), phase, actor.id);
    return snapshots;
}

std::map<std::string, PositionSnapshot> PositionTracker::capture_all(const std::string& actor_id,
                                                                     const std::vector<std::string>& observer_ids,
                                                                     const char* phase) {
    Option<scene::Entity> actor;
    std::string lookup_error;
    try {
        actor = inventory_.find(actor_id);
    } catch (const std::exception& e) {
        lookup_error = e.what();
    }

    std::map<std::string, PositionSnapshot> snapshots;
    for (const auto& observer_id : observer_ids) {
        if (observer_id == actor_id) {
            continue;
        }
        if (!actor) {
            snapshots[observer_id] = error_snapshot(actor_id, observer_id,
                lookup_error.empty() ? "entity '" + actor_id + "' not found" : lookup_error);
            continue;
        }

        Option<scene::Entity> observer;
        try {
            observer = inventory_.find(observer_id);
        } catch (const std::exception& e) {
            snapshots[observer_id] = error_snapshot(actor_id, observer_id, e.what());
            continue;
        }
        if (!observer) {
            snapshots[observer_id] = error_snapshot(actor_id, observer_id,
                                                    "entity '" + observer_id + "' not found");
            continue;
        }
        snapshots[observer_id] = capture(*actor, *observer, phase);
    }
    return snapshots;
}

PositionSnapshot PositionTracker::capture(const scene::Entity& actor, const scene::Entity& observer,
                                          const char* phase) {
    PositionSnapshot snapshot;
    snapshot.combined = integration_.get_combined_state(observer, actor);
    snapshot.distance_feet = scale_.distance_feet(observer.center, actor.center);
    snapshot.lighting = snapshot.combined.lighting;
    snapshot.stealth_bonus = snapshot.combined.stealth_bonus;
    snapshot.effective_visibility = snapshot.combined.effective_visibility;
    snapshot.has_line_of_sight = snapshot.combined.has_line_of_sight;
    snapshot.visibility_calculated = snapshot.combined.visibility_result.success;
    snapshot.cover_calculated = snapshot.combined.cover_result.success;
    snapshot.system_errors = snapshot.combined.warnings;
    snapshot.captured_at = std::chrono::system_clock::now();
    snapshot.sequence = next_sequence_++;

    if (!snapshot.visibility_calculated || !snapshot.cover_calculated) {
        integration::ErrorContext context;
        context.observer_id = observer.id;
        context.target_id = actor.id;
        context.operation = std::string("capture ") + phase + " position";
        context.fallback = integration::FallbackReport{true, "graceful-degradation", "error-snapshot"};
        ledger_.handle_system_error(integration::SystemTag::PositionTracker,
                                    std::format("{} position calculation incomplete for {} -> {}",
                                                phase, observer.id, actor.id),
                                    context);
    }
    return snapshot;
}

PositionSnapshot PositionTracker::error_snapshot(const std::string& actor_id, const std::string& observer_id,
                                                 const std::string& message) {
    LOG_WARNING(Tracking, "Position snapshot {} -> {} failed: {}", observer_id, actor_id, message);

    PositionSnapshot snapshot;
    snapshot.combined = integration::DualSystemIntegration::create_error_state(observer_id, actor_id, message);
    snapshot.system_errors = snapshot.combined.warnings;
    snapshot.captured_at = std::chrono::system_clock::now();
    snapshot.sequence = next_sequence_++;

    integration::ErrorContext context;
    context.observer_id = observer_id;
    context.target_id = actor_id;
    context.operation = "capture position";
    context.fallback = integration::FallbackReport{true, "graceful-degradation", "error-snapshot"};
    ledger_.handle_system_error(integration::SystemTag::PositionTracker, message, context);
    return snapshot;
}

std::map<std::string, PositionTransition> PositionTracker::analyze_transitions(
    const std::map<std::string, PositionSnapshot>& start,
    const std::map<std::string, PositionSnapshot>& end) const {
    std::map<std::string, PositionTransition> transitions;
    for (const auto& [observer_id, start_snapshot] : start) {
        auto it = end.find(observer_id);
        if (it == end.end()) {
            LOG_DEBUG(Tracking, "No end position for observer '{}'", observer_id);
            continue;
        }
        transitions.emplace(observer_id, analyze_transition(observer_id, start_snapshot, it->second));
    }
    return transitions;
}

PositionTransition PositionTracker::analyze_transition(const std::string& observer_id,
                                                       const PositionSnapshot& start,
                                                       const PositionSnapshot& end) {
    if (end.sequence < start.sequence) {
        throw std::invalid_argument("end position for observer '" + observer_id +
                                    "' was captured before its start position");
    }

    PositionTransition transition;
    transition.observer_id = observer_id;
    transition.start = start;
    transition.end = end;
    transition.visibility_change = {start.combined.visibility, end.combined.visibility};
    transition.cover_change = {start.combined.cover, end.combined.cover};
    transition.has_changed = transition.visibility_change.changed() || transition.cover_change.changed();
    transition.lighting_changed = start.lighting != end.lighting;
    transition.distance_change = end.distance_feet - start.distance_feet;
    transition.stealth_bonus_change = end.stealth_bonus - start.stealth_bonus;
    transition.impact_on_dc = transition.stealth_bonus_change;

    // Higher visibility rank and stronger cover both favour the actor
    const int visibility_delta = vision::rank(end.combined.visibility) - vision::rank(start.combined.visibility);
    const int cover_delta = vision::rank(end.combined.cover) - vision::rank(start.combined.cover);

    if (visibility_delta >= 0 && cover_delta >= 0 && (visibility_delta > 0 || cover_delta > 0)) {
        transition.transition_type = TransitionType::Improved;
    } else if (visibility_delta <= 0 && cover_delta <= 0 && (visibility_delta < 0 || cover_delta < 0)) {
        transition.transition_type = TransitionType::Worsened;
    } else {
        const int score = 2 * visibility_delta + cover_delta;
        if (score > 0) {
            transition.transition_type = TransitionType::Improved;
        } else if (score < 0) {
            transition.transition_type = TransitionType::Worsened;
        } else {
            transition.transition_type = TransitionType::Unchanged;
        }
    }
    return transition;
}

TransitionSummary PositionTracker::summarize(const std::map<std::string, PositionTransition>& transitions) {
    TransitionSummary summary;
    for (const auto& [observer_id, transition] : transitions) {
        switch (transition.transition_type) {
            case TransitionType::Improved: ++summary.improved; break;
            case TransitionType::Worsened: ++summary.worsened; break;
            case TransitionType::Unchanged: ++summary.unchanged; break;
        }
        summary.net_dc_impact += transition.impact_on_dc;
    }
    return summary;
}

} // namespace umbra::tracking
