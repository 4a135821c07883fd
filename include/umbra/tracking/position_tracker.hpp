#pragma once

#include <umbra/integration/dual_system_integration.hpp>
#include <umbra/integration/error_ledger.hpp>
#include <umbra/math/geometry.hpp>
#include <umbra/scene/providers.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace umbra::tracking {

// State of one observer -> actor pair at one instant
struct PositionSnapshot {
    integration::CombinedState combined;

    double distance_feet = 0.0;
    vision::LightingBand lighting = vision::LightingBand::Unknown;
    int stealth_bonus = 0;
    vision::VisibilityState effective_visibility = vision::VisibilityState::Observed;
    bool has_line_of_sight = true;

    bool visibility_calculated = false;
    bool cover_calculated = false;
    std::vector<std::string> system_errors;

    std::chrono::system_clock::time_point captured_at;
    u64 sequence = 0;   // capture order, strictly increasing per tracker
};

// Problems with a snapshot; empty when it is consistent
std::vector<std::string> validate_position_snapshot(const PositionSnapshot& snapshot);

enum class TransitionType : u8 {
    Improved,
    Worsened,
    Unchanged
};

const char* to_string(TransitionType type) noexcept;

template<typename T>
struct StateChange {
    T from{};
    T to{};

    bool changed() const noexcept { return from != to; }
};

struct PositionTransition {
    std::string observer_id;
    PositionSnapshot start;
    PositionSnapshot end;

    TransitionType transition_type = TransitionType::Unchanged;
    StateChange<vision::VisibilityState> visibility_change;
    StateChange<vision::CoverState> cover_change;
    bool has_changed = false;
    bool lighting_changed = false;
    double distance_change = 0.0;

    int stealth_bonus_change = 0;
    int impact_on_dc = 0;   // positive: the pending stealth check got easier
};

struct TransitionSummary {
    usize improved = 0;
    usize worsened = 0;
    usize unchanged = 0;
    int net_dc_impact = 0;
};

/**
 * @brief Brackets a multi-step action with combined-state snapshots.
 *
 * Each observer gets one snapshot before and one after the action. A failed
 * calculation still produces a snapshot, with the errors recorded and the
 * calculated flags cleared, so every requested observer has an entry.
 */
class PositionTracker {
public:
    PositionTracker(const scene::ISceneInventory& inventory,
                    integration::DualSystemIntegration& integration,
                    integration::ErrorLedger& ledger,
                    math::MapScale scale);

    std::map<std::string, PositionSnapshot> capture_start_positions(const scene::Entity& actor,
                                                                    const std::vector<scene::Entity>& observers);
    std::map<std::string, PositionSnapshot> calculate_end_positions(const scene::Entity& actor,
                                                                    const std::vector<scene::Entity>& observers);

    // Entities missing from the scene get error snapshots
    std::map<std::string, PositionSnapshot> capture_start_positions(const std::string& actor_id,
                                                                    const std::vector<std::string>& observer_ids);
    std::map<std::string, PositionSnapshot> calculate_end_positions(const std::string& actor_id,
                                                                    const std::vector<std::string>& observer_ids);

    /**
     * @brief Pairs start and end snapshots by observer id
     *
     * Observers missing from either map are skipped.
     * @throws std::invalid_argument if an end snapshot was captured before its start
     */
    std::map<std::string, PositionTransition> analyze_transitions(
        const std::map<std::string, PositionSnapshot>& start,
        const std::map<std::string, PositionSnapshot>& end) const;

    static PositionTransition analyze_transition(const std::string& observer_id,
                                                 const PositionSnapshot& start,
                                                 const PositionSnapshot& end);

    static TransitionSummary summarize(const std::map<std::string, PositionTransition>& transitions);

private:
    std::map<std::string, PositionSnapshot> capture_all(const scene::Entity& actor,
                                                        const std::vector<scene::Entity>& observers,
                                                        const char* phase);
    std::map<std::string, PositionSnapshot> capture_all(const std::string& actor_id,
                                                        const std::vector<std::string>& observer_ids,
                                                        const char* phase);

    PositionSnapshot capture(const scene::Entity& actor, const scene::Entity& observer, const char* phase);
    PositionSnapshot error_snapshot(const std::string& actor_id, const std::string& observer_id,
                                    const std::string& message);

    const scene::ISceneInventory& inventory_;
    integration::DualSystemIntegration& integration_;
    integration::ErrorLedger& ledger_;
    math::MapScale scale_;
    u64 next_sequence_ = 1;
};

} // namespace umbra::tracking
