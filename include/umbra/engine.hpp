#pragma once

#include <umbra/core/config.hpp>
#include <umbra/cover/cover_detector.hpp>
#include <umbra/integration/dual_system_integration.hpp>
#include <umbra/integration/error_ledger.hpp>
#include <umbra/overrides/override_store.hpp>
#include <umbra/overrides/revalidation_queue.hpp>
#include <umbra/scene/providers.hpp>
#include <umbra/tracking/position_tracker.hpp>
#include <umbra/vision/visibility_calculator.hpp>

#include <map>
#include <string>
#include <vector>

namespace umbra {

/**
 * @brief Visibility and cover determination for every observer/target pair.
 *
 * Owns the calculators, the override store, the error ledger and the
 * position tracker, and wires them to the host's providers. The providers
 * must outlive the engine.
 *
 * Usage:
 * @code
 *   umbra::scene::StaticScene scene;
 *   umbra::VisibilityCoverEngine engine(umbra::core::EngineConfig{}, scene, scene);
 *   auto state = engine.get_combined_state("guard", "rogue");
 * @endcode
 */
class VisibilityCoverEngine {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    VisibilityCoverEngine(core::EngineConfig config,
                          const scene::ISpatialQueryProvider& spatial,
                          const scene::ISceneInventory& inventory,
                          scene::IPersistenceProvider* persistence = nullptr,
                          scene::INotificationSink* notifications = nullptr);

    VisibilityCoverEngine(const VisibilityCoverEngine&) = delete;
    VisibilityCoverEngine& operator=(const VisibilityCoverEngine&) = delete;

    // ========================================================================
    // Read path
    // ========================================================================

    integration::CombinedState get_combined_state(const std::string& observer_id, const std::string& target_id);
    integration::CombinedState get_combined_state(const scene::Entity& observer, const scene::Entity& target);

    std::map<std::string, integration::CombinedState> get_batch_combined_states(
        const std::string& observer_id, const std::vector<std::string>& target_ids,
        Option<usize> batch_size = std::nullopt);

    // ========================================================================
    // Override lifecycle
    // ========================================================================

    bool set_override(const overrides::PairKey& key, vision::VisibilityState state,
                      overrides::OverrideSource source, const overrides::ValidationContext& context,
                      std::string reason = {});
    bool set_override(const overrides::PairKey& key, vision::CoverState state,
                      overrides::OverrideSource source, const overrides::ValidationContext& context,
                      std::string reason = {});

    bool clear_override(const overrides::PairKey& key, Option<overrides::OverrideKind> kind = std::nullopt);
    usize clear_overrides_for(const std::string& entity_id);

    // Immediate sweep; invalid overrides are reported, never removed
    std::vector<overrides::InvalidOverride> revalidate_all(
        const overrides::RevalidationTrigger& trigger = overrides::RevalidationTrigger::manual());

    // Queue world changes, then sweep once with process_pending_revalidations()
    void notify_entity_moved(const std::string& entity_id);
    void notify_lighting_changed();
    void notify_wall_changed();
    std::vector<overrides::InvalidOverride> process_pending_revalidations();

    Result<usize, Error> restore_overrides();

    // ========================================================================
    // Action bracketing
    // ========================================================================

    std::map<std::string, tracking::PositionSnapshot> capture_start_positions(
        const std::string& actor_id, const std::vector<std::string>& observer_ids);
    std::map<std::string, tracking::PositionSnapshot> calculate_end_positions(
        const std::string& actor_id, const std::vector<std::string>& observer_ids);
    std::map<std::string, tracking::PositionTransition> analyze_transitions(
        const std::map<std::string, tracking::PositionSnapshot>& start,
        const std::map<std::string, tracking::PositionSnapshot>& end) const;

    // ========================================================================
    // Diagnostics
    // ========================================================================

    std::map<integration::SystemTag, integration::SystemStatus> get_system_status() const;
    std::vector<integration::ErrorRecord> get_error_history(Option<integration::SystemTag> tag = std::nullopt) const;
    bool attempt_system_recovery(integration::SystemTag tag);

    // ========================================================================
    // Components
    // ========================================================================

    vision::VisibilityCalculator& visibility() { return visibility_; }
    cover::CoverDetector& cover() { return cover_; }
    overrides::OverrideStore& overrides() { return store_; }
    const overrides::RevalidationQueue& revalidation_queue() const { return queue_; }
    integration::ErrorLedger& ledger() { return ledger_; }
    integration::DualSystemIntegration& integration() { return integration_; }
    tracking::PositionTracker& tracker() { return tracker_; }

    const core::EngineConfig& config() const { return config_; }

private:
    overrides::ContextProbe context_probe() const;

    core::EngineConfig config_;
    math::MapScale scale_;

    vision::VisibilityCalculator visibility_;
    cover::CoverDetector cover_;
    overrides::OverrideStore store_;
    overrides::RevalidationQueue queue_;
    integration::ErrorLedger ledger_;
    integration::DualSystemIntegration integration_;
    tracking::PositionTracker tracker_;
};

} // namespace umbra
