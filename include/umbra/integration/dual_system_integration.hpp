#pragma once

#include <umbra/core/config.hpp>
#include <umbra/cover/cover_detector.hpp>
#include <umbra/integration/error_ledger.hpp>
#include <umbra/overrides/override_store.hpp>
#include <umbra/scene/providers.hpp>
#include <umbra/vision/visibility_calculator.hpp>

#include <map>
#include <string>
#include <vector>

namespace umbra::integration {

// Which fallback tier produced a sub-result
enum class ResultSource : u8 {
    Native,     // tier 1 calculation
    Override,   // pinned value, consulted before any calculation
    Heuristic,  // tier 2: lighting-only or wall collision
    Manual,     // tier 3: lingering override read after both calculations failed
    Default     // tier 4: observed / no cover
};

const char* to_string(ResultSource source) noexcept;

template<typename T>
struct SystemResult {
    bool success = true;
    T value{};
    std::string error;
    bool fallback_used = false;
    ResultSource source = ResultSource::Native;
};

/**
 * @brief Visibility and cover of one observer/target pair at one instant.
 *
 * Recomputed on every query; only overrides are durable.
 */
struct CombinedState {
    std::string observer_id;
    std::string target_id;

    vision::VisibilityState visibility = vision::VisibilityState::Observed;
    vision::CoverState cover = vision::CoverState::None;
    int stealth_bonus = 0;

    bool systems_available = true;
    std::vector<std::string> warnings;

    // Observed targets behind hide-capable cover read as concealed
    vision::VisibilityState effective_visibility = vision::VisibilityState::Observed;
    vision::LightingBand lighting = vision::LightingBand::Unknown;
    bool has_line_of_sight = true;

    SystemResult<vision::VisibilityState> visibility_result;
    SystemResult<vision::CoverState> cover_result;
};

/**
 * @brief Combines the visibility calculator, cover detector and override store.
 *
 * For each pair the override store is consulted first; otherwise each
 * calculator runs through its own fallback tiers. Any fallback use clears
 * systems_available, appends a warning and is reported to the error ledger.
 * None of the query methods throw.
 */
class DualSystemIntegration {
public:
    DualSystemIntegration(const scene::ISceneInventory& inventory,
                          vision::VisibilityCalculator& visibility,
                          cover::CoverDetector& cover,
                          overrides::OverrideStore& store,
                          ErrorLedger& ledger,
                          core::IntegrationConfig config = {});

    CombinedState get_combined_state(const scene::Entity& observer, const scene::Entity& target);
    CombinedState get_combined_state(const std::string& observer_id, const std::string& target_id);

    // Pairs are processed in sequential chunks; a failing pair never aborts the batch
    std::map<std::string, CombinedState> get_batch_combined_states(const scene::Entity& observer,
                                                                   const std::vector<scene::Entity>& targets,
                                                                   Option<usize> batch_size = std::nullopt);
    std::map<std::string, CombinedState> get_batch_combined_states(const std::string& observer_id,
                                                                   const std::vector<std::string>& target_ids,
                                                                   Option<usize> batch_size = std::nullopt);

    static CombinedState create_error_state(const std::string& observer_id, const std::string& target_id,
                                            const std::string& message);

    /**
     * @brief Live context of a pair for override revalidation.
     *
     * Uses the calculators only, never the override store.
     * @throws std::out_of_range if either entity is not in the scene
     */
    overrides::CurrentPairContext probe_context(const overrides::PairKey& key) const;

    const core::IntegrationConfig& config() const { return config_; }
    void set_config(const core::IntegrationConfig& config) { config_ = config; }

private:
    SystemResult<vision::VisibilityState> resolve_visibility(const scene::Entity& observer,
                                                             const scene::Entity& target,
                                                             CombinedState& combined);
    SystemResult<vision::CoverState> resolve_cover(const scene::Entity& observer,
                                                   const scene::Entity& target,
                                                   CombinedState& combined);

    cover::DetectOptions detect_options(const scene::Entity& observer) const;
    bool is_undetected(const scene::Entity& observer, const scene::Entity& blocker) const;

    void report_fallback(SystemTag tag, const scene::Entity& observer, const scene::Entity& target,
                         const std::string& message, core::ErrorCategory category,
                         const std::string& tier, bool applied, const std::string& data);

    const scene::ISceneInventory& inventory_;
    vision::VisibilityCalculator& visibility_;
    cover::CoverDetector& cover_;
    overrides::OverrideStore& store_;
    ErrorLedger& ledger_;
    core::IntegrationConfig config_;
};

} // namespace umbra::integration
