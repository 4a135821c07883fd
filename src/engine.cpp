#include <umbra/engine.hpp>
#include <umbra/core/log.hpp>

#include <stdexcept>

namespace umbra {

namespace {

    core::EngineConfig validated(core::EngineConfig config) {
        if (auto valid = core::validate(config); !valid) {
            throw std::invalid_argument("invalid engine configuration: " + valid.error().to_string());
        }
        return config;
    }

} // namespace

VisibilityCoverEngine::VisibilityCoverEngine(core::EngineConfig config,
                                             const scene::ISpatialQueryProvider& spatial,
                                             const scene::ISceneInventory& inventory,
                                             scene::IPersistenceProvider* persistence,
                                             scene::INotificationSink* notifications)
    : config_(validated(std::move(config)))
    , scale_{config_.map.grid_size, config_.map.feet_per_square}
    , visibility_(spatial, scale_)
    , cover_(spatial, inventory, config_.cover, scale_)
    , store_(persistence)
    , ledger_(config_.notifications, config_.recovery, notifications)
    , integration_(inventory, visibility_, cover_, store_, ledger_, config_.integration)
    , tracker_(inventory, integration_, ledger_, scale_) {
    visibility_.set_enabled(config_.visibility.enabled);

    store_.on_degraded([this](const Error& error) {
        ledger_.escalate(integration::SystemTag::Overrides,
                         "override persistence unavailable: " + error.to_string());
    });

    ledger_.register_probe(integration::SystemTag::Visibility, [this] { return visibility_.is_enabled(); });
    ledger_.register_probe(integration::SystemTag::Cover, [this] { return cover_.is_enabled(); });
    ledger_.register_probe(integration::SystemTag::PositionTracker, [this] {
        return visibility_.is_enabled() || cover_.is_enabled();
    });
    ledger_.register_probe(integration::SystemTag::Overrides, [this] { return !store_.is_degraded(); });

    if (persistence) {
        if (auto restored = store_.load_from_persistence(); !restored) {
            LOG_ERROR(Overrides, "Could not restore overrides: {}", restored.error().to_string());
        }
    }

    LOG_INFO(General, "Visibility and cover engine ready (grid {} units, cover mode {}, visibility {}, cover {})",
             scale_.grid_size, core::to_string(config_.cover.intersection_mode),
             visibility_.is_enabled() ? "on" : "off", cover_.is_enabled() ? "on" : "off");
}

integration::CombinedState VisibilityCoverEngine::get_combined_state(const std::string& observer_id,
                                                                     const std::string& target_id) {
    return integration_.get_combined_state(observer_id, target_id);
}

integration::CombinedState VisibilityCoverEngine::get_combined_state(const scene::Entity& observer,
                                                                     const scene::Entity& target) {
    return integration_.get_combined_state(observer, target);
}

std::map<std::string, integration::CombinedState> VisibilityCoverEngine::get_batch_combined_states(
    const std::string& observer_id, const std::vector<std::string>& target_ids, Option<usize> batch_size) {
    return integration_.get_batch_combined_states(observer_id, target_ids, batch_size);
}

bool VisibilityCoverEngine::set_override(const overrides::PairKey& key, vision::VisibilityState state,
                                         overrides::OverrideSource source,
                                         const overrides::ValidationContext& context, std::string reason) {
    return store_.set(key, state, source, context, std::move(reason));
}

bool VisibilityCoverEngine::set_override(const overrides::PairKey& key, vision::CoverState state,
                                         overrides::OverrideSource source,
                                         const overrides::ValidationContext& context, std::string reason) {
    return store_.set(key, state, source, context, std::move(reason));
}

bool VisibilityCoverEngine::clear_override(const overrides::PairKey& key, Option<overrides::OverrideKind> kind) {
    return store_.clear(key, kind);
}

usize VisibilityCoverEngine::clear_overrides_for(const std::string& entity_id) {
    return store_.clear_for_entity(entity_id);
}

std::vector<overrides::InvalidOverride> VisibilityCoverEngine::revalidate_all(
    const overrides::RevalidationTrigger& trigger) {
    return store_.revalidate_all(trigger, context_probe());
}

void VisibilityCoverEngine::notify_entity_moved(const std::string& entity_id) {
    queue_.push(overrides::RevalidationTrigger::entity_moved(entity_id));
}

void VisibilityCoverEngine::notify_lighting_changed() {
    queue_.push(overrides::RevalidationTrigger::lighting_changed());
}

void VisibilityCoverEngine::notify_wall_changed() {
    queue_.push(overrides::RevalidationTrigger::wall_changed());
}

std::vector<overrides::InvalidOverride> VisibilityCoverEngine::process_pending_revalidations() {
    return queue_.drain(store_, context_probe());
}

Result<usize, Error> VisibilityCoverEngine::restore_overrides() {
    return store_.load_from_persistence();
}

std::map<std::string, tracking::PositionSnapshot> VisibilityCoverEngine::capture_start_positions(
    const std::string& actor_id, const std::vector<std::string>& observer_ids) {
    return tracker_.capture_start_positions(actor_id, observer_ids);
}

std::map<std::string, tracking::PositionSnapshot> VisibilityCoverEngine::calculate_end_positions(
    const std::string& actor_id, const std::vector<std::string>& observer_ids) {
    return tracker_.calculate_end_positions(actor_id, observer_ids);
}

std::map<std::string, tracking::PositionTransition> VisibilityCoverEngine::analyze_transitions(
    const std::map<std::string, tracking::PositionSnapshot>& start,
    const std::map<std::string, tracking::PositionSnapshot>& end) const {
    return tracker_.analyze_transitions(start, end);
}

std::map<integration::SystemTag, integration::SystemStatus> VisibilityCoverEngine::get_system_status() const {
    return ledger_.get_system_status();
}

std::vector<integration::ErrorRecord> VisibilityCoverEngine::get_error_history(
    Option<integration::SystemTag> tag) const {
    return ledger_.get_error_history(tag);
}

bool VisibilityCoverEngine::attempt_system_recovery(integration::SystemTag tag) {
    return ledger_.attempt_system_recovery(tag);
}

overrides::ContextProbe VisibilityCoverEngine::context_probe() const {
    return [this](const overrides::PairKey& key) { return integration_.probe_context(key); };
}

} // namespace umbra
