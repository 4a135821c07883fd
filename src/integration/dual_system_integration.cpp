#include <umbra/integration/dual_system_integration.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>
#include <stdexcept>

namespace umbra::integration {

using vision::CoverState;
using vision::EvaluationSource;
using vision::VisibilityState;

const char* to_string(ResultSource source) noexcept {
    switch (source) {
        case ResultSource::Native: return "native";
        case ResultSource::Override: return "override";
        case ResultSource::Heuristic: return "heuristic";
        case ResultSource::Manual: return "manual";
        case ResultSource::Default: return "default";
    }
    return "default";
}

DualSystemIntegration::DualSystemIntegration(const scene::ISceneInventory& inventory,
                                             vision::VisibilityCalculator& visibility,
                                             cover::CoverDetector& cover,
                                             overrides::OverrideStore& store,
                                             ErrorLedger& ledger,
                                             core::IntegrationConfig config)
    : inventory_(inventory)
    , visibility_(visibility)
    , cover_(cover)
    , store_(store)
    , ledger_(ledger)
    , config_(config) {
}

CombinedState DualSystemIntegration::get_combined_state(const scene::Entity& observer, const scene::Entity& target) {
    CombinedState combined;
    combined.observer_id = observer.id;
    combined.target_id = target.id;

    try {
        combined.visibility_result = resolve_visibility(observer, target, combined);
        combined.cover_result = resolve_cover(observer, target, combined);
    } catch (const std::exception& e) {
        LOG_ERROR(Integration, "Combined state for {} -> {} aborted: {}", observer.id, target.id, e.what());
        ledger_.handle_system_error(SystemTag::Visibility,
                                    std::string("combined state calculation failed: ") + e.what(),
                                    ErrorContext{observer.id, target.id, "get_combined_state",
                                                 core::ErrorCategory::Other, FallbackReport{}});
        return create_error_state(observer.id, target.id, std::string("combined state error: ") + e.what());
    }

    combined.visibility = combined.visibility_result.value;
    combined.cover = combined.cover_result.value;
    combined.stealth_bonus = vision::stealth_bonus(combined.cover);
    combined.systems_available = !combined.visibility_result.fallback_used && !combined.cover_result.fallback_used;
    combined.effective_visibility = combined.visibility;
    if (combined.visibility == VisibilityState::Observed && vision::can_hide(combined.cover)) {
        combined.effective_visibility = VisibilityState::Concealed;
    }

    LOG_TRACE(Integration, "{} -> {}: {} ({}), cover {} ({}), stealth +{}", observer.id, target.id,
              vision::to_string(combined.visibility), to_string(combined.visibility_result.source),
              vision::to_string(combined.cover), to_string(combined.cover_result.source),
              combined.stealth_bonus);
    return combined;
}

CombinedState DualSystemIntegration::get_combined_state(const std::string& observer_id, const std::string& target_id) {
    Option<scene::Entity> observer;
    Option<scene::Entity> target;
    try {
        observer = inventory_.find(observer_id);
        target = inventory_.find(target_id);
    } catch (const std::exception& e) {
        LOG_ERROR(Integration, "Scene inventory failed for {} -> {}: {}", observer_id, target_id, e.what());
        return create_error_state(observer_id, target_id, std::string("scene inventory error: ") + e.what());
    }

    if (!observer || !target) {
        const std::string missing = observer ? target_id : observer_id;
        LOG_WARNING(Integration, "Entity '{}' not found", missing);
        return create_error_state(observer_id, target_id, "entity '" + missing + "' not found");
    }
    return get_combined_state(*observer, *target);
}

std::map<std::string, CombinedState> DualSystemIntegration::get_batch_combined_states(
    const scene::Entity& observer, const std::vector<scene::Entity>& targets, Option<usize> batch_size) {
    LOG_SCOPE_TIMER_CAT("batch combined states", Performance);

    const usize chunk = std::max<usize>(1, batch_size.value_or(config_.batch_size));
    std::map<std::string, CombinedState> results;

    for (usize begin = 0; begin < targets.size(); begin += chunk) {
        const usize end = std::min(targets.size(), begin + chunk);
        for (usize i = begin; i < end; ++i) {
            const scene::Entity& target = targets[i];
            try {
                results[target.id] = get_combined_state(observer, target);
            } catch (const std::exception& e) {
                LOG_ERROR(Integration, "Batch pair {} -> {} failed: {}", observer.id, target.id, e.what());
                results[target.id] = create_error_state(observer.id, target.id,
                                                        std::string("batch error: ") + e.what());
            }
        }
        LOG_TRACE(Integration, "Processed batch chunk {}..{} of {}", begin, end, targets.size());
    }
    return results;
}

std::map<std::string, CombinedState> DualSystemIntegration::get_batch_combined_states(
    const std::string& observer_id, const std::vector<std::string>& target_ids, Option<usize> batch_size) {
    std::map<std::string, CombinedState> results;

    Option<scene::Entity> observer;
    try {
        observer = inventory_.find(observer_id);
    } catch (const std::exception& e) {
        LOG_ERROR(Integration, "Scene inventory failed for observer '{}': {}", observer_id, e.what());
    }
    if (!observer) {
        for (const auto& id : target_ids) {
            results[id] = create_error_state(observer_id, id, "entity '" + observer_id + "' not found");
        }
        return results;
    }

    std::vector<scene::Entity> targets;
    for (const auto& id : target_ids) {
        Option<scene::Entity> target;
        try {
            target = inventory_.find(id);
        } catch (const std::exception& e) {
            LOG_ERROR(Integration, "Scene inventory failed for target '{}': {}", id, e.what());
        }
        if (target) {
            targets.push_back(std::move(*target));
        } else {
            results[id] = create_error_state(observer_id, id, "entity '" + id + "' not found");
        }
    }

    results.merge(get_batch_combined_states(*observer, targets, batch_size));
    return results;
}

CombinedState DualSystemIntegration::create_error_state(const std::string& observer_id,
                                                        const std::string& target_id,
                                                        const std::string& message) {
    CombinedState combined;
    combined.observer_id = observer_id;
    combined.target_id = target_id;
    combined.systems_available = false;
    combined.warnings.push_back(message);

    combined.visibility_result = {false, VisibilityState::Observed, message, true, ResultSource::Default};
    combined.cover_result = {false, CoverState::None, message, true, ResultSource::Default};
    return combined;
}

overrides::CurrentPairContext DualSystemIntegration::probe_context(const overrides::PairKey& key) const {
    const auto observer = inventory_.find(key.observer_id);
    if (!observer) {
        throw std::out_of_range("entity '" + key.observer_id + "' not found");
    }
    const auto target = inventory_.find(key.target_id);
    if (!target) {
        throw std::out_of_range("entity '" + key.target_id + "' not found");
    }

    const vision::VisibilityEvaluation visibility = visibility_.evaluate(*observer, *target);
    const cover::CoverEvaluation cover = cover_.evaluate(observer->center, *target, detect_options(*observer));

    overrides::CurrentPairContext context;
    context.visibility = visibility.state;
    context.cover = cover.state;
    context.lighting = visibility.lighting;
    context.observer_has_darkvision = observer->senses.darkvision;
    return context;
}

SystemResult<VisibilityState> DualSystemIntegration::resolve_visibility(const scene::Entity& observer,
                                                                        const scene::Entity& target,
                                                                        CombinedState& combined) {
    const overrides::PairKey key{observer.id, target.id};
    if (config_.respect_overrides) {
        if (auto pinned = store_.get_visibility(key)) {
            return {true, *pinned, {}, false, ResultSource::Override};
        }
    }

    vision::VisibilityEvaluation evaluation;
    std::string failure;
    if (visibility_.is_enabled()) {
        evaluation = visibility_.evaluate(observer, target);
        failure = "visibility calculation failed: " + evaluation.error;
    } else {
        evaluation = visibility_.evaluate_fallback(observer, target);
        failure = "visibility system unavailable";
        if (!evaluation.error.empty()) {
            failure += ": " + evaluation.error;
        }
    }

    combined.lighting = evaluation.lighting;
    combined.has_line_of_sight = evaluation.has_line_of_sight;

    if (evaluation.source == EvaluationSource::Native) {
        return {true, evaluation.state, {}, false, ResultSource::Native};
    }

    if (evaluation.source == EvaluationSource::Heuristic) {
        combined.warnings.push_back("visibility system error: lighting-only-fallback");
        report_fallback(SystemTag::Visibility, observer, target, failure, core::ErrorCategory::Oracle,
                        "lighting-only-fallback", true, vision::to_string(evaluation.state));
        return {true, evaluation.state, evaluation.error, true, ResultSource::Heuristic};
    }

    if (auto lingering = store_.peek_lingering(key, overrides::OverrideKind::Visibility)) {
        const VisibilityState state = lingering->visibility().value_or(VisibilityState::Observed);
        combined.warnings.push_back("visibility system error: manual-override-fallback");
        report_fallback(SystemTag::Visibility, observer, target, failure, core::ErrorCategory::Oracle,
                        "manual-override-fallback", true, vision::to_string(state));
        return {true, state, evaluation.error, true, ResultSource::Manual};
    }

    combined.warnings.push_back("visibility system error: default-fallback");
    report_fallback(SystemTag::Visibility, observer, target, failure, core::ErrorCategory::Oracle,
                    "default-fallback", false, vision::to_string(VisibilityState::Observed));
    return {false, VisibilityState::Observed, evaluation.error, true, ResultSource::Default};
}

SystemResult<CoverState> DualSystemIntegration::resolve_cover(const scene::Entity& observer,
                                                              const scene::Entity& target,
                                                              CombinedState& combined) {
    const overrides::PairKey key{observer.id, target.id};
    if (config_.respect_overrides) {
        if (auto pinned = store_.get_cover(key)) {
            return {true, *pinned, {}, false, ResultSource::Override};
        }
    }

    cover::CoverEvaluation evaluation;
    std::string failure;
    if (cover_.is_enabled()) {
        evaluation = cover_.evaluate(observer.center, target, detect_options(observer));
        failure = "cover detection failed: " + evaluation.error;
    } else {
        evaluation = cover_.evaluate_fallback(observer.center, target);
        failure = "cover system unavailable";
        if (!evaluation.error.empty()) {
            failure += ": " + evaluation.error;
        }
    }

    if (evaluation.source == EvaluationSource::Native) {
        return {true, evaluation.state, {}, false, ResultSource::Native};
    }

    if (evaluation.source == EvaluationSource::Heuristic) {
        const std::string tier = evaluation.fallback_tier();
        combined.warnings.push_back("cover system error: " + tier);
        report_fallback(SystemTag::Cover, observer, target, failure, core::ErrorCategory::Geometry,
                        tier, true, vision::to_string(evaluation.state));
        return {true, evaluation.state, evaluation.error, true, ResultSource::Heuristic};
    }

    if (auto lingering = store_.peek_lingering(key, overrides::OverrideKind::Cover)) {
        const CoverState state = lingering->cover().value_or(CoverState::None);
        combined.warnings.push_back("cover system error: manual-override-fallback");
        report_fallback(SystemTag::Cover, observer, target, failure, core::ErrorCategory::Geometry,
                        "manual-override-fallback", true, vision::to_string(state));
        return {true, state, evaluation.error, true, ResultSource::Manual};
    }

    combined.warnings.push_back("cover system error: default-fallback");
    report_fallback(SystemTag::Cover, observer, target, failure, core::ErrorCategory::Geometry,
                    "default-fallback", false, vision::to_string(CoverState::None));
    return {false, CoverState::None, evaluation.error, true, ResultSource::Default};
}

cover::DetectOptions DualSystemIntegration::detect_options(const scene::Entity& observer) const {
    cover::DetectOptions options;
    options.observer = &observer;
    if (cover_.config().ignore_undetected) {
        options.is_undetected = [this, &observer](const scene::Entity& blocker) {
            return is_undetected(observer, blocker);
        };
    }
    return options;
}

bool DualSystemIntegration::is_undetected(const scene::Entity& observer, const scene::Entity& blocker) const {
    if (auto pinned = store_.get_visibility({observer.id, blocker.id})) {
        return *pinned == VisibilityState::Undetected;
    }
    return visibility_.calculate(observer, blocker) == VisibilityState::Undetected;
}

void DualSystemIntegration::report_fallback(SystemTag tag, const scene::Entity& observer, const scene::Entity& target,
                                            const std::string& message, core::ErrorCategory category,
                                            const std::string& tier, bool applied, const std::string& data) {
    ErrorContext context;
    context.observer_id = observer.id;
    context.target_id = target.id;
    context.operation = "get_combined_state";
    context.category = category;
    context.fallback = FallbackReport{applied, tier, data};
    ledger_.handle_system_error(tag, message, context);
}

} // namespace umbra::integration
