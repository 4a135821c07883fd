#include <umbra/overrides/override_store.hpp>
#include <umbra/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <unordered_map>

using json = nlohmann::json;

namespace umbra::overrides {

using vision::CoverState;
using vision::LightingBand;
using vision::VisibilityState;

const char* to_string(OverrideKind kind) noexcept {
    return kind == OverrideKind::Cover ? "cover" : "visibility";
}

const char* to_string(OverrideSource source) noexcept {
    switch (source) {
        case OverrideSource::Manual: return "manual";
        case OverrideSource::SneakAction: return "sneak-action";
        case OverrideSource::HideAction: return "hide-action";
        case OverrideSource::SeekAction: return "seek-action";
        case OverrideSource::PointOutAction: return "point-out-action";
        case OverrideSource::Automation: return "automation";
    }
    return "manual";
}

Option<OverrideKind> parse_override_kind(std::string_view text) {
    if (text == "visibility") return OverrideKind::Visibility;
    if (text == "cover") return OverrideKind::Cover;
    return std::nullopt;
}

Option<OverrideSource> parse_override_source(std::string_view text) {
    if (text == "manual") return OverrideSource::Manual;
    if (text == "sneak-action") return OverrideSource::SneakAction;
    if (text == "hide-action") return OverrideSource::HideAction;
    if (text == "seek-action") return OverrideSource::SeekAction;
    if (text == "point-out-action") return OverrideSource::PointOutAction;
    if (text == "automation") return OverrideSource::Automation;
    return std::nullopt;
}

const char* to_string(TriggerCause cause) noexcept {
    switch (cause) {
        case TriggerCause::EntityMoved: return "entity-moved";
        case TriggerCause::LightingChanged: return "lighting-changed";
        case TriggerCause::WallChanged: return "wall-changed";
        case TriggerCause::Manual: return "manual";
    }
    return "manual";
}

Option<VisibilityState> OverrideRecord::visibility() const {
    if (const auto* state = std::get_if<VisibilityState>(&this->state)) {
        return *state;
    }
    return std::nullopt;
}

Option<CoverState> OverrideRecord::cover() const {
    if (const auto* state = std::get_if<CoverState>(&this->state)) {
        return *state;
    }
    return std::nullopt;
}

std::vector<InvalidationReason> check_override(const OverrideRecord& record, const CurrentPairContext& current) {
    std::vector<InvalidationReason> reasons;
    const ValidationContext& expected = record.context;

    const bool has_cover = current.cover != CoverState::None;
    const bool concealed = current.visibility == VisibilityState::Concealed ||
                           current.visibility == VisibilityState::Hidden;
    const bool visible = current.visibility == VisibilityState::Observed ||
                         current.visibility == VisibilityState::Concealed;

    if (expected.has_cover && !has_cover) {
        reasons.push_back({"cover-lost", "has NO cover (override expected cover)"});
    }
    if (!expected.has_cover && has_cover) {
        reasons.push_back({"cover-appeared", "now has cover (override expected no cover)"});
    }

    if (expected.has_concealment && visible && !concealed) {
        reasons.push_back({"concealment-lost", "has NO concealment (override expected concealment)"});
    }
    if (!expected.has_concealment && concealed) {
        reasons.push_back({"concealment-appeared", "now has concealment (override expected no concealment)"});
    }
    if (expected.has_concealment && current.visibility == VisibilityState::Observed) {
        reasons.push_back({"clearly-observed", "is now clearly observed (override expected concealment)"});
    }

    const bool pinned_undetected = record.visibility() == VisibilityState::Undetected;
    const bool stealth_source = record.source == OverrideSource::Manual || record.source == OverrideSource::SneakAction;
    if (pinned_undetected && stealth_source) {
        if (current.visibility == VisibilityState::Observed && !has_cover && !concealed &&
            (!current.observer_has_darkvision || current.lighting == LightingBand::Bright)) {
            if (record.source == OverrideSource::SneakAction) {
                reasons.push_back({"stealth-failed", "stealth failed: now clearly visible in bright light"});
            } else {
                reasons.push_back({"clearly-visible", "is now clearly visible with no concealment or cover"});
            }
        }
        if (record.source == OverrideSource::SneakAction && current.lighting == LightingBand::Bright && !has_cover) {
            reasons.push_back({"sneak-broken", "stealth broken: moved to bright open area"});
        }
    }

    if (expected.expected_cover && vision::rank(current.cover) < vision::rank(*expected.expected_cover)) {
        reasons.push_back({"cover-reduced", std::format("cover reduced from {} to {}",
                                                        vision::to_string(*expected.expected_cover),
                                                        vision::to_string(current.cover))});
    }
    return reasons;
}

namespace {

    i64 now_ms() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string state_name(const OverrideState& state) {
        return std::visit([](auto value) { return std::string(vision::to_string(value)); }, state);
    }

    json to_json(const OverrideRecord& record) {
        json context = {
            {"has_cover", record.context.has_cover},
            {"has_concealment", record.context.has_concealment},
            {"lighting", vision::to_string(record.context.lighting)},
            {"observer_has_darkvision", record.context.observer_has_darkvision},
        };
        context["expected_cover"] = record.context.expected_cover
            ? json(vision::to_string(*record.context.expected_cover))
            : json(nullptr);

        return {
            {"observer", record.key.observer_id},
            {"target", record.key.target_id},
            {"kind", to_string(record.kind)},
            {"state", state_name(record.state)},
            {"source", to_string(record.source)},
            {"reason", record.reason},
            {"timestamp", record.timestamp_ms},
            {"context", context},
        };
    }

    // Throws json exceptions or std::invalid_argument on malformed documents
    OverrideRecord from_json(const json& document) {
        OverrideRecord record;
        record.key.observer_id = document.at("observer").get<std::string>();
        record.key.target_id = document.at("target").get<std::string>();

        const auto kind = parse_override_kind(document.at("kind").get<std::string>());
        if (!kind) {
            throw std::invalid_argument("unknown override kind");
        }
        record.kind = *kind;

        const std::string state = document.at("state").get<std::string>();
        if (record.kind == OverrideKind::Cover) {
            const auto cover = vision::parse_cover_state(state);
            if (!cover) throw std::invalid_argument("unknown cover state '" + state + "'");
            record.state = *cover;
        } else {
            const auto visibility = vision::parse_visibility_state(state);
            if (!visibility) throw std::invalid_argument("unknown visibility state '" + state + "'");
            record.state = *visibility;
        }

        record.source = parse_override_source(document.value("source", "manual")).value_or(OverrideSource::Manual);
        record.reason = document.value("reason", "");
        record.timestamp_ms = document.value("timestamp", i64{0});

        if (document.contains("context") && document["context"].is_object()) {
            const json& context = document["context"];
            record.context.has_cover = context.value("has_cover", false);
            record.context.has_concealment = context.value("has_concealment", false);
            record.context.observer_has_darkvision = context.value("observer_has_darkvision", false);
            record.context.lighting = vision::parse_lighting_band(context.value("lighting", "unknown"))
                                          .value_or(LightingBand::Unknown);
            if (context.contains("expected_cover") && context["expected_cover"].is_string()) {
                record.context.expected_cover =
                    vision::parse_cover_state(context["expected_cover"].get<std::string>());
            }
        }
        return record;
    }

} // namespace

OverrideStore::OverrideStore(scene::IPersistenceProvider* persistence)
    : persistence_(persistence) {
}

std::string OverrideStore::storage_key(const PairKey& key, OverrideKind kind) {
    return std::format("{}/{}/{}", to_string(kind), key.observer_id, key.target_id);
}

bool OverrideStore::set(const PairKey& key, VisibilityState state, OverrideSource source,
                        const ValidationContext& context, std::string reason) {
    return put(OverrideRecord{key, OverrideKind::Visibility, state, source, std::move(reason), context, now_ms()});
}

bool OverrideStore::set(const PairKey& key, CoverState state, OverrideSource source,
                        const ValidationContext& context, std::string reason) {
    return put(OverrideRecord{key, OverrideKind::Cover, state, source, std::move(reason), context, now_ms()});
}

bool OverrideStore::put(OverrideRecord record) {
    if (degraded_) {
        LOG_DEBUG(Overrides, "Dropping {} override {} -> {}: store is degraded",
                  to_string(record.kind), record.key.observer_id, record.key.target_id);
        return false;
    }

    if (persistence_) {
        std::string document;
        try {
            document = to_json(record).dump();
        } catch (const json::exception& e) {
            // Unencodable text (invalid UTF-8) rejects this record only
            LOG_ERROR(Overrides, "Cannot encode {} override {} -> {}: {}", to_string(record.kind),
                      record.key.observer_id, record.key.target_id, e.what());
            return false;
        }

        auto stored = persistence_->store(storage_key(record.key, record.kind), document);
        if (!stored) {
            degrade(stored.error());
            return false;
        }
    }

    LOG_DEBUG(Overrides, "Pinned {} {} -> {} to {} ({})", to_string(record.kind), record.key.observer_id,
              record.key.target_id, state_name(record.state), to_string(record.source));

    const PairKey key = record.key;
    const OverrideKind kind = record.kind;
    overrides_[key].slot(kind) = std::move(record);
    return true;
}

Option<OverrideRecord> OverrideStore::get(const PairKey& key, OverrideKind kind) const {
    if (degraded_) {
        return std::nullopt;
    }
    return peek_lingering(key, kind);
}

Option<OverrideRecord> OverrideStore::peek_lingering(const PairKey& key, OverrideKind kind) const {
    auto it = overrides_.find(key);
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second.slot(kind);
}

Option<VisibilityState> OverrideStore::get_visibility(const PairKey& key) const {
    if (auto record = get(key, OverrideKind::Visibility)) {
        return record->visibility();
    }
    return std::nullopt;
}

Option<CoverState> OverrideStore::get_cover(const PairKey& key) const {
    if (auto record = get(key, OverrideKind::Cover)) {
        return record->cover();
    }
    return std::nullopt;
}

bool OverrideStore::erase_slot(const PairKey& key, OverrideKind kind) {
    auto it = overrides_.find(key);
    if (it == overrides_.end() || !it->second.slot(kind)) {
        return false;
    }

    if (persistence_) {
        auto erased = persistence_->erase(storage_key(key, kind));
        if (!erased) {
            degrade(erased.error());
            return false;
        }
    }

    it->second.slot(kind).reset();
    if (it->second.empty()) {
        overrides_.erase(it);
    }
    return true;
}

bool OverrideStore::clear(const PairKey& key, Option<OverrideKind> kind) {
    if (degraded_) {
        return false;
    }

    bool removed = false;
    if (!kind || *kind == OverrideKind::Visibility) {
        removed |= erase_slot(key, OverrideKind::Visibility);
    }
    if (!degraded_ && (!kind || *kind == OverrideKind::Cover)) {
        removed |= erase_slot(key, OverrideKind::Cover);
    }

    if (removed) {
        LOG_DEBUG(Overrides, "Cleared overrides {} -> {}", key.observer_id, key.target_id);
    }
    return removed;
}

usize OverrideStore::clear_for_entity(const std::string& entity_id) {
    std::vector<PairKey> keys;
    for (const auto& [key, slots] : overrides_) {
        if (key.touches(entity_id)) {
            keys.push_back(key);
        }
    }

    usize removed = 0;
    for (const auto& key : keys) {
        if (degraded_) break;
        if (erase_slot(key, OverrideKind::Visibility)) ++removed;
        if (!degraded_ && erase_slot(key, OverrideKind::Cover)) ++removed;
    }

    if (removed > 0) {
        LOG_INFO(Overrides, "Cleared {} overrides involving '{}'", removed, entity_id);
    }
    return removed;
}

std::vector<OverrideRecord> OverrideStore::records() const {
    std::vector<OverrideRecord> result;
    for (const auto& [key, slots] : overrides_) {
        if (slots.visibility) result.push_back(*slots.visibility);
        if (slots.cover) result.push_back(*slots.cover);
    }
    std::sort(result.begin(), result.end(), [](const OverrideRecord& a, const OverrideRecord& b) {
        if (a.key.observer_id != b.key.observer_id) return a.key.observer_id < b.key.observer_id;
        if (a.key.target_id != b.key.target_id) return a.key.target_id < b.key.target_id;
        return a.kind < b.kind;
    });
    return result;
}

usize OverrideStore::size() const noexcept {
    usize count = 0;
    for (const auto& [key, slots] : overrides_) {
        count += (slots.visibility ? 1 : 0) + (slots.cover ? 1 : 0);
    }
    return count;
}

std::vector<InvalidOverride> OverrideStore::revalidate_all(const RevalidationTrigger& trigger,
                                                           const ContextProbe& probe) const {
    LOG_DEBUG(Overrides, "Revalidating overrides ({}{}{})", to_string(trigger.cause),
              trigger.is_global() ? "" : ": ", trigger.entity_id);
    return revalidate_matching([&](const PairKey& key) { return trigger.affects(key); }, probe);
}

std::vector<InvalidOverride> OverrideStore::revalidate_entities(const std::unordered_set<std::string>& entity_ids,
                                                                const ContextProbe& probe) const {
    return revalidate_matching([&](const PairKey& key) {
        return entity_ids.contains(key.observer_id) || entity_ids.contains(key.target_id);
    }, probe);
}

std::vector<InvalidOverride> OverrideStore::revalidate_matching(const std::function<bool(const PairKey&)>& matches,
                                                                const ContextProbe& probe) const {
    std::vector<InvalidOverride> invalid;
    if (degraded_ || !probe) {
        return invalid;
    }

    usize checked = 0;
    for (const auto& record : records()) {
        if (!matches(record.key)) {
            continue;
        }

        CurrentPairContext current;
        try {
            current = probe(record.key);
        } catch (const std::exception& e) {
            LOG_WARNING(Overrides, "Skipping revalidation of {} -> {}: {}",
                        record.key.observer_id, record.key.target_id, e.what());
            continue;
        }
        ++checked;

        auto reasons = check_override(record, current);
        if (!reasons.empty()) {
            LOG_INFO(Overrides, "{} override {} -> {} no longer holds: {}", to_string(record.kind),
                     record.key.observer_id, record.key.target_id, reasons.front().message);
            invalid.push_back(InvalidOverride{record, current, std::move(reasons)});
        }
    }

    LOG_DEBUG(Overrides, "Revalidated {} overrides, {} invalid", checked, invalid.size());
    return invalid;
}

Result<usize, Error> OverrideStore::load_from_persistence() {
    if (!persistence_) {
        return usize{0};
    }
    if (degraded_) {
        return std::unexpected(degraded_reason_);
    }

    usize loaded = 0;
    for (OverrideKind kind : {OverrideKind::Visibility, OverrideKind::Cover}) {
        auto keys = persistence_->keys(std::string(to_string(kind)) + "/");
        if (!keys) {
            degrade(keys.error());
            return std::unexpected(keys.error());
        }

        for (const auto& storage : *keys) {
            auto value = persistence_->load(storage);
            if (!value) {
                degrade(value.error());
                return std::unexpected(value.error());
            }
            if (!value->has_value()) {
                continue;
            }

            try {
                OverrideRecord record = from_json(json::parse(**value));
                if (record.kind != kind) {
                    throw std::invalid_argument("kind does not match key");
                }
                const PairKey key = record.key;
                overrides_[key].slot(kind) = std::move(record);
                ++loaded;
            } catch (const std::exception& e) {
                LOG_WARNING(Persistence, "Skipping corrupt override '{}': {}", storage, e.what());
            }
        }
    }

    LOG_INFO(Overrides, "Restored {} overrides from persistence", loaded);
    return loaded;
}

void OverrideStore::degrade(const Error& error) {
    if (degraded_) {
        return;
    }
    degraded_ = true;
    degraded_reason_ = error;
    LOG_ERROR(Persistence, "Override persistence unavailable, overrides disabled: {}", error.to_string());
    if (on_degraded_) {
        on_degraded_(error);
    }
}

} // namespace umbra::overrides
