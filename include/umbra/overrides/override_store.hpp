#pragma once

#include <umbra/core/types.hpp>
#include <umbra/scene/providers.hpp>
#include <umbra/vision/states.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace umbra::overrides {

// Directional: (A, B) and (B, A) are independent
struct PairKey {
    std::string observer_id;
    std::string target_id;

    bool operator==(const PairKey& other) const = default;

    bool touches(const std::string& entity_id) const noexcept {
        return observer_id == entity_id || target_id == entity_id;
    }
};

struct PairKeyHash {
    size_t operator()(const PairKey& key) const noexcept {
        const size_t h1 = std::hash<std::string>{}(key.observer_id);
        const size_t h2 = std::hash<std::string>{}(key.target_id);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

enum class OverrideKind : u8 {
    Visibility,
    Cover
};

// What pinned the value
enum class OverrideSource : u8 {
    Manual,
    SneakAction,
    HideAction,
    SeekAction,
    PointOutAction,
    Automation
};

const char* to_string(OverrideKind kind) noexcept;
const char* to_string(OverrideSource source) noexcept;
Option<OverrideKind> parse_override_kind(std::string_view text);
Option<OverrideSource> parse_override_source(std::string_view text);

// Facts that justified the override when it was set
struct ValidationContext {
    bool has_cover = false;
    Option<vision::CoverState> expected_cover;
    bool has_concealment = false;
    vision::LightingBand lighting = vision::LightingBand::Unknown;
    bool observer_has_darkvision = false;
};

using OverrideState = std::variant<vision::VisibilityState, vision::CoverState>;

struct OverrideRecord {
    PairKey key;
    OverrideKind kind = OverrideKind::Visibility;
    OverrideState state = vision::VisibilityState::Observed;
    OverrideSource source = OverrideSource::Manual;
    std::string reason;
    ValidationContext context;
    i64 timestamp_ms = 0;

    Option<vision::VisibilityState> visibility() const;
    Option<vision::CoverState> cover() const;
};

// Live facts for a pair, computed without consulting overrides
struct CurrentPairContext {
    vision::VisibilityState visibility = vision::VisibilityState::Observed;
    vision::CoverState cover = vision::CoverState::None;
    vision::LightingBand lighting = vision::LightingBand::Unknown;
    bool observer_has_darkvision = false;
};

using ContextProbe = std::function<CurrentPairContext(const PairKey&)>;

struct InvalidationReason {
    std::string code;
    std::string message;
};

struct InvalidOverride {
    OverrideRecord record;
    CurrentPairContext current;
    std::vector<InvalidationReason> reasons;
};

// Reasons the current context no longer supports a record; empty when it still holds
std::vector<InvalidationReason> check_override(const OverrideRecord& record, const CurrentPairContext& current);

enum class TriggerCause : u8 {
    EntityMoved,
    LightingChanged,
    WallChanged,
    Manual
};

const char* to_string(TriggerCause cause) noexcept;

// World-state change that may invalidate overrides. An empty entity id affects every pair.
struct RevalidationTrigger {
    TriggerCause cause = TriggerCause::Manual;
    std::string entity_id;

    static RevalidationTrigger entity_moved(std::string id) { return {TriggerCause::EntityMoved, std::move(id)}; }
    static RevalidationTrigger lighting_changed() { return {TriggerCause::LightingChanged, {}}; }
    static RevalidationTrigger wall_changed() { return {TriggerCause::WallChanged, {}}; }
    static RevalidationTrigger manual() { return {TriggerCause::Manual, {}}; }

    bool is_global() const noexcept { return entity_id.empty(); }
    bool affects(const PairKey& key) const noexcept { return is_global() || key.touches(entity_id); }
};

/**
 * @brief Durable store of pinned visibility and cover values.
 *
 * Holds at most one record per pair and kind. Records are written through to
 * the persistence provider when one is attached. The first persistence
 * failure degrades the store: reads return no override, writes are dropped,
 * and the degraded callback fires once.
 *
 * Revalidation never removes records. Records whose context no longer holds
 * are returned to the caller, who decides whether to clear them.
 */
class OverrideStore {
public:
    using DegradedCallback = std::function<void(const Error&)>;

    explicit OverrideStore(scene::IPersistenceProvider* persistence = nullptr);

    void on_degraded(DegradedCallback callback) { on_degraded_ = std::move(callback); }

    // Returns false when the write was dropped
    bool set(const PairKey& key, vision::VisibilityState state, OverrideSource source,
             const ValidationContext& context, std::string reason = {});
    bool set(const PairKey& key, vision::CoverState state, OverrideSource source,
             const ValidationContext& context, std::string reason = {});

    Option<OverrideRecord> get(const PairKey& key, OverrideKind kind) const;
    Option<vision::VisibilityState> get_visibility(const PairKey& key) const;
    Option<vision::CoverState> get_cover(const PairKey& key) const;

    // Reads the in-memory record even when the store is degraded
    Option<OverrideRecord> peek_lingering(const PairKey& key, OverrideKind kind) const;

    // Clears one kind, or both when kind is empty. Returns whether anything was removed.
    bool clear(const PairKey& key, Option<OverrideKind> kind = std::nullopt);

    // Clears every record where the entity is observer or target
    usize clear_for_entity(const std::string& entity_id);

    std::vector<OverrideRecord> records() const;
    usize size() const noexcept;

    std::vector<InvalidOverride> revalidate_all(const RevalidationTrigger& trigger, const ContextProbe& probe) const;
    std::vector<InvalidOverride> revalidate_entities(const std::unordered_set<std::string>& entity_ids,
                                                     const ContextProbe& probe) const;

    // Restores records written by an earlier session
    Result<usize, Error> load_from_persistence();

    bool is_degraded() const noexcept { return degraded_; }
    const Error& degraded_reason() const noexcept { return degraded_reason_; }

    static std::string storage_key(const PairKey& key, OverrideKind kind);

private:
    struct PairOverrides {
        Option<OverrideRecord> visibility;
        Option<OverrideRecord> cover;

        Option<OverrideRecord>& slot(OverrideKind kind) { return kind == OverrideKind::Cover ? cover : visibility; }
        const Option<OverrideRecord>& slot(OverrideKind kind) const {
            return kind == OverrideKind::Cover ? cover : visibility;
        }
        bool empty() const noexcept { return !visibility && !cover; }
    };

    bool put(OverrideRecord record);
    bool erase_slot(const PairKey& key, OverrideKind kind);

    std::vector<InvalidOverride> revalidate_matching(const std::function<bool(const PairKey&)>& matches,
                                                     const ContextProbe& probe) const;

    void degrade(const Error& error);

    scene::IPersistenceProvider* persistence_;
    std::unordered_map<PairKey, PairOverrides, PairKeyHash> overrides_;

    bool degraded_ = false;
    Error degraded_reason_;
    DegradedCallback on_degraded_;
};

} // namespace umbra::overrides
