#pragma once

#include <umbra/core/types.hpp>

#include <string>
#include <string_view>

namespace umbra::core {

// How blocking creatures between observer and target are turned into cover
enum class IntersectionMode : u8 {
    Any,          // centre line passes through more than a sliver of the blocker
    Length10,     // centre line spends at least 10% of the blocker's squares inside it
    Center,       // only the blocker whose centre sits on the line counts
    Coverage,     // summed side coverage percentage of all blockers
    Tactical,     // corner-to-corner lines, best attacker corner
    Sampling3D    // centre line sampled at three heights
};

const char* to_string(IntersectionMode mode) noexcept;
Option<IntersectionMode> parse_intersection_mode(std::string_view text);

struct CoverConfig {
    bool enabled = true;
    IntersectionMode intersection_mode = IntersectionMode::Tactical;

    // Wall coverage percentages mapped to standard / greater cover
    double standard_threshold = 50.0;
    double greater_threshold = 70.0;
    bool allow_greater = true;

    // Blocker filters
    bool ignore_undetected = false;
    bool ignore_dead = true;
    bool ignore_allies = false;
    bool respect_ignore_flag = true;
    bool prone_can_block = true;

    u32 wall_samples = 20;
};

struct MapConfig {
    double grid_size = 50.0;      // map units per grid square
    double feet_per_square = 5.0;
};

struct VisibilityConfig {
    bool enabled = true;
};

struct NotificationConfig {
    u32 max_notifications_per_session = 5;
    u32 max_recovery_notifications = 3;
    bool show_fallback = true;
    bool show_recovery = true;
};

struct RecoveryConfig {
    u32 max_recovery_attempts = 3;
    usize history_capacity = 100;
};

struct IntegrationConfig {
    usize batch_size = 10;
    bool respect_overrides = true;
};

struct EngineConfig {
    MapConfig map;
    CoverConfig cover;
    VisibilityConfig visibility;
    NotificationConfig notifications;
    RecoveryConfig recovery;
    IntegrationConfig integration;
};

// Checks ranges and cross-field constraints
Result<void, Error> validate(const EngineConfig& config);

// Missing keys keep their defaults; the result is validated before it is returned
Result<EngineConfig, Error> parse_engine_config(std::string_view json_text);
Result<EngineConfig, Error> load_engine_config(const std::string& path);

std::string serialize_engine_config(const EngineConfig& config);

} // namespace umbra::core
