#include <umbra/core/config.hpp>
#include <umbra/core/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace umbra::core {

const char* to_string(IntersectionMode mode) noexcept {
    switch (mode) {
        case IntersectionMode::Any: return "any";
        case IntersectionMode::Length10: return "length10";
        case IntersectionMode::Center: return "center";
        case IntersectionMode::Coverage: return "coverage";
        case IntersectionMode::Tactical: return "tactical";
        case IntersectionMode::Sampling3D: return "sampling3d";
    }
    return "tactical";
}

Option<IntersectionMode> parse_intersection_mode(std::string_view text) {
    if (text == "any") return IntersectionMode::Any;
    if (text == "length10") return IntersectionMode::Length10;
    if (text == "center") return IntersectionMode::Center;
    if (text == "coverage") return IntersectionMode::Coverage;
    if (text == "tactical") return IntersectionMode::Tactical;
    if (text == "sampling3d") return IntersectionMode::Sampling3D;
    return std::nullopt;
}

namespace {

// Helpers: copy a typed value out of a JSON object, rejecting wrong types
Result<void, Error> read_bool(const json& section, const char* key, bool& out) {
    if (!section.contains(key)) return {};
    if (!section[key].is_boolean()) {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                          std::string("expected boolean for '") + key + "'"));
    }
    out = section[key].get<bool>();
    return {};
}

Result<void, Error> read_number(const json& section, const char* key, double& out) {
    if (!section.contains(key)) return {};
    if (!section[key].is_number()) {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                          std::string("expected number for '") + key + "'"));
    }
    out = section[key].get<double>();
    return {};
}

template<typename UInt>
Result<void, Error> read_unsigned(const json& section, const char* key, UInt& out) {
    if (!section.contains(key)) return {};
    const auto& value = section[key];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                          std::string("expected non-negative integer for '") + key + "'"));
    }
    const auto wide = value.get<unsigned long long>();
    if (wide > std::numeric_limits<UInt>::max()) {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                          std::string("value out of range for '") + key + "'"));
    }
    out = static_cast<UInt>(wide);
    return {};
}

Result<void, Error> read_cover(const json& section, CoverConfig& cover) {
    if (section.contains("intersection_mode")) {
        const auto& value = section["intersection_mode"];
        auto mode = value.is_string() ? parse_intersection_mode(value.get<std::string>()) : std::nullopt;
        if (!mode) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                              "unknown intersection_mode " + value.dump()));
        }
        cover.intersection_mode = *mode;
    }

    for (auto step : {read_bool(section, "enabled", cover.enabled),
                      read_number(section, "standard_threshold", cover.standard_threshold),
                      read_number(section, "greater_threshold", cover.greater_threshold),
                      read_bool(section, "allow_greater", cover.allow_greater),
                      read_bool(section, "ignore_undetected", cover.ignore_undetected),
                      read_bool(section, "ignore_dead", cover.ignore_dead),
                      read_bool(section, "ignore_allies", cover.ignore_allies),
                      read_bool(section, "respect_ignore_flag", cover.respect_ignore_flag),
                      read_bool(section, "prone_can_block", cover.prone_can_block),
                      read_unsigned(section, "wall_samples", cover.wall_samples)}) {
        if (!step) return step;
    }
    return {};
}

Result<void, Error> read_sections(const json& root, EngineConfig& config) {
    if (root.contains("map")) {
        const auto& section = root["map"];
        if (!section.is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'map' must be an object"));
        }
        for (auto step : {read_number(section, "grid_size", config.map.grid_size),
                          read_number(section, "feet_per_square", config.map.feet_per_square)}) {
            if (!step) return step;
        }
    }

    if (root.contains("cover")) {
        if (!root["cover"].is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'cover' must be an object"));
        }
        if (auto r = read_cover(root["cover"], config.cover); !r) return r;
    }

    if (root.contains("visibility")) {
        if (!root["visibility"].is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'visibility' must be an object"));
        }
        if (auto r = read_bool(root["visibility"], "enabled", config.visibility.enabled); !r) return r;
    }

    if (root.contains("notifications")) {
        const auto& section = root["notifications"];
        if (!section.is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'notifications' must be an object"));
        }
        auto& n = config.notifications;
        for (auto step : {read_unsigned(section, "max_notifications_per_session", n.max_notifications_per_session),
                          read_unsigned(section, "max_recovery_notifications", n.max_recovery_notifications),
                          read_bool(section, "show_fallback", n.show_fallback),
                          read_bool(section, "show_recovery", n.show_recovery)}) {
            if (!step) return step;
        }
    }

    if (root.contains("recovery")) {
        const auto& section = root["recovery"];
        if (!section.is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'recovery' must be an object"));
        }
        for (auto step : {read_unsigned(section, "max_recovery_attempts", config.recovery.max_recovery_attempts),
                          read_unsigned(section, "history_capacity", config.recovery.history_capacity)}) {
            if (!step) return step;
        }
    }

    if (root.contains("integration")) {
        const auto& section = root["integration"];
        if (!section.is_object()) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid, "'integration' must be an object"));
        }
        for (auto step : {read_unsigned(section, "batch_size", config.integration.batch_size),
                          read_bool(section, "respect_overrides", config.integration.respect_overrides)}) {
            if (!step) return step;
        }
    }

    return {};
}

} // namespace

Result<void, Error> validate(const EngineConfig& config) {
    const auto& cover = config.cover;
    auto invalid = [](std::string message) {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid, std::move(message)));
    };

    if (cover.standard_threshold < 0.0 || cover.standard_threshold > 100.0) {
        return invalid("standard_threshold must be within 0..100");
    }
    if (cover.greater_threshold < 0.0 || cover.greater_threshold > 100.0) {
        return invalid("greater_threshold must be within 0..100");
    }
    if (cover.standard_threshold > cover.greater_threshold) {
        return invalid("standard_threshold must not exceed greater_threshold");
    }
    if (cover.wall_samples == 0) {
        return invalid("wall_samples must be at least 1");
    }
    if (!(config.map.grid_size > 0.0) || !(config.map.feet_per_square > 0.0)) {
        return invalid("grid_size and feet_per_square must be positive");
    }
    if (config.integration.batch_size == 0) {
        return invalid("batch_size must be at least 1");
    }
    if (config.recovery.history_capacity == 0) {
        return invalid("history_capacity must be at least 1");
    }
    return {};
}

Result<EngineConfig, Error> parse_engine_config(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::ParseError, e.what()));
    }

    if (!root.is_object()) {
        return std::unexpected(make_error(ErrorCode::ParseError, "configuration root must be an object"));
    }

    EngineConfig config;
    if (auto read = read_sections(root, config); !read) {
        return std::unexpected(read.error());
    }
    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

Result<EngineConfig, Error> load_engine_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(ErrorCode::FileNotFound, "config file not found: " + path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::FileReadError, "cannot open config file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_engine_config(buffer.str());
    if (config) {
        LOG_INFO(Config, "Loaded engine config from {} (intersection mode {})",
                 path, to_string(config->cover.intersection_mode));
    } else {
        LOG_ERROR(Config, "Rejected engine config {}: {}", path, config.error().to_string());
    }
    return config;
}

std::string serialize_engine_config(const EngineConfig& config) {
    const auto& c = config.cover;
    const auto& n = config.notifications;

    json root;
    root["map"] = {
        {"grid_size", config.map.grid_size},
        {"feet_per_square", config.map.feet_per_square},
    };
    root["cover"] = {
        {"enabled", c.enabled},
        {"intersection_mode", to_string(c.intersection_mode)},
        {"standard_threshold", c.standard_threshold},
        {"greater_threshold", c.greater_threshold},
        {"allow_greater", c.allow_greater},
        {"ignore_undetected", c.ignore_undetected},
        {"ignore_dead", c.ignore_dead},
        {"ignore_allies", c.ignore_allies},
        {"respect_ignore_flag", c.respect_ignore_flag},
        {"prone_can_block", c.prone_can_block},
        {"wall_samples", c.wall_samples},
    };
    root["visibility"] = {{"enabled", config.visibility.enabled}};
    root["notifications"] = {
        {"max_notifications_per_session", n.max_notifications_per_session},
        {"max_recovery_notifications", n.max_recovery_notifications},
        {"show_fallback", n.show_fallback},
        {"show_recovery", n.show_recovery},
    };
    root["recovery"] = {
        {"max_recovery_attempts", config.recovery.max_recovery_attempts},
        {"history_capacity", config.recovery.history_capacity},
    };
    root["integration"] = {
        {"batch_size", config.integration.batch_size},
        {"respect_overrides", config.integration.respect_overrides},
    };
    return root.dump(2);
}

} // namespace umbra::core
