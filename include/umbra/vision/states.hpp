#pragma once

#include <umbra/core/types.hpp>

#include <string_view>

namespace umbra::vision {

// Ordered from easiest to hardest to detect
enum class VisibilityState : u8 {
    Observed = 0,
    Concealed = 1,
    Hidden = 2,
    Undetected = 3
};

// Ordered from no obstruction to the strongest cover
enum class CoverState : u8 {
    None = 0,
    Lesser = 1,
    Standard = 2,
    Greater = 3
};

// Illumination at a point, as reported by the lighting oracle
enum class LightingBand : u8 {
    Bright,
    Dim,
    Darkness,
    Unknown
};

// Which tier of a calculator produced a result
enum class EvaluationSource : u8 {
    Native,     // full calculation
    Heuristic,  // secondary fallback (lighting-only, wall collision)
    Failed      // both tiers failed; the state is a conservative default
};

constexpr int rank(VisibilityState state) noexcept { return static_cast<int>(state); }
constexpr int rank(CoverState state) noexcept { return static_cast<int>(state); }

constexpr VisibilityState worst(VisibilityState a, VisibilityState b) noexcept {
    return rank(a) >= rank(b) ? a : b;
}

constexpr VisibilityState best(VisibilityState a, VisibilityState b) noexcept {
    return rank(a) <= rank(b) ? a : b;
}

constexpr CoverState strongest(CoverState a, CoverState b) noexcept {
    return rank(a) >= rank(b) ? a : b;
}

// Bonus to defense and reflex saves
constexpr int cover_bonus(CoverState state) noexcept {
    switch (state) {
        case CoverState::Lesser: return 1;
        case CoverState::Standard: return 2;
        case CoverState::Greater: return 4;
        case CoverState::None: break;
    }
    return 0;
}

// Bonus to stealth checks made while behind the cover
constexpr int stealth_bonus(CoverState state) noexcept {
    return cover_bonus(state);
}

// Standard or better cover is enough to attempt to hide
constexpr bool can_hide(CoverState state) noexcept {
    return state == CoverState::Standard || state == CoverState::Greater;
}

const char* to_string(VisibilityState state) noexcept;
const char* to_string(CoverState state) noexcept;
const char* to_string(LightingBand band) noexcept;
const char* to_string(EvaluationSource source) noexcept;

Option<VisibilityState> parse_visibility_state(std::string_view text);
Option<CoverState> parse_cover_state(std::string_view text);
Option<LightingBand> parse_lighting_band(std::string_view text);

} // namespace umbra::vision
