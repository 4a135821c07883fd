#include <umbra/vision/states.hpp>

namespace umbra::vision {

const char* to_string(VisibilityState state) noexcept {
    switch (state) {
        case VisibilityState::Observed: return "observed";
        case VisibilityState::Concealed: return "concealed";
        case VisibilityState::Hidden: return "hidden";
        case VisibilityState::Undetected: return "undetected";
    }
    return "observed";
}

const char* to_string(CoverState state) noexcept {
    switch (state) {
        case CoverState::None: return "none";
        case CoverState::Lesser: return "lesser";
        case CoverState::Standard: return "standard";
        case CoverState::Greater: return "greater";
    }
    return "none";
}

const char* to_string(LightingBand band) noexcept {
    switch (band) {
        case LightingBand::Bright: return "bright";
        case LightingBand::Dim: return "dim";
        case LightingBand::Darkness: return "darkness";
        case LightingBand::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(EvaluationSource source) noexcept {
    switch (source) {
        case EvaluationSource::Native: return "native";
        case EvaluationSource::Heuristic: return "heuristic";
        case EvaluationSource::Failed: return "failed";
    }
    return "failed";
}

Option<VisibilityState> parse_visibility_state(std::string_view text) {
    if (text == "observed") return VisibilityState::Observed;
    if (text == "concealed") return VisibilityState::Concealed;
    if (text == "hidden") return VisibilityState::Hidden;
    if (text == "undetected") return VisibilityState::Undetected;
    return std::nullopt;
}

Option<CoverState> parse_cover_state(std::string_view text) {
    if (text == "none") return CoverState::None;
    if (text == "lesser") return CoverState::Lesser;
    if (text == "standard") return CoverState::Standard;
    if (text == "greater") return CoverState::Greater;
    return std::nullopt;
}

Option<LightingBand> parse_lighting_band(std::string_view text) {
    if (text == "bright") return LightingBand::Bright;
    if (text == "dim") return LightingBand::Dim;
    if (text == "darkness") return LightingBand::Darkness;
    if (text == "unknown") return LightingBand::Unknown;
    return std::nullopt;
}

} // namespace umbra::vision
