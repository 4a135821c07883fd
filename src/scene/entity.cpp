#include <umbra/scene/entity.hpp>

#include <algorithm>

namespace umbra::scene {

namespace {
    constexpr double TINY_CORNER_FRACTION = 0.35;
}

int size_rank(SizeCategory size) noexcept {
    return static_cast<int>(size);
}

double size_height_feet(SizeCategory size) noexcept {
    switch (size) {
        case SizeCategory::Tiny: return 2.5;
        case SizeCategory::Small: return 5.0;
        case SizeCategory::Medium: return 5.0;
        case SizeCategory::Large: return 10.0;
        case SizeCategory::Huge: return 15.0;
        case SizeCategory::Gargantuan: return 20.0;
    }
    return 5.0;
}

const char* to_string(SizeCategory size) noexcept {
    switch (size) {
        case SizeCategory::Tiny: return "tiny";
        case SizeCategory::Small: return "small";
        case SizeCategory::Medium: return "medium";
        case SizeCategory::Large: return "large";
        case SizeCategory::Huge: return "huge";
        case SizeCategory::Gargantuan: return "gargantuan";
    }
    return "medium";
}

Option<SizeCategory> parse_size_category(std::string_view text) {
    if (text == "tiny") return SizeCategory::Tiny;
    if (text == "small" || text == "sm") return SizeCategory::Small;
    if (text == "medium" || text == "med") return SizeCategory::Medium;
    if (text == "large" || text == "lg") return SizeCategory::Large;
    if (text == "huge") return SizeCategory::Huge;
    if (text == "gargantuan" || text == "grg") return SizeCategory::Gargantuan;
    return std::nullopt;
}

math::Rect Entity::footprint(double grid_size) const noexcept {
    const double half = std::max(0.0, size) * grid_size * 0.5;
    return math::Rect::around(center.xy(), half, half);
}

std::array<math::Vec2, 4> Entity::corners(double grid_size) const noexcept {
    math::Rect rect = footprint(grid_size);
    if (size_category == SizeCategory::Tiny) {
        const double half = grid_size * TINY_CORNER_FRACTION;
        rect = math::Rect::around(center.xy(), half, half);
    }
    return {
        math::Vec2(rect.x1, rect.y1),
        math::Vec2(rect.x2, rect.y1),
        math::Vec2(rect.x2, rect.y2),
        math::Vec2(rect.x1, rect.y2),
    };
}

VerticalSpan Entity::vertical_span() const noexcept {
    const double height = size_height_feet(size_category);
    return VerticalSpan{center.elevation, center.elevation + height};
}

} // namespace umbra::scene
