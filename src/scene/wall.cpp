#include <umbra/scene/wall.hpp>

namespace umbra::scene {

bool Wall::blocks_from(const math::Vec2& origin) const noexcept {
    if (!blocks_sight || is_open_door()) {
        return false;
    }

    switch (direction) {
        case WallDirection::Both:
            return true;
        case WallDirection::Left:
            return math::side_of_line(segment, origin) > 0.0;
        case WallDirection::Right:
            return math::side_of_line(segment, origin) < 0.0;
    }
    return true;
}

bool Wall::spans_height(double z) const noexcept {
    if (bottom && z < *bottom) return false;
    if (top && z > *top) return false;
    return true;
}

bool Wall::is_cover_candidate(const math::Vec2& origin) const noexcept {
    if (!provides_cover) {
        return false;
    }
    if (cover_override && *cover_override == vision::CoverState::None) {
        return false;
    }
    return blocks_from(origin);
}

} // namespace umbra::scene
