#pragma once

#include <umbra/math/geometry.hpp>
#include <umbra/vision/states.hpp>

#include <string>

namespace umbra::scene {

// One-way walls only block from one side of their a->b direction
enum class WallDirection : u8 {
    Both,
    Left,
    Right
};

/**
 * @brief Static occluder segment.
 *
 * Treated as immutable for the duration of a query. A cover override of
 * CoverState::None removes the wall from cover calculations while still
 * letting it block sight.
 */
struct Wall {
    std::string id;
    math::Segment segment;

    bool blocks_sight = true;
    bool provides_cover = true;
    bool is_door = false;
    bool door_open = false;
    WallDirection direction = WallDirection::Both;

    Option<vision::CoverState> cover_override;

    // Vertical extent in feet; unbounded when empty
    Option<double> bottom;
    Option<double> top;

    bool is_open_door() const noexcept { return is_door && door_open; }

    // Whether the wall stops a line of sight starting at origin
    bool blocks_from(const math::Vec2& origin) const noexcept;

    bool spans_height(double z) const noexcept;

    // Blocks sight from origin and is allowed to contribute cover
    bool is_cover_candidate(const math::Vec2& origin) const noexcept;
};

} // namespace umbra::scene
