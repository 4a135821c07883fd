#pragma once

#include <umbra/math/geometry.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace umbra::scene {

enum class SizeCategory : u8 {
    Tiny,
    Small,
    Medium,
    Large,
    Huge,
    Gargantuan
};

int size_rank(SizeCategory size) noexcept;
double size_height_feet(SizeCategory size) noexcept;
const char* to_string(SizeCategory size) noexcept;
Option<SizeCategory> parse_size_category(std::string_view text);

enum class EntityKind : u8 {
    Creature,
    Loot,
    Hazard
};

enum class SenseAcuity : u8 {
    Precise,
    Imprecise,
    Vague
};

// A non-visual sense (tremorsense, scent, echolocation...)
struct Sense {
    std::string type;
    SenseAcuity acuity = SenseAcuity::Imprecise;
    double range_feet = 0.0;    // 0 = unlimited

    bool reaches(double distance_feet) const noexcept {
        return range_feet <= 0.0 || distance_feet <= range_feet;
    }
};

struct SenseProfile {
    // Status effects
    bool blinded = false;
    bool dazzled = false;

    // Vision
    double vision_range_feet = 0.0;     // 0 = unlimited
    bool low_light_vision = false;
    bool darkvision = false;
    double darkvision_range_feet = 0.0; // 0 = unlimited

    std::vector<Sense> special_senses;

    bool sees_in_darkness_at(double distance_feet) const noexcept {
        return darkvision && (darkvision_range_feet <= 0.0 || distance_feet <= darkvision_range_feet);
    }
};

// Bottom and top of an entity's column, in feet
struct VerticalSpan {
    double bottom = 0.0;
    double top = 0.0;

    double mid() const noexcept { return (bottom + top) * 0.5; }
    // Strict interior overlap
    bool overlaps(double z) const noexcept { return bottom < z && top > z; }
};

/**
 * @brief Anything on the map that can observe or be observed.
 *
 * Entities belong to the scene. The engine only reads their current
 * geometry and flags; it never creates, moves or destroys them.
 */
struct Entity {
    std::string id;
    math::Point center;
    double size = 1.0;                       // footprint edge in grid squares
    SizeCategory size_category = SizeCategory::Medium;

    bool alive = true;
    std::string alliance;
    EntityKind kind = EntityKind::Creature;

    bool hidden_from_scene = false;
    bool never_provides_cover = false;
    bool prone = false;
    bool invisible = false;

    SenseProfile senses;

    math::Rect footprint(double grid_size) const noexcept;

    // Corner points used for tactical lines. Tiny creatures use a 0.7 square
    // effective area so they still have distinct corners.
    std::array<math::Vec2, 4> corners(double grid_size) const noexcept;

    VerticalSpan vertical_span() const noexcept;
};

} // namespace umbra::scene
