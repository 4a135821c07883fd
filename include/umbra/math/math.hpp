#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>

namespace umbra::math {

// Map coordinates are kept in double precision
using Vec2 = glm::dvec2;
using Vec3 = glm::dvec3;

inline constexpr double EPSILON = 1e-9;

inline bool is_finite(const Vec2& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

// z component of the 2D cross product
inline double cross(const Vec2& a, const Vec2& b) noexcept {
    return a.x * b.y - a.y * b.x;
}

inline Vec2 perpendicular(const Vec2& v) noexcept {
    return Vec2(-v.y, v.x);
}

} // namespace umbra::math
