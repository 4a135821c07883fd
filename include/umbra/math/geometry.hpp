#pragma once

#include <umbra/math/math.hpp>
#include <umbra/core/types.hpp>

#include <vector>

namespace umbra::math {

// A location in map space; elevation is in feet
struct Point {
    double x = 0.0;
    double y = 0.0;
    double elevation = 0.0;

    Vec2 xy() const noexcept { return Vec2(x, y); }

    bool operator==(const Point& other) const = default;
};

struct Segment {
    Vec2 a{0.0};
    Vec2 b{0.0};

    Segment() = default;
    Segment(const Vec2& a_, const Vec2& b_) : a(a_), b(b_) {}

    double length() const noexcept { return glm::length(b - a); }
    bool is_degenerate() const noexcept { return length() <= EPSILON; }
    bool is_finite() const noexcept { return math::is_finite(a) && math::is_finite(b); }
    Vec2 at(double t) const noexcept { return a + (b - a) * t; }
};

// Axis-aligned rectangle; x1 <= x2 and y1 <= y2
struct Rect {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    double width() const noexcept { return x2 - x1; }
    double height() const noexcept { return y2 - y1; }
    Vec2 center() const noexcept { return Vec2((x1 + x2) * 0.5, (y1 + y2) * 0.5); }

    bool contains(const Vec2& p) const noexcept {
        return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2;
    }

    Rect expanded(double margin) const noexcept {
        return Rect{x1 - margin, y1 - margin, x2 + margin, y2 + margin};
    }

    static Rect around(const Vec2& center, double half_width, double half_height) noexcept {
        return Rect{center.x - half_width, center.y - half_height,
                    center.x + half_width, center.y + half_height};
    }

    static Rect bounding(const Vec2& a, const Vec2& b) noexcept;
    static Rect merged(const Rect& a, const Rect& b) noexcept;
};

// Simple polygon, implicitly closed
struct Polygon {
    std::vector<Vec2> vertices;

    // Even-odd rule; points on an edge count as inside
    bool contains(const Vec2& p) const;
    bool intersects(const Segment& segment) const;
    Rect bounds() const;
};

// Parameter range [t0, t1] of a segment clipped to a rectangle
struct ClipRange {
    double t0 = 0.0;
    double t1 = 0.0;
};

// Returns 1 for counter-clockwise, -1 for clockwise, 0 for collinear
int orientation(const Vec2& a, const Vec2& b, const Vec2& c) noexcept;

// True when the segments share at least one point, collinear overlap included
bool segments_intersect(const Segment& s1, const Segment& s2) noexcept;

// Parameter along s1 where it crosses s2; empty when they are parallel or disjoint
Option<double> segment_intersection_t(const Segment& s1, const Segment& s2) noexcept;

double distance_point_to_segment(const Vec2& p, const Segment& s) noexcept;

// True when the projection of p falls within the segment's extent
bool point_between_on_segment(const Vec2& p, const Segment& s) noexcept;

// Liang-Barsky clipping
Option<ClipRange> segment_rect_intersection_range(const Segment& s, const Rect& r) noexcept;
double segment_rect_intersection_length(const Segment& s, const Rect& r) noexcept;
bool segment_intersects_rect(const Segment& s, const Rect& r) noexcept;

// Positive when p lies to the left of the directed line a->b
double side_of_line(const Segment& line, const Vec2& p) noexcept;

double distance_2d(const Point& a, const Point& b) noexcept;
double distance_3d(const Point& a, const Point& b) noexcept;

// Converts map units to feet. Elevation is already in feet.
struct MapScale {
    double grid_size = 50.0;
    double feet_per_square = 5.0;

    double to_feet(double map_units) const noexcept { return map_units / grid_size * feet_per_square; }
    double distance_feet(const Point& a, const Point& b) const noexcept;
};

} // namespace umbra::math
