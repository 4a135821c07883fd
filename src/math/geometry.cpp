#include <umbra/math/geometry.hpp>

#include <algorithm>
#include <cmath>

namespace umbra::math {

Rect Rect::bounding(const Vec2& a, const Vec2& b) noexcept {
    return Rect{std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
}

Rect Rect::merged(const Rect& a, const Rect& b) noexcept {
    return Rect{std::min(a.x1, b.x1), std::min(a.y1, b.y1), std::max(a.x2, b.x2), std::max(a.y2, b.y2)};
}

bool Polygon::contains(const Vec2& p) const {
    const size_t n = vertices.size();
    if (n < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Vec2& vi = vertices[i];
        const Vec2& vj = vertices[j];

        // Boundary points are inside
        if (distance_point_to_segment(p, Segment(vj, vi)) <= EPSILON) {
            return true;
        }

        if ((vi.y > p.y) != (vj.y > p.y)) {
            const double x_cross = (vj.x - vi.x) * (p.y - vi.y) / (vj.y - vi.y) + vi.x;
            if (p.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool Polygon::intersects(const Segment& segment) const {
    if (contains(segment.a) || contains(segment.b)) {
        return true;
    }
    const size_t n = vertices.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        if (segments_intersect(segment, Segment(vertices[j], vertices[i]))) {
            return true;
        }
    }
    return false;
}

Rect Polygon::bounds() const {
    if (vertices.empty()) {
        return Rect{};
    }
    Rect r{vertices[0].x, vertices[0].y, vertices[0].x, vertices[0].y};
    for (const auto& v : vertices) {
        r.x1 = std::min(r.x1, v.x);
        r.y1 = std::min(r.y1, v.y);
        r.x2 = std::max(r.x2, v.x);
        r.y2 = std::max(r.y2, v.y);
    }
    return r;
}

int orientation(const Vec2& a, const Vec2& b, const Vec2& c) noexcept {
    const double value = cross(b - a, c - a);
    if (std::abs(value) <= EPSILON) {
        return 0;
    }
    return value > 0.0 ? 1 : -1;
}

namespace {

// c is collinear with a-b; is it within the segment's bounding box?
bool on_segment(const Vec2& a, const Vec2& b, const Vec2& c) noexcept {
    return c.x <= std::max(a.x, b.x) + EPSILON && c.x >= std::min(a.x, b.x) - EPSILON &&
           c.y <= std::max(a.y, b.y) + EPSILON && c.y >= std::min(a.y, b.y) - EPSILON;
}

} // namespace

bool segments_intersect(const Segment& s1, const Segment& s2) noexcept {
    const int o1 = orientation(s1.a, s1.b, s2.a);
    const int o2 = orientation(s1.a, s1.b, s2.b);
    const int o3 = orientation(s2.a, s2.b, s1.a);
    const int o4 = orientation(s2.a, s2.b, s1.b);

    if (o1 != o2 && o3 != o4) {
        return true;
    }

    if (o1 == 0 && on_segment(s1.a, s1.b, s2.a)) return true;
    if (o2 == 0 && on_segment(s1.a, s1.b, s2.b)) return true;
    if (o3 == 0 && on_segment(s2.a, s2.b, s1.a)) return true;
    if (o4 == 0 && on_segment(s2.a, s2.b, s1.b)) return true;

    return false;
}

Option<double> segment_intersection_t(const Segment& s1, const Segment& s2) noexcept {
    const Vec2 r = s1.b - s1.a;
    const Vec2 s = s2.b - s2.a;
    const double denom = cross(r, s);
    if (std::abs(denom) <= EPSILON) {
        return std::nullopt;
    }

    const Vec2 qp = s2.a - s1.a;
    const double t = cross(qp, s) / denom;
    const double u = cross(qp, r) / denom;
    if (t < -EPSILON || t > 1.0 + EPSILON || u < -EPSILON || u > 1.0 + EPSILON) {
        return std::nullopt;
    }
    return std::clamp(t, 0.0, 1.0);
}

double distance_point_to_segment(const Vec2& p, const Segment& s) noexcept {
    const Vec2 d = s.b - s.a;
    const double len_sq = glm::dot(d, d);
    if (len_sq <= EPSILON * EPSILON) {
        return glm::length(p - s.a);
    }
    const double t = std::clamp(glm::dot(p - s.a, d) / len_sq, 0.0, 1.0);
    return glm::length(p - s.at(t));
}

bool point_between_on_segment(const Vec2& p, const Segment& s) noexcept {
    const Vec2 d = s.b - s.a;
    const double len_sq = glm::dot(d, d);
    if (len_sq <= EPSILON * EPSILON) {
        return glm::length(p - s.a) <= EPSILON;
    }
    const double t = glm::dot(p - s.a, d) / len_sq;
    return t >= 0.0 && t <= 1.0;
}

Option<ClipRange> segment_rect_intersection_range(const Segment& s, const Rect& r) noexcept {
    const double dx = s.b.x - s.a.x;
    const double dy = s.b.y - s.a.y;

    double t0 = 0.0;
    double t1 = 1.0;
    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {s.a.x - r.x1, r.x2 - s.a.x, s.a.y - r.y1, r.y2 - s.a.y};

    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) {
                return std::nullopt;
            }
            continue;
        }
        const double ratio = q[i] / p[i];
        if (p[i] < 0.0) {
            if (ratio > t1) return std::nullopt;
            t0 = std::max(t0, ratio);
        } else {
            if (ratio < t0) return std::nullopt;
            t1 = std::min(t1, ratio);
        }
    }

    if (t0 > t1) {
        return std::nullopt;
    }
    return ClipRange{t0, t1};
}

double segment_rect_intersection_length(const Segment& s, const Rect& r) noexcept {
    const auto range = segment_rect_intersection_range(s, r);
    if (!range) {
        return 0.0;
    }
    return std::max(0.0, s.length() * (range->t1 - range->t0));
}

bool segment_intersects_rect(const Segment& s, const Rect& r) noexcept {
    return segment_rect_intersection_range(s, r).has_value();
}

double side_of_line(const Segment& line, const Vec2& p) noexcept {
    return cross(line.b - line.a, p - line.a);
}

double distance_2d(const Point& a, const Point& b) noexcept {
    return glm::length(b.xy() - a.xy());
}

double distance_3d(const Point& a, const Point& b) noexcept {
    return glm::length(Vec3(b.x - a.x, b.y - a.y, b.elevation - a.elevation));
}

double MapScale::distance_feet(const Point& a, const Point& b) const noexcept {
    const double horizontal = to_feet(distance_2d(a, b));
    const double vertical = b.elevation - a.elevation;
    return std::sqrt(horizontal * horizontal + vertical * vertical);
}

} // namespace umbra::math
