#include <umbra/cover/coverage_estimator.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>

namespace umbra::cover {

SampledCoverageEstimator::SampledCoverageEstimator(double grid_size, u32 samples)
    : grid_size_(grid_size)
    , samples_(std::max<u32>(1, samples)) {
}

std::vector<math::Vec2> SampledCoverageEstimator::sample_points(const math::Point& origin,
                                                                const scene::Entity& target) const {
    std::vector<math::Vec2> points;
    points.reserve(samples_);

    const math::Vec2 center = target.center.xy();
    const math::Vec2 view = center - origin.xy();
    const double distance = glm::length(view);
    if (distance <= math::EPSILON) {
        return points;
    }

    const math::Vec2 across = math::perpendicular(view / distance);
    const double width = std::max(0.0, target.size) * grid_size_;
    for (u32 i = 0; i < samples_; ++i) {
        const double offset = ((static_cast<double>(i) + 0.5) / samples_ - 0.5) * width;
        points.push_back(center + across * offset);
    }
    return points;
}

WallCoverage SampledCoverageEstimator::estimate(const math::Point& origin,
                                                const scene::Entity& target,
                                                const std::vector<scene::Wall>& walls) const {
    for (const auto& wall : walls) {
        if (!wall.segment.is_finite()) {
            throw core::GeometryError("wall '" + wall.id + "' has non-finite coordinates");
        }
    }

    WallCoverage coverage;
    const auto points = sample_points(origin, target);
    if (points.empty()) {
        return coverage;
    }
    coverage.samples = static_cast<u32>(points.size());

    std::vector<u32> blocked_by_wall(walls.size(), 0);
    for (const auto& point : points) {
        const math::Segment ray(origin.xy(), point);
        bool blocked = false;
        for (size_t w = 0; w < walls.size(); ++w) {
            if (walls[w].segment.is_degenerate()) {
                continue;
            }
            if (math::segments_intersect(ray, walls[w].segment)) {
                ++blocked_by_wall[w];
                blocked = true;
            }
        }
        if (blocked) {
            ++coverage.blocked_samples;
        }
    }

    const double per_sample = 100.0 / coverage.samples;
    for (size_t w = 0; w < walls.size(); ++w) {
        if (blocked_by_wall[w] > 0) {
            coverage.contributions.push_back({walls[w].id, blocked_by_wall[w] * per_sample});
        }
    }
    coverage.percent = std::min(100.0, coverage.blocked_samples * per_sample);

    LOG_TRACE(Cover, "Wall coverage of '{}': {:.1f}% ({} of {} samples, {} walls contributing)",
              target.id, coverage.percent, coverage.blocked_samples, coverage.samples,
              coverage.contributions.size());
    return coverage;
}

} // namespace umbra::cover
