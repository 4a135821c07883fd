#pragma once

#include <umbra/math/geometry.hpp>
#include <umbra/scene/entity.hpp>
#include <umbra/scene/wall.hpp>

#include <string>
#include <vector>

namespace umbra::cover {

// Share of the sample rays a single wall blocks on its own
struct WallContribution {
    std::string wall_id;
    double percent = 0.0;
};

struct WallCoverage {
    double percent = 0.0;          // union of all walls, 0..100
    u32 samples = 0;
    u32 blocked_samples = 0;
    std::vector<WallContribution> contributions;
};

// Seam for the wall coverage estimate so alternative estimators (or failing
// ones in tests) can be injected into the detector
class ICoverageEstimator {
public:
    virtual ~ICoverageEstimator() = default;

    /**
     * @brief Percentage of the target's width hidden from origin by walls
     * @param walls Candidate walls, already filtered for cover eligibility
     * @throws core::GeometryError on malformed wall data
     */
    virtual WallCoverage estimate(const math::Point& origin,
                                  const scene::Entity& target,
                                  const std::vector<scene::Wall>& walls) const = 0;
};

/**
 * @brief Casts evenly spaced rays from the origin to points across the target.
 *
 * The sample points lie on the target's width perpendicular to the view
 * direction, at the midpoints of equal slices. A sample is blocked when any
 * wall crosses its ray. Walls that hide different slices add up; walls that
 * hide the same slices are not counted twice, so the total never exceeds 100.
 */
class SampledCoverageEstimator : public ICoverageEstimator {
public:
    SampledCoverageEstimator(double grid_size, u32 samples);

    WallCoverage estimate(const math::Point& origin,
                          const scene::Entity& target,
                          const std::vector<scene::Wall>& walls) const override;

    // Sample points for a target seen from origin
    std::vector<math::Vec2> sample_points(const math::Point& origin, const scene::Entity& target) const;

private:
    double grid_size_;
    u32 samples_;
};

} // namespace umbra::cover
