#pragma once

#include <umbra/scene/providers.hpp>

#include <map>
#include <string>
#include <vector>

namespace umbra::scene {

// Polygonal region with its own light level
struct LightZone {
    math::Polygon area;
    vision::LightingBand band = vision::LightingBand::Bright;
};

/**
 * @brief In-memory scene implementing both the spatial and inventory providers.
 *
 * Used by tests, the example programs and hosts without their own spatial
 * index. Lookups are linear; later light zones take precedence over earlier
 * ones and the ambient band applies everywhere else.
 */
class StaticScene : public ISpatialQueryProvider, public ISceneInventory {
public:
    explicit StaticScene(vision::LightingBand ambient = vision::LightingBand::Bright);

    // Entity management
    void add_entity(Entity entity);
    bool remove_entity(const std::string& id);
    bool move_entity(const std::string& id, const math::Point& to);
    Entity* entity(const std::string& id);

    // Wall management
    void add_wall(Wall wall);
    bool remove_wall(const std::string& id);
    Wall* wall(const std::string& id);

    // Lighting and terrain
    void set_ambient_light(vision::LightingBand band) noexcept { ambient_ = band; }
    void add_light_zone(LightZone zone);
    void clear_light_zones();
    void add_concealing_area(math::Polygon area);

    // ISpatialQueryProvider
    std::vector<Wall> walls_along(const math::Segment& ray) const override;
    std::vector<Wall> walls_in(const math::Rect& bounds) const override;
    vision::LightingBand illumination_at(const math::Point& point) const override;
    bool concealing_terrain_at(const math::Point& point) const override;

    // ISceneInventory
    std::vector<Entity> entities() const override;
    Option<Entity> find(const std::string& id) const override;

private:
    vision::LightingBand ambient_;
    std::map<std::string, Entity> entities_;
    std::vector<Wall> walls_;
    std::vector<LightZone> light_zones_;
    std::vector<math::Polygon> concealing_areas_;
};

} // namespace umbra::scene
