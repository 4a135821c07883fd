#include <umbra/scene/static_scene.hpp>
#include <umbra/core/log.hpp>

#include <algorithm>

namespace umbra::scene {

StaticScene::StaticScene(vision::LightingBand ambient)
    : ambient_(ambient) {
}

void StaticScene::add_entity(Entity entity) {
    const std::string id = entity.id;
    entities_.insert_or_assign(id, std::move(entity));
}

bool StaticScene::remove_entity(const std::string& id) {
    return entities_.erase(id) > 0;
}

bool StaticScene::move_entity(const std::string& id, const math::Point& to) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        LOG_WARNING(General, "move_entity: unknown entity '{}'", id);
        return false;
    }
    it->second.center = to;
    return true;
}

Entity* StaticScene::entity(const std::string& id) {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

void StaticScene::add_wall(Wall wall) {
    walls_.push_back(std::move(wall));
}

bool StaticScene::remove_wall(const std::string& id) {
    return std::erase_if(walls_, [&](const Wall& w) { return w.id == id; }) > 0;
}

Wall* StaticScene::wall(const std::string& id) {
    auto it = std::find_if(walls_.begin(), walls_.end(), [&](const Wall& w) { return w.id == id; });
    return it != walls_.end() ? &*it : nullptr;
}

void StaticScene::add_light_zone(LightZone zone) {
    light_zones_.push_back(std::move(zone));
}

void StaticScene::clear_light_zones() {
    light_zones_.clear();
}

void StaticScene::add_concealing_area(math::Polygon area) {
    concealing_areas_.push_back(std::move(area));
}

std::vector<Wall> StaticScene::walls_along(const math::Segment& ray) const {
    std::vector<Wall> result;
    for (const auto& w : walls_) {
        if (math::segments_intersect(ray, w.segment)) {
            result.push_back(w);
        }
    }
    return result;
}

std::vector<Wall> StaticScene::walls_in(const math::Rect& bounds) const {
    std::vector<Wall> result;
    for (const auto& w : walls_) {
        if (math::segment_intersects_rect(w.segment, bounds)) {
            result.push_back(w);
        }
    }
    return result;
}

vision::LightingBand StaticScene::illumination_at(const math::Point& point) const {
    for (auto it = light_zones_.rbegin(); it != light_zones_.rend(); ++it) {
        if (it->area.contains(point.xy())) {
            return it->band;
        }
    }
    return ambient_;
}

bool StaticScene::concealing_terrain_at(const math::Point& point) const {
    return std::any_of(concealing_areas_.begin(), concealing_areas_.end(),
                       [&](const math::Polygon& area) { return area.contains(point.xy()); });
}

std::vector<Entity> StaticScene::entities() const {
    std::vector<Entity> result;
    result.reserve(entities_.size());
    for (const auto& [id, e] : entities_) {
        result.push_back(e);
    }
    return result;
}

Option<Entity> StaticScene::find(const std::string& id) const {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace umbra::scene
