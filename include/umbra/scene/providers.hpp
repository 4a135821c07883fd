#pragma once

#include <umbra/core/types.hpp>
#include <umbra/math/geometry.hpp>
#include <umbra/scene/entity.hpp>
#include <umbra/scene/wall.hpp>
#include <umbra/vision/states.hpp>

#include <string>
#include <vector>

namespace umbra::scene {

// Interfaces the host application implements so the engine can read the world.
// Query methods may throw (core::OracleError or any std::exception); the engine
// recovers from those through its fallback tiers.

class ISpatialQueryProvider {
public:
    virtual ~ISpatialQueryProvider() = default;

    // Walls whose segment touches the given ray
    virtual std::vector<Wall> walls_along(const math::Segment& ray) const = 0;

    // Walls with any part inside the bounds
    virtual std::vector<Wall> walls_in(const math::Rect& bounds) const = 0;

    virtual vision::LightingBand illumination_at(const math::Point& point) const = 0;

    // Fog, foliage, magical darkness that is not a light level...
    virtual bool concealing_terrain_at(const math::Point& point) const = 0;
};

class ISceneInventory {
public:
    virtual ~ISceneInventory() = default;

    virtual std::vector<Entity> entities() const = 0;

    // Returns empty when no entity has the id
    virtual Option<Entity> find(const std::string& id) const = 0;
};

// Durable key-value storage for override records
class IPersistenceProvider {
public:
    virtual ~IPersistenceProvider() = default;

    virtual Result<Option<std::string>, Error> load(const std::string& key) = 0;
    virtual Result<void, Error> store(const std::string& key, const std::string& value) = 0;
    virtual Result<void, Error> erase(const std::string& key) = 0;
    virtual Result<std::vector<std::string>, Error> keys(const std::string& prefix) = 0;
};

enum class NotificationLevel : u8 {
    Info,
    Warning,
    Error
};

// User-facing messages; rendering them is the host's business
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(NotificationLevel level, const std::string& message) = 0;
};

} // namespace umbra::scene
