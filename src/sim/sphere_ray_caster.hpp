#pragma once

#include "sim/impact.hpp"

namespace rsim::sim {

class EntityRegistry;

/// Reference RayCaster: intersects rays with the bounding spheres of
/// registered entities. Projectiles and entities with a zero radius are
/// never hit; a ray starting inside a sphere does not hit that sphere.
class SphereRayCaster : public RayCaster {
public:
    explicit SphereRayCaster(const EntityRegistry& registry)
        : registry_(registry) {}

    std::optional<RayHit> cast_ray(
        const Vector3& origin, const Vector3& direction, f32 max_distance,
        bool solid, const std::vector<EntityId>& exclude) const override;

private:
    const EntityRegistry& registry_;
};

} // namespace rsim::sim
