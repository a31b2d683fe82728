#include "sim/sphere_ray_caster.hpp"
#include "sim/entity.hpp"
#include "sim/entity_registry.hpp"

#include <algorithm>
#include <cmath>

namespace rsim::sim {

std::optional<RayHit> SphereRayCaster::cast_ray(
    const Vector3& origin, const Vector3& direction, f32 max_distance,
    bool /*solid*/, const std::vector<EntityId>& exclude) const {
    Vector3 dir = normalize_or(direction, FORWARD_AXIS);
    std::optional<RayHit> best;

    registry_.for_each([&](const Entity& e) {
        if (e.destroyed() || e.is_projectile()) return;
        f32 radius = e.bounding_radius();
        if (radius <= 0) return;
        if (std::find(exclude.begin(), exclude.end(), e.entity_id()) !=
            exclude.end())
            return;

        Vector3 oc = origin - e.position();
        f32 b = dot(oc, dir);
        f32 c = oc.length_squared() - radius * radius;
        if (c <= 0) return; // starts inside
        f32 disc = b * b - c;
        if (disc < 0) return;

        f32 t = -b - std::sqrt(disc);
        if (t < 0 || t > max_distance) return;
        if (!best || t < best->distance) {
            best = RayHit{e.entity_id(), t};
        }
    });
    return best;
}

} // namespace rsim::sim
