#pragma once

#include "core/types.hpp"
#include "sim/vector_math.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace rsim::sim {

class Entity {
public:
    Entity() = default;
    virtual ~Entity() = default;

    EntityId entity_id() const { return entity_id_; }
    void set_entity_id(EntityId id) { entity_id_ = id; }

    const std::string& name() const { return name_; }
    void set_name(const std::string& n) { name_ = n; }

    const Vector3& position() const { return position_; }
    void set_position(const Vector3& p) { position_ = p; }

    const Quaternion& orientation() const { return orientation_; }
    void set_orientation(const Quaternion& o) { orientation_ = o; }

    /// Radius used by SphereRayCaster; 0 = not hittable.
    f32 bounding_radius() const { return bounding_radius_; }
    void set_bounding_radius(f32 r) { bounding_radius_ = std::max(0.0f, r); }

    /// Only damageable entities receive damage events.
    bool damageable() const { return damageable_; }
    void set_damageable(bool d) { damageable_ = d; }

    f32 health() const { return health_; }
    void set_health(f32 h) { health_ = std::max(0.0f, h); }

    /// Per-surface penetration resistance; unset = use the configured default.
    const std::optional<f32>& surface_resistance() const {
        return surface_resistance_;
    }
    void set_surface_resistance(std::optional<f32> r) { surface_resistance_ = r; }

    bool destroyed() const { return destroyed_; }
    void mark_destroyed() { destroyed_ = true; }

    virtual bool is_shooter() const { return false; }
    virtual bool is_projectile() const { return false; }

private:
    EntityId entity_id_ = NO_ENTITY;
    std::string name_;
    Vector3 position_;
    Quaternion orientation_;
    f32 bounding_radius_ = 0;
    bool damageable_ = false;
    f32 health_ = 0;
    std::optional<f32> surface_resistance_;
    bool destroyed_ = false;
};

} // namespace rsim::sim
