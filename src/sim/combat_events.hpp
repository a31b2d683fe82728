#pragma once

#include "core/types.hpp"
#include "sim/vector_math.hpp"
#include "sim/weapon.hpp"

#include <vector>

namespace rsim::sim {

enum class DamageType : u8 {
    Melee,
    Ranged,
    Explosion,
    Fall,
    Environmental,
};

const char* damage_type_name(DamageType type);

struct DamageEvent {
    f32 amount = 0;
    DamageType damage_type = DamageType::Ranged;
    EntityId source = NO_ENTITY;
    EntityId target = NO_ENTITY;
    Vector3 position;
    Vector3 direction;
};

enum class ImpactKind : u8 {
    Penetration, // projectile passed through a surface
    Impact,      // projectile stopped
    HitscanHit,
};

const char* impact_kind_name(ImpactKind kind);

/// Fire-and-forget notification for effect spawning.
struct ImpactNotification {
    ImpactKind kind = ImpactKind::Impact;
    Vector3 position;
    Vector3 direction;
    EntityId entity = NO_ENTITY;
};

/// Everything needed to create a projectile entity.
struct ProjectileSpawnRequest {
    Vector3 position;
    Vector3 velocity;
    f32 damage = 0;
    EntityId owner = NO_ENTITY;
    f32 lifetime = 5;
    ProjectileProperties properties;
    bool use_gravity = true;
    bool rotate_to_velocity = true;
};

/// Receives impact notifications (effects, audio, decals live elsewhere).
class ImpactListener {
public:
    virtual ~ImpactListener() = default;
    virtual void on_impact(const ImpactNotification& notification) = 0;
};

/// Per-tick outbox of combat events produced by the firing pipeline.
class CombatEventQueue {
public:
    void set_listener(ImpactListener* listener) { listener_ = listener; }

    void push_damage(const DamageEvent& event) { damage_events_.push_back(event); }
    void push_impact(const ImpactNotification& notification);
    void push_spawn(const ProjectileSpawnRequest& request) {
        spawn_requests_.push_back(request);
    }

    const std::vector<DamageEvent>& damage_events() const { return damage_events_; }
    const std::vector<ImpactNotification>& impacts() const { return impacts_; }
    const std::vector<ProjectileSpawnRequest>& spawn_requests() const {
        return spawn_requests_;
    }

    /// Hand over pending spawn requests (the queue keeps none afterwards).
    std::vector<ProjectileSpawnRequest> take_spawn_requests();

    /// Hand over damage events accumulated since the last call.
    std::vector<DamageEvent> take_damage_events();

    void clear();

private:
    ImpactListener* listener_ = nullptr;
    std::vector<DamageEvent> damage_events_;
    std::vector<ImpactNotification> impacts_;
    std::vector<ProjectileSpawnRequest> spawn_requests_;
};

} // namespace rsim::sim
