#pragma once

#include "sim/combat_events.hpp"
#include "sim/entity.hpp"
#include "sim/trajectory.hpp"

#include <memory>

namespace rsim::sim {

class EntityRegistry;
class ImpactResolver;
struct ImpactResult;

/// What a projectile needs from the world for one tick.
struct BallisticsContext {
    const BallisticsEnvironment& environment;
    const ImpactResolver& resolver;
    const EntityRegistry& registry;
    CombatEventQueue& events;
};

class Projectile : public Entity {
public:
    bool is_projectile() const override { return true; }

    static std::unique_ptr<Projectile> from_request(
        const ProjectileSpawnRequest& request);

    Vector3 velocity;
    EntityId owner_id = NO_ENTITY;
    f32 damage = 0;
    f32 lifetime = 5.0f;
    ProjectileProperties properties;
    bool use_gravity = true;
    bool rotate_to_velocity = true;

    /// Per-tick: age, integrate, sweep, penetrate or impact.
    void update(f32 dt, BallisticsContext& ctx);

private:
    /// One integration + sweep. Returns false once the tick is over for this
    /// projectile (penetration or terminal hit).
    bool advance(f32 dt, BallisticsContext& ctx);
    void on_impact(const ImpactResult& result, BallisticsContext& ctx);

    static constexpr u32 MAX_SUBSTEPS = 16;
};

} // namespace rsim::sim
