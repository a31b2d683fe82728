#include "sim/projectile.hpp"
#include "sim/entity_registry.hpp"
#include "sim/impact.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace rsim::sim {

std::unique_ptr<Projectile> Projectile::from_request(
    const ProjectileSpawnRequest& request) {
    auto proj = std::make_unique<Projectile>();
    proj->set_name("Projectile");
    proj->set_position(request.position);
    proj->velocity = request.velocity;
    proj->owner_id = request.owner;
    proj->damage = request.damage;
    proj->lifetime = request.lifetime;
    proj->properties = request.properties;
    proj->use_gravity = request.use_gravity;
    proj->rotate_to_velocity = request.rotate_to_velocity;
    if (proj->rotate_to_velocity && request.velocity.length_squared() > 0.001f) {
        proj->set_orientation(Quaternion::look_to(request.velocity));
    }
    return proj;
}

void Projectile::update(f32 dt, BallisticsContext& ctx) {
    if (destroyed() || dt <= 0) return;

    // Tick lifetime
    lifetime -= dt;
    if (lifetime <= 0) {
        mark_destroyed();
        spdlog::debug("Projectile #{} expired", entity_id());
        return;
    }

    // Long sweeps are split so thin geometry is not skipped
    u32 steps = 1;
    f32 max_step = ctx.resolver.params().max_step_distance;
    if (max_step > 0) {
        f32 travel = velocity.length() * dt;
        steps = static_cast<u32>(std::ceil(travel / max_step));
        steps = std::clamp(steps, 1u, MAX_SUBSTEPS);
    }

    f32 step_dt = dt / static_cast<f32>(steps);
    for (u32 i = 0; i < steps; i++) {
        if (!advance(step_dt, ctx)) break;
    }

    if (!destroyed() && rotate_to_velocity &&
        velocity.length_squared() > 0.001f) {
        set_orientation(Quaternion::look_to(velocity));
    }
}

bool Projectile::advance(f32 dt, BallisticsContext& ctx) {
    KinematicState next = rk4_step({position(), velocity}, dt, ctx.environment,
                                   properties, use_gravity);

    ImpactResult result = ctx.resolver.resolve_sweep(
        position(), next.position, next.velocity,
        properties.penetration_power, owner_id);

    switch (result.outcome) {
    case ImpactOutcome::Miss:
        set_position(next.position);
        velocity = next.velocity;
        return true;

    case ImpactOutcome::Penetrate:
        set_position(result.position);
        velocity = result.velocity;
        properties.penetration_power = result.penetration_power;
        ctx.events.push_impact({ImpactKind::Penetration, result.position,
                                result.direction, result.hit->entity});
        return false;

    case ImpactOutcome::Stop:
        set_position(result.position);
        velocity = result.velocity;
        on_impact(result, ctx);
        return false;
    }
    return false;
}

void Projectile::on_impact(const ImpactResult& result,
                           BallisticsContext& ctx) {
    EntityId target_id = result.hit->entity;
    auto* target = ctx.registry.find(target_id);

    // Targets without a damage record just absorb the round
    if (target && !target->destroyed() && target->damageable()) {
        DamageEvent event;
        event.amount = damage;
        event.damage_type = DamageType::Ranged;
        event.source = owner_id;
        event.target = target_id;
        event.position = result.position;
        event.direction = result.direction;
        ctx.events.push_damage(event);
    }

    ctx.events.push_impact({ImpactKind::Impact, result.position,
                            result.direction, target_id});
    spdlog::debug("Projectile #{} stopped by entity #{}", entity_id(),
                  target_id);
    mark_destroyed();
}

} // namespace rsim::sim
