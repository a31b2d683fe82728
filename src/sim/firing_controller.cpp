#include "sim/firing_controller.hpp"
#include "sim/entity.hpp"
#include "sim/entity_registry.hpp"
#include "sim/impact.hpp"
#include "sim/weapon.hpp"

#include <spdlog/spdlog.h>

namespace rsim::sim {

namespace {

/// Decides, per firing mode, whether this tick's input produces a shot.
/// Burst sequencing counters are advanced here.
struct ShotDue {
    const TriggerInput& input;
    bool ready; // fire timer elapsed

    bool operator()(SemiAuto&) const {
        return ready && input.trigger_just_pressed;
    }

    bool operator()(FullAuto&) const {
        return ready && input.trigger_held;
    }

    bool operator()(Burst& burst) const {
        if (!ready) return false;
        if (burst.is_bursting) {
            burst.current_burst_count++;
        } else if (input.trigger_just_pressed) {
            burst.is_bursting = true;
            burst.current_burst_count = 1;
        } else {
            return false;
        }
        if (burst.current_burst_count >= burst.amount) {
            burst.is_bursting = false;
        }
        return true;
    }
};

f32 interval(f32 rate) {
    return rate > 0 ? 1.0f / rate : 1.0f;
}

} // namespace

const char* fire_state_name(FireState state) {
    switch (state) {
    case FireState::Idle: return "Idle";
    case FireState::Cooldown: return "Cooldown";
    case FireState::Bursting: return "Bursting";
    }
    return "Unknown";
}

bool FiringController::update(f32 dt, const TriggerInput& input,
                              Weapon& weapon, AccuracyState& accuracy,
                              ShotContext& ctx) {
    // Tick timers
    if (weapon.fire_timer > 0) weapon.fire_timer -= dt;
    weapon.update_reload(dt);
    if (input.reload_requested) weapon.start_reload();

    bool fired = false;
    if (!weapon.is_reloading && shot_due(input, weapon)) {
        if (weapon.current_ammo > 0 || weapon.infinite_ammo) {
            fire(weapon, accuracy, input, ctx);
            fired = true;
        } else {
            weapon.cancel_burst();
            spdlog::debug("Weapon '{}' out of ammo", weapon.label);
        }
    }

    // A held full-auto trigger keeps bloom up only while another shot can come
    bool sustaining = std::holds_alternative<FullAuto>(weapon.firing_mode) &&
                      input.trigger_held && !weapon.is_reloading &&
                      (weapon.current_ammo > 0 || weapon.infinite_ammo);
    if (!fired && !weapon.is_bursting() && !sustaining) {
        recover_bloom(accuracy, dt);
    }

    if (weapon.is_bursting()) {
        state_ = FireState::Bursting;
    } else if (weapon.fire_timer > 0) {
        state_ = FireState::Cooldown;
    } else {
        state_ = FireState::Idle;
    }
    return fired;
}

void FiringController::reset(Weapon& weapon) {
    weapon.cancel_burst();
    state_ = weapon.fire_timer > 0 ? FireState::Cooldown : FireState::Idle;
}

bool FiringController::shot_due(const TriggerInput& input,
                                Weapon& weapon) const {
    return std::visit(ShotDue{input, weapon.fire_timer <= 0},
                      weapon.firing_mode);
}

void FiringController::fire(Weapon& weapon, AccuracyState& accuracy,
                            const TriggerInput& input, ShotContext& ctx) {
    if (!weapon.infinite_ammo) weapon.current_ammo--;

    const Burst* burst = weapon.burst();
    weapon.fire_timer = (burst && burst->is_bursting)
                            ? interval(burst->burst_fire_rate)
                            : interval(weapon.fire_rate);

    add_shot_bloom(accuracy);

    Stance stance{input.aiming, input.moving, input.airborne};
    f32 spread_deg = total_spread_degrees(weapon_spread(weapon, input.aiming),
                                          accuracy, stance);
    f32 zeroing = weapon.is_hitscan()
                      ? 0.0f
                      : zeroing_angle(weapon.zeroing_distance,
                                      weapon.projectile_speed,
                                      ctx.environment.gravity.length());

    for (u32 i = 0; i < weapon.projectiles_per_shot; i++) {
        auto [sample_x, sample_y] = ctx.sampler.next();
        Vector3 direction =
            shot_direction(ctx.aim_orientation, zeroing,
                           spread_rotation(sample_x, sample_y, spread_deg));
        if (weapon.is_hitscan()) {
            fire_hitscan(weapon, direction, ctx);
        } else {
            spawn_projectile(weapon, direction, ctx);
        }
    }

    total_shots_++;
    spdlog::debug("Weapon '{}' fired ({} left, spread {:.2f} deg)",
                  weapon.label, weapon.current_ammo, spread_deg);
}

void FiringController::fire_hitscan(const Weapon& weapon,
                                    const Vector3& direction,
                                    ShotContext& ctx) {
    auto hit = ctx.resolver.resolve_hitscan(ctx.muzzle_position, direction,
                                            weapon.range, ctx.shooter);
    if (!hit) return;

    Vector3 hit_point = ctx.muzzle_position + direction * hit->distance;
    auto* target = ctx.registry.find(hit->entity);
    if (target && !target->destroyed() && target->damageable()) {
        DamageEvent event;
        event.amount = weapon.damage;
        event.damage_type = DamageType::Ranged;
        event.source = ctx.shooter;
        event.target = hit->entity;
        event.position = hit_point;
        event.direction = direction;
        ctx.events.push_damage(event);
    }
    ctx.events.push_impact(
        {ImpactKind::HitscanHit, hit_point, direction, hit->entity});
    spdlog::debug("Hit entity #{} with '{}'", hit->entity, weapon.label);
}

void FiringController::spawn_projectile(const Weapon& weapon,
                                        const Vector3& direction,
                                        ShotContext& ctx) {
    Vector3 forward = ctx.aim_orientation.rotate(FORWARD_AXIS);

    ProjectileSpawnRequest request;
    request.position = ctx.muzzle_position + forward * weapon.muzzle_offset;
    request.velocity = direction * weapon.projectile_speed;
    request.damage = weapon.damage;
    request.owner = ctx.shooter;
    request.lifetime = weapon.projectile_lifetime;
    request.properties = weapon.projectile;
    ctx.events.push_spawn(request);
}

} // namespace rsim::sim
