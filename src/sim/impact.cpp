#include "sim/impact.hpp"

#include <spdlog/spdlog.h>

namespace rsim::sim {

/// Sweeps shorter than this are treated as stationary.
static constexpr f32 MIN_SWEEP_DISTANCE = 0.0001f;

ImpactResolver::ImpactResolver(const RayCaster& caster,
                               PenetrationParams params,
                               SurfaceResistanceLookup resistance)
    : caster_(caster), params_(params), resistance_(std::move(resistance)) {}

f32 ImpactResolver::surface_resistance(EntityId entity) const {
    if (resistance_) {
        if (auto r = resistance_(entity)) return *r;
    }
    return params_.default_surface_resistance;
}

ImpactResult ImpactResolver::resolve_sweep(const Vector3& from,
                                           const Vector3& to,
                                           const Vector3& velocity,
                                           f32 penetration_power,
                                           EntityId owner) const {
    ImpactResult result;
    result.position = to;
    result.velocity = velocity;
    result.penetration_power = penetration_power;

    Vector3 delta = to - from;
    f32 distance = delta.length();
    if (distance <= MIN_SWEEP_DISTANCE) return result;

    Vector3 direction = delta / distance;
    result.direction = direction;

    auto hit = caster_.cast_ray(from, direction, distance, true, {owner});
    if (!hit) return result;

    result.hit = hit;
    Vector3 hit_point = from + direction * hit->distance;
    f32 resistance = surface_resistance(hit->entity);
    f32 remaining = penetration_power -
                    hit->distance * params_.energy_loss_per_distance;

    if (remaining > resistance) {
        result.outcome = ImpactOutcome::Penetrate;
        result.penetration_power = remaining - resistance;
        result.velocity = velocity * params_.penetration_damping;
        result.position = hit_point + direction * params_.push_through_distance;
        spdlog::debug("Penetrated entity #{} ({:.1f} energy left)",
                      hit->entity, result.penetration_power);
    } else {
        result.outcome = ImpactOutcome::Stop;
        result.penetration_power = 0;
        result.position = hit_point;
        spdlog::debug("Stopped by entity #{} ({:.1f} <= {:.1f})", hit->entity,
                      remaining, resistance);
    }
    return result;
}

std::optional<RayHit> ImpactResolver::resolve_hitscan(
    const Vector3& origin, const Vector3& direction, f32 range,
    EntityId owner) const {
    if (range <= 0) return std::nullopt;
    return caster_.cast_ray(origin, normalize_or(direction, FORWARD_AXIS),
                            range, true, {owner});
}

} // namespace rsim::sim
