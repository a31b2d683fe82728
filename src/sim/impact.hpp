#pragma once

#include "core/types.hpp"
#include "sim/vector_math.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace rsim::sim {

struct RayHit {
    EntityId entity = NO_ENTITY;
    f32 distance = 0;
};

/// Ray-cast primitive supplied by the physics layer.
class RayCaster {
public:
    virtual ~RayCaster() = default;

    /// Nearest hit along `direction` (unit length) within `max_distance`,
    /// ignoring every entity in `exclude`.
    virtual std::optional<RayHit> cast_ray(
        const Vector3& origin, const Vector3& direction, f32 max_distance,
        bool solid, const std::vector<EntityId>& exclude) const = 0;
};

/// Per-surface resistance; nullopt falls back to the configured default.
using SurfaceResistanceLookup = std::function<std::optional<f32>(EntityId)>;

/// Penetration tunables.
struct PenetrationParams {
    f32 energy_loss_per_distance = 0.1f;  // penetration lost per meter flown
    f32 default_surface_resistance = 100.0f;
    f32 penetration_damping = 0.8f;       // velocity scale after a pass-through
    f32 push_through_distance = 0.01f;    // offset past the hit point
    f32 max_step_distance = 0;            // > 0 sub-steps long sweeps
};

enum class ImpactOutcome : u8 {
    Miss,      // nothing hit, commit the integrated position
    Penetrate, // passed through; keep simulating from `position`
    Stop,      // terminal hit; damage and despawn
};

struct ImpactResult {
    ImpactOutcome outcome = ImpactOutcome::Miss;
    Vector3 position;          // committed position
    Vector3 velocity;          // velocity after the sweep
    f32 penetration_power = 0; // remaining after the sweep
    Vector3 direction;         // sweep direction (unit)
    std::optional<RayHit> hit;
};

class ImpactResolver {
public:
    ImpactResolver(const RayCaster& caster, PenetrationParams params,
                   SurfaceResistanceLookup resistance = {});

    /// Sweep from `from` to `to` and decide what happens to a projectile
    /// that would otherwise arrive at `to` with `velocity`.
    ImpactResult resolve_sweep(const Vector3& from, const Vector3& to,
                               const Vector3& velocity, f32 penetration_power,
                               EntityId owner) const;

    /// Single instant-hit ray for hitscan weapons.
    std::optional<RayHit> resolve_hitscan(const Vector3& origin,
                                          const Vector3& direction, f32 range,
                                          EntityId owner) const;

    f32 surface_resistance(EntityId entity) const;

    const PenetrationParams& params() const { return params_; }

private:
    const RayCaster& caster_;
    PenetrationParams params_;
    SurfaceResistanceLookup resistance_;
};

} // namespace rsim::sim
