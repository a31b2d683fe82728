#pragma once

#include "core/types.hpp"
#include "sim/vector_math.hpp"
#include "sim/weapon.hpp" // ProjectileProperties

namespace rsim::sim {

/// Shared, read-only per tick.
struct BallisticsEnvironment {
    Vector3 gravity{0, -9.81f, 0};
    f32 air_density = 1.225f; // kg/m^3
    Vector3 wind;
};

struct KinematicState {
    Vector3 position;
    Vector3 velocity;
};

/// Below this squared relative speed the drag term is skipped.
constexpr f32 MIN_DRAG_SPEED_SQ = 0.0001f;

/// Quadratic drag opposing motion relative to the wind:
/// -0.5 * rho * |v - w|^2 * Cd * A * normalize(v - w)
Vector3 drag_force(const Vector3& velocity, const BallisticsEnvironment& env,
                   const ProjectileProperties& props);

/// a(p, v) = gravity + drag(v) / mass. Drag is skipped for massless
/// projectiles, gravity when `use_gravity` is false.
Vector3 acceleration(const Vector3& position, const Vector3& velocity,
                     const BallisticsEnvironment& env,
                     const ProjectileProperties& props, bool use_gravity = true);

/// One classical fourth-order Runge-Kutta step of length dt.
KinematicState rk4_step(const KinematicState& state, f32 dt,
                        const BallisticsEnvironment& env,
                        const ProjectileProperties& props,
                        bool use_gravity = true);

} // namespace rsim::sim
