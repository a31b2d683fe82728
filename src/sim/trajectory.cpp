#include "sim/trajectory.hpp"

#include <cmath>

namespace rsim::sim {

Vector3 drag_force(const Vector3& velocity, const BallisticsEnvironment& env,
                   const ProjectileProperties& props) {
    Vector3 relative = velocity - env.wind;
    f32 speed_sq = relative.length_squared();
    if (speed_sq < MIN_DRAG_SPEED_SQ) return {};

    f32 speed = std::sqrt(speed_sq);
    Vector3 direction = relative / speed;
    f32 magnitude = 0.5f * env.air_density * speed_sq * props.drag_coeff *
                    props.reference_area;
    return direction * -magnitude;
}

Vector3 acceleration(const Vector3& /*position*/, const Vector3& velocity,
                     const BallisticsEnvironment& env,
                     const ProjectileProperties& props, bool use_gravity) {
    Vector3 a = use_gravity ? env.gravity : Vector3{};
    if (props.mass > 0) {
        a += drag_force(velocity, env, props) / props.mass;
    }
    return a;
}

KinematicState rk4_step(const KinematicState& state, f32 dt,
                        const BallisticsEnvironment& env,
                        const ProjectileProperties& props, bool use_gravity) {
    const Vector3& pos = state.position;
    const Vector3& vel = state.velocity;
    f32 half_dt = dt * 0.5f;

    // k1
    Vector3 v1 = vel;
    Vector3 a1 = acceleration(pos, v1, env, props, use_gravity);

    // k2
    Vector3 v2 = vel + a1 * half_dt;
    Vector3 a2 = acceleration(pos + v1 * half_dt, v2, env, props, use_gravity);

    // k3
    Vector3 v3 = vel + a2 * half_dt;
    Vector3 a3 = acceleration(pos + v2 * half_dt, v3, env, props, use_gravity);

    // k4
    Vector3 v4 = vel + a3 * dt;
    Vector3 a4 = acceleration(pos + v3 * dt, v4, env, props, use_gravity);

    f32 sixth = dt / 6.0f;
    KinematicState next;
    next.velocity = vel + (a1 + a2 * 2.0f + a3 * 2.0f + a4) * sixth;
    next.position = pos + (v1 + v2 * 2.0f + v3 * 2.0f + v4) * sixth;
    return next;
}

} // namespace rsim::sim
