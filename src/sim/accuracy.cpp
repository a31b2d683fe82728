#include "sim/accuracy.hpp"
#include "sim/weapon.hpp"

#include <algorithm>
#include <cmath>

namespace rsim::sim {

f32 weapon_spread(const Weapon& weapon, bool aiming) {
    return aiming ? weapon.spread * weapon.aim_spread_mult : weapon.spread;
}

f32 total_spread_degrees(f32 weapon_spread_deg, const AccuracyState& accuracy,
                         const Stance& stance) {
    f32 bloom = accuracy.current_bloom;
    if (stance.aiming) bloom *= accuracy.ads_modifier;
    if (stance.moving) bloom *= 1.0f + accuracy.movement_penalty;
    if (stance.airborne) bloom *= accuracy.airborne_multiplier;
    return std::max(0.0f, weapon_spread_deg + bloom);
}

void add_shot_bloom(AccuracyState& accuracy) {
    accuracy.current_bloom = std::min(
        accuracy.current_bloom + accuracy.bloom_per_shot, accuracy.max_spread);
}

void recover_bloom(AccuracyState& accuracy, f32 dt) {
    accuracy.current_bloom = std::max(
        0.0f, accuracy.current_bloom - accuracy.recovery_rate * dt);
}

Quaternion spread_rotation(f32 sample_x, f32 sample_y, f32 spread_deg) {
    f32 half_cone = deg_to_rad(spread_deg) * 0.5f;
    f32 yaw = center_bias(std::clamp(sample_x, -1.0f, 1.0f)) * half_cone;
    f32 pitch = center_bias(std::clamp(sample_y, -1.0f, 1.0f)) * half_cone;
    return Quaternion::rotation_x(pitch) * Quaternion::rotation_y(yaw);
}

f32 zeroing_angle(f32 zeroing_distance, f32 projectile_speed, f32 gravity) {
    if (zeroing_distance <= 0 || projectile_speed <= 0) return 0;
    f32 time_to_zero = zeroing_distance / projectile_speed;
    f32 drop = 0.5f * gravity * time_to_zero * time_to_zero;
    return std::atan2(drop, zeroing_distance);
}

Vector3 shot_direction(const Quaternion& base_orientation, f32 zeroing_rad,
                       const Quaternion& spread) {
    Quaternion q = base_orientation * Quaternion::rotation_x(zeroing_rad) * spread;
    return normalize_or(q.rotate(FORWARD_AXIS), FORWARD_AXIS);
}

std::pair<f32, f32> SeededSpreadSampler::next() {
    f32 x = dist_(rng_);
    f32 y = dist_(rng_);
    return {x, y};
}

} // namespace rsim::sim
