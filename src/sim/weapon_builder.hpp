#pragma once

#include "sim/accuracy.hpp"
#include "sim/weapon.hpp"

#include <string>

namespace rsim::sim {

/// Fluent construction of a Weapon + AccuracyState pair. build() captures
/// the finished stat record as the weapon's base stats.
class WeaponBuilder {
public:
    explicit WeaponBuilder(std::string label);

    WeaponBuilder& damage(f32 amount);
    WeaponBuilder& range(f32 meters);
    WeaponBuilder& ammo(i32 capacity);
    WeaponBuilder& rounds_per_minute(f32 rpm);
    WeaponBuilder& reload_time(f32 seconds);
    WeaponBuilder& firing_mode(FiringMode mode);
    /// Burst of `count` shots at `fire_rate_mult` times the base fire rate.
    WeaponBuilder& burst(u32 count, f32 fire_rate_mult);
    WeaponBuilder& spread(f32 hip_degrees, f32 aim_mult);
    WeaponBuilder& accuracy(f32 max_spread, f32 bloom_per_shot,
                            f32 recovery_rate);
    WeaponBuilder& projectile(f32 speed, const ProjectileProperties& props);
    WeaponBuilder& hitscan();
    WeaponBuilder& pellets(u32 count);
    WeaponBuilder& zeroing(f32 meters);
    WeaponBuilder& infinite_ammo(bool infinite);

    Weapon build() const;
    const AccuracyState& accuracy_state() const { return accuracy_; }

private:
    Weapon weapon_;
    AccuracyState accuracy_;
};

} // namespace rsim::sim
