#include "sim/weapon_builder.hpp"

#include <algorithm>

namespace rsim::sim {

WeaponBuilder::WeaponBuilder(std::string label) {
    weapon_.label = std::move(label);
}

WeaponBuilder& WeaponBuilder::damage(f32 amount) {
    weapon_.damage = amount;
    return *this;
}

WeaponBuilder& WeaponBuilder::range(f32 meters) {
    weapon_.range = meters;
    return *this;
}

WeaponBuilder& WeaponBuilder::ammo(i32 capacity) {
    weapon_.ammo_capacity = std::max(0, capacity);
    weapon_.current_ammo = weapon_.ammo_capacity;
    return *this;
}

WeaponBuilder& WeaponBuilder::rounds_per_minute(f32 rpm) {
    weapon_.fire_rate = rpm / 60.0f;
    return *this;
}

WeaponBuilder& WeaponBuilder::reload_time(f32 seconds) {
    weapon_.reload_time = seconds;
    return *this;
}

WeaponBuilder& WeaponBuilder::firing_mode(FiringMode mode) {
    weapon_.firing_mode = mode;
    return *this;
}

WeaponBuilder& WeaponBuilder::burst(u32 count, f32 fire_rate_mult) {
    Burst b;
    b.amount = count;
    b.burst_fire_rate = weapon_.fire_rate * fire_rate_mult;
    weapon_.firing_mode = b;
    return *this;
}

WeaponBuilder& WeaponBuilder::spread(f32 hip_degrees, f32 aim_mult) {
    weapon_.spread = hip_degrees;
    weapon_.aim_spread_mult = aim_mult;
    return *this;
}

WeaponBuilder& WeaponBuilder::accuracy(f32 max_spread, f32 bloom_per_shot,
                                       f32 recovery_rate) {
    accuracy_.max_spread = max_spread;
    accuracy_.bloom_per_shot = bloom_per_shot;
    accuracy_.recovery_rate = recovery_rate;
    return *this;
}

WeaponBuilder& WeaponBuilder::projectile(f32 speed,
                                         const ProjectileProperties& props) {
    weapon_.projectile_speed = speed;
    weapon_.projectile = props;
    return *this;
}

WeaponBuilder& WeaponBuilder::hitscan() {
    weapon_.projectile_speed = 0;
    return *this;
}

WeaponBuilder& WeaponBuilder::pellets(u32 count) {
    weapon_.projectiles_per_shot = std::max(1u, count);
    return *this;
}

WeaponBuilder& WeaponBuilder::zeroing(f32 meters) {
    weapon_.zeroing_distance = meters;
    return *this;
}

WeaponBuilder& WeaponBuilder::infinite_ammo(bool infinite) {
    weapon_.infinite_ammo = infinite;
    return *this;
}

Weapon WeaponBuilder::build() const {
    Weapon w = weapon_;
    w.capture_base_stats();
    return w;
}

} // namespace rsim::sim
