#pragma once

#include "core/types.hpp"

#include <string>
#include <variant>

namespace rsim::sim {

// Firing modes. Burst carries its own sequencing counters.
struct SemiAuto {};
struct FullAuto {};
struct Burst {
    u32 amount = 3;
    f32 burst_fire_rate = 10;   // shots per second inside the burst
    u32 current_burst_count = 0;
    bool is_bursting = false;
};

using FiringMode = std::variant<SemiAuto, FullAuto, Burst>;

const char* firing_mode_name(const FiringMode& mode);

/// Physical properties handed to every projectile this weapon fires.
struct ProjectileProperties {
    f32 mass = 0.008f;             // kg
    f32 drag_coeff = 0.3f;         // Cd
    f32 reference_area = 0.000005f; // m^2
    f32 penetration_power = 500.0f;
};

class Weapon {
public:
    // Stat record (attachment modifiers act on these)
    std::string label;
    f32 damage = 10;
    f32 range = 50;
    f32 fire_rate = 10;            // shots per second
    f32 reload_time = 1.5f;        // seconds
    i32 ammo_capacity = 30;
    i32 current_ammo = 30;
    f32 spread = 2;                // hip-fire spread, degrees

    // Pristine values, captured by capture_base_stats()
    f32 base_damage = 10;
    f32 base_range = 50;
    f32 base_fire_rate = 10;
    f32 base_reload_time = 1.5f;
    i32 base_ammo_capacity = 30;
    f32 base_spread = 2;

    f32 aim_spread_mult = 0.2f;    // spread scale while aiming
    u32 projectiles_per_shot = 1;
    bool infinite_ammo = false;

    FiringMode firing_mode = SemiAuto{};

    // Ballistics
    ProjectileProperties projectile;
    f32 projectile_speed = 0;      // 0 = hitscan
    f32 projectile_lifetime = 5;
    f32 zeroing_distance = 50;     // meters
    f32 muzzle_offset = 1;         // spawn distance ahead of the muzzle

    // Runtime state
    f32 fire_timer = 0;            // seconds until the next shot may fire
    f32 reload_timer = 0;
    bool is_reloading = false;

    bool is_hitscan() const { return projectile_speed <= 0; }

    /// Copy the current stat record into the base_* mirror fields.
    void capture_base_stats();

    /// Restore the stat record from the base_* mirror fields.
    void restore_base_stats();

    /// Keep 0 <= current_ammo <= ammo_capacity.
    void clamp_ammo();

    /// Burst payload, or nullptr when the weapon is not in burst mode.
    Burst* burst() { return std::get_if<Burst>(&firing_mode); }
    const Burst* burst() const { return std::get_if<Burst>(&firing_mode); }

    bool is_bursting() const {
        const Burst* b = burst();
        return b && b->is_bursting;
    }

    void cancel_burst();

    /// Begin a reload if one is not running and the magazine is not full.
    bool start_reload();

    /// Advance reload progress. Returns true on the tick the reload finishes.
    bool update_reload(f32 dt);
};

} // namespace rsim::sim
