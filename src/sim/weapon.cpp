#include "sim/weapon.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace rsim::sim {

namespace {

struct ModeName {
    const char* operator()(const SemiAuto&) const { return "SemiAuto"; }
    const char* operator()(const FullAuto&) const { return "FullAuto"; }
    const char* operator()(const Burst&) const { return "Burst"; }
};

} // namespace

const char* firing_mode_name(const FiringMode& mode) {
    return std::visit(ModeName{}, mode);
}

void Weapon::capture_base_stats() {
    base_damage = damage;
    base_range = range;
    base_fire_rate = fire_rate;
    base_reload_time = reload_time;
    base_ammo_capacity = ammo_capacity;
    base_spread = spread;
}

void Weapon::restore_base_stats() {
    damage = base_damage;
    range = base_range;
    fire_rate = base_fire_rate;
    reload_time = base_reload_time;
    ammo_capacity = base_ammo_capacity;
    spread = base_spread;
    clamp_ammo();
}

void Weapon::clamp_ammo() {
    current_ammo = std::clamp(current_ammo, 0, std::max(0, ammo_capacity));
}

void Weapon::cancel_burst() {
    if (Burst* b = burst()) {
        b->is_bursting = false;
        b->current_burst_count = 0;
    }
}

bool Weapon::start_reload() {
    if (is_reloading || current_ammo >= ammo_capacity) return false;
    is_reloading = true;
    reload_timer = reload_time;
    cancel_burst();
    spdlog::debug("Weapon '{}' reloading ({:.2f}s)", label, reload_time);
    return true;
}

bool Weapon::update_reload(f32 dt) {
    if (!is_reloading) return false;
    reload_timer -= dt;
    if (reload_timer > 0) return false;

    reload_timer = 0;
    is_reloading = false;
    current_ammo = ammo_capacity;
    spdlog::debug("Weapon '{}' reloaded ({} rounds)", label, current_ammo);
    return true;
}

} // namespace rsim::sim
