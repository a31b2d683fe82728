#include "sim/shooter.hpp"

#include <spdlog/spdlog.h>

namespace rsim::sim {

size_t Shooter::add_weapon(const Weapon& weapon,
                           const AccuracyState& accuracy) {
    auto loadout = std::make_unique<Loadout>();
    loadout->weapon = weapon;
    loadout->accuracy = accuracy;
    loadouts_.push_back(std::move(loadout));
    return loadouts_.size() - 1;
}

Loadout* Shooter::active_loadout() {
    return active_ < loadouts_.size() ? loadouts_[active_].get() : nullptr;
}

const Loadout* Shooter::active_loadout() const {
    return active_ < loadouts_.size() ? loadouts_[active_].get() : nullptr;
}

Loadout* Shooter::loadout(size_t index) {
    return index < loadouts_.size() ? loadouts_[index].get() : nullptr;
}

bool Shooter::select_weapon(size_t index) {
    if (index >= loadouts_.size()) return false;
    if (index == active_) return true;
    if (auto* current = active_loadout()) {
        controller_.reset(current->weapon);
    }
    active_ = index;
    controller_.reset(loadouts_[active_]->weapon);
    spdlog::debug("'{}' switched to '{}'", name(),
                  loadouts_[active_]->weapon.label);
    return true;
}

void Shooter::set_trigger(bool held) {
    input_.trigger_just_pressed = held && !was_held_;
    input_.trigger_held = held;
}

Vector3 Shooter::muzzle_position() const {
    return position() + Vector3{0, eye_height_, 0};
}

void Shooter::aim_at(const Vector3& point) {
    set_orientation(Quaternion::look_to(point - muzzle_position()));
}

bool Shooter::update(f32 dt, ShotContext& ctx) {
    bool fired = false;
    if (auto* current = active_loadout()) {
        ctx.shooter = entity_id();
        ctx.muzzle_position = muzzle_position();
        ctx.aim_orientation = orientation();
        fired = controller_.update(dt, input_, current->weapon,
                                   current->accuracy, ctx);
    }

    // Edges last exactly one tick
    was_held_ = input_.trigger_held;
    input_.trigger_just_pressed = false;
    input_.reload_requested = false;
    return fired;
}

} // namespace rsim::sim
