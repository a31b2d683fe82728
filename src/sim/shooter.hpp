#pragma once

#include "sim/accuracy.hpp"
#include "sim/attachments.hpp"
#include "sim/entity.hpp"
#include "sim/firing_controller.hpp"
#include "sim/weapon.hpp"

#include <memory>
#include <vector>

namespace rsim::sim {

/// A weapon with its accuracy record and mounted attachments.
struct Loadout {
    Weapon weapon;
    AccuracyState accuracy;
    AttachmentStack attachments;

    void select_attachment(const AttachmentModifier& modifier) {
        attachments.select(weapon, modifier);
    }
    bool clear_attachment(MountPoint mount) {
        return attachments.clear(weapon, mount);
    }
};

/// Weapon-carrying entity. Owns its loadouts exclusively.
class Shooter : public Entity {
public:
    bool is_shooter() const override { return true; }

    /// Add a weapon; the first one added becomes active. Returns its index.
    size_t add_weapon(const Weapon& weapon, const AccuracyState& accuracy = {});

    size_t weapon_count() const { return loadouts_.size(); }
    size_t active_index() const { return active_; }

    Loadout* active_loadout();
    const Loadout* active_loadout() const;
    Loadout* loadout(size_t index);

    /// Switch weapons. Cancels a running burst on the outgoing weapon.
    bool select_weapon(size_t index);

    /// Input for the next update. Edges are consumed by update().
    TriggerInput& input() { return input_; }
    void set_input(const TriggerInput& input) { input_ = input; }

    /// Level-triggered helper: derives trigger_just_pressed from the
    /// previous level.
    void set_trigger(bool held);
    void request_reload() { input_.reload_requested = true; }

    f32 eye_height() const { return eye_height_; }
    void set_eye_height(f32 h) { eye_height_ = h; }

    Vector3 muzzle_position() const;

    /// Face the muzzle toward a world-space point.
    void aim_at(const Vector3& point);

    const FiringController& controller() const { return controller_; }

    /// Per-tick: run the active weapon's firing controller.
    bool update(f32 dt, ShotContext& ctx);

private:
    std::vector<std::unique_ptr<Loadout>> loadouts_;
    size_t active_ = 0;
    FiringController controller_;
    TriggerInput input_;
    bool was_held_ = false;
    f32 eye_height_ = 1.5f;
};

} // namespace rsim::sim
