#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsim::sim {

class Weapon;

enum class MountPoint : u8 {
    Scope,
    Muzzle,
    Magazine,
    Underbarrel,
};

constexpr size_t MOUNT_POINT_COUNT = 4;

const char* mount_point_name(MountPoint mount);

/// Case-insensitive parse of "scope", "muzzle", "magazine", "underbarrel".
std::optional<MountPoint> parse_mount_point(std::string_view name);

/// Stat modifier contributed by one attachment. Multipliers default to 1,
/// additive terms to 0, so a default-constructed modifier is a no-op.
struct AttachmentModifier {
    std::string id;
    std::string name;
    MountPoint mount = MountPoint::Scope;

    f32 damage_multiplier = 1;
    f32 extra_damage = 0;
    f32 spread_multiplier = 1;
    f32 fire_rate_multiplier = 1;
    f32 reload_speed_multiplier = 1;
    i32 magazine_size_modifier = 0;
    f32 range_multiplier = 1;

    /// damage = damage*mult + extra; spread, fire_rate, range *= mult;
    /// reload_time /= reload_speed; ammo_capacity += delta.
    /// Does not touch current_ammo; AttachmentStack clamps it afterwards.
    void apply_to(Weapon& weapon) const;

    /// Exact inverse of apply_to. Zero multipliers are skipped.
    void remove_from(Weapon& weapon) const;

    // Presets
    static AttachmentModifier silencer();
    static AttachmentModifier extended_magazine(i32 extra_rounds);
    static AttachmentModifier scope(f32 spread_multiplier = 0.8f);
    static AttachmentModifier heavy_barrel();
    static AttachmentModifier laser_sight();
};

/// Catalogue of the built-in attachments, grouped by mount point.
std::vector<AttachmentModifier> default_attachment_catalogue();

/// One active modifier per mount point, applied to a weapon's stat record.
///
/// Modifiers are affine on damage, so they do not commute. The stack keeps
/// the order in which mounts were applied; changing a mount unwinds every
/// modifier applied after it, swaps the mount, then reapplies the unwound
/// ones in their original order. Each change is therefore remove-then-apply
/// against exactly the state it was applied on.
class AttachmentStack {
public:
    /// Replace the modifier at `modifier.mount` (remove current, apply new).
    void select(Weapon& weapon, const AttachmentModifier& modifier);

    /// Remove the modifier at `mount`. Returns false if the mount was empty.
    bool clear(Weapon& weapon, MountPoint mount);

    /// Remove every active modifier, newest first.
    void clear_all(Weapon& weapon);

    /// Reset the weapon to its base_* stats and reapply every active
    /// modifier in order. Discards accumulated floating-point drift.
    void rebuild(Weapon& weapon) const;

    const AttachmentModifier* active(MountPoint mount) const;
    size_t active_count() const { return order_.size(); }

private:
    void unwind_after(Weapon& weapon, size_t position,
                      std::vector<MountPoint>& unwound);
    void reapply(Weapon& weapon, const std::vector<MountPoint>& unwound);

    std::array<std::optional<AttachmentModifier>, MOUNT_POINT_COUNT> slots_;
    std::vector<MountPoint> order_; // application order, oldest first
};

} // namespace rsim::sim
