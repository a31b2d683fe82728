#include "sim/attachments.hpp"
#include "sim/weapon.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace rsim::sim {

namespace {

size_t slot_index(MountPoint mount) {
    return static_cast<size_t>(mount);
}

} // namespace

const char* mount_point_name(MountPoint mount) {
    switch (mount) {
    case MountPoint::Scope: return "Scope";
    case MountPoint::Muzzle: return "Muzzle";
    case MountPoint::Magazine: return "Magazine";
    case MountPoint::Underbarrel: return "Underbarrel";
    }
    return "Unknown";
}

std::optional<MountPoint> parse_mount_point(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (key == "scope") return MountPoint::Scope;
    if (key == "muzzle") return MountPoint::Muzzle;
    if (key == "magazine") return MountPoint::Magazine;
    if (key == "underbarrel") return MountPoint::Underbarrel;
    return std::nullopt;
}

void AttachmentModifier::apply_to(Weapon& weapon) const {
    weapon.damage = weapon.damage * damage_multiplier + extra_damage;
    weapon.spread *= spread_multiplier;
    weapon.fire_rate *= fire_rate_multiplier;
    if (reload_speed_multiplier != 0) {
        weapon.reload_time /= reload_speed_multiplier;
    }
    weapon.ammo_capacity += magazine_size_modifier;
    weapon.range *= range_multiplier;
}

void AttachmentModifier::remove_from(Weapon& weapon) const {
    // Undo in reverse: subtract the additive term before dividing.
    weapon.damage -= extra_damage;
    if (damage_multiplier != 0) weapon.damage /= damage_multiplier;
    if (spread_multiplier != 0) weapon.spread /= spread_multiplier;
    if (fire_rate_multiplier != 0) weapon.fire_rate /= fire_rate_multiplier;
    if (reload_speed_multiplier != 0) {
        weapon.reload_time *= reload_speed_multiplier;
    }
    weapon.ammo_capacity -= magazine_size_modifier;
    if (range_multiplier != 0) weapon.range /= range_multiplier;
}

AttachmentModifier AttachmentModifier::silencer() {
    AttachmentModifier m;
    m.id = "silencer";
    m.name = "Silencer";
    m.mount = MountPoint::Muzzle;
    m.damage_multiplier = 0.9f;
    return m;
}

AttachmentModifier AttachmentModifier::extended_magazine(i32 extra_rounds) {
    AttachmentModifier m;
    m.id = "extended_mag";
    m.name = "Extended Magazine";
    m.mount = MountPoint::Magazine;
    m.magazine_size_modifier = extra_rounds;
    m.reload_speed_multiplier = 0.9f;
    return m;
}

AttachmentModifier AttachmentModifier::scope(f32 spread_multiplier) {
    AttachmentModifier m;
    m.id = "scope";
    m.name = "Scope";
    m.mount = MountPoint::Scope;
    m.spread_multiplier = spread_multiplier;
    return m;
}

AttachmentModifier AttachmentModifier::heavy_barrel() {
    AttachmentModifier m;
    m.id = "heavy_barrel";
    m.name = "Heavy Barrel";
    m.mount = MountPoint::Muzzle;
    m.damage_multiplier = 1.15f;
    m.spread_multiplier = 1.2f;
    return m;
}

AttachmentModifier AttachmentModifier::laser_sight() {
    AttachmentModifier m;
    m.id = "laser";
    m.name = "Laser Sight";
    m.mount = MountPoint::Underbarrel;
    m.spread_multiplier = 0.7f;
    return m;
}

std::vector<AttachmentModifier> default_attachment_catalogue() {
    auto red_dot = AttachmentModifier::scope(0.8f);
    red_dot.id = "red_dot";
    red_dot.name = "Red Dot Sight";

    auto acog = AttachmentModifier::scope(0.8f);
    acog.id = "acog";
    acog.name = "ACOG Scope";
    acog.range_multiplier = 1.25f;

    auto sniper = AttachmentModifier::scope(0.8f);
    sniper.id = "sniper_scope";
    sniper.name = "Sniper Scope";
    sniper.range_multiplier = 1.5f;

    return {
        red_dot,
        acog,
        sniper,
        AttachmentModifier::silencer(),
        AttachmentModifier::heavy_barrel(),
        AttachmentModifier::extended_magazine(15),
        AttachmentModifier::laser_sight(),
    };
}

void AttachmentStack::unwind_after(Weapon& weapon, size_t position,
                                   std::vector<MountPoint>& unwound) {
    while (order_.size() > position) {
        MountPoint mount = order_.back();
        order_.pop_back();
        slots_[slot_index(mount)]->remove_from(weapon);
        unwound.push_back(mount);
    }
    std::reverse(unwound.begin(), unwound.end());
}

void AttachmentStack::reapply(Weapon& weapon,
                              const std::vector<MountPoint>& unwound) {
    for (MountPoint mount : unwound) {
        slots_[slot_index(mount)]->apply_to(weapon);
        order_.push_back(mount);
    }
}

void AttachmentStack::select(Weapon& weapon,
                             const AttachmentModifier& modifier) {
    auto& slot = slots_[slot_index(modifier.mount)];
    std::vector<MountPoint> unwound;

    if (slot) {
        auto it = std::find(order_.begin(), order_.end(), modifier.mount);
        size_t position = static_cast<size_t>(it - order_.begin());
        // Unwind everything newer than this mount, then the mount itself
        unwind_after(weapon, position + 1, unwound);
        slot->remove_from(weapon);
        order_.pop_back();
    }

    slot = modifier;
    slot->apply_to(weapon);
    order_.push_back(modifier.mount);
    reapply(weapon, unwound);
    weapon.clamp_ammo();

    spdlog::debug("Weapon '{}': '{}' mounted on {}", weapon.label,
                  modifier.id, mount_point_name(modifier.mount));
}

bool AttachmentStack::clear(Weapon& weapon, MountPoint mount) {
    auto& slot = slots_[slot_index(mount)];
    if (!slot) return false;

    auto it = std::find(order_.begin(), order_.end(), mount);
    size_t position = static_cast<size_t>(it - order_.begin());
    std::vector<MountPoint> unwound;
    unwind_after(weapon, position + 1, unwound);
    slot->remove_from(weapon);
    order_.pop_back();
    spdlog::debug("Weapon '{}': '{}' removed from {}", weapon.label, slot->id,
                  mount_point_name(mount));
    slot.reset();
    reapply(weapon, unwound);
    weapon.clamp_ammo();
    return true;
}

void AttachmentStack::clear_all(Weapon& weapon) {
    while (!order_.empty()) {
        MountPoint mount = order_.back();
        order_.pop_back();
        slots_[slot_index(mount)]->remove_from(weapon);
        slots_[slot_index(mount)].reset();
    }
    weapon.clamp_ammo();
}

void AttachmentStack::rebuild(Weapon& weapon) const {
    weapon.restore_base_stats();
    for (MountPoint mount : order_) {
        slots_[slot_index(mount)]->apply_to(weapon);
    }
    weapon.clamp_ammo();
}

const AttachmentModifier* AttachmentStack::active(MountPoint mount) const {
    const auto& slot = slots_[slot_index(mount)];
    return slot ? &*slot : nullptr;
}

} // namespace rsim::sim
