#include "content/content_store.hpp"
#include "sim/shooter.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rsim::content {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

int absolute_index(lua_State* L, int index) {
    return index > 0 ? index : lua_gettop(L) + index + 1;
}

// Field readers. Each pushes the field, copies it out and pops it again, so
// the stack is balanced on return. Absent or mistyped fields read as nullopt.

std::optional<std::string> get_string(lua_State* L, int table,
                                      const char* field) {
    lua_pushstring(L, field);
    lua_gettable(L, table);
    std::optional<std::string> result;
    if (lua_type(L, -1) == LUA_TSTRING) {
        result = std::string(lua_tostring(L, -1), lua_strlen(L, -1));
    }
    lua_pop(L, 1);
    return result;
}

std::optional<double> get_number(lua_State* L, int table, const char* field) {
    lua_pushstring(L, field);
    lua_gettable(L, table);
    std::optional<double> result;
    if (lua_type(L, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

std::optional<bool> get_bool(lua_State* L, int table, const char* field) {
    lua_pushstring(L, field);
    lua_gettable(L, table);
    std::optional<bool> result;
    if (lua_isboolean(L, -1)) {
        result = lua_toboolean(L, -1) != 0;
    }
    lua_pop(L, 1);
    return result;
}

void read_f32(lua_State* L, int table, const char* field, f32& out) {
    if (auto v = get_number(L, table, field)) out = static_cast<f32>(*v);
}

/// Integer fields are range-checked before the cast; false means the field
/// is present but NaN or outside T.
template <typename T>
bool read_integer(lua_State* L, int table, const char* field, T& out) {
    auto v = get_number(L, table, field);
    if (!v) return true;
    if (!(*v >= static_cast<double>(std::numeric_limits<T>::min()) &&
          *v <= static_cast<double>(std::numeric_limits<T>::max()))) {
        return false;
    }
    out = static_cast<T>(*v);
    return true;
}

std::string out_of_range(const char* field) {
    return std::string(field) + " is out of range";
}

/// Accepts {x, y, z} or {x = .., y = .., z = ..}.
std::optional<sim::Vector3> get_vector(lua_State* L, int table,
                                       const char* field) {
    lua_pushstring(L, field);
    lua_gettable(L, table);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return std::nullopt;
    }
    int vec = lua_gettop(L);

    f32 xyz[3] = {0, 0, 0};
    static const char* names[3] = {"x", "y", "z"};
    for (int i = 0; i < 3; i++) {
        lua_rawgeti(L, vec, i + 1);
        if (lua_type(L, -1) == LUA_TNUMBER) {
            xyz[i] = static_cast<f32>(lua_tonumber(L, -1));
        } else {
            read_f32(L, vec, names[i], xyz[i]);
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1); // vector table
    return sim::Vector3{xyz[0], xyz[1], xyz[2]};
}

/// Push a subtable if present. Returns its stack index, or 0 if absent.
int push_subtable(lua_State* L, int table, const char* field) {
    lua_pushstring(L, field);
    lua_gettable(L, table);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return 0;
    }
    return lua_gettop(L);
}

std::vector<std::string> get_string_list(lua_State* L, int table,
                                         const char* field) {
    std::vector<std::string> result;
    int list = push_subtable(L, table, field);
    if (!list) return result;
    for (int i = 1;; i++) {
        lua_rawgeti(L, list, i);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (lua_type(L, -1) == LUA_TSTRING) {
            result.emplace_back(lua_tostring(L, -1));
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1); // list
    return result;
}

std::optional<sim::FiringMode> parse_firing_mode(std::string_view name) {
    std::string key = to_lower(std::string(name));
    if (key == "semiauto" || key == "semi") return sim::SemiAuto{};
    if (key == "fullauto" || key == "auto") return sim::FullAuto{};
    if (key == "burst") return sim::Burst{};
    return std::nullopt;
}

Result<void> validate_weapon(const WeaponBlueprint& bp) {
    const sim::Weapon& w = bp.weapon;
    auto fail = [&](const std::string& what) {
        return Error("weapon '" + bp.id + "': " + what, bp.source);
    };
    if (w.damage < 0) return fail("Damage must not be negative");
    if (w.range < 0) return fail("Range must not be negative");
    if (w.fire_rate <= 0) return fail("FireRate must be positive");
    if (w.reload_time < 0) return fail("ReloadTime must not be negative");
    if (w.ammo_capacity < 0) return fail("AmmoCapacity must not be negative");
    if (w.spread < 0) return fail("Spread must not be negative");
    if (w.projectiles_per_shot < 1)
        return fail("ProjectilesPerShot must be at least 1");
    if (w.projectile_speed < 0)
        return fail("ProjectileSpeed must not be negative");
    if (w.projectile.mass < 0) return fail("Projectile.Mass must not be negative");
    if (w.projectile_lifetime <= 0)
        return fail("Projectile.Lifetime must be positive");
    if (const sim::Burst* b = w.burst()) {
        if (b->amount < 1) return fail("BurstAmount must be at least 1");
        if (b->burst_fire_rate <= 0) return fail("BurstFireRate must be positive");
    }
    if (bp.accuracy.max_spread < 0)
        return fail("Accuracy.MaxSpread must not be negative");
    return {};
}

} // namespace

Result<void> ContentStore::register_weapon(lua_State* L, int stack_index) {
    int t = absolute_index(L, stack_index);

    // Copy to std::string immediately, lua_tostring pointers are only
    // valid while the value is on the stack.
    auto raw_id = get_string(L, t, "BlueprintId");
    if (!raw_id || raw_id->empty()) {
        return Error("Weapon blueprint has no BlueprintId");
    }

    WeaponBlueprint bp;
    bp.id = to_lower(*raw_id);
    bp.source = get_string(L, t, "Source").value_or("");

    sim::Weapon& w = bp.weapon;
    w.label = get_string(L, t, "Label").value_or(*raw_id);
    read_f32(L, t, "Damage", w.damage);
    read_f32(L, t, "Range", w.range);
    if (auto rpm = get_number(L, t, "RoundsPerMinute")) {
        w.fire_rate = static_cast<f32>(*rpm / 60.0);
    }
    read_f32(L, t, "FireRate", w.fire_rate);
    read_f32(L, t, "ReloadTime", w.reload_time);
    auto bad_integer = [&](const char* field) {
        return Error("weapon '" + bp.id + "': " + out_of_range(field), bp.source);
    };
    if (!read_integer(L, t, "AmmoCapacity", w.ammo_capacity))
        return bad_integer("AmmoCapacity");
    read_f32(L, t, "Spread", w.spread);
    read_f32(L, t, "AimSpreadMult", w.aim_spread_mult);
    if (!read_integer(L, t, "ProjectilesPerShot", w.projectiles_per_shot))
        return bad_integer("ProjectilesPerShot");
    w.infinite_ammo = get_bool(L, t, "InfiniteAmmo").value_or(false);
    read_f32(L, t, "ProjectileSpeed", w.projectile_speed);
    read_f32(L, t, "ZeroingDistance", w.zeroing_distance);
    read_f32(L, t, "MuzzleOffset", w.muzzle_offset);

    if (auto mode_name = get_string(L, t, "FiringMode")) {
        auto mode = parse_firing_mode(*mode_name);
        if (!mode) {
            return Error("weapon '" + bp.id + "': unknown FiringMode '" +
                             *mode_name + "'",
                         bp.source);
        }
        w.firing_mode = *mode;
    }
    if (sim::Burst* b = w.burst()) {
        if (!read_integer(L, t, "BurstAmount", b->amount))
            return bad_integer("BurstAmount");
        read_f32(L, t, "BurstFireRate", b->burst_fire_rate);
    }

    if (int proj = push_subtable(L, t, "Projectile")) {
        read_f32(L, proj, "Mass", w.projectile.mass);
        read_f32(L, proj, "DragCoeff", w.projectile.drag_coeff);
        read_f32(L, proj, "ReferenceArea", w.projectile.reference_area);
        read_f32(L, proj, "PenetrationPower", w.projectile.penetration_power);
        read_f32(L, proj, "Lifetime", w.projectile_lifetime);
        lua_pop(L, 1);
    }

    if (int acc = push_subtable(L, t, "Accuracy")) {
        sim::AccuracyState& a = bp.accuracy;
        read_f32(L, acc, "MaxSpread", a.max_spread);
        read_f32(L, acc, "BloomPerShot", a.bloom_per_shot);
        read_f32(L, acc, "RecoveryRate", a.recovery_rate);
        read_f32(L, acc, "AdsModifier", a.ads_modifier);
        read_f32(L, acc, "MovementPenalty", a.movement_penalty);
        read_f32(L, acc, "AirborneMultiplier", a.airborne_multiplier);
        lua_pop(L, 1);
    }

    bp.attachments = get_string_list(L, t, "Attachments");
    for (auto& a : bp.attachments) a = to_lower(a);

    if (auto valid = validate_weapon(bp); !valid) {
        return valid.error();
    }

    w.current_ammo = w.ammo_capacity;
    w.capture_base_stats();

    if (weapons_.count(bp.id)) {
        spdlog::debug("Weapon blueprint '{}' redefined", bp.id);
    }
    spdlog::debug("Registered weapon '{}': {} dmg, {} rps, {}",
                  bp.id, w.damage, w.fire_rate,
                  sim::firing_mode_name(w.firing_mode));
    std::string key = bp.id;
    weapons_[key] = std::move(bp);
    return {};
}

Result<void> ContentStore::register_attachment(lua_State* L,
                                               int stack_index) {
    int t = absolute_index(L, stack_index);

    auto raw_id = get_string(L, t, "BlueprintId");
    if (!raw_id || raw_id->empty()) {
        return Error("Attachment blueprint has no BlueprintId");
    }

    sim::AttachmentModifier mod;
    mod.id = to_lower(*raw_id);
    mod.name = get_string(L, t, "Name").value_or(*raw_id);

    auto mount_name = get_string(L, t, "Mount");
    if (!mount_name) {
        return Error("attachment '" + mod.id + "': missing Mount");
    }
    auto mount = sim::parse_mount_point(*mount_name);
    if (!mount) {
        return Error("attachment '" + mod.id + "': unknown Mount '" +
                     *mount_name + "'");
    }
    mod.mount = *mount;

    read_f32(L, t, "DamageMultiplier", mod.damage_multiplier);
    read_f32(L, t, "ExtraDamage", mod.extra_damage);
    read_f32(L, t, "SpreadMultiplier", mod.spread_multiplier);
    read_f32(L, t, "FireRateMultiplier", mod.fire_rate_multiplier);
    read_f32(L, t, "ReloadSpeedMultiplier", mod.reload_speed_multiplier);
    if (!read_integer(L, t, "MagazineSizeModifier", mod.magazine_size_modifier)) {
        return Error("attachment '" + mod.id + "': " +
                     out_of_range("MagazineSizeModifier"));
    }
    read_f32(L, t, "RangeMultiplier", mod.range_multiplier);

    // A zero multiplier cannot be undone; remove_from skips it, leaving the
    // stat stuck at zero after the attachment comes off.
    if (mod.damage_multiplier == 0 || mod.spread_multiplier == 0 ||
        mod.fire_rate_multiplier == 0 || mod.reload_speed_multiplier == 0 ||
        mod.range_multiplier == 0) {
        spdlog::warn("Attachment '{}' has a zero multiplier; removal will not "
                     "restore the affected stat",
                     mod.id);
    }

    spdlog::debug("Registered attachment '{}' on {}", mod.id,
                  sim::mount_point_name(mod.mount));
    std::string key = mod.id;
    attachments_[key] = std::move(mod);
    return {};
}

Result<void> ContentStore::set_config(lua_State* L, int stack_index) {
    int t = absolute_index(L, stack_index);
    sim::SimConfig cfg = config_;

    if (auto g = get_vector(L, t, "Gravity")) cfg.environment.gravity = *g;
    if (auto w = get_vector(L, t, "Wind")) cfg.environment.wind = *w;
    read_f32(L, t, "AirDensity", cfg.environment.air_density);

    sim::PenetrationParams& p = cfg.penetration;
    read_f32(L, t, "EnergyLossPerDistance", p.energy_loss_per_distance);
    read_f32(L, t, "SurfaceResistance", p.default_surface_resistance);
    read_f32(L, t, "PenetrationDamping", p.penetration_damping);
    read_f32(L, t, "PushThroughDistance", p.push_through_distance);
    read_f32(L, t, "MaxStepDistance", p.max_step_distance);

    if (!read_integer(L, t, "SpreadSeed", cfg.spread_seed)) {
        return Error("SetBallisticsConfig: " + out_of_range("SpreadSeed"));
    }
    read_f32(L, t, "SecondsPerTick", cfg.seconds_per_tick);

    if (cfg.environment.air_density < 0) {
        return Error("SetBallisticsConfig: AirDensity must not be negative");
    }
    if (cfg.seconds_per_tick <= 0) {
        return Error("SetBallisticsConfig: SecondsPerTick must be positive");
    }
    if (p.default_surface_resistance < 0 || p.energy_loss_per_distance < 0) {
        return Error("SetBallisticsConfig: penetration tunables must not be "
                     "negative");
    }

    config_ = cfg;
    has_config_ = true;
    spdlog::debug("Ballistics config: gravity ({}, {}, {}), air density {}",
                  cfg.environment.gravity.x, cfg.environment.gravity.y,
                  cfg.environment.gravity.z, cfg.environment.air_density);
    return {};
}

const WeaponBlueprint* ContentStore::find_weapon(std::string_view id) const {
    auto it = weapons_.find(to_lower(std::string(id)));
    return (it != weapons_.end()) ? &it->second : nullptr;
}

const sim::AttachmentModifier* ContentStore::find_attachment(
    std::string_view id) const {
    auto it = attachments_.find(to_lower(std::string(id)));
    return (it != attachments_.end()) ? &it->second : nullptr;
}

std::vector<const sim::AttachmentModifier*> ContentStore::attachments_for(
    sim::MountPoint mount) const {
    std::vector<const sim::AttachmentModifier*> result;
    for (const auto& [id, mod] : attachments_) {
        if (mod.mount == mount) result.push_back(&mod);
    }
    std::sort(result.begin(), result.end(),
              [](const auto* a, const auto* b) { return a->id < b->id; });
    return result;
}

void ContentStore::add_default_attachments() {
    for (auto& mod : sim::default_attachment_catalogue()) {
        std::string key = mod.id;
        attachments_.try_emplace(key, std::move(mod));
    }
}

Result<size_t> ContentStore::equip(sim::Shooter& shooter,
                                   std::string_view weapon_id) const {
    const WeaponBlueprint* bp = find_weapon(weapon_id);
    if (!bp) {
        return Error("Unknown weapon blueprint: " + std::string(weapon_id));
    }

    size_t index = shooter.add_weapon(bp->weapon, bp->accuracy);
    sim::Loadout* loadout = shooter.loadout(index);
    for (const auto& att_id : bp->attachments) {
        const sim::AttachmentModifier* mod = find_attachment(att_id);
        if (!mod) {
            spdlog::warn("Weapon '{}' references unknown attachment '{}'",
                         bp->id, att_id);
            continue;
        }
        loadout->select_attachment(*mod);
    }
    // Start with a full magazine at the modified capacity
    loadout->weapon.current_ammo = loadout->weapon.ammo_capacity;
    return index;
}

void ContentStore::log_statistics() const {
    spdlog::info("Content loading complete:");
    spdlog::info("  Weapons:      {}", weapons_.size());
    spdlog::info("  Attachments:  {}", attachments_.size());
    spdlog::info("  Config:       {}", has_config_ ? "custom" : "defaults");
}

} // namespace rsim::content
