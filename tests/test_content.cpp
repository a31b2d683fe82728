#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "content/content_store.hpp"
#include "lua/content_loader.hpp"
#include "lua/lua_state.hpp"
#include "sim/shooter.hpp"
#include "sim/sim_state.hpp"

#include <fstream>
#include <string>

extern "C" {
#include <lua.h>
}

using namespace rsim;
using namespace rsim::content;
using Catch::Matchers::WithinAbs;

namespace {

struct ContentFixture {
    lua::LuaState state;
    ContentStore store;
    lua::ContentLoader loader{state, store};

    Result<void> load(const char* code) {
        return loader.load_string(code, "=test_content");
    }
};

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ================================================================
// Weapons
// ================================================================

TEST_CASE("Weapon blueprint fields are parsed", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        RegisterWeaponBlueprint {
            BlueprintId = 'BR_Test',
            Label = 'Test Burst Rifle',
            Damage = 30,
            Range = 250,
            FireRate = 4,
            ReloadTime = 2.5,
            AmmoCapacity = 24,
            Spread = 1.25,
            AimSpreadMult = 0.5,
            ProjectilesPerShot = 2,
            InfiniteAmmo = true,
            FiringMode = 'Burst',
            BurstAmount = 4,
            BurstFireRate = 12,
            ProjectileSpeed = 700,
            ZeroingDistance = 150,
            MuzzleOffset = 0.75,
            Projectile = {
                Mass = 0.006,
                DragCoeff = 0.25,
                ReferenceArea = 0.00003,
                PenetrationPower = 350,
                Lifetime = 2,
            },
            Accuracy = {
                MaxSpread = 3,
                BloomPerShot = 0.2,
                RecoveryRate = 1.5,
                AdsModifier = 0.5,
                MovementPenalty = 1,
                AirborneMultiplier = 2,
            },
            Attachments = { 'Red_Dot', 'silencer' },
        }
    )");
    REQUIRE(result.ok());
    REQUIRE(f.store.weapon_count() == 1);

    const auto* bp = f.store.find_weapon("br_test");
    REQUIRE(bp != nullptr);
    CHECK(bp->id == "br_test");
    CHECK(f.store.find_weapon("BR_TEST") == bp);

    const auto& w = bp->weapon;
    CHECK(w.label == "Test Burst Rifle");
    CHECK(w.damage == 30);
    CHECK(w.range == 250);
    CHECK(w.fire_rate == 4);
    CHECK_THAT(w.reload_time, WithinAbs(2.5, 1e-6));
    CHECK(w.ammo_capacity == 24);
    CHECK(w.current_ammo == 24);
    CHECK_THAT(w.spread, WithinAbs(1.25, 1e-6));
    CHECK_THAT(w.aim_spread_mult, WithinAbs(0.5, 1e-6));
    CHECK(w.projectiles_per_shot == 2);
    CHECK(w.infinite_ammo);
    CHECK(w.projectile_speed == 700);
    CHECK(w.zeroing_distance == 150);
    CHECK_THAT(w.muzzle_offset, WithinAbs(0.75, 1e-6));

    REQUIRE(w.burst() != nullptr);
    CHECK(w.burst()->amount == 4);
    CHECK(w.burst()->burst_fire_rate == 12);

    CHECK_THAT(w.projectile.mass, WithinAbs(0.006, 1e-7));
    CHECK_THAT(w.projectile.drag_coeff, WithinAbs(0.25, 1e-7));
    CHECK_THAT(w.projectile.reference_area, WithinAbs(0.00003, 1e-9));
    CHECK(w.projectile.penetration_power == 350);
    CHECK(w.projectile_lifetime == 2);

    CHECK(bp->accuracy.max_spread == 3);
    CHECK_THAT(bp->accuracy.bloom_per_shot, WithinAbs(0.2, 1e-6));
    CHECK_THAT(bp->accuracy.recovery_rate, WithinAbs(1.5, 1e-6));
    CHECK_THAT(bp->accuracy.ads_modifier, WithinAbs(0.5, 1e-6));
    CHECK(bp->accuracy.movement_penalty == 1);
    CHECK(bp->accuracy.airborne_multiplier == 2);

    REQUIRE(bp->attachments.size() == 2);
    CHECK(bp->attachments[0] == "red_dot");
    CHECK(bp->attachments[1] == "silencer");

    // Base stats mirror the parsed values
    CHECK(w.base_damage == 30);
    CHECK(w.base_ammo_capacity == 24);
}

TEST_CASE("Weapon blueprint defaults and fire rate units", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        RegisterWeaponBlueprint { BlueprintId = 'smg', RoundsPerMinute = 900 }
        RegisterWeaponBlueprint { BlueprintId = 'both', RoundsPerMinute = 900, FireRate = 3 }
    )");
    REQUIRE(result.ok());

    const auto* smg = f.store.find_weapon("smg");
    REQUIRE(smg != nullptr);
    CHECK_THAT(smg->weapon.fire_rate, WithinAbs(15.0, 1e-5));
    CHECK(smg->weapon.label == "smg");
    CHECK(std::holds_alternative<sim::SemiAuto>(smg->weapon.firing_mode));

    CHECK(f.store.find_weapon("both")->weapon.fire_rate == 3);
}

TEST_CASE("Firing mode names", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        RegisterWeaponBlueprint { BlueprintId = 'a', FiringMode = 'fullauto' }
        RegisterWeaponBlueprint { BlueprintId = 'b', FiringMode = 'SemiAuto' }
    )");
    REQUIRE(result.ok());
    CHECK(std::holds_alternative<sim::FullAuto>(f.store.find_weapon("a")->weapon.firing_mode));
    CHECK(std::holds_alternative<sim::SemiAuto>(f.store.find_weapon("b")->weapon.firing_mode));
}

TEST_CASE("Invalid weapon blueprints stop the script", "[content]") {
    ContentFixture f;

    SECTION("Missing BlueprintId") {
        auto result = f.load("RegisterWeaponBlueprint { Damage = 5 }");
        REQUIRE_FALSE(result.ok());
        CHECK(contains(result.error().message, "BlueprintId"));
    }

    SECTION("Unknown firing mode") {
        auto result = f.load(R"(
            RegisterWeaponBlueprint { BlueprintId = 'x', FiringMode = 'Laser' }
            after = true
        )");
        REQUIRE_FALSE(result.ok());
        CHECK(contains(result.error().message, "FiringMode"));
        CHECK(contains(result.error().message, "test_content:2"));

        // Execution stopped at the failing call
        lua_State* L = f.state.raw();
        lua_getglobal(L, "after");
        CHECK(lua_isnil(L, -1));
        lua_pop(L, 1);
    }

    SECTION("Non-positive fire rate") {
        auto result = f.load("RegisterWeaponBlueprint { BlueprintId = 'x', FireRate = 0 }");
        REQUIRE_FALSE(result.ok());
        CHECK(contains(result.error().message, "FireRate"));
    }

    SECTION("Negative magazine") {
        auto result = f.load("RegisterWeaponBlueprint { BlueprintId = 'x', AmmoCapacity = -1 }");
        REQUIRE_FALSE(result.ok());
        CHECK(contains(result.error().message, "AmmoCapacity"));
    }

    SECTION("Integer fields outside their type") {
        auto huge = f.load("RegisterWeaponBlueprint { BlueprintId = 'x', AmmoCapacity = 1e12 }");
        REQUIRE_FALSE(huge.ok());
        CHECK(contains(huge.error().message, "AmmoCapacity is out of range"));

        auto nan = f.load("RegisterWeaponBlueprint { BlueprintId = 'x', ProjectilesPerShot = 0/0 }");
        REQUIRE_FALSE(nan.ok());
        CHECK(contains(nan.error().message, "ProjectilesPerShot"));

        auto burst = f.load(
            "RegisterWeaponBlueprint { BlueprintId = 'x', FiringMode = 'Burst', BurstAmount = -3 }");
        REQUIRE_FALSE(burst.ok());
        CHECK(contains(burst.error().message, "BurstAmount"));
    }

    SECTION("Non-table argument") {
        auto result = f.load("RegisterWeaponBlueprint('x')");
        CHECK_FALSE(result.ok());
    }

    CHECK(f.store.weapon_count() == 0);
}

// ================================================================
// Attachments
// ================================================================

TEST_CASE("Attachment blueprints are parsed", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        RegisterAttachmentBlueprint {
            BlueprintId = 'AP_Rounds',
            Name = 'AP Rounds',
            Mount = 'magazine',
            DamageMultiplier = 0.9,
            ExtraDamage = 4,
            SpreadMultiplier = 1.1,
            FireRateMultiplier = 0.95,
            ReloadSpeedMultiplier = 1.2,
            MagazineSizeModifier = -5,
            RangeMultiplier = 1.3,
        }
    )");
    REQUIRE(result.ok());

    const auto* m = f.store.find_attachment("ap_rounds");
    REQUIRE(m != nullptr);
    CHECK(m->name == "AP Rounds");
    CHECK(m->mount == sim::MountPoint::Magazine);
    CHECK_THAT(m->damage_multiplier, WithinAbs(0.9, 1e-6));
    CHECK(m->extra_damage == 4);
    CHECK_THAT(m->spread_multiplier, WithinAbs(1.1, 1e-6));
    CHECK_THAT(m->fire_rate_multiplier, WithinAbs(0.95, 1e-6));
    CHECK_THAT(m->reload_speed_multiplier, WithinAbs(1.2, 1e-6));
    CHECK(m->magazine_size_modifier == -5);
    CHECK_THAT(m->range_multiplier, WithinAbs(1.3, 1e-6));
}

TEST_CASE("Attachment mount is required and validated", "[content]") {
    ContentFixture f;

    auto missing = f.load("RegisterAttachmentBlueprint { BlueprintId = 'a' }");
    REQUIRE_FALSE(missing.ok());
    CHECK(contains(missing.error().message, "Mount"));

    auto unknown = f.load(
        "RegisterAttachmentBlueprint { BlueprintId = 'a', Mount = 'Stock' }");
    REQUIRE_FALSE(unknown.ok());
    CHECK(contains(unknown.error().message, "Stock"));
    CHECK(f.store.attachment_count() == 0);
}

TEST_CASE("Out-of-range integers are rejected outside weapons", "[content]") {
    ContentFixture f;

    auto mag = f.load(R"(
        RegisterAttachmentBlueprint { BlueprintId = 'drum', Mount = 'Magazine', MagazineSizeModifier = 3e9 }
    )");
    REQUIRE_FALSE(mag.ok());
    CHECK(contains(mag.error().message, "MagazineSizeModifier"));
    CHECK(f.store.attachment_count() == 0);

    auto seed = f.load("SetBallisticsConfig { SpreadSeed = -1 }");
    REQUIRE_FALSE(seed.ok());
    CHECK(contains(seed.error().message, "SpreadSeed"));
    CHECK_FALSE(f.store.has_config());
    CHECK(f.store.config().spread_seed == 1337);
}

TEST_CASE("Default attachments do not override content", "[content]") {
    ContentFixture f;
    REQUIRE(f.load(R"(
        RegisterAttachmentBlueprint { BlueprintId = 'silencer', Mount = 'Muzzle', DamageMultiplier = 0.5 }
    )").ok());
    f.store.add_default_attachments();

    CHECK(f.store.find_attachment("silencer")->damage_multiplier == 0.5f);
    CHECK(f.store.find_attachment("red_dot") != nullptr);

    auto scopes = f.store.attachments_for(sim::MountPoint::Scope);
    REQUIRE(scopes.size() == 3);
    CHECK(scopes[0]->id == "acog");
    CHECK(scopes[1]->id == "red_dot");
    CHECK(scopes[2]->id == "sniper_scope");
}

// ================================================================
// Ballistics config
// ================================================================

TEST_CASE("Ballistics config overrides only given fields", "[content]") {
    ContentFixture f;
    CHECK_FALSE(f.store.has_config());

    auto result = f.load(R"(
        SetBallisticsConfig {
            Gravity = { 0, -1.62, 0 },
            Wind = { x = 3, z = -1 },
            EnergyLossPerDistance = 0.5,
            MaxStepDistance = 2,
            SpreadSeed = 99,
            SecondsPerTick = 0.05,
        }
    )");
    REQUIRE(result.ok());
    REQUIRE(f.store.has_config());

    const auto& cfg = f.store.config();
    CHECK_THAT(cfg.environment.gravity.y, WithinAbs(-1.62, 1e-6));
    CHECK(cfg.environment.wind.x == 3);
    CHECK(cfg.environment.wind.y == 0);
    CHECK(cfg.environment.wind.z == -1);
    CHECK_THAT(cfg.environment.air_density, WithinAbs(1.225, 1e-6));
    CHECK_THAT(cfg.penetration.energy_loss_per_distance, WithinAbs(0.5, 1e-6));
    CHECK(cfg.penetration.default_surface_resistance == 100);
    CHECK(cfg.penetration.max_step_distance == 2);
    CHECK(cfg.spread_seed == 99);
    CHECK_THAT(cfg.seconds_per_tick, WithinAbs(0.05, 1e-7));
}

TEST_CASE("Invalid ballistics config is rejected whole", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        SetBallisticsConfig { AirDensity = 2, SecondsPerTick = 0 }
    )");
    REQUIRE_FALSE(result.ok());
    CHECK(contains(result.error().message, "SecondsPerTick"));
    CHECK_FALSE(f.store.has_config());
    CHECK_THAT(f.store.config().environment.air_density, WithinAbs(1.225, 1e-6));
}

// ================================================================
// Equipping and loading
// ================================================================

TEST_CASE("Equip applies default attachments", "[content]") {
    ContentFixture f;
    f.store.add_default_attachments();
    REQUIRE(f.load(R"(
        RegisterWeaponBlueprint {
            BlueprintId = 'rifle',
            Damage = 20,
            AmmoCapacity = 30,
            Spread = 2,
            Attachments = { 'red_dot', 'extended_mag', 'no_such_thing' },
        }
    )").ok());

    sim::SimState sim;
    auto& shooter = sim.spawn_shooter("S", {});
    auto index = f.store.equip(shooter, "rifle");
    REQUIRE(index.ok());
    CHECK(index.value() == 0);

    const auto* lo = shooter.active_loadout();
    REQUIRE(lo != nullptr);
    CHECK(lo->attachments.active_count() == 2);
    CHECK_THAT(lo->weapon.spread, WithinAbs(1.6, 1e-5));
    CHECK(lo->weapon.ammo_capacity == 45);
    CHECK(lo->weapon.current_ammo == 45);
    CHECK(lo->weapon.base_ammo_capacity == 30);

    auto missing = f.store.equip(shooter, "nope");
    CHECK_FALSE(missing.ok());
    CHECK(shooter.weapon_count() == 1);
}

TEST_CASE("Content logging functions are available", "[content]") {
    ContentFixture f;
    auto result = f.load(R"(
        LOG('loaded ', 3, ' weapons')
        WARN('careful')
        SPEW('detail')
    )");
    CHECK(result.ok());
}

TEST_CASE("Content loader walks directories in sorted order", "[content]") {
    auto dir = fs::temp_directory_path() / "rangedsim_content_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir / "sub");
    {
        std::ofstream(dir / "a_weapons.lua")
            << "RegisterWeaponBlueprint { BlueprintId = 'w', Damage = 1 }\n";
        std::ofstream(dir / "sub" / "b_override.lua")
            << "RegisterWeaponBlueprint { BlueprintId = 'w', Damage = 2 }\n";
        std::ofstream(dir / "notes.txt") << "not lua";
    }

    ContentFixture f;
    auto result = f.loader.load_path(dir);
    REQUIRE(result.ok());
    CHECK(f.loader.files_loaded() == 2);
    CHECK(f.store.find_weapon("w")->weapon.damage == 2);

    auto missing = f.loader.load_path(dir / "does_not_exist");
    CHECK_FALSE(missing.ok());

    fs::remove_all(dir, ec);
}

TEST_CASE("Failing content file reports its path", "[content]") {
    auto path = fs::temp_directory_path() / "rangedsim_bad_content.lua";
    std::ofstream(path) << "RegisterWeaponBlueprint { BlueprintId = 'x', FireRate = -1 }\n";

    ContentFixture f;
    auto result = f.loader.load_file(path);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().source == path.string());
    CHECK(contains(result.error().describe(), "FireRate"));

    std::error_code ec;
    fs::remove(path, ec);
}

#ifdef RANGEDSIM_DATA_DIR
TEST_CASE("Bundled sample content loads and equips", "[content]") {
    ContentFixture f;
    f.store.add_default_attachments();
    auto result = f.loader.load_path(RANGEDSIM_DATA_DIR);
    REQUIRE(result.ok());
    CHECK(f.store.has_config());
    CHECK(f.store.weapon_count() >= 4);

    sim::SimState sim(f.store.config());
    auto& shooter = sim.spawn_shooter("S", {});
    for (const char* id : {"ar_standard", "br_burst", "dmr_marksman", "sg_pump"}) {
        auto index = f.store.equip(shooter, id);
        CHECK(index.ok());
    }
    CHECK(shooter.weapon_count() == 4);
    CHECK(shooter.loadout(0)->attachments.active_count() == 2);
}
#endif
