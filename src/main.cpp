#include "core/log.hpp"
#include "core/types.hpp"
#include "content/content_store.hpp"
#include "lua/content_loader.hpp"
#include "lua/lua_state.hpp"
#include "sim/combat_events.hpp"
#include "sim/entity.hpp"
#include "sim/shooter.hpp"
#include "sim/sim_state.hpp"
#include "sim/weapon_builder.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>

static void print_usage() {
    std::cout << "rangedsim v0.1.0\n"
              << "Ranged weapon firing and ballistics simulation\n\n"
              << "Usage:\n"
              << "  rangedsim [options]\n\n"
              << "Options:\n"
              << "  --content <path>   Content file or directory of .lua files\n"
              << "  --weapon <id>      Weapon blueprint to equip (default per scenario)\n"
              << "  --scenario <name>  range | burst | penetration (default: range)\n"
              << "  --ticks <n>        Number of sim ticks to run (default: 100)\n"
              << "  --dt <seconds>     Tick length (default: content or 0.1)\n"
              << "  --seed <n>         Spread sampler seed (default: content or 1337)\n"
              << "  --aim              Fire aimed down sights\n"
              << "  --log <path>       Log file (default: rangedsim.log)\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help message\n";
}

struct Options {
    rsim::fs::path content;
    std::string weapon;
    std::string scenario = "range";
    rsim::u32 ticks = 100;
    rsim::f32 dt = 0;  // 0 = use content / default
    long seed = -1;    // < 0 = use content / default
    bool aim = false;
    rsim::fs::path log_file = "rangedsim.log";
    bool verbose = false;
};

static long parse_long(const char* flag, const char* value, long lo, long hi) {
    char* end = nullptr;
    long val = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || val < lo || val > hi) {
        std::cerr << "Invalid " << flag << " value: " << value << "\n";
        std::exit(1);
    }
    return val;
}

static Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--content") == 0 && i + 1 < argc) {
            opts.content = argv[++i];
        } else if (std::strcmp(argv[i], "--weapon") == 0 && i + 1 < argc) {
            opts.weapon = argv[++i];
        } else if (std::strcmp(argv[i], "--scenario") == 0 && i + 1 < argc) {
            opts.scenario = argv[++i];
        } else if (std::strcmp(argv[i], "--ticks") == 0 && i + 1 < argc) {
            opts.ticks = static_cast<rsim::u32>(
                parse_long("--ticks", argv[i + 1], 0, 1'000'000));
            i++;
        } else if (std::strcmp(argv[i], "--dt") == 0 && i + 1 < argc) {
            char* end = nullptr;
            double val = std::strtod(argv[++i], &end);
            if (end == argv[i] || *end != '\0' || val <= 0 || val > 1.0) {
                std::cerr << "Invalid --dt value: " << argv[i] << "\n";
                std::exit(1);
            }
            opts.dt = static_cast<rsim::f32>(val);
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            opts.seed = parse_long("--seed", argv[i + 1], 0, 0xFFFFFFFFL);
            i++;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--aim") == 0) {
            opts.aim = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            std::exit(1);
        }
    }

    return opts;
}

/// Counts impact notifications; stands in for the effects layer.
class ImpactCounter : public rsim::sim::ImpactListener {
public:
    void on_impact(const rsim::sim::ImpactNotification& n) override {
        counts_[static_cast<size_t>(n.kind)]++;
        spdlog::debug("{} at ({:.2f}, {:.2f}, {:.2f}) entity #{}",
                      rsim::sim::impact_kind_name(n.kind), n.position.x,
                      n.position.y, n.position.z, n.entity);
    }

    rsim::u32 count(rsim::sim::ImpactKind kind) const {
        return counts_[static_cast<size_t>(kind)];
    }

private:
    std::array<rsim::u32, 3> counts_{};
};

/// Apply this tick's damage events to entity health. Damage is consumed
/// here; the sim itself only reports it.
static rsim::f32 apply_damage(rsim::sim::SimState& sim) {
    rsim::f32 total = 0;
    for (const auto& ev : sim.events().damage_events()) {
        auto* target = sim.entity_registry().find(ev.target);
        if (!target || target->destroyed()) continue;
        target->set_health(target->health() - ev.amount);
        total += ev.amount;
        spdlog::debug("Entity #{} took {:.1f} {} damage from #{} ({:.1f} left)",
                      ev.target, ev.amount,
                      rsim::sim::damage_type_name(ev.damage_type), ev.source,
                      target->health());
        if (target->health() <= 0) {
            spdlog::info("  {} (#{}) destroyed at t={:.2f}s", target->name(),
                         ev.target, sim.game_time());
            target->mark_destroyed();
        }
    }
    return total;
}

/// Equip `id` from content, or the built-in fallback if content lacks it.
static bool equip_weapon(const rsim::content::ContentStore& store,
                         rsim::sim::Shooter& shooter, const std::string& id,
                         const rsim::sim::WeaponBuilder& fallback) {
    if (store.find_weapon(id)) {
        auto result = store.equip(shooter, id);
        if (!result) {
            spdlog::error("{}", result.error().describe());
            return false;
        }
        return true;
    }
    spdlog::info("Weapon '{}' not in content, using built-in {}", id,
                 fallback.build().label);
    shooter.add_weapon(fallback.build(), fallback.accuracy_state());
    return true;
}

static void log_loadout(const rsim::sim::Shooter& shooter) {
    const auto* lo = shooter.active_loadout();
    if (!lo) return;
    const auto& w = lo->weapon;
    spdlog::info("{} wields '{}': dmg={:.1f} rps={:.2f} mag={} spread={:.2f} "
                 "speed={} mode={} attachments={}",
                 shooter.name(), w.label, w.damage, w.fire_rate,
                 w.ammo_capacity, w.spread,
                 w.is_hitscan() ? std::string("hitscan")
                                : std::to_string(w.projectile_speed),
                 rsim::sim::firing_mode_name(w.firing_mode),
                 lo->attachments.active_count());
}

static void log_summary(rsim::sim::SimState& sim,
                        const rsim::sim::Shooter& shooter,
                        const ImpactCounter& impacts, rsim::f32 damage) {
    using rsim::sim::ImpactKind;
    const auto* lo = shooter.active_loadout();
    spdlog::info("After {} ticks ({:.2f}s):", sim.tick_count(),
                 sim.game_time());
    spdlog::info("  Shots fired:    {}", shooter.controller().total_shots());
    if (lo) {
        spdlog::info("  Ammo left:      {}/{}", lo->weapon.current_ammo,
                     lo->weapon.ammo_capacity);
        spdlog::info("  Bloom:          {:.2f} deg", lo->accuracy.current_bloom);
    }
    spdlog::info("  Hitscan hits:   {}", impacts.count(ImpactKind::HitscanHit));
    spdlog::info("  Impacts:        {}", impacts.count(ImpactKind::Impact));
    spdlog::info("  Penetrations:   {}", impacts.count(ImpactKind::Penetration));
    spdlog::info("  Damage dealt:   {:.1f}", damage);
    spdlog::info("  In flight:      {}", sim.projectile_count());
}

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    rsim::log::init(opts.log_file,
                    opts.verbose ? spdlog::level::debug : spdlog::level::info);

    // Content
    rsim::lua::LuaState state;
    rsim::content::ContentStore store;
    store.add_default_attachments();

    if (!opts.content.empty()) {
        rsim::lua::ContentLoader loader(state, store);
        auto result = loader.load_path(opts.content);
        if (!result) {
            spdlog::error("Content loading failed: {}",
                          result.error().describe());
            rsim::log::shutdown();
            return 1;
        }
    }
    store.log_statistics();

    rsim::sim::SimConfig config = store.config();
    if (opts.dt > 0) config.seconds_per_tick = opts.dt;
    if (opts.seed >= 0) config.spread_seed = static_cast<rsim::u32>(opts.seed);

    rsim::sim::SimState sim(config);
    ImpactCounter impacts;
    sim.events().set_listener(&impacts);

    auto& shooter = sim.spawn_shooter("Shooter", {0, 0, 0});
    bool burst_scenario = opts.scenario == "burst";
    bool pen_scenario = opts.scenario == "penetration";
    if (!burst_scenario && !pen_scenario && opts.scenario != "range") {
        spdlog::error("Unknown scenario: {}", opts.scenario);
        rsim::log::shutdown();
        return 1;
    }

    spdlog::info("=== SCENARIO: {} ===", opts.scenario);

    rsim::sim::TargetDesc target;
    target.name = "Target";
    target.position = {0, 1.5f, -50};
    target.radius = 0.5f;
    target.health = 500;

    bool equipped = false;
    if (burst_scenario) {
        auto fallback = rsim::sim::WeaponBuilder("Burst Carbine")
                            .damage(30)
                            .rounds_per_minute(240)
                            .ammo(24)
                            .burst(3, 2.5f)
                            .spread(1.0f, 0.3f)
                            .hitscan();
        equipped = equip_weapon(store, shooter,
                                opts.weapon.empty() ? "br_burst" : opts.weapon,
                                fallback);
    } else if (pen_scenario) {
        rsim::sim::ProjectileProperties props;
        props.penetration_power = 500;
        auto fallback = rsim::sim::WeaponBuilder("Marksman Rifle")
                            .damage(60)
                            .rounds_per_minute(120)
                            .ammo(10)
                            .spread(0.2f, 0.1f)
                            .projectile(900, props)
                            .zeroing(40);
        equipped = equip_weapon(
            store, shooter, opts.weapon.empty() ? "dmr_marksman" : opts.weapon,
            fallback);

        // Thin plywood-like wall between the shooter and the target
        rsim::sim::TargetDesc wall;
        wall.name = "Wall";
        wall.position = {0, 1.5f, -20};
        wall.radius = 1.0f;
        wall.damageable = false;
        wall.surface_resistance = 150.0f;
        sim.spawn_target(wall);
        target.position = {0, 1.5f, -40};
    } else {
        rsim::sim::ProjectileProperties props;
        auto fallback = rsim::sim::WeaponBuilder("Assault Rifle")
                            .damage(25)
                            .rounds_per_minute(600)
                            .ammo(30)
                            .firing_mode(rsim::sim::FullAuto{})
                            .spread(1.5f, 0.3f)
                            .accuracy(4, 0.35f, 3)
                            .projectile(880, props)
                            .zeroing(50);
        equipped = equip_weapon(
            store, shooter, opts.weapon.empty() ? "ar_standard" : opts.weapon,
            fallback);
    }
    if (!equipped) {
        rsim::log::shutdown();
        return 1;
    }

    rsim::EntityId target_id = sim.spawn_target(target);
    shooter.aim_at(target.position);
    log_loadout(shooter);

    // Trigger pattern: full-auto weapons hold, everything else taps once a
    // second so semi-auto and burst weapons re-arm between presses.
    const auto* active = shooter.active_loadout();
    bool hold = active &&
                std::holds_alternative<rsim::sim::FullAuto>(
                    active->weapon.firing_mode);
    rsim::u32 tap_interval = std::max<rsim::u32>(
        1, static_cast<rsim::u32>(1.0f / sim.config().seconds_per_tick));

    rsim::f32 damage = 0;
    for (rsim::u32 i = 0; i < opts.ticks; i++) {
        if (!sim.entity_registry().find(target_id)) {
            spdlog::info("Target gone, stopping after {} ticks",
                         sim.tick_count());
            break;
        }
        bool pressed = hold || (i % tap_interval == 0);
        shooter.set_trigger(pressed);
        shooter.input().aiming = opts.aim;

        auto* lo = shooter.active_loadout();
        if (lo && lo->weapon.current_ammo == 0 && !lo->weapon.infinite_ammo &&
            !lo->weapon.is_reloading) {
            shooter.request_reload();
        }

        sim.tick();
        damage += apply_damage(sim);
    }

    log_summary(sim, shooter, impacts, damage);
    auto* t = sim.entity_registry().find(target_id);
    if (t && !t->destroyed()) {
        spdlog::info("  Target health:  {:.1f}", t->health());
    }

    rsim::log::shutdown();
    return 0;
}
