#pragma once

#include "sim/accuracy.hpp"
#include "sim/combat_events.hpp"
#include "sim/entity_registry.hpp"
#include "sim/impact.hpp"
#include "sim/trajectory.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rsim::sim {

class Shooter;

/// Tunables for one simulation. Loaded from content (SetBallisticsConfig)
/// or left at defaults.
struct SimConfig {
    BallisticsEnvironment environment;
    PenetrationParams penetration;
    u32 spread_seed = 1337;
    f32 seconds_per_tick = 0.1f;
};

/// Static obstacle or target description for spawn_target().
struct TargetDesc {
    std::string name = "Target";
    Vector3 position;
    f32 radius = 0.5f;
    bool damageable = true;
    f32 health = 100;
    std::optional<f32> surface_resistance;
};

class SimState {
public:
    explicit SimState(SimConfig config = {});
    ~SimState();

    EntityRegistry& entity_registry() { return entity_registry_; }
    const EntityRegistry& entity_registry() const { return entity_registry_; }

    CombatEventQueue& events() { return events_; }
    const CombatEventQueue& events() const { return events_; }

    const SimConfig& config() const { return config_; }

    /// Mutable between ticks (wind changes, low-gravity zones...).
    BallisticsEnvironment& environment() { return config_.environment; }

    /// Replace the ray-cast primitive (defaults to SphereRayCaster).
    void set_ray_caster(std::unique_ptr<RayCaster> caster);

    /// Replace the spread sampler (defaults to a SeededSpreadSampler).
    void set_spread_sampler(std::unique_ptr<SpreadSampler> sampler);

    const ImpactResolver& impact_resolver() const { return *resolver_; }

    // Spawning
    Shooter& spawn_shooter(const std::string& name, const Vector3& position);
    EntityId spawn_target(const TargetDesc& desc);
    EntityId spawn_projectile(const ProjectileSpawnRequest& request);

    Shooter* find_shooter(EntityId id) const;
    size_t projectile_count() const;

    // Tick loop
    void tick() { tick(config_.seconds_per_tick); }

    /// (1) shooters fire, (2) projectiles that existed before this tick are
    /// integrated and swept, (3) destroyed entities are removed. Projectiles
    /// fired in this tick first move on the next one. The event queue holds
    /// this tick's output until the next tick starts.
    void tick(f32 dt);

    u32 tick_count() const { return tick_count_; }
    f64 game_time() const { return game_time_; }

private:
    void rebuild_resolver();
    void update_shooters(f32 dt);
    void spawn_pending_projectiles();
    void update_projectiles(const std::vector<EntityId>& ids, f32 dt);

    SimConfig config_;
    EntityRegistry entity_registry_;
    CombatEventQueue events_;
    std::unique_ptr<RayCaster> ray_caster_;
    std::unique_ptr<ImpactResolver> resolver_;
    std::unique_ptr<SpreadSampler> sampler_;
    u32 tick_count_ = 0;
    f64 game_time_ = 0.0;
};

} // namespace rsim::sim
