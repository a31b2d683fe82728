#include "sim/sim_state.hpp"
#include "sim/entity.hpp"
#include "sim/firing_controller.hpp"
#include "sim/projectile.hpp"
#include "sim/shooter.hpp"
#include "sim/sphere_ray_caster.hpp"

#include <spdlog/spdlog.h>

namespace rsim::sim {

SimState::SimState(SimConfig config)
    : config_(config),
      ray_caster_(std::make_unique<SphereRayCaster>(entity_registry_)),
      sampler_(std::make_unique<SeededSpreadSampler>(config.spread_seed)) {
    rebuild_resolver();
}

SimState::~SimState() = default;

void SimState::rebuild_resolver() {
    const EntityRegistry& registry = entity_registry_;
    resolver_ = std::make_unique<ImpactResolver>(
        *ray_caster_, config_.penetration,
        [&registry](EntityId id) -> std::optional<f32> {
            auto* e = registry.find(id);
            if (!e) return std::nullopt;
            return e->surface_resistance();
        });
}

void SimState::set_ray_caster(std::unique_ptr<RayCaster> caster) {
    if (!caster) return;
    ray_caster_ = std::move(caster);
    rebuild_resolver();
}

void SimState::set_spread_sampler(std::unique_ptr<SpreadSampler> sampler) {
    if (sampler) sampler_ = std::move(sampler);
}

Shooter& SimState::spawn_shooter(const std::string& name,
                                 const Vector3& position) {
    auto shooter = std::make_unique<Shooter>();
    shooter->set_name(name);
    shooter->set_position(position);
    auto* ptr = shooter.get();
    entity_registry_.register_entity(std::move(shooter));
    return *ptr;
}

EntityId SimState::spawn_target(const TargetDesc& desc) {
    auto target = std::make_unique<Entity>();
    target->set_name(desc.name);
    target->set_position(desc.position);
    target->set_bounding_radius(desc.radius);
    target->set_damageable(desc.damageable);
    target->set_health(desc.health);
    target->set_surface_resistance(desc.surface_resistance);
    return entity_registry_.register_entity(std::move(target));
}

EntityId SimState::spawn_projectile(const ProjectileSpawnRequest& request) {
    return entity_registry_.register_entity(Projectile::from_request(request));
}

Shooter* SimState::find_shooter(EntityId id) const {
    auto* e = entity_registry_.find(id);
    if (!e || !e->is_shooter()) return nullptr;
    return static_cast<Shooter*>(e);
}

size_t SimState::projectile_count() const {
    return entity_registry_.projectile_ids().size();
}

void SimState::tick(f32 dt) {
    tick_count_++;
    game_time_ += dt;
    events_.clear();

    // Snapshot before firing so fresh projectiles wait a tick
    std::vector<EntityId> in_flight = entity_registry_.projectile_ids();

    update_shooters(dt);
    spawn_pending_projectiles();
    update_projectiles(in_flight, dt);

    entity_registry_.remove_destroyed();
}

void SimState::update_shooters(f32 dt) {
    ShotContext ctx{NO_ENTITY,  {},         {},       config_.environment,
                    *resolver_, entity_registry_, *sampler_, events_};

    for (EntityId id : entity_registry_.shooter_ids()) {
        auto* shooter = find_shooter(id);
        if (!shooter || shooter->destroyed()) continue;
        shooter->update(dt, ctx);
    }
}

void SimState::spawn_pending_projectiles() {
    for (const auto& request : events_.take_spawn_requests()) {
        EntityId id = spawn_projectile(request);
        spdlog::debug("Spawned projectile #{} for entity #{}", id,
                      request.owner);
    }
}

void SimState::update_projectiles(const std::vector<EntityId>& ids, f32 dt) {
    BallisticsContext ctx{config_.environment, *resolver_, entity_registry_,
                          events_};

    for (EntityId id : ids) {
        auto* e = entity_registry_.find(id);
        if (!e || e->destroyed() || !e->is_projectile()) continue;
        static_cast<Projectile*>(e)->update(dt, ctx);
    }
}

} // namespace rsim::sim
