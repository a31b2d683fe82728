#include "sim/entity_registry.hpp"
#include "sim/entity.hpp"

#include <algorithm>

namespace rsim::sim {

EntityRegistry::EntityRegistry() = default;
EntityRegistry::~EntityRegistry() = default;

EntityId EntityRegistry::register_entity(std::unique_ptr<Entity> entity) {
    EntityId id = next_id_++;
    entity->set_entity_id(id);
    entities_[id] = std::move(entity);
    return id;
}

Entity* EntityRegistry::find(EntityId id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? it->second.get() : nullptr;
}

std::vector<EntityId> EntityRegistry::collect_ids(bool projectiles) const {
    std::vector<EntityId> result;
    for (const auto& [id, e] : entities_) {
        if (e->destroyed()) continue;
        if (projectiles ? e->is_projectile() : e->is_shooter())
            result.push_back(id);
    }
    // IDs are monotonic, so sorting restores registration order and keeps
    // update order deterministic regardless of hash layout.
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<EntityId> EntityRegistry::projectile_ids() const {
    return collect_ids(true);
}

std::vector<EntityId> EntityRegistry::shooter_ids() const {
    return collect_ids(false);
}

size_t EntityRegistry::remove_destroyed() {
    return std::erase_if(entities_, [](const auto& kv) {
        return kv.second->destroyed();
    });
}

} // namespace rsim::sim
