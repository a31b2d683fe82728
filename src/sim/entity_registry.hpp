#pragma once

#include "core/types.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace rsim::sim {

class Entity;

class EntityRegistry {
public:
    EntityRegistry();
    ~EntityRegistry();

    /// Register an entity and assign it a unique ID. Returns the ID.
    EntityId register_entity(std::unique_ptr<Entity> entity);

    /// Look up an entity by ID. Returns nullptr if not found.
    Entity* find(EntityId id) const;

    /// Number of registered entities (destroyed ones included until swept).
    size_t count() const { return entities_.size(); }

    /// IDs of all live projectiles, in registration order.
    std::vector<EntityId> projectile_ids() const;

    /// IDs of all live shooters, in registration order.
    std::vector<EntityId> shooter_ids() const;

    /// Drop every entity flagged destroyed. Returns how many were removed.
    size_t remove_destroyed();

    /// Iterate all entities.
    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [id, e] : entities_)
            fn(*e);
    }

private:
    std::vector<EntityId> collect_ids(bool projectiles) const;

    std::unordered_map<EntityId, std::unique_ptr<Entity>> entities_;
    EntityId next_id_ = 1;
};

} // namespace rsim::sim
