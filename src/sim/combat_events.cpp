#include "sim/combat_events.hpp"

#include <utility>

namespace rsim::sim {

const char* damage_type_name(DamageType type) {
    switch (type) {
    case DamageType::Melee: return "Melee";
    case DamageType::Ranged: return "Ranged";
    case DamageType::Explosion: return "Explosion";
    case DamageType::Fall: return "Fall";
    case DamageType::Environmental: return "Environmental";
    }
    return "Unknown";
}

const char* impact_kind_name(ImpactKind kind) {
    switch (kind) {
    case ImpactKind::Penetration: return "Penetration";
    case ImpactKind::Impact: return "Impact";
    case ImpactKind::HitscanHit: return "HitscanHit";
    }
    return "Unknown";
}

void CombatEventQueue::push_impact(const ImpactNotification& notification) {
    impacts_.push_back(notification);
    if (listener_) listener_->on_impact(notification);
}

std::vector<ProjectileSpawnRequest> CombatEventQueue::take_spawn_requests() {
    return std::exchange(spawn_requests_, {});
}

std::vector<DamageEvent> CombatEventQueue::take_damage_events() {
    return std::exchange(damage_events_, {});
}

void CombatEventQueue::clear() {
    damage_events_.clear();
    impacts_.clear();
    spawn_requests_.clear();
}

} // namespace rsim::sim
