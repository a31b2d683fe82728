#pragma once

#include "core/types.hpp"
#include "sim/accuracy.hpp"
#include "sim/combat_events.hpp"
#include "sim/trajectory.hpp"

namespace rsim::sim {

class EntityRegistry;
class ImpactResolver;
class Weapon;

enum class FireState : u8 { Idle, Cooldown, Bursting };

const char* fire_state_name(FireState state);

/// Per-tick input levels and edges for one weapon carrier.
struct TriggerInput {
    bool trigger_held = false;
    bool trigger_just_pressed = false;
    bool reload_requested = false;
    bool aiming = false;
    bool moving = false;
    bool airborne = false;
};

/// Where shots leave from and where their results go.
struct ShotContext {
    EntityId shooter = NO_ENTITY;
    Vector3 muzzle_position;
    Quaternion aim_orientation;
    const BallisticsEnvironment& environment;
    const ImpactResolver& resolver;
    const EntityRegistry& registry;
    SpreadSampler& sampler;
    CombatEventQueue& events;
};

/// Drives one weapon's firing-mode state machine.
///
/// Each update: advance fire/reload timers by dt, handle a reload request,
/// then decide whether a shot is due for the weapon's mode:
///   SemiAuto  - trigger_just_pressed
///   FullAuto  - trigger_held
///   Burst     - a press starts the sequence; queued shots auto-fire on
///               the burst timer until `amount` shots are out
/// A due shot with an empty magazine cancels any burst and does nothing.
/// Bloom recovers only on ticks where the trigger is released and no burst
/// is running.
class FiringController {
public:
    /// Returns true if a shot was fired this tick.
    bool update(f32 dt, const TriggerInput& input, Weapon& weapon,
                AccuracyState& accuracy, ShotContext& ctx);

    FireState state() const { return state_; }
    u64 total_shots() const { return total_shots_; }

    /// Drop any pending burst and return to Idle (weapon switch, stun...).
    void reset(Weapon& weapon);

private:
    bool shot_due(const TriggerInput& input, Weapon& weapon) const;
    void fire(Weapon& weapon, AccuracyState& accuracy,
              const TriggerInput& input, ShotContext& ctx);
    void fire_hitscan(const Weapon& weapon, const Vector3& direction,
                      ShotContext& ctx);
    void spawn_projectile(const Weapon& weapon, const Vector3& direction,
                          ShotContext& ctx);

    FireState state_ = FireState::Idle;
    u64 total_shots_ = 0;
};

} // namespace rsim::sim
