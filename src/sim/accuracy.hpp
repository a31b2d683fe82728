#pragma once

#include "core/types.hpp"
#include "sim/vector_math.hpp"

#include <random>
#include <utility>

namespace rsim::sim {

class Weapon;

constexpr f32 STANDARD_GRAVITY = 9.81f;

/// Dynamic spread ("bloom") for one weapon.
struct AccuracyState {
    f32 current_bloom = 0;      // degrees, kept in [0, max_spread]
    f32 max_spread = 5;
    f32 bloom_per_shot = 0.5f;
    f32 recovery_rate = 2;      // degrees per second while not firing

    // Stance scaling of the bloom contribution (1 / 0 / 1 = no effect)
    f32 ads_modifier = 1;
    f32 movement_penalty = 0;
    f32 airborne_multiplier = 1;
};

struct Stance {
    bool aiming = false;
    bool moving = false;
    bool airborne = false;
};

/// Hip or aimed weapon spread in degrees.
f32 weapon_spread(const Weapon& weapon, bool aiming);

/// weapon_spread + current_bloom (bloom scaled by the stance modifiers).
f32 total_spread_degrees(f32 weapon_spread_deg, const AccuracyState& accuracy,
                         const Stance& stance = {});

/// current_bloom = min(current_bloom + bloom_per_shot, max_spread)
void add_shot_bloom(AccuracyState& accuracy);

/// current_bloom = max(0, current_bloom - recovery_rate * dt)
void recover_bloom(AccuracyState& accuracy, f32 dt);

/// v * |v|: keeps the sign, pulls samples toward zero.
inline f32 center_bias(f32 v) { return v * (v < 0 ? -v : v); }

/// Small-angle spread rotation from two raw samples in [-1, 1].
/// Pitch comes from sample_y, yaw from sample_x; each is center-biased and
/// scaled by half the spread cone.
Quaternion spread_rotation(f32 sample_x, f32 sample_y, f32 spread_deg);

/// Barrel pitch (radians) that puts point of impact on point of aim at
/// `zeroing_distance`. Zero when either distance or speed is not positive.
f32 zeroing_angle(f32 zeroing_distance, f32 projectile_speed,
                  f32 gravity = STANDARD_GRAVITY);

/// base_orientation * zeroing * spread * forward, normalised.
Vector3 shot_direction(const Quaternion& base_orientation, f32 zeroing_rad,
                       const Quaternion& spread);

/// Source of raw spread samples. Replaceable so tests can script shots.
class SpreadSampler {
public:
    virtual ~SpreadSampler() = default;

    /// Two independent values in [-1, 1]. Advances the sampler.
    virtual std::pair<f32, f32> next() = 0;
};

class SeededSpreadSampler : public SpreadSampler {
public:
    explicit SeededSpreadSampler(u32 seed = 1337) : rng_(seed) {}

    std::pair<f32, f32> next() override;
    void reseed(u32 seed) { rng_.seed(seed); }

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<f32> dist_{-1.0f, 1.0f};
};

} // namespace rsim::sim
