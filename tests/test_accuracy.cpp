#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/accuracy.hpp"
#include "sim/weapon.hpp"

#include <algorithm>
#include <cmath>

using namespace rsim;
using namespace rsim::sim;
using Catch::Matchers::WithinAbs;

// ================================================================
// Zeroing
// ================================================================

TEST_CASE("Zeroing angle for a slow round at short range", "[accuracy]") {
    // t = 0.1s, drop = 0.5 * 9.81 * 0.01 = 0.04905m over 10m
    f32 angle = zeroing_angle(10, 100, 9.81f);
    CHECK_THAT(rad_to_deg(angle), WithinAbs(0.2810, 0.0005));
    CHECK_THAT(angle, WithinAbs(std::atan2(0.04905, 10.0), 1e-6));
}

TEST_CASE("Zeroing angle degenerate inputs", "[accuracy]") {
    CHECK(zeroing_angle(0, 100) == 0);
    CHECK(zeroing_angle(-5, 100) == 0);
    CHECK(zeroing_angle(100, 0) == 0);
    CHECK(zeroing_angle(100, -1) == 0);
    CHECK(zeroing_angle(100, 900, 0) == 0);
}

TEST_CASE("Zeroing pitches the shot upward", "[accuracy]") {
    f32 angle = zeroing_angle(200, 400);
    Vector3 dir = shot_direction(Quaternion{}, angle, Quaternion{});
    CHECK(dir.y > 0);
    CHECK_THAT(dir.y, WithinAbs(std::sin(angle), 1e-5));
    CHECK_THAT(dir.length(), WithinAbs(1.0, 1e-5));
}

TEST_CASE("Zero-length directions fall back to forward", "[accuracy]") {
    auto finite = [](const Vector3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    };

    SECTION("Looking along a zero vector") {
        Quaternion q = Quaternion::look_to(Vector3{});
        Vector3 dir = q.rotate(FORWARD_AXIS);
        CHECK(finite(dir));
        CHECK_THAT(dir.x, WithinAbs(0.0, 1e-6));
        CHECK_THAT(dir.y, WithinAbs(0.0, 1e-6));
        CHECK_THAT(dir.z, WithinAbs(-1.0, 1e-6));
    }

    SECTION("Orientation that collapses the forward axis") {
        // Non-unit quaternion mapping (0, 0, -1) onto (0, 0, ~0)
        Quaternion degenerate{0.70710678f, 0, 0, 0};
        REQUIRE(degenerate.rotate(FORWARD_AXIS).length() < NORMALIZE_EPSILON);

        Vector3 dir = shot_direction(degenerate, 0, Quaternion{});
        CHECK(finite(dir));
        CHECK(dir == FORWARD_AXIS);
    }
}

// ================================================================
// Spread and bloom
// ================================================================

TEST_CASE("Hip and aimed weapon spread", "[accuracy]") {
    Weapon w;
    w.spread = 2;
    w.aim_spread_mult = 0.25f;

    CHECK_THAT(weapon_spread(w, false), WithinAbs(2.0, 1e-6));
    CHECK_THAT(weapon_spread(w, true), WithinAbs(0.5, 1e-6));
}

TEST_CASE("Total spread adds bloom", "[accuracy]") {
    AccuracyState acc;
    acc.current_bloom = 1.5f;

    CHECK_THAT(total_spread_degrees(2, acc), WithinAbs(3.5, 1e-6));

    SECTION("Stance modifiers scale the bloom term only") {
        acc.ads_modifier = 0.5f;
        acc.movement_penalty = 1.0f;
        acc.airborne_multiplier = 3.0f;

        CHECK_THAT(total_spread_degrees(2, acc, {true, false, false}),
                   WithinAbs(2.75, 1e-6));
        CHECK_THAT(total_spread_degrees(2, acc, {false, true, false}),
                   WithinAbs(5.0, 1e-6));
        CHECK_THAT(total_spread_degrees(2, acc, {false, false, true}),
                   WithinAbs(6.5, 1e-6));
    }
}

TEST_CASE("Bloom grows per shot and clamps at max", "[accuracy]") {
    AccuracyState acc;
    acc.max_spread = 3;
    acc.bloom_per_shot = 0.5f;

    add_shot_bloom(acc);
    CHECK_THAT(acc.current_bloom, WithinAbs(0.5, 1e-6));

    f32 previous = acc.current_bloom;
    for (int i = 0; i < 20; i++) {
        add_shot_bloom(acc);
        CHECK(acc.current_bloom >= previous);
        CHECK(acc.current_bloom <= acc.max_spread);
        previous = acc.current_bloom;
    }
    CHECK_THAT(acc.current_bloom, WithinAbs(3.0, 1e-6));
}

TEST_CASE("Bloom recovers linearly and stops at zero", "[accuracy]") {
    AccuracyState acc;
    acc.current_bloom = 3;
    acc.recovery_rate = 2;

    recover_bloom(acc, 0.5f);
    CHECK_THAT(acc.current_bloom, WithinAbs(2.0, 1e-6));

    recover_bloom(acc, 10);
    CHECK(acc.current_bloom == 0);
}

TEST_CASE("Center bias keeps sign and pulls toward zero", "[accuracy]") {
    CHECK_THAT(center_bias(0.5f), WithinAbs(0.25, 1e-6));
    CHECK_THAT(center_bias(-0.5f), WithinAbs(-0.25, 1e-6));
    CHECK(center_bias(1) == 1);
    CHECK(center_bias(-1) == -1);
    CHECK(center_bias(0) == 0);
}

TEST_CASE("Spread rotation stays inside the cone", "[accuracy]") {
    SECTION("Zero spread leaves the aim untouched") {
        Vector3 dir = shot_direction(Quaternion{}, 0,
                                     spread_rotation(1, -1, 0));
        CHECK_THAT(dir.x, WithinAbs(0.0, 1e-6));
        CHECK_THAT(dir.y, WithinAbs(0.0, 1e-6));
        CHECK_THAT(dir.z, WithinAbs(-1.0, 1e-6));
    }

    SECTION("A full-scale sample deflects by half the cone") {
        Vector3 dir = shot_direction(Quaternion{}, 0,
                                     spread_rotation(1, 0, 10));
        f32 deflection = std::acos(std::clamp(dot(dir, FORWARD_AXIS), -1.0f, 1.0f));
        CHECK_THAT(rad_to_deg(deflection), WithinAbs(5.0, 0.01));
    }

    SECTION("Half-scale samples deflect by a quarter of the half cone") {
        Vector3 dir = shot_direction(Quaternion{}, 0,
                                     spread_rotation(0, 0.5f, 8));
        f32 deflection = std::acos(std::clamp(dot(dir, FORWARD_AXIS), -1.0f, 1.0f));
        CHECK_THAT(rad_to_deg(deflection), WithinAbs(1.0, 0.01));
    }

    SECTION("Deflection follows the aim orientation") {
        Quaternion aim = Quaternion::look_to({1, 0, 0});
        Vector3 dir = shot_direction(aim, 0, spread_rotation(0, 0, 10));
        CHECK_THAT(dir.x, WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("Seeded spread sampler is deterministic", "[accuracy]") {
    SeededSpreadSampler a(42);
    SeededSpreadSampler b(42);

    for (int i = 0; i < 50; i++) {
        auto [ax, ay] = a.next();
        auto [bx, by] = b.next();
        CHECK(ax == bx);
        CHECK(ay == by);
        CHECK(ax >= -1.0f);
        CHECK(ax <= 1.0f);
        CHECK(ay >= -1.0f);
        CHECK(ay <= 1.0f);
    }

    SeededSpreadSampler c(42);
    auto first = c.next();
    c.next();
    c.reseed(42);
    CHECK(c.next() == first);
}
