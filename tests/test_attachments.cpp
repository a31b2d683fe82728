#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/attachments.hpp"
#include "sim/weapon.hpp"

#include <cmath>
#include <set>
#include <string>

using namespace rsim;
using namespace rsim::sim;
using Catch::Matchers::WithinAbs;

static Weapon make_rifle() {
    Weapon w;
    w.label = "Rifle";
    w.damage = 10;
    w.range = 100;
    w.fire_rate = 10;
    w.reload_time = 2;
    w.ammo_capacity = 30;
    w.current_ammo = 30;
    w.spread = 2;
    w.capture_base_stats();
    return w;
}

static AttachmentModifier damage_mod(const char* id, MountPoint mount,
                                     f32 mult, f32 extra) {
    AttachmentModifier m;
    m.id = id;
    m.name = id;
    m.mount = mount;
    m.damage_multiplier = mult;
    m.extra_damage = extra;
    return m;
}

static void check_base_stats(const Weapon& w) {
    CHECK_THAT(w.damage, WithinAbs(w.base_damage, 1e-4));
    CHECK_THAT(w.range, WithinAbs(w.base_range, 1e-4));
    CHECK_THAT(w.fire_rate, WithinAbs(w.base_fire_rate, 1e-4));
    CHECK_THAT(w.reload_time, WithinAbs(w.base_reload_time, 1e-4));
    CHECK_THAT(w.spread, WithinAbs(w.base_spread, 1e-4));
    CHECK(w.ammo_capacity == w.base_ammo_capacity);
}

// ================================================================
// Single modifier
// ================================================================

TEST_CASE("Modifier apply then remove restores the weapon", "[attachments]") {
    Weapon w = make_rifle();

    AttachmentModifier m;
    m.damage_multiplier = 1.1f;
    m.extra_damage = 5;
    m.spread_multiplier = 0.7f;
    m.fire_rate_multiplier = 1.3f;
    m.reload_speed_multiplier = 1.25f;
    m.magazine_size_modifier = 12;
    m.range_multiplier = 1.5f;

    m.apply_to(w);
    CHECK_THAT(w.damage, WithinAbs(16.0, 1e-4));
    CHECK_THAT(w.spread, WithinAbs(1.4, 1e-4));
    CHECK_THAT(w.fire_rate, WithinAbs(13.0, 1e-4));
    CHECK_THAT(w.reload_time, WithinAbs(1.6, 1e-4));
    CHECK(w.ammo_capacity == 42);
    CHECK_THAT(w.range, WithinAbs(150.0, 1e-4));

    m.remove_from(w);
    check_base_stats(w);
}

TEST_CASE("Default modifier is a no-op", "[attachments]") {
    Weapon w = make_rifle();
    AttachmentModifier{}.apply_to(w);
    check_base_stats(w);
}

TEST_CASE("Zero multiplier does not poison the stat", "[attachments]") {
    Weapon w = make_rifle();
    AttachmentModifier m;
    m.damage_multiplier = 0;
    m.extra_damage = 3;
    m.reload_speed_multiplier = 0;

    m.apply_to(w);
    CHECK_THAT(w.damage, WithinAbs(3.0, 1e-6));
    CHECK_THAT(w.reload_time, WithinAbs(2.0, 1e-6));

    m.remove_from(w);
    CHECK(std::isfinite(w.damage));
    CHECK(std::isfinite(w.reload_time));
    CHECK_THAT(w.damage, WithinAbs(0.0, 1e-6));
    CHECK_THAT(w.reload_time, WithinAbs(2.0, 1e-6));
}

// ================================================================
// AttachmentStack
// ================================================================

TEST_CASE("Swapping a mount keeps the remaining modifiers intact",
          "[attachments]") {
    Weapon w = make_rifle();
    AttachmentStack stack;

    auto doubler = damage_mod("doubler", MountPoint::Muzzle, 2, 0);
    auto plus_ten = damage_mod("plus_ten", MountPoint::Magazine, 1, 10);
    auto tripler = damage_mod("tripler", MountPoint::Muzzle, 3, 0);

    stack.select(w, doubler);
    stack.select(w, plus_ten);
    CHECK_THAT(w.damage, WithinAbs(30.0, 1e-4)); // 10 * 2 + 10
    CHECK(stack.active_count() == 2);

    // Replacing the older mount must not scale the newer additive term
    stack.select(w, tripler);
    CHECK_THAT(w.damage, WithinAbs(40.0, 1e-4)); // 10 * 3 + 10
    REQUIRE(stack.active(MountPoint::Muzzle) != nullptr);
    CHECK(stack.active(MountPoint::Muzzle)->id == "tripler");
    CHECK(stack.active_count() == 2);

    SECTION("Clearing the older mount") {
        CHECK(stack.clear(w, MountPoint::Muzzle));
        CHECK_THAT(w.damage, WithinAbs(20.0, 1e-4));
        CHECK(stack.active(MountPoint::Muzzle) == nullptr);
        CHECK(stack.active_count() == 1);
    }

    SECTION("Clearing an empty mount") {
        CHECK_FALSE(stack.clear(w, MountPoint::Underbarrel));
        CHECK_THAT(w.damage, WithinAbs(40.0, 1e-4));
    }

    SECTION("Clearing everything returns to base stats") {
        stack.clear_all(w);
        CHECK(stack.active_count() == 0);
        check_base_stats(w);
    }
}

TEST_CASE("Rebuild matches incremental application", "[attachments]") {
    Weapon w = make_rifle();
    AttachmentStack stack;

    // Churn the stack to accumulate rounding
    for (int i = 0; i < 25; i++) {
        stack.select(w, AttachmentModifier::heavy_barrel());
        stack.select(w, AttachmentModifier::scope(0.9f));
        stack.select(w, AttachmentModifier::silencer());
        stack.select(w, damage_mod("mag", MountPoint::Magazine, 1.05f, 2));
    }

    Weapon incremental = w;
    stack.rebuild(w);

    // A replaced mount keeps its place: muzzle, scope, magazine
    Weapon expected = make_rifle();
    AttachmentModifier::silencer().apply_to(expected);
    AttachmentModifier::scope(0.9f).apply_to(expected);
    damage_mod("mag", MountPoint::Magazine, 1.05f, 2).apply_to(expected);

    CHECK_THAT(w.damage, WithinAbs(expected.damage, 1e-5));
    CHECK_THAT(w.spread, WithinAbs(expected.spread, 1e-5));
    CHECK_THAT(incremental.damage, WithinAbs(expected.damage, 1e-3));
    CHECK_THAT(incremental.spread, WithinAbs(expected.spread, 1e-3));
}

TEST_CASE("Magazine modifiers keep current ammo in bounds", "[attachments]") {
    Weapon w = make_rifle();
    AttachmentStack stack;

    stack.select(w, AttachmentModifier::extended_magazine(15));
    CHECK(w.ammo_capacity == 45);
    CHECK(w.current_ammo == 30); // not refilled
    CHECK_THAT(w.reload_time, WithinAbs(2.0 / 0.9, 1e-4));

    w.current_ammo = 45;
    stack.clear(w, MountPoint::Magazine);
    CHECK(w.ammo_capacity == 30);
    CHECK(w.current_ammo == 30);

    SECTION("Swapping an older mount does not drop loaded rounds") {
        // The magazine is unwound and reapplied around the scope swap
        stack.select(w, AttachmentModifier::scope());
        stack.select(w, AttachmentModifier::extended_magazine(15));
        w.current_ammo = 45;
        stack.select(w, AttachmentModifier::scope(0.5f));
        CHECK(w.ammo_capacity == 45);
        CHECK(w.current_ammo == 45);
    }

    SECTION("Capacity cannot drive ammo negative") {
        AttachmentModifier drum_removed;
        drum_removed.mount = MountPoint::Magazine;
        drum_removed.magazine_size_modifier = -40;
        stack.select(w, drum_removed);
        CHECK(w.current_ammo == 0);
        stack.clear(w, MountPoint::Magazine);
        CHECK(w.ammo_capacity == 30);
        CHECK(w.current_ammo == 0);
    }
}

// ================================================================
// Presets and catalogue
// ================================================================

TEST_CASE("Attachment presets", "[attachments]") {
    Weapon w = make_rifle();

    AttachmentModifier::silencer().apply_to(w);
    CHECK_THAT(w.damage, WithinAbs(9.0, 1e-4));

    w = make_rifle();
    AttachmentModifier::heavy_barrel().apply_to(w);
    CHECK_THAT(w.damage, WithinAbs(11.5, 1e-4));
    CHECK_THAT(w.spread, WithinAbs(2.4, 1e-4));

    w = make_rifle();
    AttachmentModifier::laser_sight().apply_to(w);
    CHECK_THAT(w.spread, WithinAbs(1.4, 1e-4));
    CHECK(AttachmentModifier::laser_sight().mount == MountPoint::Underbarrel);
}

TEST_CASE("Default catalogue covers every mount", "[attachments]") {
    auto catalogue = default_attachment_catalogue();
    std::set<std::string> ids;
    bool mounts[MOUNT_POINT_COUNT] = {};
    for (const auto& m : catalogue) {
        ids.insert(m.id);
        mounts[static_cast<size_t>(m.mount)] = true;
    }
    CHECK(ids.size() == catalogue.size());
    for (bool covered : mounts) CHECK(covered);
}

TEST_CASE("Mount point names parse case-insensitively", "[attachments]") {
    CHECK(parse_mount_point("Scope") == MountPoint::Scope);
    CHECK(parse_mount_point("MUZZLE") == MountPoint::Muzzle);
    CHECK(parse_mount_point("magazine") == MountPoint::Magazine);
    CHECK(parse_mount_point("UnderBarrel") == MountPoint::Underbarrel);
    CHECK_FALSE(parse_mount_point("stock").has_value());
    CHECK(std::string(mount_point_name(MountPoint::Muzzle)) == "Muzzle");
}
