#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <string>

#include <drvsim/hazards.hpp>

using Catch::Approx;
using namespace drvsim;

namespace {
const RoadSpan kSpan{390.0 / 1280.0, 890.0 / 1280.0};

std::size_t count_kind(const HazardSystem& hs, HazardKind k) {
  return static_cast<std::size_t>(std::count_if(hs.hazards().begin(), hs.hazards().end(),
                                                [&](const Hazard& h) { return h.kind == k; }));
}
} // namespace

TEST_CASE("Construction zone layout") {
  DriveTuning t;
  std::mt19937 rng(41);
  HazardSystem hs(t, rng);

  auto zone = hs.spawn_construction_zone(kSpan);
  REQUIRE(zone.has_value());
  REQUIRE(zone->start_y >= 500.0);

  const double length = zone->end_y - zone->start_y;
  REQUIRE(length >= 200.0);
  REQUIRE(length <= 400.0);
  REQUIRE(length == std::floor(length));

  SECTION("lanes are one lane or an adjacent same-direction pair") {
    if (zone->lanes.size() == 1) {
      REQUIRE(zone->lanes[0] >= 1);
      REQUIRE(zone->lanes[0] <= 4);
    } else {
      REQUIRE(zone->lanes.size() == 2);
      REQUIRE(lane_direction(zone->lanes[0]) == lane_direction(zone->lanes[1]));
    }
  }

  SECTION("one warning sign ahead of the cones") {
    REQUIRE(count_kind(hs, HazardKind::WarningSign) == 1);
    for (const auto& h : hs.hazards()) {
      if (h.kind != HazardKind::WarningSign) continue;
      REQUIRE(h.y == Approx(zone->start_y - 100.0));
      REQUIRE(h.x == Approx(0.5));
      REQUIRE_FALSE(h.collides());
    }
  }

  SECTION("cones every 40 units inside the zone, end excluded") {
    const std::size_t per_lane = static_cast<std::size_t>(std::ceil(length / 40.0));
    REQUIRE(count_kind(hs, HazardKind::Cone) == per_lane * zone->lanes.size());
    for (const auto& h : hs.hazards()) {
      if (h.kind != HazardKind::Cone) continue;
      REQUIRE(h.y >= zone->start_y);
      REQUIRE(h.y < zone->end_y);
      REQUIRE(h.x == Approx(lane_center_x(h.lane, kSpan)));
      REQUIRE_FALSE(h.is_dynamic());
    }
  }

  SECTION("barriers only in long zones") {
    const std::size_t expected = length > 300.0 ? zone->lanes.size() : 0;
    REQUIRE(count_kind(hs, HazardKind::Barrier) == expected);
  }
}

TEST_CASE("Zone length on an exact multiple of the spacing") {
  DriveTuning t;
  t.zone_min_length = 240;
  t.zone_max_length = 240;
  std::mt19937 rng(47);
  HazardSystem hs(t, rng);

  auto zone = hs.spawn_construction_zone(kSpan);
  REQUIRE(zone.has_value());
  REQUIRE(zone->end_y - zone->start_y == Approx(240.0));
  REQUIRE(count_kind(hs, HazardKind::Cone) == 6 * zone->lanes.size());
  REQUIRE(count_kind(hs, HazardKind::Barrier) == 0);
}

TEST_CASE("Barrier shape") {
  DriveTuning t;
  std::mt19937 rng(48);
  HazardSystem hs(t, rng);

  const Hazard* b = hs.find(hs.spawn_static(HazardKind::Barrier, 0.5, 100.0, 3));
  REQUIRE(b->width_px == 48.0);
  REQUIRE(b->height_px == 32.0);
  REQUIRE(b->collision_w_px == 48.0);
  REQUIRE(b->collision_h_px == 32.0);
  REQUIRE(b->color.r == 128);
  REQUIRE(b->color.g == 128);
  REQUIRE(b->color.b == 128);
}

TEST_CASE("Zones are spaced and capped") {
  DriveTuning t;
  std::mt19937 rng(42);
  HazardSystem hs(t, rng);

  auto z1 = hs.spawn_construction_zone(kSpan);
  auto z2 = hs.spawn_construction_zone(kSpan);
  REQUIRE(z1.has_value());
  REQUIRE(z2.has_value());

  const double gap = z2->start_y - z1->end_y;
  REQUIRE(gap >= 400.0);
  REQUIRE(gap <= 800.0);

  REQUIRE_FALSE(hs.spawn_construction_zone(kSpan).has_value());
  REQUIRE(hs.zones().size() == 2);
}

TEST_CASE("Zone cadence in update") {
  DriveTuning t;
  std::mt19937 rng(43);
  HazardSystem hs(t, rng);

  hs.update(7.9, 0.0, kSpan);
  REQUIRE(hs.zones().empty());
  hs.update(0.2, 0.0, kSpan);
  REQUIRE(hs.zones().size() == 1);
  REQUIRE_FALSE(hs.hazards().empty());
}

TEST_CASE("A capped zone spawns as soon as a slot frees") {
  DriveTuning t;
  t.zone_max_active = 1;
  std::mt19937 rng(49);
  HazardSystem hs(t, rng);

  REQUIRE(hs.spawn_construction_zone(kSpan).has_value());
  hs.update(8.5, 0.0, kSpan);
  REQUIRE(hs.zones().size() == 1);

  // Scroll the zone past the prune line
  hs.update(0.01, 1300.0, kSpan);
  REQUIRE(hs.zones().empty());

  hs.update(0.01, 0.0, kSpan);
  REQUIRE(hs.zones().size() == 1);
}

TEST_CASE("Hazards scroll with the player and are pruned") {
  DriveTuning t;
  std::mt19937 rng(44);
  HazardSystem hs(t, rng);

  auto cone = hs.spawn_static(HazardKind::Cone, 0.5, 100.0, 3);
  auto old = hs.spawn_static(HazardKind::Cone, 0.5, -290.0, 3);

  hs.update(0.5, 1.0, kSpan);
  REQUIRE(hs.find(cone)->y == Approx(50.0));
  REQUIRE(hs.find(old) == nullptr);
}

TEST_CASE("Remove is idempotent") {
  DriveTuning t;
  std::mt19937 rng(45);
  HazardSystem hs(t, rng);

  auto id = hs.spawn_static(HazardKind::Barrier, 0.4, 200.0, 2);
  REQUIRE(hs.remove(id));
  REQUIRE_FALSE(hs.remove(id));
  REQUIRE(hs.find(id) == nullptr);
  REQUIRE(hs.hazards().empty());
}

TEST_CASE("Dynamic hazards carry their effect") {
  DriveTuning t;
  std::mt19937 rng(46);
  HazardSystem hs(t, rng);

  const Hazard* oil = hs.find(hs.spawn_dynamic(HazardKind::OilSlick, 0.5, 100.0, "truck"));
  REQUIRE(oil->is_dynamic());
  REQUIRE(oil->effect->type == EffectType::Slip);
  REQUIRE(oil->effect->duration == Approx(1.5));
  REQUIRE(oil->effect->strength == Approx(0.3));
  REQUIRE(oil->effect->source == "truck");

  const Hazard* puddle = hs.find(hs.spawn_dynamic(HazardKind::WaterPuddle, 0.5, 100.0, "road"));
  REQUIRE(puddle->effect->duration == Approx(0.8));
  REQUIRE(puddle->effect->strength == Approx(0.7));

  const Hazard* tire = hs.find(hs.spawn_dynamic(HazardKind::DebrisTire, 0.5, 100.0, "road"));
  REQUIRE(tire->effect->type == EffectType::Damage);
  REQUIRE(tire->effect->strength == Approx(0.15));

  const Hazard* cone = hs.find(hs.spawn_dynamic(HazardKind::Cone, 0.5, 100.0, "road"));
  REQUIRE_FALSE(cone->is_dynamic());

  REQUIRE(std::string(hazard_kind_name(HazardKind::OilSlick)) == "oil_slick");
}

TEST_CASE("Dynamic effect values follow the tuning") {
  DriveTuning t;
  t.oil_slip_strength = 0.5;
  t.oil_slip_duration = 2.0;
  t.debris_damage = 0.25;
  std::mt19937 rng(50);
  HazardSystem hs(t, rng);

  const Hazard* oil = hs.find(hs.spawn_dynamic(HazardKind::OilSlick, 0.5, 100.0, "truck"));
  REQUIRE(oil->effect->strength == Approx(0.5));
  REQUIRE(oil->effect->duration == Approx(2.0));

  const Hazard* metal = hs.find(hs.spawn_dynamic(HazardKind::DebrisMetal, 0.5, 100.0, "road"));
  REQUIRE(metal->effect->strength == Approx(0.25));
}

TEST_CASE("Slip effects stack multiplicatively and expire") {
  DriveTuning t;
  std::mt19937 rng(47);
  HazardSystem hs(t, rng);
  REQUIRE(hs.slip_factor() == 1.0);

  hs.push_effect(ActiveEffect{EffectType::Slip, 1.5, 0.3});
  REQUIRE(hs.slip_factor() == Approx(0.3));
  REQUIRE(hs.effect_visual_timer() == Approx(1.5));

  hs.push_effect(ActiveEffect{EffectType::Slip, 0.8, 0.7});
  hs.update_effects(0.1);
  REQUIRE(hs.slip_factor() == Approx(0.21));
  REQUIRE(hs.slip_spin_deg() == Approx(72.0));

  // puddle gone, oil remains
  hs.update_effects(1.0);
  REQUIRE(hs.active_effects().size() == 1);
  REQUIRE(hs.slip_factor() == Approx(0.3));

  hs.update_effects(0.5);
  REQUIRE(hs.active_effects().empty());
  REQUIRE(hs.slip_factor() == 1.0);

  // spin returns to zero once nothing is slipping
  hs.update_effects(1.0);
  REQUIRE(hs.slip_spin_deg() == 0.0);
  REQUIRE(hs.effect_visual_timer() == 0.0);
}

TEST_CASE("Zero-length effects are ignored") {
  DriveTuning t;
  std::mt19937 rng(48);
  HazardSystem hs(t, rng);

  hs.push_effect(ActiveEffect{EffectType::Slip, 0.0, 0.3});
  REQUIRE(hs.active_effects().empty());
  REQUIRE(hs.slip_factor() == 1.0);
}

TEST_CASE("Trucks ahead drop oil, the road drops debris") {
  DriveTuning t;
  std::mt19937 rng(49);

  SECTION("oil only behind trucks ahead of the player") {
    t.oil_drop_prob = 1.0;
    t.debris_drop_prob = 0.0;
    HazardSystem hs(t, rng);

    std::vector<NpcVehicle> traffic;
    traffic.push_back(make_vehicle(VehicleClass::Truck, 3, 0.55, 200.0, 0.7));
    traffic.push_back(make_vehicle(VehicleClass::Truck, 4, 0.65, -10.0, 0.7));
    traffic.push_back(make_vehicle(VehicleClass::Car, 4, 0.65, 200.0, 0.7));

    hs.update_dynamic_spawning(traffic, kSpan);
    REQUIRE(hs.hazards().size() == 1);
    const Hazard& oil = hs.hazards().front();
    REQUIRE(oil.kind == HazardKind::OilSlick);
    REQUIRE(oil.y == Approx(150.0));
    REQUIRE(oil.x >= 0.53);
    REQUIRE(oil.x <= 0.57);
    REQUIRE(oil.effect->source == "truck");
  }

  SECTION("debris spawns far ahead inside the road") {
    t.oil_drop_prob = 0.0;
    t.debris_drop_prob = 1.0;
    HazardSystem hs(t, rng);

    for (int i = 0; i < 20; ++i) hs.update_dynamic_spawning({}, kSpan);
    REQUIRE(hs.hazards().size() == 20);
    for (const auto& h : hs.hazards()) {
      REQUIRE(h.y == Approx(860.0));
      REQUIRE(h.x >= kSpan.left + 0.05);
      REQUIRE(h.x <= kSpan.right - 0.05);
      REQUIRE(h.effect->type == EffectType::Damage);
    }
  }
}
