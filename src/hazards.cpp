#include <drvsim/hazards.hpp>
#include <algorithm>
#include <cmath>

namespace drvsim {

namespace {

struct KindInfo {
  double w, h;     // drawn size (px)
  double cw, ch;   // collision box (px), zero for decoration
  Rgb color;
};

KindInfo kind_info(HazardKind k) {
  switch (k) {
    case HazardKind::Cone:        return {16, 24, 16, 24, {255, 140, 0}};
    case HazardKind::Barrier:     return {48, 32, 48, 32, {128, 128, 128}};
    case HazardKind::WarningSign: return {32, 32, 0, 0, {255, 200, 0}};
    case HazardKind::OilSlick:    return {64, 32, 60, 28, {20, 20, 20}};
    case HazardKind::DebrisTire:  return {24, 24, 24, 24, {30, 30, 30}};
    case HazardKind::DebrisMetal: return {24, 24, 24, 24, {150, 150, 160}};
    case HazardKind::DebrisCargo: return {24, 24, 24, 24, {139, 90, 43}};
    case HazardKind::WaterPuddle: return {48, 24, 44, 20, {70, 110, 200}};
  }
  return {16, 24, 16, 24, {255, 255, 255}};
}

bool is_debris(HazardKind k) {
  return k == HazardKind::DebrisTire || k == HazardKind::DebrisMetal || k == HazardKind::DebrisCargo;
}

} // namespace

const char* hazard_kind_name(HazardKind k) {
  switch (k) {
    case HazardKind::Cone:        return "cone";
    case HazardKind::Barrier:     return "barrier";
    case HazardKind::WarningSign: return "warning_sign";
    case HazardKind::OilSlick:    return "oil_slick";
    case HazardKind::DebrisTire:  return "debris_tire";
    case HazardKind::DebrisMetal: return "debris_metal";
    case HazardKind::DebrisCargo: return "debris_cargo";
    case HazardKind::WaterPuddle: return "water_puddle";
  }
  return "unknown";
}

HazardSystem::HazardSystem(const DriveTuning& tuning, std::mt19937& rng)
  : tuning_(tuning), rng_(rng) {}

void HazardSystem::clear() {
  hazards_.clear();
  zones_.clear();
  effects_.clear();
  zone_timer_ = 0.0;
  next_zone_y_ = 0.0;
  slip_factor_ = 1.0;
  slip_spin_deg_ = 0.0;
  effect_visual_timer_ = 0.0;
}

void HazardSystem::update(double dt, double player_speed, const RoadSpan& span) {
  if (dt < 0.0) return;

  // A capped zone keeps the timer running so the next one appears as soon as a slot frees.
  zone_timer_ += dt;
  if (zone_timer_ > tuning_.zone_spawn_interval_s && spawn_construction_zone(span)) {
    zone_timer_ = 0.0;
  }

  const double scroll = player_speed * dt * tuning_.scroll_rate;
  for (auto& h : hazards_) h.y -= scroll;
  for (auto& z : zones_) { z.start_y -= scroll; z.end_y -= scroll; }
  next_zone_y_ -= scroll;

  const double prune = tuning_.hazard_prune_y;
  std::erase_if(hazards_, [&](const Hazard& h) { return h.y < prune; });
  std::erase_if(zones_, [&](const ConstructionZone& z) { return z.end_y < prune; });
}

std::optional<ConstructionZone> HazardSystem::spawn_construction_zone(const RoadSpan& span) {
  if (static_cast<int>(zones_.size()) >= tuning_.zone_max_active) return std::nullopt;

  std::uniform_int_distribution<int> len(tuning_.zone_min_length, tuning_.zone_max_length);
  std::uniform_int_distribution<int> gap(tuning_.zone_gap_min, tuning_.zone_gap_max);
  std::uniform_real_distribution<double> U(0.0, 1.0);

  ConstructionZone zone;
  zone.start_y = std::max(next_zone_y_, tuning_.zone_first_y);
  const int length = len(rng_);
  zone.end_y = zone.start_y + length;

  if (U(rng_) < tuning_.zone_single_lane_prob) {
    std::uniform_int_distribution<int> lane(1, 4);
    zone.lanes = {lane(rng_)};
  } else if (U(rng_) < 0.5) {
    zone.lanes = {1, 2};
  } else {
    zone.lanes = {3, 4};
  }

  (void)spawn_static(HazardKind::WarningSign, 0.5, zone.start_y - tuning_.zone_sign_lead, 0);

  for (int lane : zone.lanes) {
    const double x = lane_center_x(lane, span);
    for (int offset = 0; offset < length; offset += tuning_.zone_cone_spacing) {
      (void)spawn_static(HazardKind::Cone, x, zone.start_y + offset, lane);
    }
    if (length > tuning_.zone_barrier_min_len) {
      (void)spawn_static(HazardKind::Barrier, x, zone.start_y + length * 0.5, lane);
    }
  }

  next_zone_y_ = zone.end_y + gap(rng_);
  zones_.push_back(zone);
  return zone;
}

EntityId HazardSystem::spawn_static(HazardKind kind, double x, double y, int lane) {
  const KindInfo info = kind_info(kind);
  Hazard h;
  h.id = next_id_++;
  h.x = x;
  h.y = y;
  h.lane = lane;
  h.kind = kind;
  h.width_px = info.w;
  h.height_px = info.h;
  h.collision_w_px = info.cw;
  h.collision_h_px = info.ch;
  h.color = info.color;
  hazards_.push_back(h);
  return h.id;
}

EntityId HazardSystem::spawn_dynamic(HazardKind kind, double x, double y, const std::string& source) {
  const EntityId id = spawn_static(kind, x, y, -1);
  Hazard& h = hazards_.back();

  if (kind == HazardKind::OilSlick) {
    h.effect = HazardEffect{EffectType::Slip, tuning_.oil_slip_duration,
                            tuning_.oil_slip_strength, source};
  } else if (kind == HazardKind::WaterPuddle) {
    h.effect = HazardEffect{EffectType::Slip, tuning_.puddle_slip_duration,
                            tuning_.puddle_slip_strength, source};
  } else if (is_debris(kind)) {
    h.effect = HazardEffect{EffectType::Damage, 0.0, tuning_.debris_damage, source};
  } else {
    // Cones, barriers and signs carry no effect.
    h.effect.reset();
  }
  return id;
}

void HazardSystem::update_dynamic_spawning(const std::vector<NpcVehicle>& traffic, const RoadSpan& span) {
  std::uniform_real_distribution<double> U(0.0, 1.0);

  for (const auto& car : traffic) {
    if (!car.is_truck() || car.y <= 0.0) continue;
    if (U(rng_) < tuning_.oil_drop_prob) {
      std::uniform_real_distribution<double> jitter(-tuning_.oil_drop_jitter, tuning_.oil_drop_jitter);
      (void)spawn_dynamic(HazardKind::OilSlick, car.x + jitter(rng_),
                          car.y - tuning_.oil_drop_offset, "truck");
    }
  }

  if (U(rng_) < tuning_.debris_drop_prob) {
    const double m = tuning_.debris_edge_margin;
    const double lo = span.left + m;
    const double hi = std::max(lo, span.right - m);
    std::uniform_real_distribution<double> xs(lo, hi);
    std::uniform_int_distribution<int> pick(0, 2);
    const HazardKind kinds[] = {HazardKind::DebrisTire, HazardKind::DebrisMetal, HazardKind::DebrisCargo};
    (void)spawn_dynamic(kinds[pick(rng_)], xs(rng_), tuning_.debris_spawn_y, "road");
  }
}

void HazardSystem::update_effects(double dt) {
  if (dt < 0.0) return;

  for (auto& e : effects_) e.remaining -= dt;
  std::erase_if(effects_, [](const ActiveEffect& e) { return e.remaining <= 0.0; });

  slip_factor_ = 1.0;
  bool slipping = false;
  for (const auto& e : effects_) {
    if (e.kind != EffectType::Slip) continue;
    slip_factor_ *= std::clamp(e.strength, 0.0, 1.0);
    slipping = true;
  }

  if (slipping) {
    slip_spin_deg_ += tuning_.slip_spin_speed_deg * dt;
    if (slip_spin_deg_ >= 360.0) slip_spin_deg_ -= 360.0;
  } else if (slip_spin_deg_ > 0.0) {
    slip_spin_deg_ = std::max(0.0, slip_spin_deg_ - tuning_.slip_spin_return_deg * dt);
  }

  if (effect_visual_timer_ > 0.0) effect_visual_timer_ = std::max(0.0, effect_visual_timer_ - dt);
}

void HazardSystem::push_effect(const ActiveEffect& e) {
  if (!(e.remaining > 0.0)) return;
  effects_.push_back(e);
  if (e.kind == EffectType::Slip) {
    slip_factor_ *= std::clamp(e.strength, 0.0, 1.0);
    effect_visual_timer_ = std::max(effect_visual_timer_, e.remaining);
  }
}

bool HazardSystem::remove(EntityId id) {
  auto it = std::find_if(hazards_.begin(), hazards_.end(), [&](const Hazard& h){ return h.id == id; });
  if (it == hazards_.end()) return false;
  hazards_.erase(it);
  return true;
}

const Hazard* HazardSystem::find(EntityId id) const {
  auto it = std::find_if(hazards_.begin(), hazards_.end(), [&](const Hazard& h){ return h.id == id; });
  return it == hazards_.end() ? nullptr : &*it;
}

} // namespace drvsim
