#include <drvsim/collision.hpp>
#include <algorithm>

namespace drvsim {

void CollisionResolver::tick(double dt) {
  if (!(dt > 0.0)) return;
  state_.cooldown = std::max(0.0, state_.cooldown - dt);
  state_.flash_timer = std::max(0.0, state_.flash_timer - dt);
  if (state_.cooldown <= 0.0 && state_.speed_penalty > 0.0) {
    state_.speed_penalty = std::max(0.0, state_.speed_penalty - tuning_.penalty_recovery_rate * dt);
  }
}

CollisionRect CollisionResolver::player_rect(double player_x) const {
  const double half_w = tuning_.player_box_w * 0.5;
  return {player_x - half_w, tuning_.player_box_top,
          player_x + half_w, tuning_.player_box_top + tuning_.player_box_h};
}

CollisionRect CollisionResolver::target_rect(double x, double y, double cw, double ch) const {
  const double w = cw / std::max(1.0, tuning_.screen_width);
  const double h = ch / tuning_.box_height_scale;
  const double sy = 0.5 - y / tuning_.depth_scale;
  return {x - w * 0.5, sy - h * 0.5, x + w * 0.5, sy + h * 0.5};
}

void CollisionResolver::add_penalty_(double speed_penalty, double damage) {
  state_.speed_penalty = std::min(tuning_.max_speed_penalty, state_.speed_penalty + speed_penalty);
  state_.damage = std::clamp(state_.damage + damage, 0.0, 1.0);
}

std::optional<CollisionHit> CollisionResolver::resolve(double dt, PlayerDriveModel& player,
                                                       TrafficAI& traffic, HazardSystem& hazards) {
  tick(dt);
  if (state_.cooldown > 0.0) return std::nullopt;

  const CollisionRect me = player_rect(player.state().x);

  for (const auto& car : traffic.vehicles()) {
    if (me.overlaps(target_rect(car.x, car.y, car.collision_w_px, car.collision_h_px))) {
      NpcVehicle* hit = traffic.find(car.id);
      return register_traffic_hit(*hit);
    }
  }

  for (const auto& h : hazards.hazards()) {
    if (!h.collides()) continue;
    if (me.overlaps(target_rect(h.x, h.y, h.collision_w_px, h.collision_h_px))) {
      const EntityId id = h.id;
      return apply_hazard_hit(id, player, hazards);
    }
  }
  return std::nullopt;
}

CollisionHit CollisionResolver::register_traffic_hit(NpcVehicle& car) {
  CollisionHit hit;
  hit.target = HitTarget::Traffic;
  hit.id = car.id;

  if (car.is_truck()) {
    add_penalty_(tuning_.truck_hit_penalty, tuning_.truck_hit_damage);
    hit.label = "truck";
    hit.sound = "crash_heavy";
  } else {
    add_penalty_(tuning_.car_hit_penalty, tuning_.car_hit_damage);
    hit.label = "car";
    hit.sound = "crash_light";
  }

  state_.cooldown = tuning_.traffic_cooldown_s;
  state_.flash_timer = tuning_.traffic_flash_s;
  state_.last_label = hit.label;

  car.y += car.direction > 0 ? tuning_.traffic_nudge : -tuning_.traffic_nudge;
  return hit;
}

std::optional<CollisionHit> CollisionResolver::apply_hazard_hit(EntityId id, PlayerDriveModel& player,
                                                                HazardSystem& hazards) {
  const Hazard* found = hazards.find(id);
  if (!found) return std::nullopt;
  const Hazard h = *found;

  CollisionHit hit;
  hit.id = id;
  hit.sound = h.kind == HazardKind::Cone ? "cone_hit" : "barrier_hit";

  if (h.effect) {
    hit.target = HitTarget::DynamicHazard;
    if (h.effect->type == EffectType::Slip) {
      hazards.push_effect(ActiveEffect{EffectType::Slip, h.effect->duration, h.effect->strength});
      hit.label = std::string("slippery_") + hazard_kind_name(h.kind);
      hit.slip = true;
    } else {
      state_.damage = std::clamp(state_.damage + h.effect->strength, 0.0, 1.0);
      player.apply_speed_factor(1.0 - h.effect->strength);
      state_.flash_timer = tuning_.traffic_flash_s;
      hit.label = hazard_kind_name(h.kind);
    }
    (void)hazards.remove(id);
  } else {
    hit.target = HitTarget::StaticHazard;
    if (h.kind == HazardKind::Cone) add_penalty_(tuning_.cone_penalty, tuning_.cone_damage);
    else                            add_penalty_(tuning_.barrier_penalty, tuning_.barrier_damage);
    hit.label = hazard_kind_name(h.kind);
    state_.cooldown = tuning_.hazard_cooldown_s;
    state_.flash_timer = tuning_.hazard_flash_s;
    // Barriers stay on the road.
    if (h.kind == HazardKind::Cone) (void)hazards.remove(id);
  }

  state_.last_label = hit.label;
  return hit;
}

} // namespace drvsim
