#include <drvsim/traffic.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>

namespace drvsim {

namespace {

const std::array<const char*, 7> kCarSprites = {
  "sedan_blue", "sedan_red", "sedan_green",
  "suv_silver", "suv_black",
  "compact_yellow", "compact_orange",
};
const std::array<const char*, 4> kTruckSprites = {
  "semi_truck_white", "semi_truck_red",
  "delivery_truck_brown", "pickup_truck_blue",
};

// Same direction: warm colours. Oncoming: cool colours. Trucks: dark.
const std::array<Rgb, 4> kWarm = {{ {255, 0, 0}, {255, 255, 0}, {255, 128, 0}, {0, 255, 0} }};
const std::array<Rgb, 4> kCool = {{ {0, 0, 255}, {0, 255, 255}, {255, 0, 255}, {128, 0, 128} }};
const std::array<Rgb, 6> kDark = {{
  {100, 100, 100}, {80, 80, 80}, {60, 60, 60},
  {120, 80, 40}, {40, 40, 120}, {80, 40, 40},
}};

} // namespace

NpcVehicle make_vehicle(VehicleClass cls, int lane, double x, double y, double speed,
                        unsigned variant) {
  NpcVehicle v;
  v.cls = cls;
  v.lane = std::clamp(lane, 1, 4);
  v.direction = lane_direction(v.lane);
  v.x = x;
  v.y = y;
  v.speed = speed;
  if (cls == VehicleClass::Truck) {
    v.width_px = 40.0;  v.height_px = 80.0;
    v.collision_w_px = 40.0; v.collision_h_px = 80.0;
    v.color = kDark[variant % kDark.size()];
    v.sprite_name = kTruckSprites[variant % kTruckSprites.size()];
  } else {
    v.width_px = 32.0;  v.height_px = 48.0;
    v.collision_w_px = 32.0; v.collision_h_px = 48.0;
    v.color = v.direction > 0 ? kWarm[variant % kWarm.size()] : kCool[variant % kCool.size()];
    v.sprite_name = kCarSprites[variant % kCarSprites.size()];
  }
  return v;
}

TrafficAI::TrafficAI(const DriveTuning& tuning, std::mt19937& rng)
  : tuning_(tuning), rng_(rng) {}

void TrafficAI::clear() {
  cars_.clear();
  spawn_timer_ = 0.0;
}

double TrafficAI::roll_() {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng_);
}

std::optional<EntityId> TrafficAI::add_vehicle(NpcVehicle v) {
  if (static_cast<int>(cars_.size()) >= tuning_.traffic_max_cars) return std::nullopt;
  v.id = next_id_++;
  cars_.push_back(std::move(v));
  return cars_.back().id;
}

std::optional<EntityId> TrafficAI::spawn(const TrafficContext& ctx) {
  if (static_cast<int>(cars_.size()) >= tuning_.traffic_max_cars) return std::nullopt;

  auto uniform = [&](double a, double b) {
    std::uniform_real_distribution<double> U(a, b);
    return U(rng_);
  };

  const int player_lane = ctx.player_x < 0.5 ? 3 : 4;
  int lane;
  double y;
  double speed;

  if (roll_() < tuning_.same_direction_prob) {
    lane = roll_() < 0.5 ? 3 : 4;
    if (roll_() < tuning_.avoid_player_lane_prob && lane == player_lane) lane = 7 - lane;
    if (roll_() < 0.5) {
      y = uniform(tuning_.ahead_spawn_min_y, tuning_.ahead_spawn_max_y);
      speed = uniform(tuning_.ahead_speed_min, tuning_.ahead_speed_max);
    } else {
      y = uniform(tuning_.behind_spawn_min_y, tuning_.behind_spawn_max_y);
      speed = uniform(tuning_.behind_speed_min, tuning_.behind_speed_max);
    }
  } else {
    lane = roll_() < 0.5 ? 1 : 2;
    y = uniform(tuning_.oncoming_spawn_min_y, tuning_.oncoming_spawn_max_y);
    speed = uniform(tuning_.oncoming_speed_min, tuning_.oncoming_speed_max);
  }

  const bool truck = roll_() < tuning_.truck_prob;
  if (truck) speed *= tuning_.truck_speed_mul;

  std::uniform_int_distribution<unsigned> pick(0u, 1023u);
  auto v = make_vehicle(truck ? VehicleClass::Truck : VehicleClass::Car,
                        lane, lane_center_x(lane, ctx.span), y, speed, pick(rng_));
  return add_vehicle(std::move(v));
}

bool TrafficAI::remove(EntityId id) {
  auto it = std::find_if(cars_.begin(), cars_.end(), [&](const NpcVehicle& c){ return c.id == id; });
  if (it == cars_.end()) return false;
  cars_.erase(it);
  return true;
}

NpcVehicle* TrafficAI::find(EntityId id) {
  auto it = std::find_if(cars_.begin(), cars_.end(), [&](const NpcVehicle& c){ return c.id == id; });
  return it == cars_.end() ? nullptr : &*it;
}

const NpcVehicle* TrafficAI::find(EntityId id) const {
  auto it = std::find_if(cars_.begin(), cars_.end(), [&](const NpcVehicle& c){ return c.id == id; });
  return it == cars_.end() ? nullptr : &*it;
}

void TrafficAI::update(double dt, const TrafficContext& ctx) {
  if (dt < 0.0) return;

  spawn_timer_ += dt;
  if (spawn_timer_ > tuning_.traffic_spawn_interval_s &&
      static_cast<int>(cars_.size()) < tuning_.traffic_max_cars) {
    if (roll_() < tuning_.traffic_spawn_prob) (void)spawn(ctx);
    spawn_timer_ = 0.0;
  }

  // Indices stay valid: nothing is added or removed inside this loop.
  for (std::size_t i = 0; i < cars_.size(); ++i) {
    move_(cars_[i], dt, ctx.player_speed);
    update_ai_(cars_[i], dt, ctx);
    avoid_collisions_(i, dt, ctx);
    enforce_boundaries(cars_[i], ctx.span);
  }

  std::erase_if(cars_, [&](const NpcVehicle& c) {
    return c.y < tuning_.despawn_min_y || c.y > tuning_.despawn_max_y;
  });
}

void TrafficAI::move_(NpcVehicle& car, double dt, double player_speed) const {
  if (car.direction > 0) {
    car.y += (car.speed - player_speed) * dt * tuning_.scroll_rate;
  } else {
    // Oncoming traffic always closes in, even with the player stopped.
    car.y -= (tuning_.oncoming_base_speed + player_speed) * dt * tuning_.scroll_rate;
  }
}

bool TrafficAI::try_lane_change_(NpcVehicle& car, int target_lane, const TrafficContext& ctx) {
  if (!is_lane_change_safe(car, target_lane, ctx)) return false;
  car.ai = ChangingLanes{lane_center_x(target_lane, ctx.span)};
  car.lane = target_lane;
  car.lane_change_timer = 0.0;
  return true;
}

void TrafficAI::update_ai_(NpcVehicle& car, double dt, const TrafficContext& ctx) {
  car.lane_change_timer += dt;

  if (car.direction > 0) {
    if (const auto* change = std::get_if<ChangingLanes>(&car.ai)) {
      const double target = change->target_x;
      if (std::fabs(car.x - target) < tuning_.lane_change_snap) {
        car.x = target;
        car.ai = Cruising{};
      } else {
        car.x += (target > car.x ? 1.0 : -1.0) * tuning_.lane_change_speed * dt;
      }
    } else {
      const double rate = car.is_truck() ? tuning_.lane_change_rate_truck : tuning_.lane_change_rate_car;
      const double cooldown = car.is_truck() ? tuning_.lane_change_cooldown_truck
                                             : tuning_.lane_change_cooldown_car;
      if (roll_() < rate * dt && car.lane_change_timer > cooldown) {
        (void)try_lane_change_(car, other_lane_same_direction(car.lane), ctx);
      }
    }
  } else {
    car.ai = Cruising{};
  }

  const double jitter_rate = car.direction < 0 ? tuning_.speed_jitter_rate_oncoming
                                                : tuning_.speed_jitter_rate;
  if (roll_() < jitter_rate * dt) {
    std::uniform_real_distribution<double> dv(-tuning_.speed_jitter, tuning_.speed_jitter);
    if (car.direction > 0) {
      car.speed = std::clamp(car.speed + dv(rng_), tuning_.cruise_speed_min, tuning_.cruise_speed_max);
    } else {
      car.speed = std::clamp(car.speed + dv(rng_), tuning_.oncoming_cruise_min,
                             tuning_.oncoming_cruise_max);
    }
  }
}

bool TrafficAI::is_lane_change_safe(const NpcVehicle& car, int target_lane,
                                    const TrafficContext& ctx) const {
  if (target_lane < 1 || target_lane > 4) return false;
  if (lane_direction(target_lane) != car.direction) return false;

  const double target_x = lane_center_x(target_lane, ctx.span);
  const RoadSpan half = direction_half(car.direction, ctx.span, tuning_.direction_margin);
  if (!(target_x > half.left && target_x < half.right)) return false;

  for (const auto& other : cars_) {
    if (other.id == car.id) continue;
    const double dy = std::fabs(other.y - car.y);
    if (other.lane == target_lane || std::fabs(other.x - target_x) < tuning_.lane_safe_dx) {
      if (dy < tuning_.lane_safe_gap) return false;
    }
    if (const auto t = other.target_x(); t && std::fabs(*t - target_x) < tuning_.lane_safe_dx) {
      if (dy < tuning_.lane_safe_gap_merging) return false;
    }
  }

  if (car.direction > 0 &&
      std::fabs(target_x - ctx.player_x) < tuning_.lane_player_clearance &&
      std::fabs(car.y) < tuning_.lane_safe_gap) {
    return false;
  }
  return true;
}

void TrafficAI::avoid_collisions_(std::size_t index, double dt, const TrafficContext& ctx) {
  const double min_gap = tuning_.follow_min_gap;
  const double brake_gap = tuning_.follow_brake_gap;

  for (std::size_t j = 0; j < cars_.size(); ++j) {
    if (j == index) continue;
    NpcVehicle& car = cars_[index];
    const NpcVehicle& other = cars_[j];

    const int lane_diff = std::abs(car.lane - other.lane);
    if (lane_diff > 1) continue;

    if (car.direction != other.direction) {
      // Head-on: only exact lane matches near the player matter. Each lane has a
      // fixed direction, so this is unreachable for vehicles built by make_vehicle.
      if (car.lane != other.lane) continue;
      const double w = tuning_.head_on_window;
      if (std::fabs(car.y) < w && std::fabs(other.y) < w && !car.changing_lanes()) {
        (void)try_lane_change_(car, other_lane_same_direction(car.lane), ctx);
      }
      continue;
    }

    const double distance = car.direction > 0 ? other.y - car.y : car.y - other.y;
    if (!(distance > 0.0 && distance < brake_gap) || lane_diff != 0) continue;

    if (distance < min_gap) {
      car.speed = std::max(tuning_.emergency_brake_floor,
                           car.speed - tuning_.emergency_brake_rate * dt);
    } else {
      const double speed_diff = car.speed - other.speed;
      if (speed_diff > 0.0) {
        const double brake_force = (1.0 - distance / brake_gap) * speed_diff;
        car.speed = std::max(other.speed * tuning_.follow_speed_match,
                             car.speed - brake_force * dt);
      }
    }

    if (!car.changing_lanes() && distance < brake_gap * tuning_.stuck_merge_gap_frac &&
        roll_() < tuning_.stuck_merge_rate * dt) {
      (void)try_lane_change_(car, other_lane_same_direction(car.lane), ctx);
    }
  }
}

void TrafficAI::enforce_boundaries(NpcVehicle& car, const RoadSpan& span) const {
  const RoadSpan half = direction_half(car.direction, span, tuning_.car_half_width);

  if (car.x < half.left || car.x > half.right) {
    car.x = std::clamp(car.x, half.left, std::max(half.left, half.right));
    car.ai = Cruising{};
  }

  if (!car.changing_lanes()) {
    const double lane_w = span.width() * 0.25;
    const double ideal = lane_center_x(car.lane, span);
    if (std::fabs(car.x - ideal) > lane_w * tuning_.lane_drift_tolerance) {
      car.x += (ideal - car.x) * tuning_.lane_drift_correction * tuning_.lane_drift_step;
    }
  }
}

} // namespace drvsim
