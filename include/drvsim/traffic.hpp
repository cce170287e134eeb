#pragma once
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>
#include <drvsim/road.hpp>
#include <drvsim/tuning.hpp>
#include <drvsim/types.hpp>

namespace drvsim {

enum class VehicleClass { Car, Truck };

struct Cruising {};
struct ChangingLanes { double target_x = 0.0; };

// A lane-change target exists only while changing lanes.
using AiState = std::variant<Cruising, ChangingLanes>;

struct NpcVehicle {
  EntityId id = 0;
  double x = 0.5;          // normalized
  double y = 0.0;          // road units ahead (+) / behind (-) the player
  int lane = 3;            // 1..4
  int direction = +1;      // +1 with the player, -1 oncoming
  double speed = 0.5;
  VehicleClass cls = VehicleClass::Car;
  double width_px = 32.0;
  double height_px = 48.0;
  double collision_w_px = 32.0;
  double collision_h_px = 48.0;
  double lane_change_timer = 0.0;
  AiState ai = Cruising{};
  Rgb color{};
  std::string sprite_name;

  bool changing_lanes() const { return std::holds_alternative<ChangingLanes>(ai); }
  std::optional<double> target_x() const {
    if (const auto* c = std::get_if<ChangingLanes>(&ai)) return c->target_x;
    return std::nullopt;
  }
  bool is_truck() const { return cls == VehicleClass::Truck; }
};

// Fills class-dependent size, collision box, palette and sprite.
// `variant` picks the colour and sprite (wrapped to the palette size).
NpcVehicle make_vehicle(VehicleClass cls, int lane, double x, double y, double speed,
                        unsigned variant = 0);

// What the traffic needs to know about the rest of the world this frame.
struct TrafficContext {
  double player_x = 0.5;
  double player_speed = 0.0;
  RoadSpan span{};
};

class TrafficAI {
public:
  TrafficAI(const DriveTuning& tuning, std::mt19937& rng);

  void clear();

  // Spawn cadence, motion, lane AI, avoidance, boundary enforcement, despawn.
  void update(double dt, const TrafficContext& ctx);

  // Spawns one randomized vehicle regardless of cadence. Returns its id,
  // or nullopt when the cap is reached.
  std::optional<EntityId> spawn(const TrafficContext& ctx);

  // Inserts a prepared vehicle (id is assigned here).
  std::optional<EntityId> add_vehicle(NpcVehicle v);

  bool remove(EntityId id);
  NpcVehicle* find(EntityId id);
  const NpcVehicle* find(EntityId id) const;

  bool is_lane_change_safe(const NpcVehicle& car, int target_lane, const TrafficContext& ctx) const;

  // Clamp into the car's directional half and keep cruising cars near lane centre.
  void enforce_boundaries(NpcVehicle& car, const RoadSpan& span) const;

  const std::vector<NpcVehicle>& vehicles() const { return cars_; }
  std::size_t size() const { return cars_.size(); }

private:
  void move_(NpcVehicle& car, double dt, double player_speed) const;
  void update_ai_(NpcVehicle& car, double dt, const TrafficContext& ctx);
  void avoid_collisions_(std::size_t index, double dt, const TrafficContext& ctx);
  bool try_lane_change_(NpcVehicle& car, int target_lane, const TrafficContext& ctx);
  double roll_();

  const DriveTuning& tuning_;
  std::mt19937& rng_;
  std::vector<NpcVehicle> cars_;
  double spawn_timer_{0.0};
  EntityId next_id_{1};
};

} // namespace drvsim
