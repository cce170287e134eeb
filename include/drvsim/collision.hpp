#pragma once
#include <optional>
#include <string>
#include <drvsim/hazards.hpp>
#include <drvsim/player.hpp>
#include <drvsim/traffic.hpp>
#include <drvsim/tuning.hpp>
#include <drvsim/types.hpp>

namespace drvsim {

struct CollisionPenaltyState {
  double speed_penalty = 0.0;  // [0, max_speed_penalty]
  double cooldown = 0.0;       // seconds until the next hit may register
  double damage = 0.0;         // [0,1]
  double flash_timer = 0.0;
  std::string last_label;
};

enum class HitTarget { Traffic, StaticHazard, DynamicHazard };

struct CollisionHit {
  HitTarget target = HitTarget::Traffic;
  EntityId id = 0;
  std::string label;  // "truck", "car", "cone", "barrier", "slippery_oil_slick", ...
  std::string sound;  // audio cue id
  bool slip = false;
};

// Player vs traffic/hazards. At most one hit per frame; a hit arms a cooldown
// that suppresses all further checks until it elapses.
class CollisionResolver {
public:
  explicit CollisionResolver(const DriveTuning& tuning) : tuning_(tuning) {}

  void reset() { state_ = CollisionPenaltyState{}; }

  // Timers and penalty recovery.
  void tick(double dt);

  // tick(dt), then traffic checks, then hazard checks.
  std::optional<CollisionHit> resolve(double dt, PlayerDriveModel& player,
                                      TrafficAI& traffic, HazardSystem& hazards);

  // Applies a traffic penalty and nudges the car away.
  CollisionHit register_traffic_hit(NpcVehicle& car);

  // Applies the hazard's penalty or effect. No-op (nullopt) if the id is gone.
  std::optional<CollisionHit> apply_hazard_hit(EntityId id, PlayerDriveModel& player,
                                               HazardSystem& hazards);

  CollisionRect player_rect(double player_x) const;
  CollisionRect target_rect(double x, double y, double collision_w_px, double collision_h_px) const;

  const CollisionPenaltyState& state() const { return state_; }

private:
  void add_penalty_(double speed_penalty, double damage);

  const DriveTuning& tuning_;
  CollisionPenaltyState state_{};
};

} // namespace drvsim
