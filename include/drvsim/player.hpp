#pragma once
#include <drvsim/road.hpp>
#include <drvsim/tuning.hpp>
#include <drvsim/turn.hpp>

namespace drvsim {

// Held controls are level-triggered; the rest fire once per press.
struct DriveInput {
  bool accelerate = false;
  bool steer_left = false;
  bool steer_right = false;
  bool start = false;
  bool pause = false;
  bool quit_to_hub = false;
  bool change_music = false;
};

struct PlayerState {
  double x = 0.5;               // normalized lateral position
  double speed = 0.0;           // [0, max_speed]
  double rotation_deg = 0.0;    // sprite rotation, cosmetic
  double momentum_x = 0.0;
  double drift_factor = 0.0;    // [0,1]
  double off_road_timer = 0.0;
  double off_road_penalty = 0.0; // [0, off_road_penalty_max]
  bool boost = false;
  bool crashed = false;
  double crash_timer = 0.0;     // seconds until `crashed` clears
};

// What the player model reads from the rest of the frame.
struct PlayerContext {
  const TurnStateMachine* turn = nullptr;
  double road_curve = 0.0;
  RoadBounds bounds{};
  double slip_factor = 1.0;
  double collision_speed_penalty = 0.0;
};

class PlayerDriveModel {
public:
  explicit PlayerDriveModel(const DriveTuning& tuning) : tuning_(tuning) {}

  void reset() { state_ = PlayerState{}; }

  // Integrates one frame. Returns true when this frame caused a crash.
  bool update(double dt, const DriveInput& in, const PlayerContext& ctx);

  // Off-road push-back and penalty bookkeeping against the given bounds.
  void enforce_road_bounds(double dt, const RoadBounds& bounds);

  // Edge crash: cuts speed and raises the crash flag. True if it fired.
  bool check_crash();

  bool off_road(const RoadBounds& b) const { return state_.x < b.left || state_.x > b.right; }

  // speed *= factor, factor clamped to [0,1]
  void apply_speed_factor(double factor);

  const PlayerState& state() const { return state_; }
  PlayerState& mutable_state() { return state_; }

private:
  void update_speed_(double dt, const DriveInput& in, const TurnStateMachine* turn);
  void update_steering_(double dt, const DriveInput& in, const PlayerContext& ctx);
  void update_rotation_(double dt, const DriveInput& in, const TurnStateMachine* turn);
  void update_momentum_(double dt, const TurnStateMachine* turn);

  const DriveTuning& tuning_;
  PlayerState state_{};
};

} // namespace drvsim
