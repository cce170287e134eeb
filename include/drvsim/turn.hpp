#pragma once
#include <optional>
#include <random>
#include <drvsim/tuning.hpp>

namespace drvsim {

enum class TurnPhase { Straight, TurningLeft, TurningRight };

struct TurnState {
  TurnPhase phase = TurnPhase::Straight;
  double progress = 0.0;          // [0,1], advances only while turning
  double intensity = 0.0;         // [0.3,1.0] once a turn was entered
  double timer = 0.0;             // seconds in the current phase
  double straight_duration = 0.0; // length of the current straight
  std::optional<TurnPhase> last_turn; // direction of the previous turn
};

// Discrete left/right turn scheduler. Cyclic: Straight -> Turning* -> Straight.
class TurnStateMachine {
public:
  TurnStateMachine(const DriveTuning& tuning, std::mt19937& rng);

  void reset();
  void update(double dt);

  // Enter a turn immediately (progress=0) with a fixed intensity.
  void begin_turn(TurnPhase direction, double intensity);

  // Half-cosine ease of progress in [0,1].
  static double ease(double progress);

  // Signed curve contribution: +right / -left, 0 while straight.
  double curve_contribution() const;

  // intensity*progress while turning, else 0.
  double severity() const;

  // +1 right, -1 left, 0 straight
  int direction_sign() const;

  bool turning() const { return state_.phase != TurnPhase::Straight; }
  const TurnState& state() const { return state_; }

private:
  void enter_(TurnPhase phase, double intensity);

  const DriveTuning& tuning_;
  std::mt19937& rng_;
  TurnState state_{};
};

} // namespace drvsim
