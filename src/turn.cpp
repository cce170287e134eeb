#include <drvsim/turn.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace drvsim {

TurnStateMachine::TurnStateMachine(const DriveTuning& tuning, std::mt19937& rng)
  : tuning_(tuning), rng_(rng) {
  reset();
}

void TurnStateMachine::reset() {
  state_ = TurnState{};
  state_.straight_duration = tuning_.initial_straight_s;
}

void TurnStateMachine::enter_(TurnPhase phase, double intensity) {
  state_.phase = phase;
  state_.progress = 0.0;
  state_.timer = 0.0;
  state_.intensity = std::clamp(intensity, tuning_.turn_intensity_min, tuning_.turn_intensity_max);
  if (phase != TurnPhase::Straight) state_.last_turn = phase;
}

void TurnStateMachine::begin_turn(TurnPhase direction, double intensity) {
  if (direction == TurnPhase::Straight) return;
  enter_(direction, intensity);
}

void TurnStateMachine::update(double dt) {
  if (dt <= 0.0) return;
  state_.timer += dt;

  if (state_.phase == TurnPhase::Straight) {
    if (state_.timer < state_.straight_duration) return;

    std::uniform_real_distribution<double> U(0.0, 1.0);
    TurnPhase next;
    if (!state_.last_turn) {
      next = U(rng_) < 0.5 ? TurnPhase::TurningLeft : TurnPhase::TurningRight;
    } else if (U(rng_) < tuning_.turn_alternate_prob) {
      next = *state_.last_turn == TurnPhase::TurningLeft ? TurnPhase::TurningRight
                                                         : TurnPhase::TurningLeft;
    } else {
      next = *state_.last_turn;
    }

    std::uniform_real_distribution<double> jitter(-tuning_.turn_intensity_var,
                                                  +tuning_.turn_intensity_var);
    enter_(next, tuning_.turn_base_intensity + jitter(rng_));
    return;
  }

  const double dur = tuning_.turn_duration_s > 0.0 ? tuning_.turn_duration_s : 1.0;
  state_.progress = std::min(1.0, state_.timer / dur);
  if (state_.progress >= 1.0) {
    state_.phase = TurnPhase::Straight;
    state_.progress = 0.0;
    state_.timer = 0.0;
    std::uniform_real_distribution<double> S(tuning_.straight_min_s, tuning_.straight_max_s);
    state_.straight_duration = S(rng_);
  }
}

double TurnStateMachine::ease(double progress) {
  const double p = std::clamp(progress, 0.0, 1.0);
  return 0.5 * (1.0 - std::cos(p * std::numbers::pi));
}

double TurnStateMachine::curve_contribution() const {
  if (!turning()) return 0.0;
  return direction_sign() * state_.intensity * ease(state_.progress);
}

double TurnStateMachine::severity() const {
  return turning() ? state_.intensity * state_.progress : 0.0;
}

int TurnStateMachine::direction_sign() const {
  switch (state_.phase) {
    case TurnPhase::TurningRight: return +1;
    case TurnPhase::TurningLeft:  return -1;
    default: return 0;
  }
}

} // namespace drvsim
