#include <drvsim/player.hpp>
#include <algorithm>
#include <cmath>

namespace drvsim {

namespace {
double turn_severity(const TurnStateMachine* turn) {
  return turn ? turn->severity() : 0.0;
}
int turn_sign(const TurnStateMachine* turn) {
  return turn ? turn->direction_sign() : 0;
}
} // namespace

bool PlayerDriveModel::update(double dt, const DriveInput& in, const PlayerContext& ctx) {
  if (!(dt > 0.0)) return false;

  if (state_.crash_timer > 0.0) {
    state_.crash_timer -= dt;
    if (state_.crash_timer <= 0.0) {
      state_.crash_timer = 0.0;
      state_.crashed = false;
    }
  }

  update_speed_(dt, in, ctx.turn);

  const double penalty = std::clamp(ctx.collision_speed_penalty, 0.0, 1.0);
  state_.speed = std::max(tuning_.min_speed, state_.speed * (1.0 - penalty));

  update_steering_(dt, in, ctx);
  update_rotation_(dt, in, ctx.turn);
  update_momentum_(dt, ctx.turn);
  enforce_road_bounds(dt, ctx.bounds);
  return check_crash();
}

void PlayerDriveModel::update_speed_(double dt, const DriveInput& in, const TurnStateMachine* turn) {
  double accel = tuning_.acceleration;
  double decel = tuning_.deceleration;
  const bool turning = turn && turn->turning();
  if (turning) {
    const double sev = turn_severity(turn);
    accel *= 1.0 - tuning_.turn_accel_penalty * sev;
    decel *= 1.0 + tuning_.turn_decel_increase * sev;
  }

  if (in.accelerate) {
    state_.speed = std::min(tuning_.max_speed, state_.speed + accel * dt);
    const double threshold = turning ? tuning_.boost_threshold_turn : tuning_.boost_threshold;
    if (state_.speed > threshold) state_.boost = true;
  } else {
    state_.speed = std::max(0.0, state_.speed - decel * dt);
    state_.boost = false;
  }
}

void PlayerDriveModel::update_steering_(double dt, const DriveInput& in, const PlayerContext& ctx) {
  const double slip = std::clamp(ctx.slip_factor, 0.0, 1.0);
  const double step = tuning_.steering_rate * dt * (1.0 - state_.off_road_penalty * tuning_.steer_off_road_damping) * slip;

  if (in.steer_left)  state_.x = std::max(0.0, state_.x - step);
  if (in.steer_right) state_.x = std::min(1.0, state_.x + step);

  // Racing line: drift towards the inside of the current turn.
  if (ctx.turn && ctx.turn->turning()) {
    const auto& ts = ctx.turn->state();
    const double offset = -turn_sign(ctx.turn) * ts.intensity * tuning_.racing_line_strength * ts.progress;
    const double target = 0.5 + offset;
    state_.x += (target - state_.x) * tuning_.racing_line_response * dt;
  }

  const double push = ctx.road_curve * state_.speed * dt * tuning_.curve_push;
  state_.x = std::clamp(state_.x + push, 0.0, 1.0);
}

void PlayerDriveModel::update_rotation_(double dt, const DriveInput& in, const TurnStateMachine* turn) {
  const double max_rot = tuning_.max_rotation_deg;

  double target = 0.0;
  if (in.steer_left)       target = -max_rot * tuning_.steer_rotation_share;
  else if (in.steer_right) target = max_rot * tuning_.steer_rotation_share;

  if (turn && turn->turning()) {
    target += turn_sign(turn) * max_rot * tuning_.turn_rotation_share * turn_severity(turn);
  }
  target = std::clamp(target, -max_rot, max_rot);

  const double step = tuning_.rotation_rate_deg * dt;
  const double diff = target - state_.rotation_deg;
  if (std::fabs(diff) > step) state_.rotation_deg += diff > 0.0 ? step : -step;
  else state_.rotation_deg = target;
}

void PlayerDriveModel::update_momentum_(double dt, const TurnStateMachine* turn) {
  if (turn && turn->turning()) {
    const double intensity = turn->state().intensity;
    const double target = turn_sign(turn) * state_.speed * intensity * dt * tuning_.momentum_build;
    state_.momentum_x += (target - state_.momentum_x) * tuning_.momentum_response * dt;

    if (state_.speed > tuning_.drift_threshold) {
      const double over = state_.speed - tuning_.drift_threshold;
      state_.drift_factor = std::min(1.0, over * intensity * tuning_.drift_gain);
    } else {
      state_.drift_factor *= tuning_.drift_decay_turn;
    }
  } else {
    state_.momentum_x *= tuning_.momentum_decay;
    state_.drift_factor *= tuning_.drift_decay;
  }

  state_.x += state_.momentum_x * dt * tuning_.momentum_push;
}

void PlayerDriveModel::enforce_road_bounds(double dt, const RoadBounds& b) {
  if (dt < 0.0) return;

  if (off_road(b)) {
    state_.off_road_timer += dt;

    if (state_.x < b.left) {
      const double strength = std::min(1.0, (b.left - state_.x) * tuning_.off_road_push_gain);
      state_.x += strength * dt * tuning_.off_road_push;
      state_.x = std::min(state_.x, b.left + tuning_.off_road_overshoot);
    } else {
      const double strength = std::min(1.0, (state_.x - b.right) * tuning_.off_road_push_gain);
      state_.x -= strength * dt * tuning_.off_road_push;
      state_.x = std::max(state_.x, b.right - tuning_.off_road_overshoot);
    }

    const double rate = tuning_.off_road_penalty_rate * state_.speed;
    state_.off_road_penalty = std::min(tuning_.off_road_penalty_max, state_.off_road_penalty + rate * dt);
  } else {
    state_.off_road_timer = std::max(0.0, state_.off_road_timer - dt * tuning_.off_road_timer_recovery);
    state_.off_road_penalty = std::max(0.0, state_.off_road_penalty - dt * tuning_.off_road_recovery);
  }

  if (state_.off_road_penalty > 0.0) {
    const double cap = tuning_.max_speed * (1.0 - state_.off_road_penalty);
    if (state_.speed > cap) {
      state_.speed = std::max(cap, state_.speed - tuning_.off_road_decel * dt);
    }
  }
}

bool PlayerDriveModel::check_crash() {
  const double edge = tuning_.crash_edge;
  if ((state_.x < edge || state_.x > 1.0 - edge) && state_.speed > tuning_.crash_speed) {
    state_.speed *= tuning_.crash_speed_keep;
    state_.crashed = true;
    state_.crash_timer = tuning_.crash_flag_s;
    return true;
  }
  return false;
}

void PlayerDriveModel::apply_speed_factor(double factor) {
  state_.speed *= std::clamp(factor, 0.0, 1.0);
}

} // namespace drvsim
