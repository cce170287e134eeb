#include <drvsim/road.hpp>
#include <algorithm>
#include <cmath>
#include <drvsim/turn.hpp>

namespace drvsim {

double lane_center_x(int lane, const RoadSpan& span) {
  const double lane_w = span.width() * 0.25;
  if (lane <= 2) {
    const int offset = std::clamp(lane, 1, 2) - 1;
    return span.left + lane_w * (offset + 0.5);
  }
  const int offset = std::clamp(lane, 3, 4) - 3;
  return span.center() + lane_w * (offset + 0.5);
}

RoadSpan direction_half(int direction, const RoadSpan& span, double margin) {
  if (direction > 0) return RoadSpan{span.center() + margin, span.right - margin};
  return RoadSpan{span.left + margin, span.center() - margin};
}

RoadBounds derive_bounds(double curve, double total_width_px, const DriveTuning& t) {
  const double W = t.screen_width > 0.0 ? t.screen_width : 1.0;
  const double half_band = std::clamp(t.fallback_half_band, 0.0, 0.5);

  // Integer pixel math, as the road is drawn
  const double center_px = std::floor(W / 2.0) + std::trunc(curve * t.curve_to_px);
  const double half_w = std::floor(total_width_px / 2.0);
  const double safe_left = center_px - half_w + t.player_half_width_px;
  const double safe_right = center_px + half_w - t.player_half_width_px;

  RoadBounds b{};
  b.left = std::clamp(safe_left / W, 0.0, 1.0);
  b.right = std::clamp(safe_right / W, 0.0, 1.0);

  if (!(b.left < b.right)) {
    double mid = (b.left + b.right) * 0.5;
    if (!std::isfinite(mid)) mid = 0.5;
    mid = std::clamp(mid, half_band, 1.0 - half_band);
    b.left = std::max(0.0, mid - half_band);
    b.right = std::min(1.0, mid + half_band);
    if (!(b.left < b.right)) { b.left = 0.4; b.right = 0.6; }
  }
  return b;
}

void RoadGeometryModel::update(double dt, double speed, const TurnStateMachine& turn) {
  const auto& t = tuning_;
  state_.road_position += speed * dt * t.road_advance_rate;
  const double pos = state_.road_position;

  const double freeway = std::sin(pos * t.freeway_freq) * t.freeway_amplitude;
  const double variation = std::sin(pos * t.freeway_freq * t.freeway_variation_mul)
                         * t.freeway_amplitude * t.freeway_variation_amp;

  // Turns own the bend while active; straights let the previous bend relax.
  double prior;
  double influence;
  if (turn.turning()) {
    prior = turn.curve_contribution();
    influence = t.freeway_influence_turn;
  } else {
    prior = state_.curve * t.straight_curve_decay;
    influence = 1.0;
  }
  state_.curve = prior * t.curve_smoothing
               + (freeway + variation) * influence * (1.0 - t.curve_smoothing);

  const double primary_freq = t.width_primary_freq + speed * t.width_primary_speed_freq;
  const double secondary_freq = t.width_secondary_freq + speed * t.width_secondary_speed_freq;
  state_.width_oscillation = std::sin(pos * primary_freq) * t.width_primary_amp
                           + std::sin(pos * secondary_freq * t.width_secondary_freq_mul)
                             * t.width_secondary_amp;

  const double surface_freq = t.surface_noise_freq + speed * t.surface_noise_speed_freq;
  state_.surface_noise = std::sin(pos * surface_freq) * t.surface_noise_amp;
  state_.speed_shimmer = std::sin(pos * t.shimmer_freq) * speed * t.shimmer_amp;

  update_bounds_();
}

double RoadGeometryModel::total_width_px() const {
  return tuning_.road_width_px + std::trunc(state_.width_oscillation)
                               + std::trunc(state_.surface_noise);
}

void RoadGeometryModel::update_bounds_() {
  state_.bounds = derive_bounds(state_.curve, total_width_px(), tuning_);
}

RoadSpan RoadGeometryModel::lane_span() const {
  const double W = tuning_.screen_width > 0.0 ? tuning_.screen_width : 1.0;
  const double center_px = std::floor(W / 2.0);
  const double half_w = std::floor(std::max(0.0, total_width_px()) / 2.0);
  return RoadSpan{(center_px - half_w) / W, (center_px + half_w) / W};
}

double scanline_curve_offset(double curve, double screen_y, double horizon_y, double screen_h) {
  if (screen_y < horizon_y || screen_h <= horizon_y) return 0.0;

  const double screen_factor = std::clamp((screen_y - horizon_y) / (screen_h - horizon_y), 0.0, 1.0);
  const double distance = 1.0 - screen_factor; // 0 at the player, 1 at the horizon

  const double scanline_curve = std::trunc(curve * 300.0 * distance * distance);
  const double s = (distance - 0.5) * 2.0;
  return scanline_curve + std::trunc(s * s * s * 50.0);
}

double RoadGeometryModel::curve_offset_at(double screen_y, double horizon_y, double screen_h) const {
  return scanline_curve_offset(state_.curve, screen_y, horizon_y, screen_h);
}

void RoadGeometryModel::set_shape(double curve, double width_oscillation, double surface_noise) {
  state_.curve = curve;
  state_.width_oscillation = width_oscillation;
  state_.surface_noise = surface_noise;
  update_bounds_();
}

} // namespace drvsim
