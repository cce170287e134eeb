#pragma once
#include <drvsim/tuning.hpp>

namespace drvsim {

class TurnStateMachine;

// Normalized drivable band for the player (safety margin already applied).
// Invariant: left < right.
struct RoadBounds {
  double left = 0.0;
  double right = 1.0;
};

// Raw road extent used for lane placement (no curve, no player margin).
struct RoadSpan {
  double left = 0.0;
  double right = 1.0;
  double width() const { return right - left; }
  double center() const { return left + width() * 0.5; }
};

struct RoadState {
  double curve = 0.0;             // signed bend strength, +right
  double width_oscillation = 0.0; // px
  double surface_noise = 0.0;     // px
  double speed_shimmer = 0.0;     // cosmetic
  double road_position = 0.0;     // monotonically increasing phase
  RoadBounds bounds{};
};

// Lanes 1-2 run against the player (left half), 3-4 with the player (right half).
inline int lane_direction(int lane) { return lane <= 2 ? -1 : +1; }
inline int other_lane_same_direction(int lane) {
  switch (lane) {
    case 1: return 2;
    case 2: return 1;
    case 3: return 4;
    default: return 3;
  }
}

// Centre of a lane within the given span.
double lane_center_x(int lane, const RoadSpan& span);

// Half of the span owned by a travel direction, shrunk by `margin` on both sides.
RoadSpan direction_half(int direction, const RoadSpan& span, double margin);

// Pixel-space boundary derivation, normalized and guarded against inversion.
RoadBounds derive_bounds(double curve, double total_width_px, const DriveTuning& t);

// Horizontal offset (px) of one road scanline for a given bend. 0 above the horizon.
double scanline_curve_offset(double curve, double screen_y, double horizon_y, double screen_h);

class RoadGeometryModel {
public:
  explicit RoadGeometryModel(const DriveTuning& tuning) : tuning_(tuning) { reset(); }

  void reset() { state_ = RoadState{}; update_bounds_(); }

  // Advance phase by speed and recompute curve, width terms and bounds.
  void update(double dt, double speed, const TurnStateMachine& turn);

  // Current road extent for lane placement.
  RoadSpan lane_span() const;

  // Horizontal curve offset (px) of the scanline at screen_y.
  double curve_offset_at(double screen_y, double horizon_y, double screen_h) const;

  double total_width_px() const;

  const RoadState& state() const { return state_; }
  const RoadBounds& bounds() const { return state_.bounds; }

  // Test and tooling hook: overrides curve and width terms, then re-derives bounds.
  void set_shape(double curve, double width_oscillation, double surface_noise);

private:
  void update_bounds_();

  const DriveTuning& tuning_;
  RoadState state_{};
};

} // namespace drvsim
