#include <drvsim/tuning.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace drvsim {

namespace {

struct DoubleField { const char* key; double DriveTuning::* member; };
struct IntField    { const char* key; int DriveTuning::* member; };

const DoubleField kDoubleFields[] = {
  {"screen_width", &DriveTuning::screen_width}, {"screen_height", &DriveTuning::screen_height},
  {"road_width_px", &DriveTuning::road_width_px},
  {"player_half_width_px", &DriveTuning::player_half_width_px},
  {"curve_to_px", &DriveTuning::curve_to_px},
  {"road_advance_rate", &DriveTuning::road_advance_rate},
  {"freeway_freq", &DriveTuning::freeway_freq},
  {"freeway_amplitude", &DriveTuning::freeway_amplitude},
  {"freeway_variation_mul", &DriveTuning::freeway_variation_mul},
  {"freeway_variation_amp", &DriveTuning::freeway_variation_amp},
  {"freeway_influence_turn", &DriveTuning::freeway_influence_turn},
  {"curve_smoothing", &DriveTuning::curve_smoothing},
  {"straight_curve_decay", &DriveTuning::straight_curve_decay},
  {"width_primary_amp", &DriveTuning::width_primary_amp},
  {"width_secondary_amp", &DriveTuning::width_secondary_amp},
  {"surface_noise_amp", &DriveTuning::surface_noise_amp},
  {"width_primary_freq", &DriveTuning::width_primary_freq},
  {"width_primary_speed_freq", &DriveTuning::width_primary_speed_freq},
  {"width_secondary_freq", &DriveTuning::width_secondary_freq},
  {"width_secondary_speed_freq", &DriveTuning::width_secondary_speed_freq},
  {"width_secondary_freq_mul", &DriveTuning::width_secondary_freq_mul},
  {"surface_noise_freq", &DriveTuning::surface_noise_freq},
  {"surface_noise_speed_freq", &DriveTuning::surface_noise_speed_freq},
  {"shimmer_freq", &DriveTuning::shimmer_freq}, {"shimmer_amp", &DriveTuning::shimmer_amp},
  {"fallback_half_band", &DriveTuning::fallback_half_band},
  {"initial_straight_s", &DriveTuning::initial_straight_s},
  {"straight_min_s", &DriveTuning::straight_min_s},
  {"straight_max_s", &DriveTuning::straight_max_s},
  {"turn_duration_s", &DriveTuning::turn_duration_s},
  {"turn_base_intensity", &DriveTuning::turn_base_intensity},
  {"turn_intensity_var", &DriveTuning::turn_intensity_var},
  {"turn_alternate_prob", &DriveTuning::turn_alternate_prob},
  {"turn_intensity_min", &DriveTuning::turn_intensity_min},
  {"turn_intensity_max", &DriveTuning::turn_intensity_max},
  {"traffic_spawn_interval_s", &DriveTuning::traffic_spawn_interval_s},
  {"traffic_spawn_prob", &DriveTuning::traffic_spawn_prob},
  {"same_direction_prob", &DriveTuning::same_direction_prob},
  {"avoid_player_lane_prob", &DriveTuning::avoid_player_lane_prob},
  {"truck_prob", &DriveTuning::truck_prob}, {"truck_speed_mul", &DriveTuning::truck_speed_mul},
  {"oncoming_base_speed", &DriveTuning::oncoming_base_speed},
  {"ahead_spawn_min_y", &DriveTuning::ahead_spawn_min_y},
  {"ahead_spawn_max_y", &DriveTuning::ahead_spawn_max_y},
  {"ahead_speed_min", &DriveTuning::ahead_speed_min},
  {"ahead_speed_max", &DriveTuning::ahead_speed_max},
  {"behind_spawn_min_y", &DriveTuning::behind_spawn_min_y},
  {"behind_spawn_max_y", &DriveTuning::behind_spawn_max_y},
  {"behind_speed_min", &DriveTuning::behind_speed_min},
  {"behind_speed_max", &DriveTuning::behind_speed_max},
  {"oncoming_spawn_min_y", &DriveTuning::oncoming_spawn_min_y},
  {"oncoming_spawn_max_y", &DriveTuning::oncoming_spawn_max_y},
  {"oncoming_speed_min", &DriveTuning::oncoming_speed_min},
  {"oncoming_speed_max", &DriveTuning::oncoming_speed_max},
  {"speed_jitter_rate", &DriveTuning::speed_jitter_rate},
  {"speed_jitter_rate_oncoming", &DriveTuning::speed_jitter_rate_oncoming},
  {"speed_jitter", &DriveTuning::speed_jitter},
  {"cruise_speed_min", &DriveTuning::cruise_speed_min},
  {"cruise_speed_max", &DriveTuning::cruise_speed_max},
  {"oncoming_cruise_min", &DriveTuning::oncoming_cruise_min},
  {"oncoming_cruise_max", &DriveTuning::oncoming_cruise_max},
  {"despawn_min_y", &DriveTuning::despawn_min_y},
  {"despawn_max_y", &DriveTuning::despawn_max_y},
  {"lane_change_rate_car", &DriveTuning::lane_change_rate_car},
  {"lane_change_rate_truck", &DriveTuning::lane_change_rate_truck},
  {"lane_change_cooldown_car", &DriveTuning::lane_change_cooldown_car},
  {"lane_change_cooldown_truck", &DriveTuning::lane_change_cooldown_truck},
  {"lane_change_speed", &DriveTuning::lane_change_speed},
  {"lane_change_snap", &DriveTuning::lane_change_snap},
  {"lane_safe_gap", &DriveTuning::lane_safe_gap},
  {"lane_safe_gap_merging", &DriveTuning::lane_safe_gap_merging},
  {"lane_safe_dx", &DriveTuning::lane_safe_dx},
  {"lane_player_clearance", &DriveTuning::lane_player_clearance},
  {"direction_margin", &DriveTuning::direction_margin},
  {"follow_min_gap", &DriveTuning::follow_min_gap},
  {"follow_brake_gap", &DriveTuning::follow_brake_gap},
  {"emergency_brake_rate", &DriveTuning::emergency_brake_rate},
  {"emergency_brake_floor", &DriveTuning::emergency_brake_floor},
  {"follow_speed_match", &DriveTuning::follow_speed_match},
  {"stuck_merge_gap_frac", &DriveTuning::stuck_merge_gap_frac},
  {"stuck_merge_rate", &DriveTuning::stuck_merge_rate},
  {"head_on_window", &DriveTuning::head_on_window},
  {"lane_drift_tolerance", &DriveTuning::lane_drift_tolerance},
  {"lane_drift_correction", &DriveTuning::lane_drift_correction},
  {"lane_drift_step", &DriveTuning::lane_drift_step},
  {"car_half_width", &DriveTuning::car_half_width},
  {"zone_spawn_interval_s", &DriveTuning::zone_spawn_interval_s},
  {"zone_first_y", &DriveTuning::zone_first_y},
  {"zone_sign_lead", &DriveTuning::zone_sign_lead},
  {"zone_barrier_min_len", &DriveTuning::zone_barrier_min_len},
  {"zone_single_lane_prob", &DriveTuning::zone_single_lane_prob},
  {"hazard_prune_y", &DriveTuning::hazard_prune_y},
  {"oil_drop_prob", &DriveTuning::oil_drop_prob},
  {"debris_drop_prob", &DriveTuning::debris_drop_prob},
  {"debris_spawn_y", &DriveTuning::debris_spawn_y},
  {"debris_edge_margin", &DriveTuning::debris_edge_margin},
  {"oil_drop_offset", &DriveTuning::oil_drop_offset},
  {"oil_drop_jitter", &DriveTuning::oil_drop_jitter},
  {"oil_slip_strength", &DriveTuning::oil_slip_strength},
  {"oil_slip_duration", &DriveTuning::oil_slip_duration},
  {"puddle_slip_strength", &DriveTuning::puddle_slip_strength},
  {"puddle_slip_duration", &DriveTuning::puddle_slip_duration},
  {"debris_damage", &DriveTuning::debris_damage},
  {"slip_spin_speed_deg", &DriveTuning::slip_spin_speed_deg},
  {"slip_spin_return_deg", &DriveTuning::slip_spin_return_deg},
  {"max_speed", &DriveTuning::max_speed}, {"acceleration", &DriveTuning::acceleration},
  {"deceleration", &DriveTuning::deceleration},
  {"turn_accel_penalty", &DriveTuning::turn_accel_penalty},
  {"turn_decel_increase", &DriveTuning::turn_decel_increase},
  {"min_speed", &DriveTuning::min_speed}, {"steering_rate", &DriveTuning::steering_rate},
  {"steer_off_road_damping", &DriveTuning::steer_off_road_damping},
  {"racing_line_strength", &DriveTuning::racing_line_strength},
  {"racing_line_response", &DriveTuning::racing_line_response},
  {"curve_push", &DriveTuning::curve_push},
  {"max_rotation_deg", &DriveTuning::max_rotation_deg},
  {"rotation_rate_deg", &DriveTuning::rotation_rate_deg},
  {"steer_rotation_share", &DriveTuning::steer_rotation_share},
  {"turn_rotation_share", &DriveTuning::turn_rotation_share},
  {"momentum_build", &DriveTuning::momentum_build},
  {"momentum_response", &DriveTuning::momentum_response},
  {"momentum_push", &DriveTuning::momentum_push},
  {"drift_threshold", &DriveTuning::drift_threshold}, {"drift_gain", &DriveTuning::drift_gain},
  {"drift_decay_turn", &DriveTuning::drift_decay_turn},
  {"drift_decay", &DriveTuning::drift_decay}, {"momentum_decay", &DriveTuning::momentum_decay},
  {"off_road_push", &DriveTuning::off_road_push},
  {"off_road_push_gain", &DriveTuning::off_road_push_gain},
  {"off_road_overshoot", &DriveTuning::off_road_overshoot},
  {"off_road_penalty_rate", &DriveTuning::off_road_penalty_rate},
  {"off_road_penalty_max", &DriveTuning::off_road_penalty_max},
  {"off_road_recovery", &DriveTuning::off_road_recovery},
  {"off_road_timer_recovery", &DriveTuning::off_road_timer_recovery},
  {"off_road_decel", &DriveTuning::off_road_decel}, {"crash_edge", &DriveTuning::crash_edge},
  {"crash_speed", &DriveTuning::crash_speed},
  {"crash_speed_keep", &DriveTuning::crash_speed_keep},
  {"crash_flag_s", &DriveTuning::crash_flag_s},
  {"boost_threshold", &DriveTuning::boost_threshold},
  {"boost_threshold_turn", &DriveTuning::boost_threshold_turn},
  {"player_box_w", &DriveTuning::player_box_w}, {"player_box_h", &DriveTuning::player_box_h},
  {"player_box_top", &DriveTuning::player_box_top}, {"depth_scale", &DriveTuning::depth_scale},
  {"box_height_scale", &DriveTuning::box_height_scale},
  {"traffic_cooldown_s", &DriveTuning::traffic_cooldown_s},
  {"hazard_cooldown_s", &DriveTuning::hazard_cooldown_s},
  {"traffic_flash_s", &DriveTuning::traffic_flash_s},
  {"hazard_flash_s", &DriveTuning::hazard_flash_s},
  {"max_speed_penalty", &DriveTuning::max_speed_penalty},
  {"penalty_recovery_rate", &DriveTuning::penalty_recovery_rate},
  {"traffic_nudge", &DriveTuning::traffic_nudge},
  {"car_hit_penalty", &DriveTuning::car_hit_penalty},
  {"car_hit_damage", &DriveTuning::car_hit_damage},
  {"truck_hit_penalty", &DriveTuning::truck_hit_penalty},
  {"truck_hit_damage", &DriveTuning::truck_hit_damage},
  {"cone_penalty", &DriveTuning::cone_penalty}, {"cone_damage", &DriveTuning::cone_damage},
  {"barrier_penalty", &DriveTuning::barrier_penalty},
  {"barrier_damage", &DriveTuning::barrier_damage},
  {"race_duration_s", &DriveTuning::race_duration_s},
  {"final_lap_s", &DriveTuning::final_lap_s}, {"position_base", &DriveTuning::position_base},
  {"position_speed_scale", &DriveTuning::position_speed_scale},
  {"scroll_rate", &DriveTuning::scroll_rate}, {"score_per_unit", &DriveTuning::score_per_unit},
  {"music_fade_in_s", &DriveTuning::music_fade_in_s},
  {"music_fade_out_s", &DriveTuning::music_fade_out_s},
  {"leave_fade_out_s", &DriveTuning::leave_fade_out_s}, {"max_dt", &DriveTuning::max_dt},
  {"taunt_min_s", &DriveTuning::taunt_min_s}, {"taunt_max_s", &DriveTuning::taunt_max_s},
  {"taunt_show_s", &DriveTuning::taunt_show_s},
};

const IntField kIntFields[] = {
  {"traffic_max_cars", &DriveTuning::traffic_max_cars},
  {"zone_max_active", &DriveTuning::zone_max_active},
  {"zone_min_length", &DriveTuning::zone_min_length},
  {"zone_max_length", &DriveTuning::zone_max_length},
  {"zone_gap_min", &DriveTuning::zone_gap_min}, {"zone_gap_max", &DriveTuning::zone_gap_max},
  {"zone_cone_spacing", &DriveTuning::zone_cone_spacing},
  {"total_racers", &DriveTuning::total_racers},
};

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  std::size_t idx = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &idx);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (idx != s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

bool apply_field(DriveTuning& t, const std::string& key, double value) {
  for (const auto& f : kDoubleFields) {
    if (key == f.key) { t.*(f.member) = value; return true; }
  }
  for (const auto& f : kIntFields) {
    if (key == f.key) { t.*(f.member) = static_cast<int>(std::lround(value)); return true; }
  }
  return false;
}

// Longitudinal positions behind the player
bool may_be_negative(std::string_view key) {
  return key == "despawn_min_y" || key == "hazard_prune_y"
      || key == "behind_spawn_min_y" || key == "behind_spawn_max_y";
}

// Resets a [lo, hi] pair to defaults when it is inverted.
int fix_range(DriveTuning& t, const DriveTuning& d, double DriveTuning::* lo, double DriveTuning::* hi) {
  if (t.*lo <= t.*hi) return 0;
  t.*lo = d.*lo;
  t.*hi = d.*hi;
  return 1;
}

} // namespace

TuningLoad tuning_from_csv_stream(std::istream& in, const DriveTuning& base) {
  TuningLoad out{base, {}};
  std::string line;
  bool header_checked = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto comma = raw.find(',');
    std::string key = trim(raw.substr(0, comma));
    std::string val = comma == std::string::npos ? std::string{} : trim(raw.substr(comma + 1));

    if (!header_checked) {
      header_checked = true;
      if (key == "key") continue;
    }

    const auto v = to_double(val);
    if (key.empty() || !v || !apply_field(out.tuning, key, *v)) {
      out.rejected.push_back(key.empty() ? raw : key);
    }
  }
  return out;
}

std::optional<TuningLoad> load_tuning_csv(const std::string& path, const DriveTuning& base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return tuning_from_csv_stream(f, base);
}

int validate_tuning(DriveTuning& t) {
  const DriveTuning d{};
  int fixed = 0;

  // Rates, sizes and durations must be non-negative
  for (const auto& f : kDoubleFields) {
    const double v = t.*(f.member);
    if (!std::isfinite(v) || (v < 0.0 && !may_be_negative(f.key))) {
      t.*(f.member) = d.*(f.member);
      ++fixed;
    }
  }
  if (t.screen_width < 1.0)  { t.screen_width = d.screen_width; ++fixed; }
  if (t.screen_height < 1.0) { t.screen_height = d.screen_height; ++fixed; }
  if (t.traffic_max_cars < 0) { t.traffic_max_cars = d.traffic_max_cars; ++fixed; }
  if (t.zone_max_active < 0)  { t.zone_max_active = d.zone_max_active; ++fixed; }
  if (t.zone_cone_spacing < 1) { t.zone_cone_spacing = d.zone_cone_spacing; ++fixed; }
  if (t.total_racers < 1)      { t.total_racers = d.total_racers; ++fixed; }

  // Inverted ranges
  fixed += fix_range(t, d, &DriveTuning::straight_min_s, &DriveTuning::straight_max_s);
  if (t.zone_min_length < 1 || t.zone_min_length > t.zone_max_length) {
    t.zone_min_length = d.zone_min_length; t.zone_max_length = d.zone_max_length; ++fixed;
  }
  if (t.zone_gap_min < 0 || t.zone_gap_min > t.zone_gap_max) {
    t.zone_gap_min = d.zone_gap_min; t.zone_gap_max = d.zone_gap_max; ++fixed;
  }
  fixed += fix_range(t, d, &DriveTuning::taunt_min_s, &DriveTuning::taunt_max_s);
  fixed += fix_range(t, d, &DriveTuning::turn_intensity_min, &DriveTuning::turn_intensity_max);
  fixed += fix_range(t, d, &DriveTuning::ahead_spawn_min_y, &DriveTuning::ahead_spawn_max_y);
  fixed += fix_range(t, d, &DriveTuning::ahead_speed_min, &DriveTuning::ahead_speed_max);
  fixed += fix_range(t, d, &DriveTuning::behind_spawn_min_y, &DriveTuning::behind_spawn_max_y);
  fixed += fix_range(t, d, &DriveTuning::behind_speed_min, &DriveTuning::behind_speed_max);
  fixed += fix_range(t, d, &DriveTuning::oncoming_spawn_min_y, &DriveTuning::oncoming_spawn_max_y);
  fixed += fix_range(t, d, &DriveTuning::oncoming_speed_min, &DriveTuning::oncoming_speed_max);
  fixed += fix_range(t, d, &DriveTuning::cruise_speed_min, &DriveTuning::cruise_speed_max);
  fixed += fix_range(t, d, &DriveTuning::oncoming_cruise_min, &DriveTuning::oncoming_cruise_max);
  if (t.despawn_min_y >= t.despawn_max_y) {
    t.despawn_min_y = d.despawn_min_y; t.despawn_max_y = d.despawn_max_y; ++fixed;
  }
  if (t.turn_duration_s <= 0.0) { t.turn_duration_s = d.turn_duration_s; ++fixed; }
  return fixed;
}

} // namespace drvsim
