#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace drvsim {

// Every balance constant of the drive simulation in one place.
// Distances on the longitudinal axis are "road units" (roughly pixels at the
// player's depth); x positions are normalized to [0,1] of the screen width.
struct DriveTuning {
  // Logical screen used to normalize pixel-space road math
  double screen_width  = 1280.0;
  double screen_height = 720.0;

  // --- Road geometry ---
  double road_width_px          = 500.0; // 4-lane highway base width
  double player_half_width_px   = 32.0;  // safety margin folded into bounds
  double curve_to_px            = 200.0; // road centre shift per unit of curve
  double road_advance_rate      = 10.0;  // road_position += speed*dt*rate
  double freeway_freq           = 0.01;
  double freeway_amplitude      = 0.3;
  double freeway_variation_mul  = 1.7;   // secondary wave frequency multiplier
  double freeway_variation_amp  = 0.2;   // secondary wave relative amplitude
  double freeway_influence_turn = 0.3;   // freeway weight while turning
  double curve_smoothing        = 0.7;   // curve = curve*k + target*(1-k)
  double straight_curve_decay   = 0.95;
  double width_primary_amp      = 20.0;
  double width_secondary_amp    = 7.5;
  double surface_noise_amp      = 3.75;
  double width_primary_freq     = 0.08;  // + speed * width_primary_speed_freq
  double width_primary_speed_freq   = 0.05;
  double width_secondary_freq       = 0.25;
  double width_secondary_speed_freq = 0.1;
  double width_secondary_freq_mul   = 1.3;
  double surface_noise_freq       = 1.8;
  double surface_noise_speed_freq = 2.0;
  double shimmer_freq           = 3.2;
  double shimmer_amp            = 0.8;
  double fallback_half_band     = 0.1;   // centred band used on inverted bounds

  // --- Turn scheduler ---
  double initial_straight_s   = 15.0;
  double straight_min_s       = 8.0;
  double straight_max_s       = 10.0;
  double turn_duration_s      = 5.0;
  double turn_base_intensity  = 0.6;
  double turn_intensity_var   = 0.2;
  double turn_alternate_prob  = 0.8;
  double turn_intensity_min   = 0.3;
  double turn_intensity_max   = 1.0;

  // --- Traffic ---
  double traffic_spawn_interval_s = 1.5;
  double traffic_spawn_prob       = 0.7;
  int    traffic_max_cars         = 10;
  double same_direction_prob      = 0.7;
  double avoid_player_lane_prob   = 0.6;
  double truck_prob               = 0.15;
  double truck_speed_mul          = 0.85;
  double oncoming_base_speed      = 0.7;
  double ahead_spawn_min_y        = 150.0;  // same direction, in front
  double ahead_spawn_max_y        = 400.0;
  double ahead_speed_min          = 0.4;
  double ahead_speed_max          = 0.9;
  double behind_spawn_min_y       = -150.0; // same direction, behind
  double behind_spawn_max_y       = -50.0;
  double behind_speed_min         = 0.6;
  double behind_speed_max         = 1.2;
  double oncoming_spawn_min_y     = 300.0;
  double oncoming_spawn_max_y     = 600.0;
  double oncoming_speed_min       = 0.5;
  double oncoming_speed_max       = 1.0;
  double speed_jitter_rate          = 0.1;  // chance per second
  double speed_jitter_rate_oncoming = 0.05;
  double speed_jitter               = 0.05;
  double cruise_speed_min         = 0.2;
  double cruise_speed_max         = 1.2;
  double oncoming_cruise_min      = 0.4;
  double oncoming_cruise_max      = 1.0;
  double despawn_min_y            = -250.0;
  double despawn_max_y            = 700.0;
  double lane_change_rate_car     = 0.03; // chance per second
  double lane_change_rate_truck   = 0.01;
  double lane_change_cooldown_car   = 4.0;
  double lane_change_cooldown_truck = 8.0;
  double lane_change_speed        = 0.8;  // normalized x per second
  double lane_change_snap         = 0.05;
  double lane_safe_gap            = 100.0;
  double lane_safe_gap_merging    = 120.0;
  double lane_safe_dx             = 0.08;
  double lane_player_clearance    = 0.15;
  double direction_margin         = 0.02;
  double follow_min_gap           = 60.0;
  double follow_brake_gap         = 120.0;
  double emergency_brake_rate     = 2.0;  // speed lost per second inside follow_min_gap
  double emergency_brake_floor    = 0.1;
  double follow_speed_match       = 0.9;  // never brake below leader speed * this
  double stuck_merge_gap_frac     = 0.7;  // of follow_brake_gap
  double stuck_merge_rate         = 0.02; // chance per second
  double head_on_window           = 50.0;
  double lane_drift_tolerance     = 0.4;  // fraction of a lane width
  double lane_drift_correction    = 0.5;
  double lane_drift_step          = 0.02;
  double car_half_width           = 0.02; // normalized, for boundary clamps

  // --- Hazards ---
  double zone_spawn_interval_s = 8.0;
  int    zone_max_active       = 2;
  int    zone_min_length       = 200;
  int    zone_max_length       = 400;
  double zone_first_y          = 500.0;
  int    zone_gap_min          = 400;
  int    zone_gap_max          = 800;
  double zone_sign_lead        = 100.0;
  int    zone_cone_spacing     = 40;
  double zone_barrier_min_len  = 300.0;
  double zone_single_lane_prob = 0.5;
  double hazard_prune_y        = -300.0;
  double oil_drop_prob         = 0.003; // per truck per frame
  double debris_drop_prob      = 0.002; // per frame
  double debris_spawn_y        = 860.0;
  double debris_edge_margin    = 0.05;
  double oil_drop_offset       = 50.0;  // behind the truck
  double oil_drop_jitter       = 0.02;
  double oil_slip_strength     = 0.3;
  double oil_slip_duration     = 1.5;
  double puddle_slip_strength  = 0.7;
  double puddle_slip_duration  = 0.8;
  double debris_damage         = 0.15;  // also the speed fraction lost
  double slip_spin_speed_deg   = 720.0;
  double slip_spin_return_deg  = 1080.0;

  // --- Player ---
  double max_speed             = 1.0;
  double acceleration          = 0.5;
  double deceleration          = 0.8;
  double turn_accel_penalty    = 0.4;
  double turn_decel_increase   = 0.6;
  double min_speed             = 0.1;
  double steering_rate         = 0.35;
  double steer_off_road_damping = 0.5;
  double racing_line_strength  = 0.04;
  double racing_line_response  = 0.15;
  double curve_push            = 0.04;
  double max_rotation_deg      = 18.0;
  double rotation_rate_deg     = 150.0;
  double steer_rotation_share  = 0.7;
  double turn_rotation_share   = 0.3;
  double momentum_build        = 0.8;
  double momentum_response     = 3.0;
  double momentum_push         = 0.04;
  double drift_threshold       = 0.6;
  double drift_gain            = 2.0;
  double drift_decay_turn      = 0.9;
  double drift_decay           = 0.95;
  double momentum_decay        = 0.85;
  double off_road_push         = 2.0;
  double off_road_push_gain    = 8.0;   // push strength per unit of overshoot
  double off_road_overshoot    = 0.02;
  double off_road_penalty_rate = 1.5;
  double off_road_penalty_max  = 0.6;
  double off_road_recovery     = 0.8;
  double off_road_timer_recovery = 2.0;
  double off_road_decel        = 2.0;
  double crash_edge            = 0.1;
  double crash_speed           = 0.6;
  double crash_speed_keep      = 0.3;
  double crash_flag_s          = 0.5;
  double boost_threshold       = 0.8;
  double boost_threshold_turn  = 0.9;

  // --- Collisions ---
  double player_box_w          = 0.02;
  double player_box_h          = 0.04;
  double player_box_top        = 0.42;
  double depth_scale           = 400.0; // y road units -> normalized screen
  double box_height_scale      = 200.0;
  double traffic_cooldown_s    = 1.0;
  double hazard_cooldown_s     = 0.5;
  double traffic_flash_s       = 0.3;
  double hazard_flash_s        = 0.2;
  double max_speed_penalty     = 0.6;
  double penalty_recovery_rate = 0.5;
  double traffic_nudge         = 50.0;
  double car_hit_penalty       = 0.2;
  double car_hit_damage        = 0.1;
  double truck_hit_penalty     = 0.4;
  double truck_hit_damage      = 0.2;
  double cone_penalty          = 0.1;
  double cone_damage           = 0.05;
  double barrier_penalty       = 0.3;
  double barrier_damage        = 0.15;

  // --- Session ---
  double race_duration_s  = 120.0;
  double final_lap_s      = 10.0;
  int    total_racers     = 8;
  double position_base    = 9.0;  // position = base - speed * scale
  double position_speed_scale = 8.0;
  double scroll_rate      = 100.0; // road units per second at speed 1
  double score_per_unit   = 10.0;
  double music_fade_in_s  = 1.0;
  double music_fade_out_s = 2.0;
  double leave_fade_out_s = 0.5;
  double max_dt           = 0.1;
  double taunt_min_s      = 10.0;
  double taunt_max_s      = 15.0;
  double taunt_show_s     = 3.0;
};

struct TuningLoad {
  DriveTuning tuning;
  std::vector<std::string> rejected; // unknown keys or unparsable rows
};

// Stream-based key,value loader. Accepts an optional "key,value" header row,
// ignores '#' comments and blank lines, trims whitespace. Starts from `base`.
TuningLoad tuning_from_csv_stream(std::istream& in, const DriveTuning& base = {});

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<TuningLoad> load_tuning_csv(const std::string& path, const DriveTuning& base = {});

// Resets out-of-range fields to defaults. Returns how many were corrected.
int validate_tuning(DriveTuning& t);

} // namespace drvsim
