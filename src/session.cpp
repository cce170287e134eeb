#include <drvsim/session.hpp>
#include <algorithm>
#include <cmath>

namespace drvsim {

DriveSession::DriveSession(const DriveTuning& tuning, std::uint32_t seed,
                           AudioSink* audio, RaceMusicSink* music)
  : tuning_(tuning),
    rng_(seed),
    audio_(audio),
    music_(music),
    turn_(tuning_, rng_),
    road_(tuning_),
    traffic_(tuning_, rng_),
    hazards_(tuning_, rng_),
    player_(tuning_),
    collisions_(tuning_),
    taunts_(tuning_, rng_) {
  race_.total_racers = tuning_.total_racers;
  race_.time_remaining = tuning_.race_duration_s;
}

double DriveSession::sanitize_dt(double dt, double max_dt) {
  if (!std::isfinite(dt) || dt < 0.0) return 0.0;
  return std::min(dt, std::max(0.0, max_dt));
}

void DriveSession::emit_(DriveEventKind kind, const std::string& label, const std::string& sound) {
  events_.push_back(DriveEvent{kind, label, sound});
  if (audio_ && !sound.empty()) audio_->play_sound(sound);
}

void DriveSession::set_state_(GameState s) {
  if (s == state_) return;
  state_ = s;
  emit_(DriveEventKind::StateChanged, game_state_name(s));
}

void DriveSession::enter() {
  exit_requested_ = false;
  set_state_(track_ ? GameState::Ready : GameState::MusicSelect);
}

void DriveSession::leave() {
  if (music_) music_->stop_race_music(tuning_.leave_fade_out_s);
}

void DriveSession::on_music_selector(const SelectorResult& r) {
  if (state_ != GameState::MusicSelect) return;
  switch (r.outcome) {
    case SelectorOutcome::TrackSelected:
      track_ = r.value;
      if (music_) music_->select_track(r.value);
      set_state_(GameState::VehicleSelect);
      break;
    case SelectorOutcome::Cancelled:
      if (track_) set_state_(GameState::Ready);
      else exit_requested_ = true;
      break;
    default:
      break;
  }
}

void DriveSession::on_vehicle_selector(const SelectorResult& r) {
  if (state_ != GameState::VehicleSelect) return;
  switch (r.outcome) {
    case SelectorOutcome::VehicleSelected:
      vehicle_ = r.value;
      set_state_(GameState::Ready);
      break;
    case SelectorOutcome::Cancelled:
      set_state_(GameState::MusicSelect);
      break;
    default:
      break;
  }
}

void DriveSession::start_race() {
  race_ = RaceState{};
  race_.total_racers = tuning_.total_racers;
  race_.position = tuning_.total_racers;  // start at the back
  race_.time_remaining = tuning_.race_duration_s;

  player_.reset();
  road_.reset();
  turn_.reset();
  traffic_.clear();
  hazards_.clear();
  collisions_.reset();
  taunts_.reset();

  elapsed_ = 0.0;
  distance_ = 0.0;
  top_speed_ = 0.0;
  score_ = 0;

  set_state_(GameState::Racing);
  emit_(DriveEventKind::RaceStarted, track_.value_or(""));
  if (music_) music_->start_race_music(tuning_.music_fade_in_s);
}

void DriveSession::end_race() {
  if (state_ != GameState::Racing) return;

  race_.victory = race_.position <= 3;
  race_.game_over = true;
  race_.boost = false;

  set_state_(GameState::GameOver);
  emit_(DriveEventKind::RaceEnded, race_.victory ? "victory" : "finished");

  if (music_) {
    music_->stop_race_music(tuning_.music_fade_out_s);
    if (race_.victory) music_->play_stinger("victory");
  }
}

void DriveSession::restart() {
  if (state_ == GameState::GameOver) set_state_(GameState::Ready);
}

std::optional<RaceResult> DriveSession::result() const {
  if (state_ != GameState::GameOver) return std::nullopt;
  return RaceResult{score_, distance_, top_speed_, race_.position, race_.victory};
}

void DriveSession::update(double dt, const DriveInput& in) {
  events_.clear();
  dt = sanitize_dt(dt, tuning_.max_dt);

  switch (state_) {
    case GameState::MusicSelect:
    case GameState::VehicleSelect:
      // Pickers report through on_music_selector / on_vehicle_selector.
      break;

    case GameState::Ready:
      if (in.start || in.accelerate) start_race();
      else if (in.quit_to_hub) exit_requested_ = true;
      else if (in.change_music) set_state_(GameState::MusicSelect);
      break;

    case GameState::Racing:
      if (in.pause) end_race();
      else if (in.quit_to_hub) { exit_requested_ = true; leave(); }
      else update_racing_(dt, in);
      break;

    case GameState::GameOver:
      if (in.start) restart();
      else if (in.quit_to_hub) exit_requested_ = true;
      else if (in.change_music) set_state_(GameState::MusicSelect);
      break;
  }
}

void DriveSession::record_hit_(const CollisionHit& hit) {
  switch (hit.target) {
    case HitTarget::Traffic:
      emit_(DriveEventKind::TrafficHit, hit.label, hit.sound);
      break;
    case HitTarget::StaticHazard:
      emit_(DriveEventKind::HazardHit, hit.label, hit.sound);
      break;
    case HitTarget::DynamicHazard:
      emit_(hit.slip ? DriveEventKind::SlipStart : DriveEventKind::HazardHit, hit.label, hit.sound);
      break;
  }
}

void DriveSession::update_racing_(double dt, const DriveInput& in) {
  // Input and player physics run against last frame's road and effects.
  PlayerContext pctx;
  pctx.turn = &turn_;
  pctx.road_curve = road_.state().curve;
  pctx.bounds = road_.bounds();
  pctx.slip_factor = hazards_.slip_factor();
  pctx.collision_speed_penalty = collisions_.state().speed_penalty;
  if (player_.update(dt, in, pctx)) emit_(DriveEventKind::Crash, "edge", "collision");

  elapsed_ += dt;
  race_.time_remaining = std::max(0.0, tuning_.race_duration_s - elapsed_);
  if (race_.time_remaining <= tuning_.final_lap_s) race_.final_lap = true;
  if (race_.time_remaining <= 0.0) {
    end_race();
    return;
  }

  const double speed = player_.state().speed;
  turn_.update(dt);
  road_.update(dt, speed, turn_);

  const RoadSpan span = road_.lane_span();
  traffic_.update(dt, TrafficContext{player_.state().x, speed, span});
  hazards_.update(dt, speed, span);
  hazards_.update_dynamic_spawning(traffic_.vehicles(), span);
  hazards_.update_effects(dt);

  if (auto taunt = taunts_.update(dt)) emit_(DriveEventKind::Taunt, *taunt);

  if (auto hit = collisions_.resolve(dt, player_, traffic_, hazards_)) record_hit_(*hit);

  const PlayerState& ps = player_.state();
  const double delta = ps.speed * dt * tuning_.scroll_rate;
  distance_ += delta;
  score_ += static_cast<std::int64_t>(delta * tuning_.score_per_unit);
  top_speed_ = std::max(top_speed_, ps.speed);

  race_.speed = ps.speed;
  const double rank = tuning_.position_base - ps.speed * tuning_.position_speed_scale;
  race_.position = std::clamp(static_cast<int>(rank), 1, std::max(1, race_.total_racers));
  race_.boost = ps.boost;
  race_.crash = ps.crashed;
  if (music_) music_->update_race_state(race_);
}

DriveSnapshot DriveSession::snapshot() const {
  DriveSnapshot s;
  s.state = state_;
  s.player = player_.state();
  s.road = road_.state();
  s.lane_span = road_.lane_span();
  s.turn = turn_.state();
  s.traffic = traffic_.vehicles();
  s.hazards = hazards_.hazards();
  s.zones = hazards_.zones();
  s.penalty = collisions_.state();
  s.slip_factor = hazards_.slip_factor();
  s.slip_spin_deg = hazards_.slip_spin_deg();
  s.effect_visual_timer = hazards_.effect_visual_timer();
  s.taunt = taunts_.current();
  s.race = race_;
  s.score = score_;
  s.distance = distance_;
  s.top_speed = top_speed_;
  s.track = track_.value_or("");
  s.vehicle = vehicle_.value_or("");
  return s;
}

} // namespace drvsim
