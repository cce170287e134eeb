#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <drvsim/collaborators.hpp>
#include <drvsim/collision.hpp>
#include <drvsim/events.hpp>
#include <drvsim/hazards.hpp>
#include <drvsim/player.hpp>
#include <drvsim/race_state.hpp>
#include <drvsim/road.hpp>
#include <drvsim/snap.hpp>
#include <drvsim/taunt.hpp>
#include <drvsim/traffic.hpp>
#include <drvsim/tuning.hpp>
#include <drvsim/turn.hpp>

namespace drvsim {

// Read values for an external score submission.
struct RaceResult {
  std::int64_t score = 0;
  double distance_traveled = 0.0;
  double top_speed_reached = 0.0;
  int final_position = 0;
  bool victory = false;
};

// Owns every drive component and steps them once per frame.
// Sinks are optional and not owned.
class DriveSession {
public:
  DriveSession(const DriveTuning& tuning, std::uint32_t seed,
               AudioSink* audio = nullptr, RaceMusicSink* music = nullptr);
  DriveSession(const DriveSession&) = delete;
  DriveSession& operator=(const DriveSession&) = delete;

  // Host enters/leaves the drive scene.
  void enter();
  void leave();

  // Clears last frame's events, sanitizes dt and runs the current state.
  void update(double dt, const DriveInput& in);

  void on_music_selector(const SelectorResult& r);
  void on_vehicle_selector(const SelectorResult& r);

  void start_race();
  void end_race();
  void restart();

  // NaN/negative -> 0, capped at max_dt
  static double sanitize_dt(double dt, double max_dt);

  GameState state() const { return state_; }
  bool exit_requested() const { return exit_requested_; }
  void clear_exit_request() { exit_requested_ = false; }

  const EventList& events() const { return events_; }
  DriveSnapshot snapshot() const;
  std::optional<RaceResult> result() const;

  const RaceState& race_state() const { return race_; }
  std::int64_t score() const { return score_; }
  double distance_traveled() const { return distance_; }
  double top_speed_reached() const { return top_speed_; }
  double elapsed() const { return elapsed_; }
  const std::optional<std::string>& selected_track() const { return track_; }
  const std::optional<std::string>& selected_vehicle() const { return vehicle_; }
  const DriveTuning& tuning() const { return tuning_; }

  PlayerDriveModel& player() { return player_; }
  RoadGeometryModel& road() { return road_; }
  TurnStateMachine& turn() { return turn_; }
  TrafficAI& traffic() { return traffic_; }
  HazardSystem& hazards() { return hazards_; }
  CollisionResolver& collisions() { return collisions_; }
  const TauntTimer& taunts() const { return taunts_; }

private:
  void update_racing_(double dt, const DriveInput& in);
  void set_state_(GameState s);
  void emit_(DriveEventKind kind, const std::string& label, const std::string& sound = {});
  void record_hit_(const CollisionHit& hit);

  DriveTuning tuning_;
  std::mt19937 rng_;
  AudioSink* audio_;
  RaceMusicSink* music_;

  TurnStateMachine turn_;
  RoadGeometryModel road_;
  TrafficAI traffic_;
  HazardSystem hazards_;
  PlayerDriveModel player_;
  CollisionResolver collisions_;
  TauntTimer taunts_;

  GameState state_{GameState::MusicSelect};
  RaceState race_{};
  EventList events_;
  std::optional<std::string> track_;
  std::optional<std::string> vehicle_;
  bool exit_requested_{false};

  double elapsed_{0.0};
  double distance_{0.0};
  double top_speed_{0.0};
  std::int64_t score_{0};
};

} // namespace drvsim
