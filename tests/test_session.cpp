#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <drvsim/session.hpp>

using Catch::Approx;
using namespace drvsim;

namespace {

struct RecordingAudio : AudioSink {
  std::vector<std::string> sounds;
  void play_sound(const std::string& id) noexcept override { sounds.push_back(id); }
  void set_music_volume(double) noexcept override {}
  void crossfade(const std::string&, double) noexcept override {}
  void preview(const std::string&) noexcept override {}
  void stop() noexcept override {}
};

struct RecordingMusic : RaceMusicSink {
  std::string track;
  int starts = 0;
  int stops = 0;
  double last_fade_out = 0.0;
  int updates = 0;
  RaceState last_state{};
  std::vector<std::string> stingers;

  void select_track(const std::string& t) noexcept override { track = t; }
  void start_race_music(double) noexcept override { ++starts; }
  void stop_race_music(double fade) noexcept override { ++stops; last_fade_out = fade; }
  void update_race_state(const RaceState& rs) noexcept override { ++updates; last_state = rs; }
  void play_stinger(const std::string& name) noexcept override { stingers.push_back(name); }
};

bool has_event(const DriveSession& s, DriveEventKind k, const std::string& label = {}) {
  return std::any_of(s.events().begin(), s.events().end(), [&](const DriveEvent& e) {
    return e.kind == k && (label.empty() || e.label == label);
  });
}

// No traffic, hazards or taunts: a clean straight for deterministic races.
DriveTuning quiet_race(double duration) {
  DriveTuning t;
  t.race_duration_s = duration;
  t.traffic_spawn_prob = 0.0;
  t.oil_drop_prob = 0.0;
  t.debris_drop_prob = 0.0;
  t.zone_spawn_interval_s = 1000.0;
  return t;
}

DriveInput pressed_start() { DriveInput in; in.start = true; return in; }
DriveInput held_throttle() { DriveInput in; in.accelerate = true; return in; }

} // namespace

TEST_CASE("sanitize_dt clamps bad frame times") {
  REQUIRE(DriveSession::sanitize_dt(0.016, 0.1) == Approx(0.016));
  REQUIRE(DriveSession::sanitize_dt(0.5, 0.1) == Approx(0.1));
  REQUIRE(DriveSession::sanitize_dt(-1.0, 0.1) == 0.0);
  REQUIRE(DriveSession::sanitize_dt(std::numeric_limits<double>::quiet_NaN(), 0.1) == 0.0);
  REQUIRE(DriveSession::sanitize_dt(std::numeric_limits<double>::infinity(), 0.1) == 0.0);
}

TEST_CASE("Picker flow into a race") {
  DriveTuning t;
  RecordingAudio audio;
  RecordingMusic music;
  DriveSession s(t, 7, &audio, &music);

  REQUIRE(s.state() == GameState::MusicSelect);
  s.enter();
  REQUIRE(s.state() == GameState::MusicSelect);

  s.on_music_selector({SelectorOutcome::TrackSelected, "highway_dreams"});
  REQUIRE(s.state() == GameState::VehicleSelect);
  REQUIRE(music.track == "highway_dreams");

  SECTION("cancelling the vehicle picker goes back to music") {
    s.on_vehicle_selector({SelectorOutcome::Cancelled, ""});
    REQUIRE(s.state() == GameState::MusicSelect);

    // a track is already chosen, so cancel lands on the ready screen
    s.on_music_selector({SelectorOutcome::Cancelled, ""});
    REQUIRE(s.state() == GameState::Ready);
    REQUIRE_FALSE(s.exit_requested());
  }

  SECTION("choosing a vehicle and starting") {
    s.on_vehicle_selector({SelectorOutcome::VehicleSelected, "kids_drawing"});
    REQUIRE(s.state() == GameState::Ready);
    REQUIRE(s.selected_vehicle() == std::optional<std::string>("kids_drawing"));

    s.update(0.016, pressed_start());
    REQUIRE(s.state() == GameState::Racing);
    REQUIRE(has_event(s, DriveEventKind::StateChanged, "racing"));
    REQUIRE(has_event(s, DriveEventKind::RaceStarted, "highway_dreams"));
    REQUIRE(music.starts == 1);
    REQUIRE(s.race_state().position == 8);
    REQUIRE(s.race_state().time_remaining == Approx(t.race_duration_s));
    REQUIRE_FALSE(s.result().has_value());
  }

  SECTION("selector results for another state are ignored") {
    s.on_music_selector({SelectorOutcome::TrackSelected, "turbo_rush"});
    REQUIRE(s.state() == GameState::VehicleSelect);
    REQUIRE(music.track == "highway_dreams");
  }
}

TEST_CASE("Cancelling the first music pick asks to leave") {
  DriveTuning t;
  DriveSession s(t, 8);
  s.enter();
  s.on_music_selector({SelectorOutcome::Cancelled, ""});
  REQUIRE(s.exit_requested());
  REQUIRE(s.state() == GameState::MusicSelect);

  s.clear_exit_request();
  REQUIRE_FALSE(s.exit_requested());
}

TEST_CASE("Ready screen controls") {
  DriveTuning t;
  DriveSession s(t, 9);
  s.on_music_selector({SelectorOutcome::TrackSelected, "sunset_cruise"});
  s.on_vehicle_selector({SelectorOutcome::VehicleSelected, "professional"});
  REQUIRE(s.state() == GameState::Ready);

  SECTION("change music") {
    DriveInput in;
    in.change_music = true;
    s.update(0.016, in);
    REQUIRE(s.state() == GameState::MusicSelect);
  }

  SECTION("quit to hub") {
    DriveInput in;
    in.quit_to_hub = true;
    s.update(0.016, in);
    REQUIRE(s.exit_requested());
  }

  SECTION("throttle also starts") {
    s.update(0.016, held_throttle());
    REQUIRE(s.state() == GameState::Racing);
  }

  SECTION("re-entering with a track skips the pickers") {
    s.enter();
    REQUIRE(s.state() == GameState::Ready);
  }
}

TEST_CASE("A clean race at full throttle ends in victory") {
  DriveTuning t = quiet_race(5.0);
  RecordingMusic music;
  DriveSession s(t, 10, nullptr, &music);
  s.start_race();

  bool ended_this_frame = false;
  for (int i = 0; i < 200 && s.state() == GameState::Racing; ++i) {
    s.update(0.05, held_throttle());
    ended_this_frame = has_event(s, DriveEventKind::RaceEnded);
  }

  REQUIRE(s.state() == GameState::GameOver);
  REQUIRE(ended_this_frame);
  REQUIRE(has_event(s, DriveEventKind::RaceEnded, "victory"));
  REQUIRE(s.elapsed() == Approx(5.0).margin(0.06));

  auto r = s.result();
  REQUIRE(r.has_value());
  REQUIRE(r->victory);
  REQUIRE(r->final_position == 1);
  REQUIRE(r->score > 0);
  REQUIRE(r->distance_traveled > 0.0);
  REQUIRE(r->top_speed_reached == Approx(1.0));
  REQUIRE(r->score == s.score());

  REQUIRE(s.race_state().final_lap);
  REQUIRE(s.race_state().game_over);
  REQUIRE(music.stops == 1);
  REQUIRE(music.last_fade_out == Approx(2.0));
  REQUIRE(music.stingers == std::vector<std::string>{"victory"});
  REQUIRE(music.updates > 0);
  REQUIRE(music.last_state.position == 1);
}

TEST_CASE("Pausing ends the race without a win") {
  DriveTuning t;
  RecordingMusic music;
  DriveSession s(t, 11, nullptr, &music);
  s.start_race();

  DriveInput pause;
  pause.pause = true;
  s.update(0.016, pause);

  REQUIRE(s.state() == GameState::GameOver);
  REQUIRE(has_event(s, DriveEventKind::RaceEnded, "finished"));
  auto r = s.result();
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r->victory);
  REQUIRE(r->final_position == 8);
  REQUIRE(music.stingers.empty());

  // End of race is idempotent
  s.end_race();
  REQUIRE(music.stops == 1);
}

TEST_CASE("Game over screen restarts with fresh totals") {
  DriveTuning t = quiet_race(30.0);
  DriveSession s(t, 12);
  s.start_race();
  for (int i = 0; i < 40; ++i) s.update(0.05, held_throttle());
  REQUIRE(s.score() > 0);
  s.end_race();

  s.update(0.016, pressed_start());
  REQUIRE(s.state() == GameState::Ready);
  REQUIRE_FALSE(s.result().has_value());

  s.update(0.016, held_throttle());
  REQUIRE(s.state() == GameState::Racing);
  REQUIRE(s.score() == 0);
  REQUIRE(s.distance_traveled() == 0.0);
  REQUIRE(s.elapsed() == 0.0);
  REQUIRE(s.player().state().speed == 0.0);
}

TEST_CASE("Quitting mid-race asks to leave and fades the music") {
  DriveTuning t;
  RecordingMusic music;
  DriveSession s(t, 13, nullptr, &music);
  s.start_race();

  DriveInput quit;
  quit.quit_to_hub = true;
  s.update(0.016, quit);
  REQUIRE(s.exit_requested());
  REQUIRE(music.stops == 1);
  REQUIRE(music.last_fade_out == Approx(0.5));
}

TEST_CASE("Edge crash reaches the event list and audio") {
  DriveTuning t = quiet_race(60.0);
  RecordingAudio audio;
  DriveSession s(t, 14, &audio);
  s.start_race();

  s.player().mutable_state().x = 0.05;
  s.player().mutable_state().speed = 0.8;
  s.update(0.016, DriveInput{});

  REQUIRE(has_event(s, DriveEventKind::Crash, "edge"));
  REQUIRE(std::find(audio.sounds.begin(), audio.sounds.end(), "collision") != audio.sounds.end());
  REQUIRE(s.race_state().crash);
  REQUIRE(s.snapshot().player.crashed);
}

TEST_CASE("Hazard hits during a race") {
  DriveTuning t = quiet_race(60.0);
  RecordingAudio audio;
  DriveSession s(t, 15, &audio);
  s.start_race();

  // Player sits still on a cone
  (void)s.hazards().spawn_static(HazardKind::Cone, 0.5, 20.0, 3);
  s.update(0.016, DriveInput{});

  REQUIRE(has_event(s, DriveEventKind::HazardHit, "cone"));
  REQUIRE(std::find(audio.sounds.begin(), audio.sounds.end(), "cone_hit") != audio.sounds.end());
  REQUIRE(s.collisions().state().damage == Approx(0.05));

  // Penalty feeds the next frame's speed
  REQUIRE(s.snapshot().penalty.speed_penalty > 0.0);
}

TEST_CASE("Bad frame times do not advance the race") {
  DriveTuning t = quiet_race(60.0);
  DriveSession s(t, 16);
  s.start_race();

  s.update(std::numeric_limits<double>::quiet_NaN(), held_throttle());
  REQUIRE(s.elapsed() == 0.0);
  s.update(-0.5, held_throttle());
  REQUIRE(s.elapsed() == 0.0);
  s.update(5.0, held_throttle());
  REQUIRE(s.elapsed() == Approx(t.max_dt));
}

TEST_CASE("Snapshot mirrors the session") {
  DriveTuning t;
  DriveSession s(t, 17);
  s.on_music_selector({SelectorOutcome::TrackSelected, "turbo_rush"});
  s.on_vehicle_selector({SelectorOutcome::VehicleSelected, "professional"});
  s.update(0.016, pressed_start());
  for (int i = 0; i < 200; ++i) s.update(0.016, held_throttle());

  const DriveSnapshot snap = s.snapshot();
  REQUIRE(snap.state == GameState::Racing);
  REQUIRE(snap.track == "turbo_rush");
  REQUIRE(snap.vehicle == "professional");
  REQUIRE(snap.race.total_racers == 8);
  REQUIRE(snap.traffic.size() == s.traffic().size());
  REQUIRE(snap.hazards.size() == s.hazards().hazards().size());
  REQUIRE(snap.score == s.score());
  REQUIRE(snap.road.bounds.left < snap.road.bounds.right);
  REQUIRE(snap.race.position >= 1);
  REQUIRE(snap.race.position <= 8);
}

TEST_CASE("DriveSession is deterministic with same seed") {
  DriveTuning t;
  DriveSession a(t, 42), b(t, 42);
  a.start_race();
  b.start_race();

  for (int i = 0; i < 60 * 30; ++i) {
    DriveInput in;
    in.accelerate = true;
    in.steer_left = (i / 90) % 3 == 0;
    in.steer_right = (i / 90) % 3 == 2;
    a.update(1.0 / 60.0, in);
    b.update(1.0 / 60.0, in);
  }

  REQUIRE(a.score() == b.score());
  REQUIRE(a.player().state().x == b.player().state().x);
  REQUIRE(a.traffic().size() == b.traffic().size());
  REQUIRE(a.hazards().hazards().size() == b.hazards().hazards().size());
  REQUIRE(a.collisions().state().damage == b.collisions().state().damage);
}

TEST_CASE("event_kind_name") {
  REQUIRE(std::string(event_kind_name(DriveEventKind::TrafficHit)) == "traffic_hit");
  REQUIRE(std::string(event_kind_name(DriveEventKind::SlipStart)) == "slip");
  REQUIRE(std::string(game_state_name(GameState::GameOver)) == "game_over");
}

TEST_CASE("Audio sinks cannot throw into the session") {
  STATIC_REQUIRE(noexcept(std::declval<AudioSink&>().play_sound(std::declval<const std::string&>())));
  STATIC_REQUIRE(noexcept(std::declval<AudioSink&>().crossfade(std::declval<const std::string&>(), 1.0)));
  STATIC_REQUIRE(noexcept(std::declval<AudioSink&>().stop()));
  STATIC_REQUIRE(noexcept(std::declval<RaceMusicSink&>().start_race_music(1.0)));
  STATIC_REQUIRE(noexcept(std::declval<RaceMusicSink&>().update_race_state(std::declval<const RaceState&>())));
  STATIC_REQUIRE(noexcept(std::declval<RaceMusicSink&>().play_stinger(std::declval<const std::string&>())));
}
