#pragma once
#include <string>
#include <drvsim/race_state.hpp>

namespace drvsim {

// Sound/music output. Implementations must tolerate missing assets and never
// throw into the simulation.
class AudioSink {
public:
  virtual ~AudioSink() = default;
  virtual void play_sound(const std::string& id) noexcept = 0;
  virtual void set_music_volume(double v) noexcept = 0;
  virtual void crossfade(const std::string& track, double duration_s) noexcept = 0;
  virtual void preview(const std::string& track) noexcept = 0;
  virtual void stop() noexcept = 0;
};

// Speed-reactive race music (pitch, ducking and stingers live behind this).
class RaceMusicSink {
public:
  virtual ~RaceMusicSink() = default;
  virtual void select_track(const std::string& track) noexcept = 0;
  virtual void start_race_music(double fade_in_s) noexcept = 0;
  virtual void stop_race_music(double fade_out_s) noexcept = 0;
  virtual void update_race_state(const RaceState& rs) noexcept = 0;
  virtual void play_stinger(const std::string& name) noexcept = 0;
};

// Completion signal of the music and vehicle pickers.
enum class SelectorOutcome { None, TrackSelected, VehicleSelected, Cancelled };

struct SelectorResult {
  SelectorOutcome outcome = SelectorOutcome::None;
  std::string value; // track or vehicle id
};

} // namespace drvsim
