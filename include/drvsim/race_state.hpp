#pragma once

namespace drvsim {

enum class GameState { MusicSelect, VehicleSelect, Ready, Racing, GameOver };

inline const char* game_state_name(GameState s) {
  switch (s) {
    case GameState::MusicSelect:   return "music_select";
    case GameState::VehicleSelect: return "vehicle_select";
    case GameState::Ready:         return "ready";
    case GameState::Racing:        return "racing";
    case GameState::GameOver:      return "game_over";
  }
  return "unknown";
}

// Published every racing frame to the race-music collaborator and the HUD.
struct RaceState {
  double speed = 0.0;          // [0,1]
  int position = 1;            // rank, >= 1
  int total_racers = 8;
  double time_remaining = 0.0; // seconds
  bool boost = false;
  bool crash = false;
  bool final_lap = false;
  bool victory = false;
  bool game_over = false;
};

} // namespace drvsim
