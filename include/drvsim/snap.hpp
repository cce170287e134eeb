#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <drvsim/collision.hpp>
#include <drvsim/hazards.hpp>
#include <drvsim/player.hpp>
#include <drvsim/race_state.hpp>
#include <drvsim/road.hpp>
#include <drvsim/traffic.hpp>
#include <drvsim/turn.hpp>

namespace drvsim {

// Immutable copy of everything a host needs to draw one frame
struct DriveSnapshot {
  GameState state = GameState::MusicSelect;
  PlayerState player{};
  RoadState road{};
  RoadSpan lane_span{};
  TurnState turn{};
  std::vector<NpcVehicle> traffic;
  std::vector<Hazard> hazards;
  std::vector<ConstructionZone> zones;
  CollisionPenaltyState penalty{};
  double slip_factor = 1.0;
  double slip_spin_deg = 0.0;
  double effect_visual_timer = 0.0;
  std::optional<std::string> taunt;
  RaceState race{};
  std::int64_t score = 0;
  double distance = 0.0;
  double top_speed = 0.0;
  std::string track;
  std::string vehicle;
};

} // namespace drvsim
