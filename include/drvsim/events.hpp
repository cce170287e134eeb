#pragma once
#include <string>
#include <vector>

namespace drvsim {

enum class DriveEventKind {
  StateChanged,
  RaceStarted,
  RaceEnded,
  Crash,
  TrafficHit,
  HazardHit,
  SlipStart,
  Taunt,
};

const char* event_kind_name(DriveEventKind k);

// One feedback record produced during a frame.
struct DriveEvent {
  DriveEventKind kind = DriveEventKind::StateChanged;
  std::string label;
  std::string sound; // empty when silent
};

using EventList = std::vector<DriveEvent>;

} // namespace drvsim
