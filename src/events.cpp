#include <drvsim/events.hpp>

namespace drvsim {

const char* event_kind_name(DriveEventKind k) {
  switch (k) {
    case DriveEventKind::StateChanged: return "state";
    case DriveEventKind::RaceStarted:  return "race_started";
    case DriveEventKind::RaceEnded:    return "race_ended";
    case DriveEventKind::Crash:        return "crash";
    case DriveEventKind::TrafficHit:   return "traffic_hit";
    case DriveEventKind::HazardHit:    return "hazard_hit";
    case DriveEventKind::SlipStart:    return "slip";
    case DriveEventKind::Taunt:        return "taunt";
  }
  return "unknown";
}

} // namespace drvsim
