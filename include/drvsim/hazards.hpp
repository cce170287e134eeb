#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <drvsim/road.hpp>
#include <drvsim/traffic.hpp>
#include <drvsim/tuning.hpp>
#include <drvsim/types.hpp>

namespace drvsim {

enum class HazardKind {
  Cone,
  Barrier,
  WarningSign,
  OilSlick,
  DebrisTire,
  DebrisMetal,
  DebrisCargo,
  WaterPuddle,
};

const char* hazard_kind_name(HazardKind k);

enum class EffectType { Slip, Damage };

// Present only on dynamic hazards.
struct HazardEffect {
  EffectType type = EffectType::Slip;
  double duration = 0.0;
  double strength = 1.0;
  std::string source;
};

struct Hazard {
  EntityId id = 0;
  double x = 0.5;
  double y = 0.0;
  int lane = -1;              // -1 when free-positioned
  HazardKind kind = HazardKind::Cone;
  double width_px = 16.0;
  double height_px = 24.0;
  double collision_w_px = 16.0;
  double collision_h_px = 24.0;
  Rgb color{};
  std::optional<HazardEffect> effect;

  bool is_dynamic() const { return effect.has_value(); }
  bool collides() const { return collision_w_px > 0.0 && collision_h_px > 0.0; }
};

struct ActiveEffect {
  EffectType kind = EffectType::Slip;
  double remaining = 0.0;
  double strength = 1.0;
};

struct ConstructionZone {
  double start_y = 0.0;
  double end_y = 0.0;
  std::vector<int> lanes;
};

class HazardSystem {
public:
  HazardSystem(const DriveTuning& tuning, std::mt19937& rng);

  void clear();

  // Zone cadence, scrolling with the player and pruning.
  void update(double dt, double player_speed, const RoadSpan& span);

  // Oil from trucks ahead of the player and random debris.
  void update_dynamic_spawning(const std::vector<NpcVehicle>& traffic, const RoadSpan& span);

  // Ages active effects and recomputes slip factor and spin.
  void update_effects(double dt);

  std::optional<ConstructionZone> spawn_construction_zone(const RoadSpan& span);
  EntityId spawn_static(HazardKind kind, double x, double y, int lane);
  EntityId spawn_dynamic(HazardKind kind, double x, double y, const std::string& source);

  // No-op (false) when the id is already gone.
  bool remove(EntityId id);
  const Hazard* find(EntityId id) const;

  void push_effect(const ActiveEffect& e);

  const std::vector<Hazard>& hazards() const { return hazards_; }
  const std::vector<ConstructionZone>& zones() const { return zones_; }
  const std::vector<ActiveEffect>& active_effects() const { return effects_; }
  double slip_factor() const { return slip_factor_; }
  double slip_spin_deg() const { return slip_spin_deg_; }
  double effect_visual_timer() const { return effect_visual_timer_; }

private:
  const DriveTuning& tuning_;
  std::mt19937& rng_;
  std::vector<Hazard> hazards_;
  std::vector<ConstructionZone> zones_;
  std::vector<ActiveEffect> effects_;
  double zone_timer_{0.0};
  double next_zone_y_{0.0};
  double slip_factor_{1.0};
  double slip_spin_deg_{0.0};
  double effect_visual_timer_{0.0};
  EntityId next_id_{1};
};

} // namespace drvsim
