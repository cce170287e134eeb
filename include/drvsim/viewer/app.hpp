#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <drvsim/session.hpp>
#include <drvsim/snap.hpp>
#include <drvsim/tuning.hpp>

namespace drvsim {

class RaylibAudio;

// RAII application: window, input mapping, pickers, pseudo-3D road and HUD.
class ViewerApp {
public:
  ViewerApp(const DriveTuning& tuning, std::uint32_t seed, std::string assets_dir);
  ~ViewerApp();
  ViewerApp(const ViewerApp&) = delete;
  ViewerApp& operator=(const ViewerApp&) = delete;

  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  DriveInput read_input_() const;
  bool process_pickers_(); // true when a picker consumed this frame's keys
  void log_events_();
  // Rendering
  void render_frame_(const DriveSnapshot& s);
  void draw_road_(const DriveSnapshot& s);
  void draw_traffic_(const DriveSnapshot& s);
  void draw_hazards_(const DriveSnapshot& s);
  void draw_player_(const DriveSnapshot& s);
  void draw_hud_(const DriveSnapshot& s);
  void draw_picker_(const char* title, const std::vector<std::string>& items, int selected);
  void draw_ready_(const DriveSnapshot& s);
  void draw_game_over_(const DriveSnapshot& s);

  // Normalized x / road-unit y -> screen pixels
  struct Vec2f { float x; float y; };
  Vec2f to_screen_(double x, double y, double curve) const;

  std::unique_ptr<RaylibAudio> audio_;
  DriveSession session_;

  std::vector<std::string> tracks_;
  std::vector<std::string> vehicles_;
  int track_idx_{0};
  int vehicle_idx_{0};
  bool muted_{false};
};

} // namespace drvsim
