#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

#include <drvsim/viewer/app.hpp>
#include <drvsim/collaborators.hpp>
#include <drvsim/events.hpp>

namespace drvsim {

// Sound effects and race music through raylib audio. Missing files are
// logged once and then played as silence.
class RaylibAudio : public AudioSink, public RaceMusicSink {
public:
  explicit RaylibAudio(std::string assets_dir) : dir_(std::move(assets_dir)) {}
  ~RaylibAudio() override { unload(); }

  void unload() {
    if (!IsAudioDeviceReady()) return;
    for (auto& kv : sounds_) {
      if (kv.second.frameCount > 0) UnloadSound(kv.second);
    }
    sounds_.clear();
    unload_music_();
  }

  void pump() {
    if (music_loaded_) UpdateMusicStream(music_);
  }

  // AudioSink
  void play_sound(const std::string& id) noexcept override {
    if (!IsAudioDeviceReady()) return;
    auto it = sounds_.find(id);
    if (it == sounds_.end()) {
      const std::string path = dir_ + "/sfx/" + id + ".wav";
      Sound snd{};
      if (FileExists(path.c_str())) snd = LoadSound(path.c_str());
      else TraceLog(LOG_WARNING, "audio: missing %s", path.c_str());
      it = sounds_.emplace(id, snd).first;
    }
    if (it->second.frameCount > 0) PlaySound(it->second);
  }

  void set_music_volume(double v) noexcept override {
    volume_ = static_cast<float>(std::clamp(v, 0.0, 1.0));
    if (music_loaded_) SetMusicVolume(music_, volume_);
  }

  void crossfade(const std::string& track, double) noexcept override {
    load_music_(track);
    if (music_loaded_) PlayMusicStream(music_);
  }

  void preview(const std::string& track) noexcept override { crossfade(track, 0.0); }

  void stop() noexcept override {
    if (music_loaded_) StopMusicStream(music_);
  }

  // RaceMusicSink
  void select_track(const std::string& track) noexcept override { track_ = track; }

  void start_race_music(double fade_in_s) noexcept override {
    TraceLog(LOG_INFO, "music: start '%s' (fade %.1fs)", track_.c_str(), fade_in_s);
    crossfade(track_, fade_in_s);
  }

  void stop_race_music(double fade_out_s) noexcept override {
    TraceLog(LOG_INFO, "music: stop (fade %.1fs)", fade_out_s);
    stop();
  }

  void update_race_state(const RaceState& rs) noexcept override {
    if (!music_loaded_) return;
    SetMusicPitch(music_, static_cast<float>(0.95 + rs.speed * 0.15));
    SetMusicVolume(music_, rs.crash ? volume_ * 0.5f : volume_);
  }

  void play_stinger(const std::string& name) noexcept override { play_sound("stinger_" + name); }

private:
  void load_music_(const std::string& track) {
    if (!IsAudioDeviceReady() || track.empty()) return;
    if (music_loaded_ && track == loaded_track_) return;
    unload_music_();
    const std::string path = dir_ + "/music/" + track + ".ogg";
    if (!FileExists(path.c_str())) {
      TraceLog(LOG_WARNING, "audio: missing %s", path.c_str());
      return;
    }
    music_ = LoadMusicStream(path.c_str());
    music_loaded_ = music_.frameCount > 0;
    if (music_loaded_) {
      loaded_track_ = track;
      SetMusicVolume(music_, volume_);
    }
  }

  void unload_music_() {
    if (!music_loaded_) return;
    StopMusicStream(music_);
    UnloadMusicStream(music_);
    music_loaded_ = false;
    loaded_track_.clear();
  }

  std::string dir_;
  std::unordered_map<std::string, Sound> sounds_;
  Music music_{};
  bool music_loaded_{false};
  std::string track_;
  std::string loaded_track_;
  float volume_{0.7f};
};

namespace {

// --- Screen layout ---
static constexpr int kW = 1280;
static constexpr int kH = 720;
static constexpr int kHorizon = kH / 2;
static constexpr int kStripe = 4; // scanline band height (px)

static Color to_color(const Rgb& c, unsigned char a = 255) {
  return Color{c.r, c.g, c.b, a};
}

static const char* state_label(GameState s) {
  switch (s) {
    case GameState::MusicSelect:   return "Select music";
    case GameState::VehicleSelect: return "Select vehicle";
    case GameState::Ready:         return "Ready";
    case GameState::Racing:        return "Racing";
    case GameState::GameOver:      return "Game over";
  }
  return "";
}

// Depth factor for a road-unit y: 1 at the player, 0 at the horizon.
static double depth_scale(double y) {
  const double d = std::clamp(y / 700.0, -0.3, 1.0);
  return 1.0 - d;
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const DriveTuning& tuning, std::uint32_t seed, std::string assets_dir)
  : audio_(std::make_unique<RaylibAudio>(std::move(assets_dir))),
    session_(tuning, seed, audio_.get(), audio_.get()),
    tracks_{"highway_dreams", "sunset_cruise", "turbo_rush"},
    vehicles_{"professional", "kids_drawing"} {}

ViewerApp::~ViewerApp() = default;

ViewerApp::Vec2f ViewerApp::to_screen_(double x, double y, double curve) const {
  const double depth = depth_scale(y);
  const float sy = static_cast<float>(kHorizon + (kH - kHorizon) * depth * 0.83);
  const double offset = scanline_curve_offset(curve, sy, kHorizon, kH);
  const float sx = static_cast<float>(kW * 0.5 + (x - 0.5) * kW * depth + offset);
  return { sx, sy };
}

int ViewerApp::run() {
  SetTraceLogLevel(LOG_INFO);
  InitWindow(kW, kH, "drvsim - Drive");
  InitAudioDevice();
  SetTargetFPS(60);
  SetExitKey(KEY_NULL); // Esc is a game key

  session_.enter();
  log_events_();

  while (!WindowShouldClose() && !session_.exit_requested()) {
    DriveInput in = read_input_();
    if (process_pickers_()) in = DriveInput{};
    if (IsKeyPressed(KEY_N)) {
      muted_ = !muted_;
      audio_->set_music_volume(muted_ ? 0.0 : 0.7);
    }
    session_.update(GetFrameTime(), in);
    log_events_();
    audio_->pump();
    render_frame_(session_.snapshot());
  }

  session_.leave();
  audio_->unload();
  CloseAudioDevice();
  CloseWindow();
  return 0;
}

DriveInput ViewerApp::read_input_() const {
  DriveInput in;
  in.accelerate   = IsKeyDown(KEY_UP) || IsKeyDown(KEY_W);
  in.steer_left   = IsKeyDown(KEY_LEFT) || IsKeyDown(KEY_A);
  in.steer_right  = IsKeyDown(KEY_RIGHT) || IsKeyDown(KEY_D);
  in.start        = IsKeyPressed(KEY_SPACE);
  in.pause        = session_.state() == GameState::Racing && IsKeyPressed(KEY_ESCAPE);
  in.quit_to_hub  = IsKeyPressed(KEY_Q) ||
                    (session_.state() != GameState::Racing && IsKeyPressed(KEY_ESCAPE));
  in.change_music = IsKeyPressed(KEY_M);
  return in;
}

bool ViewerApp::process_pickers_() {
  const GameState st = session_.state();
  if (st != GameState::MusicSelect && st != GameState::VehicleSelect) return false;

  const bool music = st == GameState::MusicSelect;
  auto& items = music ? tracks_ : vehicles_;
  int& idx = music ? track_idx_ : vehicle_idx_;
  const int n = static_cast<int>(items.size());

  if (IsKeyPressed(KEY_UP) || IsKeyPressed(KEY_LEFT))    idx = (idx + n - 1) % n;
  if (IsKeyPressed(KEY_DOWN) || IsKeyPressed(KEY_RIGHT)) idx = (idx + 1) % n;
  if (music && IsKeyPressed(KEY_P)) audio_->preview(items[idx]);

  SelectorResult r;
  if (IsKeyPressed(KEY_ENTER)) {
    r.outcome = music ? SelectorOutcome::TrackSelected : SelectorOutcome::VehicleSelected;
    r.value = items[idx];
  } else if (IsKeyPressed(KEY_ESCAPE)) {
    r.outcome = SelectorOutcome::Cancelled;
  }
  if (r.outcome == SelectorOutcome::None) return false;

  if (music) {
    audio_->stop();
    session_.on_music_selector(r);
  } else {
    session_.on_vehicle_selector(r);
  }
  log_events_();
  return true;
}

void ViewerApp::log_events_() {
  for (const auto& e : session_.events()) {
    const int level = (e.kind == DriveEventKind::Crash || e.kind == DriveEventKind::TrafficHit)
                    ? LOG_WARNING : LOG_INFO;
    TraceLog(level, "drive: %s %s", event_kind_name(e.kind), e.label.c_str());
  }
}

void ViewerApp::render_frame_(const DriveSnapshot& s) {
  BeginDrawing();
  ClearBackground(Color{20, 20, 40, 255});

  switch (s.state) {
    case GameState::MusicSelect:
      draw_picker_("Choose your music", tracks_, track_idx_);
      break;
    case GameState::VehicleSelect:
      draw_picker_("Choose your vehicle", vehicles_, vehicle_idx_);
      break;
    case GameState::Ready:
      draw_road_(s);
      draw_player_(s);
      draw_ready_(s);
      break;
    case GameState::Racing:
      draw_road_(s);
      draw_hazards_(s);
      draw_traffic_(s);
      draw_player_(s);
      draw_hud_(s);
      break;
    case GameState::GameOver:
      draw_road_(s);
      draw_game_over_(s);
      break;
  }

  EndDrawing();
}

void ViewerApp::draw_road_(const DriveSnapshot& s) {
  // Sky and grass
  DrawRectangle(0, 0, kW, kHorizon, Color{100, 160, 230, 255});
  DrawRectangle(0, kHorizon, kW, kH - kHorizon, Color{40, 120, 40, 255});

  const double curve = s.road.curve;
  const double base_w = 500.0 + s.road.width_oscillation + s.road.surface_noise;
  const double center = kW * 0.5 + curve * 200.0;

  for (int y = kHorizon; y < kH; y += kStripe) {
    const double t = double(y - kHorizon) / double(kH - kHorizon); // 0 far, 1 near
    const double width = std::max(8.0, base_w * (0.1 + 0.9 * t));
    const double cx = center + scanline_curve_offset(curve, y, kHorizon, kH) + s.road.speed_shimmer;
    const bool band = std::fmod(s.road.road_position * 2.0 + (1.0 - t) * 40.0, 2.0) < 1.0;

    const Color asphalt = band ? Color{70, 70, 76, 255} : Color{62, 62, 68, 255};
    DrawRectangle(int(cx - width * 0.5), y, int(width), kStripe, asphalt);

    // Edge lines and the centre divider
    const int edge = std::max(1, int(6 * t));
    DrawRectangle(int(cx - width * 0.5), y, edge, kStripe, RAYWHITE);
    DrawRectangle(int(cx + width * 0.5) - edge, y, edge, kStripe, RAYWHITE);
    DrawRectangle(int(cx) - edge / 2, y, edge, kStripe, Color{240, 200, 0, 255});
    if (band) {
      DrawRectangle(int(cx - width * 0.25), y, std::max(1, edge / 2), kStripe, RAYWHITE);
      DrawRectangle(int(cx + width * 0.25), y, std::max(1, edge / 2), kStripe, RAYWHITE);
    }
  }
}

void ViewerApp::draw_traffic_(const DriveSnapshot& s) {
  // Far cars first
  std::vector<const NpcVehicle*> order;
  order.reserve(s.traffic.size());
  for (const auto& v : s.traffic) order.push_back(&v);
  std::sort(order.begin(), order.end(), [](const NpcVehicle* a, const NpcVehicle* b){ return a->y > b->y; });

  for (const NpcVehicle* v : order) {
    if (v->y > 650.0) continue;
    const auto p = to_screen_(v->x, v->y, s.road.curve);
    const float k = static_cast<float>(depth_scale(v->y));
    const float w = static_cast<float>(v->width_px) * k;
    const float h = static_cast<float>(v->height_px) * k;
    DrawRectangleRec({p.x - w * 0.5f, p.y - h, w, h}, to_color(v->color));
    DrawRectangleLinesEx({p.x - w * 0.5f, p.y - h, w, h}, 1.0f, BLACK);
    if (v->direction < 0) DrawRectangle(int(p.x - w * 0.4f), int(p.y - h + 2), int(w * 0.8f), 3, YELLOW);
    else                  DrawRectangle(int(p.x - w * 0.4f), int(p.y - 4), int(w * 0.8f), 3, RED);
  }
}

void ViewerApp::draw_hazards_(const DriveSnapshot& s) {
  for (const auto& h : s.hazards) {
    if (h.y > 650.0) continue;
    const auto p = to_screen_(h.x, h.y, s.road.curve);
    const float k = static_cast<float>(depth_scale(h.y));
    const float w = static_cast<float>(h.width_px) * k;
    const float hh = static_cast<float>(h.height_px) * k;
    switch (h.kind) {
      case HazardKind::Cone:
        DrawTriangle({p.x, p.y - hh}, {p.x - w * 0.5f, p.y}, {p.x + w * 0.5f, p.y}, to_color(h.color));
        break;
      case HazardKind::WarningSign:
        DrawRectangle(int(p.x - 1), int(p.y - hh * 2), 2, int(hh * 2), DARKGRAY);
        DrawPoly({p.x, p.y - hh * 2}, 4, w * 0.5f, 45.0f, to_color(h.color));
        break;
      case HazardKind::OilSlick:
      case HazardKind::WaterPuddle:
        DrawEllipse(int(p.x), int(p.y - hh * 0.5f), w * 0.5f, hh * 0.5f, to_color(h.color, 200));
        break;
      default:
        DrawRectangleRec({p.x - w * 0.5f, p.y - hh, w, hh}, to_color(h.color));
        break;
    }
  }
}

void ViewerApp::draw_player_(const DriveSnapshot& s) {
  const float x = static_cast<float>(s.player.x * kW);
  const float y = kH * 0.46f * 2.0f - 40.0f;
  const float rot = static_cast<float>(s.player.rotation_deg + s.slip_spin_deg);

  Color body = Color{220, 40, 40, 255};
  if (s.vehicle == "kids_drawing") body = Color{60, 140, 255, 255};
  if (s.player.crashed) body = WHITE;
  else if (s.penalty.flash_timer > 0.0) body = Color{255, 120, 120, 255};

  const Rectangle car{x, y, 64.0f, 96.0f};
  if (s.player.boost) DrawRectanglePro({x, y, 76.0f, 108.0f}, {38.0f, 54.0f}, rot, Color{255, 230, 0, 120});
  DrawRectanglePro(car, {32.0f, 48.0f}, rot, body);
  DrawRectanglePro({x, y - 20.0f, 44.0f, 22.0f}, {22.0f, 11.0f}, rot, Color{30, 30, 40, 255});
}

void ViewerApp::draw_hud_(const DriveSnapshot& s) {
  const auto& rs = s.race;
  const int secs = static_cast<int>(std::ceil(rs.time_remaining));

  DrawText(TextFormat("Speed: %d%%", int(s.player.speed * 100.0)), 20, 20, 24, WHITE);
  DrawText(TextFormat("Position: %d/%d", rs.position, rs.total_racers), 20, 50, 24, WHITE);
  DrawText(TextFormat("Time: %d:%02d", secs / 60, secs % 60), 20, 80, 24,
           rs.final_lap ? Color{255, 80, 80, 255} : WHITE);
  DrawText(TextFormat("Score: %lld", (long long)s.score), kW - 240, 20, 24, WHITE);
  DrawText(TextFormat("Distance: %.0f", s.distance), kW - 240, 50, 20, LIGHTGRAY);
  DrawText(TextFormat("Damage: %d%%", int(s.penalty.damage * 100.0)), kW - 240, 76, 20, LIGHTGRAY);

  if (rs.final_lap) DrawText("FINAL LAP!", kW / 2 - 90, 60, 36, RED);
  if (rs.boost) DrawText("BOOST!", kW / 2 - 60, 100, 36, YELLOW);
  if (s.player.drift_factor > 0.1) {
    DrawText(TextFormat("DRIFT! %d%%", int(s.player.drift_factor * 100.0)), kW / 2 - 80, 180, 30,
             s.player.drift_factor < 0.7 ? YELLOW : RED);
  }
  if (s.player.off_road_penalty > 0.1) {
    DrawText(TextFormat("SPEED PENALTY: %d%%", int(s.player.off_road_penalty * 100.0)), 20, 120, 20, ORANGE);
  }
  if (s.penalty.speed_penalty > 0.05) {
    DrawText(TextFormat("COLLISION DAMAGE: %d%%", int(s.penalty.speed_penalty * 100.0)), 20, 146, 20,
             s.penalty.speed_penalty < 0.3 ? YELLOW : RED);
  }
  if (s.effect_visual_timer > 0.0) DrawText("SLIPPERY!", kW / 2 - 70, 220, 28, SKYBLUE);
  if (s.penalty.flash_timer > 0.0) DrawRectangle(0, 0, kW, kH, Color{255, 0, 0, 50});

  if (s.taunt) {
    const int tw = MeasureText(s.taunt->c_str(), 28);
    DrawRectangle(kW / 2 - tw / 2 - 16, 260, tw + 32, 48, Color{255, 255, 255, 220});
    DrawText(s.taunt->c_str(), kW / 2 - tw / 2, 270, 28, BLACK);
  }

  DrawText("Up/W: Accelerate | Left/Right: Steer | Esc: End race | Q: Hub | N: Mute",
           20, kH - 28, 16, Color{220, 220, 220, 200});
}

void ViewerApp::draw_picker_(const char* title, const std::vector<std::string>& items, int selected) {
  DrawText(title, kW / 2 - MeasureText(title, 40) / 2, 120, 40, WHITE);
  int y = 240;
  for (int i = 0; i < static_cast<int>(items.size()); ++i) {
    const bool sel = i == selected;
    DrawRectangle(kW / 2 - 220, y - 8, 440, 48, sel ? Color{60, 60, 100, 255} : Color{40, 40, 60, 255});
    DrawText(items[i].c_str(), kW / 2 - 200, y, 30, sel ? YELLOW : WHITE);
    y += 64;
  }
  DrawText("Up/Down: choose | Enter: confirm | P: preview | Esc: back", kW / 2 - 300, kH - 60, 20, LIGHTGRAY);
}

void ViewerApp::draw_ready_(const DriveSnapshot& s) {
  DrawRectangle(0, 0, kW, kH, Color{0, 0, 0, 120});
  DrawText("GET READY", kW / 2 - MeasureText("GET READY", 60) / 2, 200, 60, YELLOW);
  DrawText(TextFormat("Track: %s   Vehicle: %s", s.track.c_str(), s.vehicle.c_str()),
           kW / 2 - 260, 290, 24, WHITE);
  DrawText("Space: start | M: music | Esc: hub", kW / 2 - 200, 340, 24, LIGHTGRAY);
}

void ViewerApp::draw_game_over_(const DriveSnapshot& s) {
  DrawRectangle(0, 0, kW, kH, Color{0, 0, 0, 160});
  const char* head = s.race.victory ? "VICTORY!" : "RACE OVER";
  DrawText(head, kW / 2 - MeasureText(head, 60) / 2, 160, 60, s.race.victory ? GOLD : WHITE);
  DrawText(TextFormat("Final position: %d", s.race.position), kW / 2 - 160, 260, 28, WHITE);
  DrawText(TextFormat("Score: %lld", (long long)s.score), kW / 2 - 160, 300, 28, WHITE);
  DrawText(TextFormat("Distance: %.0f   Top speed: %d%%", s.distance, int(s.top_speed * 100.0)),
           kW / 2 - 160, 340, 24, LIGHTGRAY);
  DrawText(TextFormat("%s | Space: again | M: music | Esc: hub", state_label(s.state)),
           kW / 2 - 260, 420, 22, LIGHTGRAY);
}

} // namespace drvsim
