#include <cstdlib>
#include <ctime>
#include <string>
#include <raylib.h>
#include <drvsim/tuning.hpp>
#include <drvsim/viewer/app.hpp>

using namespace drvsim;

// usage: drvsim_viewer [tuning.csv] [assets_dir]
int main(int argc, char** argv) {
  DriveTuning tuning;
  if (argc > 1) {
    if (auto loaded = load_tuning_csv(argv[1])) {
      tuning = loaded->tuning;
      for (const auto& key : loaded->rejected) {
        TraceLog(LOG_WARNING, "tuning: ignored '%s'", key.c_str());
      }
    } else {
      TraceLog(LOG_WARNING, "tuning: cannot open %s, using defaults", argv[1]);
    }
  }
  if (const int fixed = validate_tuning(tuning); fixed > 0) {
    TraceLog(LOG_WARNING, "tuning: reset %d out-of-range values", fixed);
  }

  const std::string assets = argc > 2 ? argv[2] : "assets";
  ViewerApp app(tuning, static_cast<std::uint32_t>(std::time(nullptr)), assets);
  return app.run();
}
