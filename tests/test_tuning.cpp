#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <sstream>
#include <string>

#include <drvsim/tuning.hpp>

using Catch::Approx;
using namespace drvsim;

static std::string csv_minimal = R"(key,value
max_speed,0.9
traffic_max_cars,4
race_duration_s,90
)";

static std::string csv_with_noise = R"(  max_speed , 0.8
# comment lines are ignored

unknown_key,1
acceleration, abc
zone_cone_spacing , 35.4
)";

TEST_CASE("tuning_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto load = tuning_from_csv_stream(ss);
  REQUIRE(load.rejected.empty());
  REQUIRE(load.tuning.max_speed == Approx(0.9));
  REQUIRE(load.tuning.traffic_max_cars == 4);
  REQUIRE(load.tuning.race_duration_s == Approx(90.0));
  // untouched fields keep their defaults
  REQUIRE(load.tuning.acceleration == Approx(0.5));
}

TEST_CASE("tuning_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto load = tuning_from_csv_stream(ss);
  REQUIRE(load.tuning.max_speed == Approx(0.8));
  REQUIRE(load.tuning.acceleration == Approx(0.5));
  REQUIRE(load.tuning.zone_cone_spacing == 35);

  REQUIRE(load.rejected.size() == 2);
  REQUIRE(std::find(load.rejected.begin(), load.rejected.end(), "unknown_key") != load.rejected.end());
  REQUIRE(std::find(load.rejected.begin(), load.rejected.end(), "acceleration") != load.rejected.end());
}

TEST_CASE("tuning_from_csv_stream starts from the given base") {
  DriveTuning base;
  base.race_duration_s = 60.0;
  std::istringstream ss("key,value\nmax_dt,0.05\n");
  auto load = tuning_from_csv_stream(ss, base);
  REQUIRE(load.tuning.race_duration_s == Approx(60.0));
  REQUIRE(load.tuning.max_dt == Approx(0.05));
}

static std::string csv_balance = R"(key,value
cone_penalty,0.5
cone_damage,0.2
oil_slip_strength,0.4
ahead_spawn_min_y,200
emergency_brake_rate,3
width_primary_freq,0.1
behind_spawn_min_y,-180
)";

TEST_CASE("tuning_from_csv_stream accepts balance constants") {
  std::istringstream ss(csv_balance);
  auto load = tuning_from_csv_stream(ss);
  REQUIRE(load.rejected.empty());
  REQUIRE(load.tuning.cone_penalty == Approx(0.5));
  REQUIRE(load.tuning.cone_damage == Approx(0.2));
  REQUIRE(load.tuning.oil_slip_strength == Approx(0.4));
  REQUIRE(load.tuning.ahead_spawn_min_y == Approx(200.0));
  REQUIRE(load.tuning.emergency_brake_rate == Approx(3.0));
  REQUIRE(load.tuning.width_primary_freq == Approx(0.1));
  REQUIRE(load.tuning.behind_spawn_min_y == Approx(-180.0));
  REQUIRE(validate_tuning(load.tuning) == 0);
}

TEST_CASE("load_tuning_csv returns nullopt on missing file") {
  auto none = load_tuning_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}

TEST_CASE("validate_tuning resets out-of-range values") {
  DriveTuning ok;
  REQUIRE(validate_tuning(ok) == 0);

  DriveTuning t;
  t.acceleration = -1.0;
  t.straight_min_s = 12.0;   // above straight_max_s
  t.total_racers = 0;
  REQUIRE(validate_tuning(t) == 3);
  REQUIRE(t.acceleration == Approx(0.5));
  REQUIRE(t.straight_min_s == Approx(8.0));
  REQUIRE(t.straight_max_s == Approx(10.0));
  REQUIRE(t.total_racers == 8);

  // Negative despawn / prune lines are legitimate
  REQUIRE(t.despawn_min_y < 0.0);
  REQUIRE(t.hazard_prune_y < 0.0);
}

TEST_CASE("validate_tuning resets inverted spawn and speed windows") {
  DriveTuning t;
  t.ahead_spawn_min_y = 500.0;   // above ahead_spawn_max_y
  t.oncoming_speed_min = 1.5;    // above oncoming_speed_max
  t.cruise_speed_min = 2.0;      // above cruise_speed_max
  REQUIRE(validate_tuning(t) == 3);
  REQUIRE(t.ahead_spawn_min_y == Approx(150.0));
  REQUIRE(t.ahead_spawn_max_y == Approx(400.0));
  REQUIRE(t.oncoming_speed_min == Approx(0.5));
  REQUIRE(t.cruise_speed_min == Approx(0.2));

  // The behind window lives at negative y
  REQUIRE(t.behind_spawn_min_y == Approx(-150.0));
  REQUIRE(t.behind_spawn_max_y == Approx(-50.0));
}
