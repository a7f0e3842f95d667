#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <tdw/world_config.hpp>

using Catch::Approx;
using namespace tdw;

static std::string cfg_basic = R"(# city tuning
world_width = 8000
world_height = 5000
npc_count = 4
player_speed = 250
vehicle_policy = bounce_or_hold
interact_radius = 90
)";

static std::string cfg_with_noise = R"(
  marker_x = 1500   # trailing comment
MARKER_Y=1700
npc_speed_min = fast
no equals sign here
mystery_key = 12
road = 0, 100, 500, 50
road = 10,20,30
building = 100,100,40,60
npc_count = -3
)";

TEST_CASE("default_world_config matches the stock city") {
  const WorldConfig cfg = default_world_config();
  REQUIRE(cfg.bounds.width == Approx(6000.0));
  REQUIRE(cfg.bounds.height == Approx(4000.0));
  REQUIRE(cfg.view_w == Approx(1280.0));
  REQUIRE(cfg.view_h == Approx(720.0));
  REQUIRE(cfg.roads.size() == 4);
  REQUIRE(cfg.roads[0].width == Approx(6000.0));
  REQUIRE(cfg.buildings.empty());
  REQUIRE(cfg.npc_count == 10);
  REQUIRE(cfg.vehicle.max_speed == Approx(900.0));
  REQUIRE(cfg.possession.interact_radius == Approx(80.0));
  REQUIRE(cfg.objective_radius == Approx(100.0));
}

TEST_CASE("world_config_from_stream applies known keys") {
  std::istringstream ss(cfg_basic);
  std::vector<std::string> rejected;
  const WorldConfig cfg = world_config_from_stream(ss, &rejected);

  REQUIRE(rejected.empty());
  REQUIRE(cfg.bounds.width == Approx(8000.0));
  REQUIRE(cfg.bounds.height == Approx(5000.0));
  REQUIRE(cfg.npc_count == 4);
  REQUIRE(cfg.player_speed == Approx(250.0));
  REQUIRE(cfg.vehicle.policy == CollisionPolicy::BounceOrHold);
  REQUIRE(cfg.possession.interact_radius == Approx(90.0));

  // Stock roads follow the resized world
  REQUIRE(cfg.roads.size() == 4);
  REQUIRE(cfg.roads[0].width == Approx(8000.0));
  REQUIRE(cfg.roads[1].height == Approx(5000.0));
}

TEST_CASE("world_config_from_stream handles spaces, comments and bad lines") {
  std::istringstream ss(cfg_with_noise);
  std::vector<std::string> rejected;
  const WorldConfig cfg = world_config_from_stream(ss, &rejected);

  REQUIRE(cfg.marker.x == Approx(1500.0));
  REQUIRE(cfg.marker.y == Approx(1700.0));   // keys are case-insensitive
  REQUIRE(cfg.npc_speed.lo == Approx(30.0)); // bad value kept default
  REQUIRE(cfg.npc_count == 10);              // negative count rejected

  // Explicit roads replace the stock set; malformed rect skipped
  REQUIRE(cfg.roads.size() == 1);
  REQUIRE(cfg.roads[0].top == Approx(100.0));
  REQUIRE(cfg.buildings.size() == 1);
  REQUIRE(cfg.buildings[0].height == Approx(60.0));

  REQUIRE(rejected.size() == 5);
}

static WorldConfig parse(const std::string& text, std::vector<std::string>& rejected) {
  std::istringstream ss(text);
  return world_config_from_stream(ss, &rejected);
}

TEST_CASE("world_config_from_stream rejects out-of-range values") {
  std::vector<std::string> rejected;

  SECTION("world and view sizes must be positive") {
    const WorldConfig cfg = parse("world_width = 0\nworld_height = -5\nview_width = 0\n", rejected);
    REQUIRE(rejected.size() == 3);
    REQUIRE(cfg.bounds.width == Approx(6000.0));
    REQUIRE(cfg.bounds.height == Approx(4000.0));
    REQUIRE(cfg.view_w == Approx(1280.0));
  }

  SECTION("speeds and radii cannot be negative") {
    const WorldConfig cfg = parse("vehicle_max_speed = -100\nplayer_speed = -1\n"
                                  "interact_radius = -80\nobjective_radius = 0\n", rejected);
    REQUIRE(rejected.size() == 3);
    REQUIRE(cfg.vehicle.max_speed == Approx(900.0));
    REQUIRE(cfg.player_speed == Approx(300.0));
    REQUIRE(cfg.possession.interact_radius == Approx(80.0));
    REQUIRE(cfg.objective_radius == 0.0);
  }

  SECTION("friction must lie in (0, 1]") {
    const WorldConfig cfg = parse("vehicle_friction = 0\nvehicle_friction = 1.2\n", rejected);
    REQUIRE(rejected.size() == 2);
    REQUIRE(cfg.vehicle.friction == Approx(0.985));

    rejected.clear();
    REQUIRE(parse("vehicle_friction = 1\n", rejected).vehicle.friction == 1.0);
    REQUIRE(rejected.empty());
  }

  SECTION("bounce may only reverse the velocity and damping is a fraction") {
    const WorldConfig cfg = parse("vehicle_bounce = 0.5\nexit_damping = 1.5\n", rejected);
    REQUIRE(rejected.size() == 2);
    REQUIRE(cfg.vehicle.bounce == Approx(-0.35));
    REQUIRE(cfg.possession.exit_damping == Approx(0.6));
  }

  SECTION("counts are capped whole numbers") {
    const WorldConfig cfg = parse("npc_count = 1e13\nscattered_count = 2.5\n"
                                  "spawn_attempts = 1e9\nnpc_count = 25\n", rejected);
    REQUIRE(rejected.size() == 3);
    REQUIRE(cfg.npc_count == 25);
    REQUIRE(cfg.scattered.count == 6);
    REQUIRE(cfg.spawn_attempts == 10000);
  }
}

TEST_CASE("world_config_from_stream reverts inverted min/max pairs") {
  std::vector<std::string> rejected;

  SECTION("wander interval") {
    const WorldConfig cfg = parse("wander_min = 5\nwander_max = 1\n", rejected);
    REQUIRE(cfg.wander.min_interval == Approx(1.0));
    REQUIRE(cfg.wander.max_interval == Approx(4.0));
    REQUIRE(rejected == std::vector<std::string>{"wander_min = 5", "wander_max = 1"});
  }

  SECTION("a single bound past the stock partner") {
    const WorldConfig cfg = parse("npc_speed_min = 200\n", rejected);
    REQUIRE(cfg.npc_speed.lo == Approx(30.0));
    REQUIRE(cfg.npc_speed.hi == Approx(110.0));
    REQUIRE(rejected == std::vector<std::string>{"npc_speed_min = 200"});
  }

  SECTION("equal bounds are fine") {
    const WorldConfig cfg = parse("npc_speed_min = 50\nnpc_speed_max = 50\n", rejected);
    REQUIRE(rejected.empty());
    REQUIRE(cfg.npc_speed.lo == Approx(50.0));
    REQUIRE(cfg.npc_speed.hi == Approx(50.0));
  }
}

TEST_CASE("world_config_from_stream on empty input gives defaults") {
  std::istringstream ss("");
  const WorldConfig cfg = world_config_from_stream(ss);
  REQUIRE(cfg.bounds.width == Approx(6000.0));
  REQUIRE(cfg.roads.size() == 4);
}

TEST_CASE("load_world_config returns nullopt on missing file") {
  auto none = load_world_config("this_file_does_not_exist.ini");
  REQUIRE_FALSE(none.has_value());
}
