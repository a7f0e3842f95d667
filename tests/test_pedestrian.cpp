#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include <tdw/pedestrian.hpp>

using Catch::Approx;
using namespace tdw;

static Pedestrian make_walker(double x, double y) {
  Pedestrian p;
  p.pos = {x, y};
  p.speed = 300.0;
  p.size = 24.0;
  return p;
}

TEST_CASE("MoveIntent builds a screen-space direction") {
  MoveIntent in;
  REQUIRE_FALSE(in.any());
  REQUIRE(in.direction().length_sq() == 0.0);

  in.up = true; in.right = true;
  REQUIRE(in.any());
  REQUIRE(in.direction().x == 1.0);
  REQUIRE(in.direction().y == -1.0);

  in.down = true; // up and down cancel
  REQUIRE(in.direction().y == 0.0);
}

TEST_CASE("walk moves at speed along the normalized intent") {
  const WorldBounds bounds{6000.0, 4000.0};
  const ObstacleSet none;
  Pedestrian p = make_walker(500.0, 500.0);

  SECTION("straight") {
    walk(p, Vec2{1.0, 0.0}, 0.1, none, bounds);
    REQUIRE(p.pos.x == Approx(530.0));
    REQUIRE(p.pos.y == Approx(500.0));
  }

  SECTION("diagonal is not faster") {
    walk(p, Vec2{1.0, 1.0}, 0.1, none, bounds);
    const double step = 30.0 / std::sqrt(2.0);
    REQUIRE(p.pos.x == Approx(500.0 + step));
    REQUIRE(p.pos.y == Approx(500.0 + step));
  }
}

TEST_CASE("walk with zero intent never moves") {
  const WorldBounds bounds{6000.0, 4000.0};
  const ObstacleSet none;
  Pedestrian p = make_walker(1234.5, 987.25);

  for (int i = 0; i < 120; ++i) walk(p, Vec2{}, 1.0 / 60.0, none, bounds);
  REQUIRE(p.pos.x == 1234.5);
  REQUIRE(p.pos.y == 987.25);
}

TEST_CASE("walk rejects the whole move when the candidate hits a building") {
  const WorldBounds bounds{6000.0, 4000.0};
  // Wall just right of the walker: box [488,512] -> candidate [518,542] hits x=520
  const ObstacleSet wall(std::vector<Obstacle>{Obstacle{Rect{520.0, 300.0, 100.0, 400.0}, Rgb{}}});
  Pedestrian p = make_walker(500.0, 500.0);

  SECTION("head-on") {
    walk(p, Vec2{1.0, 0.0}, 0.1, wall, bounds);
    REQUIRE(p.pos.x == 500.0);
    REQUIRE(p.pos.y == 500.0);
  }

  SECTION("no sliding along the wall") {
    walk(p, Vec2{1.0, 1.0}, 0.1, wall, bounds);
    REQUIRE(p.pos.x == 500.0);
    REQUIRE(p.pos.y == 500.0);
  }

  SECTION("moving away is allowed") {
    walk(p, Vec2{-1.0, 0.0}, 0.1, wall, bounds);
    REQUIRE(p.pos.x == Approx(470.0));
    REQUIRE_FALSE(wall.any_overlap(p.rect()));
  }
}

TEST_CASE("walk clamps into the world") {
  const WorldBounds bounds{6000.0, 4000.0};
  const ObstacleSet none;
  Pedestrian p = make_walker(5.0, 3995.0);

  walk(p, Vec2{-1.0, 1.0}, 0.5, none, bounds);
  REQUIRE(p.pos.x == 0.0);
  REQUIRE(p.pos.y == 4000.0);
  REQUIRE(bounds.contains(p.pos));
}

TEST_CASE("walk is a no-op while inside a vehicle") {
  const WorldBounds bounds{6000.0, 4000.0};
  const ObstacleSet none;
  Pedestrian p = make_walker(500.0, 500.0);
  p.vehicle = VehicleId{0};

  walk(p, Vec2{1.0, 0.0}, 1.0, none, bounds);
  REQUIRE(p.pos.x == 500.0);
  REQUIRE(p.pos.y == 500.0);
}
