#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <tdw/possession.hpp>

using Catch::Approx;
using namespace tdw;

namespace {

Pedestrian walker_at(double x, double y, AgentId id = 0) {
  Pedestrian p;
  p.id = id;
  p.pos = {x, y};
  p.size = 24.0;
  return p;
}

Vehicle car_at(double x, double y, VehicleId id = 0) {
  Vehicle v;
  v.id = id;
  v.pos = {x, y};
  return v;
}

ObstacleSet obstacles_of(std::vector<Rect> rects) {
  std::vector<Obstacle> obs;
  for (const auto& r : rects) obs.push_back(Obstacle{r, Rgb{}});
  return ObstacleSet{std::move(obs)};
}

const WorldBounds kBounds{6000.0, 4000.0};
const PossessionParams kParams{};

} // namespace

TEST_CASE("interact enters a free vehicle in range") {
  Pedestrian p = walker_at(100.0, 100.0);
  std::vector<Vehicle> cars{car_at(150.0, 100.0)};

  const auto ev = interact(p, cars, kParams, ObstacleSet{}, kBounds);
  REQUIRE(ev == PossessionEvent::Entered);
  REQUIRE(p.vehicle.has_value());
  REQUIRE(*p.vehicle == cars[0].id);
  REQUIRE(cars[0].driver.has_value());
  REQUIRE(*cars[0].driver == p.id);
  REQUIRE(link_consistent(p, cars[0]));
  // snapped onto the vehicle
  REQUIRE(p.pos == cars[0].pos);
}

TEST_CASE("interact out of range is a no-op") {
  std::vector<Vehicle> cars{car_at(180.0, 100.0)};

  SECTION("well outside") {
    Pedestrian p = walker_at(100.0, 300.0);
    REQUIRE(interact(p, cars, kParams, ObstacleSet{}, kBounds) == PossessionEvent::None);
    REQUIRE_FALSE(p.vehicle.has_value());
    REQUIRE_FALSE(cars[0].driver.has_value());
  }

  SECTION("exactly on the radius") {
    Pedestrian p = walker_at(100.0, 100.0); // distance 80
    REQUIRE(interact(p, cars, kParams, ObstacleSet{}, kBounds) == PossessionEvent::None);
    REQUIRE(p.pos.x == 100.0);
  }
}

TEST_CASE("enter then exit returns to the right-hand side") {
  Pedestrian p = walker_at(100.0, 100.0);
  std::vector<Vehicle> cars{car_at(150.0, 100.0)};

  REQUIRE(interact(p, cars, kParams, ObstacleSet{}, kBounds) == PossessionEvent::Entered);
  REQUIRE(interact(p, cars, kParams, ObstacleSet{}, kBounds) == PossessionEvent::Exited);

  REQUIRE_FALSE(p.vehicle.has_value());
  REQUIRE_FALSE(cars[0].driver.has_value());
  REQUIRE(link_consistent(p, cars[0]));
  // heading 0 -> right-hand side is +90 deg = +y
  REQUIRE(p.pos.x == Approx(150.0));
  REQUIRE(p.pos.y == Approx(170.0));
}

TEST_CASE("exit falls back to the left-hand side when the right is blocked") {
  std::vector<Vehicle> cars{car_at(150.0, 100.0)};
  cars[0].heading_deg = 0.0;

  SECTION("right blocked") {
    const ObstacleSet block = obstacles_of({Rect{130.0, 150.0, 40.0, 40.0}});
    Pedestrian p = walker_at(150.0, 100.0);
    link(p, cars[0]);
    REQUIRE(interact(p, cars, kParams, block, kBounds) == PossessionEvent::Exited);
    REQUIRE(p.pos.x == Approx(150.0));
    REQUIRE(p.pos.y == Approx(30.0));
  }

  SECTION("both sides blocked still exits on the left") {
    const ObstacleSet block = obstacles_of({
      Rect{130.0, 150.0, 40.0, 40.0},
      Rect{130.0, 10.0, 40.0, 40.0},
    });
    Pedestrian p = walker_at(150.0, 100.0);
    link(p, cars[0]);
    REQUIRE(interact(p, cars, kParams, block, kBounds) == PossessionEvent::Exited);
    REQUIRE(p.pos.y == Approx(30.0));
    REQUIRE(block.any_overlap(p.rect()));
  }
}

TEST_CASE("exit follows the vehicle heading and clamps to the world") {
  SECTION("heading 90 puts the right-hand side at -x") {
    std::vector<Vehicle> cars{car_at(500.0, 500.0)};
    cars[0].heading_deg = 90.0;
    Pedestrian p = walker_at(500.0, 500.0);
    link(p, cars[0]);
    interact(p, cars, kParams, ObstacleSet{}, kBounds);
    REQUIRE(p.pos.x == Approx(430.0));
    REQUIRE(p.pos.y == Approx(500.0));
  }

  SECTION("exit beyond the bottom edge is clamped") {
    std::vector<Vehicle> cars{car_at(10.0, 3990.0)};
    Pedestrian p = walker_at(10.0, 3990.0);
    link(p, cars[0]);
    interact(p, cars, kParams, ObstacleSet{}, kBounds);
    REQUIRE(p.pos.y == 4000.0);
    REQUIRE(kBounds.contains(p.pos));
  }
}

TEST_CASE("exit damps the vehicle's residual velocity") {
  std::vector<Vehicle> cars{car_at(500.0, 500.0)};
  cars[0].vel = {100.0, -50.0};
  Pedestrian p = walker_at(500.0, 500.0);
  link(p, cars[0]);

  interact(p, cars, kParams, ObstacleSet{}, kBounds);
  REQUIRE(cars[0].vel.x == Approx(60.0));
  REQUIRE(cars[0].vel.y == Approx(-30.0));
}

TEST_CASE("interact ignores occupied vehicles and prefers the nearest") {
  std::vector<Vehicle> cars{car_at(130.0, 100.0, 0), car_at(160.0, 100.0, 1)};
  Pedestrian driver = walker_at(130.0, 100.0, 1);
  link(driver, cars[0]);

  Pedestrian p = walker_at(100.0, 100.0, 2);
  REQUIRE(interact(p, cars, kParams, ObstacleSet{}, kBounds) == PossessionEvent::Entered);
  REQUIRE(*p.vehicle == 1u);
  REQUIRE(*cars[1].driver == 2u);
  REQUIRE(*cars[0].driver == 1u);
  REQUIRE(link_consistent(driver, cars[0]));
  REQUIRE(link_consistent(p, cars[1]));
  REQUIRE(link_consistent(p, cars[0]));  // neither points at the other
}

TEST_CASE("link_consistent detects a half-set link") {
  Pedestrian p = walker_at(0.0, 0.0);
  Vehicle v = car_at(0.0, 0.0);
  REQUIRE(link_consistent(p, v));

  p.vehicle = v.id;
  REQUIRE_FALSE(link_consistent(p, v));

  v.driver = p.id;
  REQUIRE(link_consistent(p, v));

  unlink(p, v);
  REQUIRE(link_consistent(p, v));
  REQUIRE_FALSE(p.vehicle.has_value());
  REQUIRE_FALSE(v.driver.has_value());
}
