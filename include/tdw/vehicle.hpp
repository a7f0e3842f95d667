#pragma once
#include <optional>
#include <tdw/geom.hpp>
#include <tdw/world.hpp>
#include <tdw/pedestrian.hpp>

namespace tdw {

// How a vehicle reacts when its next position would hit a building.
enum class CollisionPolicy : int {
  SinglePassBounce = 0, // reverse + damp, accept the bounced position unchecked
  BounceOrHold = 1,     // same bounce, but stay put if the bounced position still overlaps
};

struct VehicleParams {
  double max_speed = 900.0;   // units/s
  double accel = 1400.0;      // units/s^2 while throttling
  double brake = 2600.0;      // units/s^2 (applied at half strength)
  double turn_rate = 160.0;   // deg/s at speed_factor 1
  double friction = 0.985;    // velocity multiplier per tick
  double bounce = -0.35;      // velocity multiplier on impact
  double width = 56.0;
  double height = 32.0;
  CollisionPolicy policy{CollisionPolicy::SinglePassBounce};
};

struct Vehicle {
  VehicleId id = 0;
  Vec2   pos{};
  Vec2   vel{};
  double heading_deg = 0.0;   // 0 = +x
  VehicleParams params{};
  std::optional<AgentId> driver{};

  bool occupied() const { return driver.has_value(); }
  double speed() const { return vel.length(); }
  Vec2 forward() const { return heading_vector(heading_deg); }

  // Unrotated bounding box, used for collision.
  Rect rect() const { return rect_at(pos); }
  Rect rect_at(const Vec2& p) const {
    return Rect::centered_at(p, params.width, params.height);
  }
};

// Speed-dependent steering gain: sluggish near standstill, capped at speed.
double steering_factor(double speed);

// Heading folded into [0, 360).
double wrap_heading(double deg);

// One physics tick. Controls are ignored unless the vehicle has a driver.
// Returns true if the collision response fired this tick.
bool drive(Vehicle& v, const MoveIntent& controls, double dt,
           const ObstacleSet& obstacles, const WorldBounds& bounds);

} // namespace tdw
