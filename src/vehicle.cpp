#include <tdw/vehicle.hpp>
#include <cmath>

namespace tdw {

double steering_factor(double speed) {
  return clamp(speed / 200.0, 0.15, 1.2);
}

double wrap_heading(double deg) {
  double h = std::fmod(deg, 360.0);
  if (h < 0.0) h += 360.0;
  return h >= 360.0 ? 0.0 : h;
}

static void apply_controls_(Vehicle& v, const MoveIntent& in, double dt) {
  const auto& P = v.params;
  const Vec2 fwd = v.forward();
  if (in.up)   v.vel += fwd * (P.accel * dt);
  if (in.down) v.vel -= fwd * (P.brake * dt * 0.5);  // braking, not full reverse thrust

  const double k = steering_factor(v.speed());
  if (in.left)  v.heading_deg -= P.turn_rate * dt * k;
  if (in.right) v.heading_deg += P.turn_rate * dt * k;
  v.heading_deg = wrap_heading(v.heading_deg);
}

static void apply_friction_(Vehicle& v) {
  v.vel *= v.params.friction;
  const double s = v.speed();
  if (s > v.params.max_speed) {
    v.vel *= v.params.max_speed / s;
  }
}

bool drive(Vehicle& v, const MoveIntent& controls, double dt,
           const ObstacleSet& obstacles, const WorldBounds& bounds) {
  if (v.occupied()) apply_controls_(v, controls, dt);
  apply_friction_(v);

  Vec2 next = v.pos + v.vel * dt;
  bool hit = false;
  if (obstacles.any_overlap(v.rect_at(next))) {
    hit = true;
    v.vel *= v.params.bounce;
    next = v.pos + v.vel * dt;
    // Single pass: the bounced position is not re-checked unless asked to.
    if (v.params.policy == CollisionPolicy::BounceOrHold &&
        obstacles.any_overlap(v.rect_at(next))) {
      next = v.pos;
    }
  }
  v.pos = bounds.clamp(next);
  return hit;
}

} // namespace tdw
