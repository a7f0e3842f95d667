#include <tdw/pedestrian.hpp>

namespace tdw {

void walk(Pedestrian& p, const Vec2& direction, double dt,
          const ObstacleSet& obstacles, const WorldBounds& bounds) {
  if (!p.on_foot()) return;

  if (direction.length_sq() > 0.0) {
    const Vec2 candidate = p.pos + direction.normalized() * (p.speed * dt);
    if (!obstacles.any_overlap(p.rect_at(candidate))) {
      p.pos = candidate;
    }
  }
  p.pos = bounds.clamp(p.pos);
}

} // namespace tdw
