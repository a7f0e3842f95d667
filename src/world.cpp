#include <tdw/world.hpp>

namespace tdw {

const Obstacle* ObstacleSet::first_overlap(const Rect& r) const {
  for (const auto& o : obs_) {
    if (r.overlaps(o.rect)) return &o;
  }
  return nullptr;
}

} // namespace tdw
