#include <tdw/possession.hpp>
#include <limits>

namespace tdw {

void link(Pedestrian& p, Vehicle& v) {
  p.vehicle = v.id;
  v.driver = p.id;
}

void unlink(Pedestrian& p, Vehicle& v) {
  p.vehicle.reset();
  v.driver.reset();
}

bool link_consistent(const Pedestrian& p, const Vehicle& v) {
  const bool p_to_v = p.vehicle.has_value() && *p.vehicle == v.id;
  const bool v_to_p = v.driver.has_value() && *v.driver == p.id;
  return p_to_v == v_to_p;
}

Vec2 exit_position(const Pedestrian& p, const Vehicle& v, const PossessionParams& params,
                   const ObstacleSet& obstacles, const WorldBounds& bounds) {
  Vec2 out = v.pos + heading_vector(v.heading_deg + 90.0) * params.exit_offset;
  if (obstacles.any_overlap(p.rect_at(out))) {
    // No further fallback; the left side is taken even if it is blocked too.
    out = v.pos + heading_vector(v.heading_deg - 90.0) * params.exit_offset;
  }
  return bounds.clamp(out);
}

static Vehicle* find_vehicle_(std::vector<Vehicle>& vehicles, VehicleId id) {
  for (auto& v : vehicles) if (v.id == id) return &v;
  return nullptr;
}

PossessionEvent interact(Pedestrian& p, std::vector<Vehicle>& vehicles,
                         const PossessionParams& params,
                         const ObstacleSet& obstacles, const WorldBounds& bounds) {
  if (p.vehicle.has_value()) {
    Vehicle* v = find_vehicle_(vehicles, *p.vehicle);
    if (!v) return PossessionEvent::None;
    p.pos = exit_position(p, *v, params, obstacles, bounds);
    unlink(p, *v);
    v->vel *= params.exit_damping;
    return PossessionEvent::Exited;
  }

  Vehicle* best = nullptr;
  double best_d = std::numeric_limits<double>::infinity();
  for (auto& v : vehicles) {
    if (v.occupied()) continue;
    const double d = distance(p.pos, v.pos);
    if (d < params.interact_radius && d < best_d) { best = &v; best_d = d; }
  }
  if (!best) return PossessionEvent::None;

  link(p, *best);
  p.pos = best->pos;
  return PossessionEvent::Entered;
}

} // namespace tdw
