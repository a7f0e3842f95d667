#pragma once
#include <vector>
#include <tdw/world.hpp>
#include <tdw/pedestrian.hpp>
#include <tdw/vehicle.hpp>

namespace tdw {

struct PossessionParams {
  double interact_radius = 80.0;  // must be strictly closer to enter
  double exit_offset = 70.0;      // distance beside the vehicle on exit
  double exit_damping = 0.6;      // residual velocity multiplier on exit
};

enum class PossessionEvent : int { None = 0, Entered, Exited };

// Link/unlink helpers. Both sides are always written together.
void link(Pedestrian& p, Vehicle& v);
void unlink(Pedestrian& p, Vehicle& v);

// True if p and v agree about each other (both linked, or neither points at the other).
bool link_consistent(const Pedestrian& p, const Vehicle& v);

// Where a pedestrian would be placed when leaving v: right-hand side first,
// left-hand side if the right box hits a building; clamped to the world.
Vec2 exit_position(const Pedestrian& p, const Vehicle& v, const PossessionParams& params,
                   const ObstacleSet& obstacles, const WorldBounds& bounds);

// Interact action: enter the nearest free vehicle in range, or leave the current one.
// Silent no-op when neither applies.
PossessionEvent interact(Pedestrian& p, std::vector<Vehicle>& vehicles,
                         const PossessionParams& params,
                         const ObstacleSet& obstacles, const WorldBounds& bounds);

} // namespace tdw
