#pragma once
#include <cstdint>
#include <vector>
#include <tdw/pedestrian.hpp>

namespace tdw {

struct AgentPose {
  AgentId id = 0;
  double x = 0.0;          // world X (center)
  double y = 0.0;          // world Y (center)
  double size = 0.0;       // box edge
};

struct VehiclePose {
  VehicleId id = 0;
  double x = 0.0;
  double y = 0.0;
  double heading_deg = 0.0;
  double speed = 0.0;
  double width = 0.0;
  double height = 0.0;
  bool occupied = false;
};

// Read-only copy of one tick for the presentation layer.
// Static geometry (buildings, roads, bounds) is read from the simulation's WorldState.
struct SimSnapshot {
  std::uint64_t tick = 0;
  double sim_time = 0.0;

  AgentPose player{};
  bool player_in_vehicle = false;
  std::vector<AgentPose> npcs;
  std::vector<VehiclePose> vehicles;

  double marker_x = 0.0;
  double marker_y = 0.0;
  double marker_distance = 0.0;
  bool objective_reached = false;

  bool boost_active = false;
  double boost_phase = 0.0;   // seconds since boost started; drives color cycling

  double camera_x = 0.0;      // top-left offset
  double camera_y = 0.0;
  double view_w = 0.0;
  double view_h = 0.0;

  double fps = 0.0;           // pass-through from the frame clock
};

} // namespace tdw
