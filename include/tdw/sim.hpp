#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>
#include <vector>
#include <tdw/geom.hpp>
#include <tdw/world.hpp>
#include <tdw/world_config.hpp>
#include <tdw/worldgen.hpp>
#include <tdw/camera.hpp>
#include <tdw/pedestrian.hpp>
#include <tdw/vehicle.hpp>
#include <tdw/wander.hpp>
#include <tdw/possession.hpp>
#include <tdw/sequence.hpp>

namespace tdw {

inline constexpr AgentId kPlayerId = 0;

// Everything the player did since the previous tick.
struct TickInput {
  MoveIntent move{};                // walk or drive, whichever applies
  bool interact{false};             // enter/exit edge
  bool relocate{false};             // move the marker (only honored when reached)
  std::vector<Keystroke> keys{};    // ordered keystrokes, for the sequence matcher
};

// What happened during one step; lets the caller log or play cues.
struct TickEvents {
  PossessionEvent possession{PossessionEvent::None};
  bool boost_triggered{false};
  bool marker_relocated{false};
  std::size_t vehicle_hits{0};
};

struct Npc {
  Pedestrian body;
  Wander     wander;
};

// Authoritative single-threaded world simulation.
class Simulation {
public:
  Simulation(const WorldConfig& cfg, WorldState world, std::uint32_t seed);

  // generate_world + construct; nullopt if spawning failed.
  static std::optional<Simulation> create(std::uint32_t seed, const WorldConfig& cfg);

  // --- Simulation
  // dt is the measured frame time in seconds; negative values count as 0.
  TickEvents step(const TickInput& in, double dt);

  // --- World
  const WorldConfig& config() const { return cfg_; }
  const WorldState&  world() const { return world_; }
  const ObstacleSet& obstacles() const { return world_.obstacles; }
  const WorldBounds& bounds() const { return world_.bounds; }

  // --- Agents
  const Pedestrian& player() const { return player_; }
  Pedestrian&       player() { return player_; }
  const std::vector<Npc>& npcs() const { return npcs_; }
  std::vector<Npc>&       npcs() { return npcs_; }
  const std::vector<Vehicle>& vehicles() const { return vehicles_; }
  std::vector<Vehicle>&       vehicles() { return vehicles_; }

  const Vehicle* vehicle_by_id(VehicleId id) const;
  Vehicle*       vehicle_by_id(VehicleId id);
  // Vehicle the player is driving, or nullptr when on foot.
  const Vehicle* player_vehicle() const;

  // --- Camera / objective
  const Camera& camera() const { return camera_; }
  Vec2 camera_target() const;
  const Vec2& marker() const { return marker_; }
  void set_marker(const Vec2& p) { marker_ = p; }
  double marker_distance() const { return marker_distance_; }
  bool objective_reached() const { return objective_reached_; }

  // --- Boost mode (no end condition; lasts for the session once triggered)
  bool boost_active() const { return boost_active_; }
  double boost_phase() const { return boost_phase_; }

  std::uint64_t tick() const { return tick_; }
  double sim_time() const { return sim_time_; }

private:
  void update_camera_and_objective_(bool relocate, TickEvents& ev);
  Vec2 random_marker_position_();

  WorldConfig cfg_;
  WorldState  world_;
  std::mt19937 rng_;

  Pedestrian player_{};
  std::vector<Npc> npcs_;
  std::vector<Vehicle> vehicles_;

  Camera camera_{};
  Vec2   marker_{};
  double marker_distance_{0.0};
  bool   objective_reached_{false};

  SequenceMatcher seq_{};
  bool   boost_active_{false};
  double boost_phase_{0.0};

  std::uint64_t tick_{0};
  double sim_time_{0.0};
};

} // namespace tdw
