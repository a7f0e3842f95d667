#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>
#include <tdw/geom.hpp>
#include <tdw/world.hpp>
#include <tdw/world_config.hpp>

namespace tdw {

struct NpcSpawn {
  Vec2   pos{};
  double speed = 0.0;
};

// Static world plus initial agent placement produced once per session.
struct WorldState {
  WorldBounds bounds{};
  ObstacleSet obstacles{};
  std::vector<Rect> roads{};
  Vec2 marker{};
  Vec2 player_spawn{};
  std::vector<NpcSpawn> npc_spawns{};
  Vec2 vehicle_spawn{};
};

// Rejection sampling: uniform points in region until a size x size box centered
// there clears every obstacle. nullopt when the attempt budget runs out.
std::optional<Vec2> find_spawn(std::mt19937& rng, const Rect& region, double size,
                               const ObstacleSet& obstacles, std::size_t attempts);

// Buildings only (grid + scattered, or cfg.buildings when given).
ObstacleSet generate_obstacles(const WorldConfig& cfg, std::mt19937& rng);

// Pure function of (seed, cfg). nullopt if an agent cannot be placed.
std::optional<WorldState> generate_world(std::uint32_t seed, const WorldConfig& cfg);

} // namespace tdw
