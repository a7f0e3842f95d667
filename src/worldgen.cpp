#include <tdw/worldgen.hpp>
#include <algorithm>

namespace tdw {

static std::uint8_t jitter_channel(std::uint8_t base, int jitter, std::mt19937& rng) {
  if (jitter <= 0) return base;
  std::uniform_int_distribution<int> J(-jitter, jitter);
  return static_cast<std::uint8_t>(std::clamp(int(base) + J(rng), 0, 255));
}

static Rgb roof_tint(const WorldConfig& cfg, std::mt19937& rng) {
  return Rgb{
    jitter_channel(cfg.roof_base.r, cfg.roof_jitter, rng),
    jitter_channel(cfg.roof_base.g, cfg.roof_jitter, rng),
    jitter_channel(cfg.roof_base.b, cfg.roof_jitter, rng),
  };
}

static double uniform(std::mt19937& rng, double lo, double hi) {
  if (hi <= lo) return lo;
  std::uniform_real_distribution<double> U(lo, hi);
  return U(rng);
}

std::optional<Vec2> find_spawn(std::mt19937& rng, const Rect& region, double size,
                               const ObstacleSet& obstacles, std::size_t attempts) {
  for (std::size_t i = 0; i < attempts; ++i) {
    const Vec2 p{uniform(rng, region.left, region.right()),
                 uniform(rng, region.top, region.bottom())};
    if (!obstacles.any_overlap(Rect::centered_at(p, size, size))) return p;
  }
  return std::nullopt;
}

ObstacleSet generate_obstacles(const WorldConfig& cfg, std::mt19937& rng) {
  std::vector<Obstacle> obs;

  if (!cfg.buildings.empty()) {
    obs.reserve(cfg.buildings.size());
    for (const auto& r : cfg.buildings) obs.push_back(Obstacle{r, roof_tint(cfg, rng)});
    return ObstacleSet{std::move(obs)};
  }

  // Sparse grid near the city center
  const auto& g = cfg.grid;
  if (g.x_step > 0.0 && g.y_step > 0.0) {
    for (double rx = g.x0; rx < g.x1; rx += g.x_step) {
      for (double ry = g.y0; ry < g.y1; ry += g.y_step) {
        const double w = uniform(rng, g.width.lo, g.width.hi);
        const double h = uniform(rng, g.height.lo, g.height.hi);
        const double x = rx + uniform(rng, -g.jitter, g.jitter);
        const double y = ry + uniform(rng, -g.jitter, g.jitter);
        obs.push_back(Obstacle{Rect{x, y, w, h}, roof_tint(cfg, rng)});
      }
    }
  }

  // A few scattered elsewhere
  const auto& s = cfg.scattered;
  const double W = cfg.bounds.width, H = cfg.bounds.height;
  for (std::size_t i = 0; i < s.count; ++i) {
    const double x = uniform(rng, s.edge_margin, W - s.far_margin);
    const double y = uniform(rng, s.edge_margin, H - s.far_margin);
    const double w = uniform(rng, s.size.lo, s.size.hi);
    const double h = uniform(rng, s.size.lo, s.size.hi);
    obs.push_back(Obstacle{Rect{x, y, w, h}, roof_tint(cfg, rng)});
  }
  return ObstacleSet{std::move(obs)};
}

std::optional<WorldState> generate_world(std::uint32_t seed, const WorldConfig& cfg) {
  std::mt19937 rng(seed);
  WorldState ws;
  ws.bounds = cfg.bounds;
  ws.obstacles = generate_obstacles(cfg, rng);
  ws.roads = cfg.roads;
  ws.marker = cfg.bounds.clamp(cfg.marker);
  ws.vehicle_spawn = cfg.bounds.clamp(cfg.vehicle_spawn);
  // The car spawn is fixed, so a building on top of it fails the world.
  if (ws.obstacles.any_overlap(Rect::centered_at(ws.vehicle_spawn, cfg.vehicle.width,
                                                 cfg.vehicle.height))) {
    return std::nullopt;
  }

  const double W = cfg.bounds.width, H = cfg.bounds.height;
  const double plo = cfg.player_spawn_lo;
  const Rect player_region{plo, plo,
                           std::max(0.0, W - cfg.player_spawn_hi - plo),
                           std::max(0.0, H - cfg.player_spawn_hi - plo)};
  auto player = find_spawn(rng, player_region, cfg.player_size, ws.obstacles, cfg.spawn_attempts);
  if (!player) return std::nullopt;
  ws.player_spawn = *player;

  const double m = cfg.npc_spawn_margin;
  const Rect npc_region{m, m, std::max(0.0, W - 2.0 * m), std::max(0.0, H - 2.0 * m)};
  ws.npc_spawns.reserve(cfg.npc_count);
  for (std::size_t i = 0; i < cfg.npc_count; ++i) {
    auto p = find_spawn(rng, npc_region, cfg.npc_size, ws.obstacles, cfg.spawn_attempts);
    if (!p) return std::nullopt;
    ws.npc_spawns.push_back(NpcSpawn{*p, uniform(rng, cfg.npc_speed.lo, cfg.npc_speed.hi)});
  }
  return ws;
}

} // namespace tdw
