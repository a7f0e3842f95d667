#include <tdw/world_config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <stdexcept>

namespace tdw {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> split_csv(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size() && std::isfinite(v);
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static std::optional<Rect> parse_rect(const std::string& value) {
  const auto cols = split_csv(value);
  if (cols.size() != 4) return std::nullopt;
  double v[4];
  for (std::size_t i = 0; i < 4; ++i) {
    bool ok = false;
    v[i] = to_double_safe(cols[i], ok);
    if (!ok) return std::nullopt;
  }
  if (v[2] <= 0.0 || v[3] <= 0.0) return std::nullopt;
  return Rect{v[0], v[1], v[2], v[3]};
}

static std::vector<Rect> default_roads(const WorldBounds& b) {
  return {
    Rect{0.0,    900.0,  b.width, 160.0},
    Rect{400.0,  0.0,    200.0,   b.height},
    Rect{1200.0, 1200.0, 1000.0,  140.0},
    Rect{2000.0, 200.0,  300.0,   b.height},
  };
}

WorldConfig default_world_config() {
  WorldConfig cfg;
  cfg.roads = default_roads(cfg.bounds);
  return cfg;
}

// Accepted range of a numeric key.
enum class Bound { Any, NonNegative, Positive, UnitInterval, Fraction, Rebound };

struct NumericField {
  double* value = nullptr;
  Bound bound = Bound::Any;
};

static bool in_bound(double v, Bound b) {
  switch (b) {
    case Bound::Any:          return true;
    case Bound::NonNegative:  return v >= 0.0;
    case Bound::Positive:     return v > 0.0;
    case Bound::UnitInterval: return v > 0.0 && v <= 1.0;   // (0, 1]
    case Bound::Fraction:     return v >= 0.0 && v <= 1.0;  // [0, 1]
    case Bound::Rebound:      return v >= -1.0 && v <= 0.0; // reverses, never amplifies
  }
  return false;
}

// Maps a key to the double it controls and its accepted range.
static NumericField numeric_field(WorldConfig& c, const std::string& key) {
  using B = Bound;
  if (key == "world_width")        return {&c.bounds.width, B::Positive};
  if (key == "world_height")       return {&c.bounds.height, B::Positive};
  if (key == "view_width")         return {&c.view_w, B::Positive};
  if (key == "view_height")        return {&c.view_h, B::Positive};
  if (key == "marker_x")           return {&c.marker.x, B::Any};
  if (key == "marker_y")           return {&c.marker.y, B::Any};
  if (key == "objective_radius")   return {&c.objective_radius, B::NonNegative};
  if (key == "marker_margin")      return {&c.marker_margin, B::NonNegative};
  if (key == "player_size")        return {&c.player_size, B::Positive};
  if (key == "player_speed")       return {&c.player_speed, B::NonNegative};
  if (key == "boost_speed")        return {&c.boost_speed, B::NonNegative};
  if (key == "npc_size")           return {&c.npc_size, B::Positive};
  if (key == "npc_speed_min")      return {&c.npc_speed.lo, B::NonNegative};
  if (key == "npc_speed_max")      return {&c.npc_speed.hi, B::NonNegative};
  if (key == "wander_min")         return {&c.wander.min_interval, B::NonNegative};
  if (key == "wander_max")         return {&c.wander.max_interval, B::NonNegative};
  if (key == "vehicle_x")          return {&c.vehicle_spawn.x, B::Any};
  if (key == "vehicle_y")          return {&c.vehicle_spawn.y, B::Any};
  if (key == "vehicle_max_speed")  return {&c.vehicle.max_speed, B::NonNegative};
  if (key == "vehicle_accel")      return {&c.vehicle.accel, B::NonNegative};
  if (key == "vehicle_brake")      return {&c.vehicle.brake, B::NonNegative};
  if (key == "vehicle_turn_rate")  return {&c.vehicle.turn_rate, B::NonNegative};
  if (key == "vehicle_friction")   return {&c.vehicle.friction, B::UnitInterval};
  if (key == "vehicle_bounce")     return {&c.vehicle.bounce, B::Rebound};
  if (key == "interact_radius")    return {&c.possession.interact_radius, B::NonNegative};
  if (key == "exit_offset")        return {&c.possession.exit_offset, B::NonNegative};
  if (key == "exit_damping")       return {&c.possession.exit_damping, B::Fraction};
  return {};
}

struct CountField {
  std::size_t* value = nullptr;
  double max = 0.0;
};

static constexpr double kMaxAgents = 10000.0;
static constexpr double kMaxSpawnAttempts = 1000000.0;

static CountField count_field(WorldConfig& c, const std::string& key) {
  if (key == "npc_count")        return {&c.npc_count, kMaxAgents};
  if (key == "scattered_count")  return {&c.scattered.count, kMaxAgents};
  if (key == "spawn_attempts")   return {&c.spawn_attempts, kMaxSpawnAttempts};
  return {};
}

static bool apply_entry(WorldConfig& cfg, const std::string& key, const std::string& value,
                        bool& roads_seen) {
  if (key == "road" || key == "building") {
    auto r = parse_rect(value);
    if (!r) return false;
    if (key == "road") {
      if (!roads_seen) { cfg.roads.clear(); roads_seen = true; }
      cfg.roads.push_back(*r);
    } else {
      cfg.buildings.push_back(*r);
    }
    return true;
  }

  if (key == "vehicle_policy") {
    const auto v = lower(value);
    if (v == "single_pass")    { cfg.vehicle.policy = CollisionPolicy::SinglePassBounce; return true; }
    if (v == "bounce_or_hold") { cfg.vehicle.policy = CollisionPolicy::BounceOrHold; return true; }
    return false;
  }

  bool ok = false;
  const double v = to_double_safe(value, ok);
  if (!ok) return false;

  if (const NumericField f = numeric_field(cfg, key); f.value) {
    if (!in_bound(v, f.bound)) return false;
    *f.value = v;
    return true;
  }
  if (const CountField f = count_field(cfg, key); f.value) {
    // whole numbers only; the cap also keeps the size_t conversion defined
    if (v < 0.0 || v > f.max || v != std::floor(v)) return false;
    *f.value = static_cast<std::size_t>(v);
    return true;
  }
  return false;
}

// A min/max pair written in the wrong order falls back to the defaults.
static void check_range(Range& r, const Range& fallback, const char* lo_key, const char* hi_key,
                        const std::map<std::string, std::string>& lines,
                        std::vector<std::string>* rejected) {
  if (r.lo <= r.hi) return;
  r = fallback;
  if (!rejected) return;
  for (const char* k : {lo_key, hi_key}) {
    if (auto it = lines.find(k); it != lines.end()) rejected->push_back(it->second);
  }
}

WorldConfig world_config_from_stream(std::istream& in, std::vector<std::string>* rejected) {
  WorldConfig cfg = default_world_config();
  bool roads_seen = false;
  const WorldBounds initial = cfg.bounds;
  std::map<std::string, std::string> applied;  // key -> last line that set it
  std::string line;

  while (std::getline(in, line)) {
    // Strip trailing comments, then whitespace
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    std::string raw = trim(line);
    if (raw.empty()) continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      if (rejected) rejected->push_back(raw);
      continue;
    }
    const std::string key = lower(trim(raw.substr(0, eq)));
    const std::string value = trim(raw.substr(eq + 1));
    if (key.empty() || value.empty() || !apply_entry(cfg, key, value, roads_seen)) {
      if (rejected) rejected->push_back(raw);
      continue;
    }
    applied[key] = raw;
  }

  const WorldConfig stock = default_world_config();
  check_range(cfg.npc_speed, stock.npc_speed, "npc_speed_min", "npc_speed_max", applied, rejected);
  Range wander{cfg.wander.min_interval, cfg.wander.max_interval};
  check_range(wander, Range{stock.wander.min_interval, stock.wander.max_interval},
              "wander_min", "wander_max", applied, rejected);
  cfg.wander.min_interval = wander.lo;
  cfg.wander.max_interval = wander.hi;

  // Stock roads follow a resized world unless the file lists its own.
  if (!roads_seen &&
      (cfg.bounds.width != initial.width || cfg.bounds.height != initial.height)) {
    cfg.roads = default_roads(cfg.bounds);
  }
  return cfg;
}

std::optional<WorldConfig> load_world_config(const std::string& path,
                                             std::vector<std::string>* rejected) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return world_config_from_stream(f, rejected);
}

} // namespace tdw
