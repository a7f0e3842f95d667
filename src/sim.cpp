#include <tdw/sim.hpp>
#include <utility>

namespace tdw {

Simulation::Simulation(const WorldConfig& cfg, WorldState world, std::uint32_t seed)
  : cfg_(cfg), world_(std::move(world)), rng_(seed),
    camera_(cfg.view_w, cfg.view_h, world_.bounds) {
  player_.id = kPlayerId;
  player_.pos = world_.player_spawn;
  player_.speed = cfg_.player_speed;
  player_.size = cfg_.player_size;

  npcs_.reserve(world_.npc_spawns.size());
  AgentId next_id = kPlayerId + 1;
  for (const auto& s : world_.npc_spawns) {
    Npc n;
    n.body.id = next_id++;
    n.body.pos = s.pos;
    n.body.speed = s.speed;
    n.body.size = cfg_.npc_size;
    n.wander = Wander::spawn(rng_, cfg_.wander);
    npcs_.push_back(n);
  }

  Vehicle car;
  car.id = 0;
  car.pos = world_.vehicle_spawn;
  car.params = cfg_.vehicle;
  vehicles_.push_back(car);

  marker_ = world_.marker;
  camera_.update(camera_target());
  marker_distance_ = distance(camera_target(), marker_);
  objective_reached_ = marker_distance_ < cfg_.objective_radius;
}

std::optional<Simulation> Simulation::create(std::uint32_t seed, const WorldConfig& cfg) {
  auto ws = generate_world(seed, cfg);
  if (!ws) return std::nullopt;
  return Simulation(cfg, std::move(*ws), seed);
}

const Vehicle* Simulation::vehicle_by_id(VehicleId id) const {
  for (const auto& v : vehicles_) if (v.id == id) return &v;
  return nullptr;
}
Vehicle* Simulation::vehicle_by_id(VehicleId id) {
  for (auto& v : vehicles_) if (v.id == id) return &v;
  return nullptr;
}

const Vehicle* Simulation::player_vehicle() const {
  if (!player_.vehicle) return nullptr;
  return vehicle_by_id(*player_.vehicle);
}

Vec2 Simulation::camera_target() const {
  if (const Vehicle* v = player_vehicle()) return v->pos;
  return player_.pos;
}

Vec2 Simulation::random_marker_position_() {
  const double m = cfg_.marker_margin;
  const double W = world_.bounds.width, H = world_.bounds.height;
  auto pick = [&](double lo, double hi) {
    if (hi <= lo) return 0.5 * (lo + hi);
    std::uniform_real_distribution<double> U(lo, hi);
    return U(rng_);
  };
  return Vec2{pick(m, W - m), pick(m, H - m)};
}

void Simulation::update_camera_and_objective_(bool relocate, TickEvents& ev) {
  const Vec2 target = camera_target();
  camera_.update(target);

  marker_distance_ = distance(target, marker_);
  objective_reached_ = marker_distance_ < cfg_.objective_radius;
  if (objective_reached_ && relocate) {
    marker_ = random_marker_position_();
    ev.marker_relocated = true;
  }
}

TickEvents Simulation::step(const TickInput& in, double dt) {
  TickEvents ev{};
  if (dt < 0.0) dt = 0.0;

  // Keystroke log -> boost mode
  for (Keystroke k : in.keys) {
    if (seq_.push(k)) {
      boost_active_ = true;
      boost_phase_ = 0.0;
      ev.boost_triggered = true;
    }
  }

  if (in.interact) {
    ev.possession = interact(player_, vehicles_, cfg_.possession,
                             world_.obstacles, world_.bounds);
  }

  if (boost_active_) {
    boost_phase_ += dt;
    player_.speed = cfg_.boost_speed;
  } else {
    player_.speed = cfg_.player_speed;
  }

  // Vehicles first; the player's intent steers the vehicle it occupies.
  static const MoveIntent kNoControls{};
  for (auto& v : vehicles_) {
    const bool player_driving = v.driver.has_value() && *v.driver == player_.id;
    if (drive(v, player_driving ? in.move : kNoControls, dt,
              world_.obstacles, world_.bounds)) {
      ++ev.vehicle_hits;
    }
  }

  if (const Vehicle* v = player_vehicle()) {
    player_.pos = v->pos;  // cosmetic parity while embedded
  } else {
    walk(player_, in.move.direction(), dt, world_.obstacles, world_.bounds);
  }

  for (auto& n : npcs_) {
    const Vec2 dir = n.wander.update(dt, rng_);
    walk(n.body, dir, dt, world_.obstacles, world_.bounds);
  }

  update_camera_and_objective_(in.relocate, ev);

  sim_time_ += dt;
  ++tick_;
  return ev;
}

} // namespace tdw
