#include <tdw/sim_runner.hpp>
#include <algorithm>
#include <utility>

namespace tdw {

SimRunner::SimRunner(WorldConfig cfg) : cfg_(std::move(cfg)) {}

bool SimRunner::reset(std::uint32_t seed) {
  auto fresh = Simulation::create(seed, cfg_);
  if (!fresh) return false;
  sim_.emplace(std::move(*fresh));
  seed_ = seed;
  events_ = TickEvents{};
  held_ = TickInput{};
  snap_ = make_snapshot_(*sim_, snap_.fps);
  return true;
}

void SimRunner::request_reseed(std::uint32_t seed) {
  pending_seed_ = seed;
}

const SimSnapshot& SimRunner::advance(const TickInput& in, double frame_dt, double fps) {
  if (pending_seed_) {
    const std::uint32_t s = *pending_seed_;
    pending_seed_.reset();
    reseed_failed_ = !reset(s);  // on failure the current world keeps running
  }
  if (!sim_) return snap_;

  events_ = TickEvents{};
  if (paused()) {
    hold_(in);
  } else {
    // A zero frame time still steps so presses on that frame are applied.
    const double dt_eff = std::max(0.0, frame_dt) * time_scale;
    events_ = sim_->step(take_held_(in), dt_eff);
  }
  // publish heartbeats even when paused
  snap_ = make_snapshot_(*sim_, fps);
  return snap_;
}

void SimRunner::hold_(const TickInput& in) {
  held_.interact = held_.interact || in.interact;
  held_.relocate = held_.relocate || in.relocate;
  for (Keystroke k : in.keys) {
    if (held_.keys.size() >= kMaxHeldKeys) held_.keys.erase(held_.keys.begin());
    held_.keys.push_back(k);
  }
}

TickInput SimRunner::take_held_(const TickInput& in) {
  TickInput merged = std::move(held_);
  held_ = TickInput{};
  merged.move = in.move;
  merged.interact = merged.interact || in.interact;
  merged.relocate = merged.relocate || in.relocate;
  merged.keys.insert(merged.keys.end(), in.keys.begin(), in.keys.end());
  return merged;
}

SimSnapshot SimRunner::make_snapshot_(const Simulation& sim, double fps) {
  SimSnapshot s{};
  s.tick = sim.tick();
  s.sim_time = sim.sim_time();
  s.fps = fps;

  const auto& p = sim.player();
  s.player = AgentPose{p.id, p.pos.x, p.pos.y, p.size};
  s.player_in_vehicle = !p.on_foot();

  s.npcs.reserve(sim.npcs().size());
  for (const auto& n : sim.npcs()) {
    s.npcs.push_back(AgentPose{n.body.id, n.body.pos.x, n.body.pos.y, n.body.size});
  }

  s.vehicles.reserve(sim.vehicles().size());
  for (const auto& v : sim.vehicles()) {
    VehiclePose vp{};
    vp.id = v.id;
    vp.x = v.pos.x; vp.y = v.pos.y;
    vp.heading_deg = v.heading_deg;
    vp.speed = v.speed();
    vp.width = v.params.width; vp.height = v.params.height;
    vp.occupied = v.occupied();
    s.vehicles.push_back(vp);
  }

  s.marker_x = sim.marker().x;
  s.marker_y = sim.marker().y;
  s.marker_distance = sim.marker_distance();
  s.objective_reached = sim.objective_reached();

  s.boost_active = sim.boost_active();
  s.boost_phase = sim.boost_phase();

  const auto& cam = sim.camera();
  s.camera_x = cam.offset().x;
  s.camera_y = cam.offset().y;
  s.view_w = cam.view_width();
  s.view_h = cam.view_height();
  return s;
}

} // namespace tdw
