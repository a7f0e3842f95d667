#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <tdw/sim.hpp>
#include <tdw/snap.hpp>
#include <tdw/world_config.hpp>

namespace tdw {

// Owns the session: builds the simulation, advances it once per frame with the
// measured frame time, and keeps the snapshot the presenter draws from.
class SimRunner {
public:
  explicit SimRunner(WorldConfig cfg = default_world_config());

  // Regenerates the world. Returns false (and keeps the current session) if
  // the world could not be generated.
  bool reset(std::uint32_t seed);

  // Deferred reset, applied at the start of the next advance().
  void request_reseed(std::uint32_t seed);

  // One frame: apply pending reseed, step (unless paused), publish a snapshot.
  // Frames with zero frame_dt still step. While paused, interact/relocate
  // presses and keystrokes are held and applied on the first unpaused frame.
  const SimSnapshot& advance(const TickInput& in, double frame_dt, double fps = 0.0);

  bool ready() const { return sim_.has_value(); }
  const Simulation* sim() const { return sim_ ? &*sim_ : nullptr; }
  Simulation*       sim() { return sim_ ? &*sim_ : nullptr; }
  const WorldConfig& config() const { return cfg_; }
  std::uint32_t seed() const { return seed_; }

  const SimSnapshot& latest() const { return snap_; }
  const TickEvents& last_events() const { return events_; }
  // True when the most recent deferred reseed could not generate a world.
  bool reseed_failed() const { return reseed_failed_; }

  bool paused() const { return time_scale <= 0.0; }

  // Control surface
  double time_scale{1.0}; // 0.0 = paused

private:
  static SimSnapshot make_snapshot_(const Simulation& sim, double fps);
  void hold_(const TickInput& in);
  TickInput take_held_(const TickInput& in);

  static constexpr std::size_t kMaxHeldKeys = 64;

  WorldConfig cfg_;
  std::optional<Simulation> sim_;
  std::uint32_t seed_{0};
  std::optional<std::uint32_t> pending_seed_;
  bool reseed_failed_{false};

  SimSnapshot snap_{};
  TickEvents events_{};
  TickInput held_{};  // one-shot input collected while paused
};

} // namespace tdw
