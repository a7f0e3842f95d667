#pragma once
#include <random>
#include <tdw/geom.hpp>

namespace tdw {

struct WanderParams {
  double min_interval = 1.0;   // seconds between direction changes
  double max_interval = 4.0;
};

// Random-walk intent generator for NPCs.
// Holds a unit direction until its countdown expires, then resamples.
class Wander {
public:
  Wander() = default;
  Wander(double timer, Vec2 dir, WanderParams params = {})
    : timer_(timer), dir_(dir), params_(params) {}

  // Fresh state: random direction, random timer.
  static Wander spawn(std::mt19937& rng, WanderParams params = {});

  // Advances the countdown and returns the direction to walk this tick.
  Vec2 update(double dt, std::mt19937& rng);

  double timer() const { return timer_; }
  const Vec2& direction() const { return dir_; }

  // Uniform over [-1,1]^2, +x when the sample is degenerate, normalized.
  static Vec2 sample_direction(std::mt19937& rng);

private:
  double next_interval_(std::mt19937& rng) const;

  double timer_{0.0};
  Vec2   dir_{1.0, 0.0};
  WanderParams params_{};
};

} // namespace tdw
