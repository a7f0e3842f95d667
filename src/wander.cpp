#include <tdw/wander.hpp>

namespace tdw {

Vec2 Wander::sample_direction(std::mt19937& rng) {
  std::uniform_real_distribution<double> U(-1.0, 1.0);
  Vec2 d{U(rng), U(rng)};
  if (d.length_sq() == 0.0) d = Vec2{1.0, 0.0};
  return d.normalized();
}

double Wander::next_interval_(std::mt19937& rng) const {
  std::uniform_real_distribution<double> U(params_.min_interval, params_.max_interval);
  return U(rng);
}

Wander Wander::spawn(std::mt19937& rng, WanderParams params) {
  Wander w;
  w.params_ = params;
  w.dir_ = sample_direction(rng);
  w.timer_ = w.next_interval_(rng);
  return w;
}

Vec2 Wander::update(double dt, std::mt19937& rng) {
  timer_ -= dt;
  if (timer_ <= 0.0) {
    timer_ = next_interval_(rng);
    dir_ = sample_direction(rng);
  }
  return dir_;
}

} // namespace tdw
