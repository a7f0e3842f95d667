#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>
#include <tdw/geom.hpp>

namespace tdw {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};
  bool operator==(const Rgb&) const = default;
};

// World extent; valid positions are [0,width] x [0,height].
struct WorldBounds {
  double width{6000.0};
  double height{4000.0};

  Vec2 clamp(const Vec2& p) const {
    return {tdw::clamp(p.x, 0.0, width), tdw::clamp(p.y, 0.0, height)};
  }
  bool contains(const Vec2& p) const {
    return p.x >= 0.0 && p.x <= width && p.y >= 0.0 && p.y <= height;
  }
};

// Static building. Never moves once created.
struct Obstacle {
  Rect rect;
  Rgb  roof;   // cosmetic only
};

// Immutable set of obstacles; collision queries are read-only linear scans.
class ObstacleSet {
public:
  ObstacleSet() = default;
  explicit ObstacleSet(std::vector<Obstacle> obs) : obs_(std::move(obs)) {}

  const std::vector<Obstacle>& items() const { return obs_; }
  std::size_t size() const { return obs_.size(); }
  bool empty() const { return obs_.empty(); }

  // First obstacle overlapping r, or nullptr.
  const Obstacle* first_overlap(const Rect& r) const;
  bool any_overlap(const Rect& r) const { return first_overlap(r) != nullptr; }

private:
  std::vector<Obstacle> obs_;
};

} // namespace tdw
