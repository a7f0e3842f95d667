#pragma once
#include <tdw/geom.hpp>
#include <tdw/world.hpp>

namespace tdw {

// Follows a target and maps world coordinates to viewport coordinates.
// The visible area stays inside the world unless the world is smaller than the view.
class Camera {
public:
  Camera() = default;
  Camera(double view_w, double view_h, WorldBounds world)
    : view_w_(view_w), view_h_(view_h), world_(world) {}

  void update(const Vec2& target);

  Vec2 world_to_screen(const Vec2& p) const { return p - offset_; }
  Vec2 screen_to_world(const Vec2& p) const { return p + offset_; }

  const Vec2& offset() const { return offset_; }
  double view_width() const { return view_w_; }
  double view_height() const { return view_h_; }
  Rect view_rect() const { return Rect{offset_.x, offset_.y, view_w_, view_h_}; }

private:
  Vec2   offset_{};
  double view_w_{1280.0};
  double view_h_{720.0};
  WorldBounds world_{};
};

} // namespace tdw
