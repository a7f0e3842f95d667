#include <tdw/camera.hpp>

namespace tdw {

void Camera::update(const Vec2& target) {
  offset_.x = clamp(target.x - view_w_ * 0.5, 0.0, world_.width - view_w_);
  offset_.y = clamp(target.y - view_h_ * 0.5, 0.0, world_.height - view_h_);
}

} // namespace tdw
