#include <facelens/core/orientation.hpp>

namespace facelens::core {

Size upright_size(const Size& sensor_size, ImageRotation rotation) noexcept {
  if (swaps_axes(rotation)) {
    return Size{sensor_size.height, sensor_size.width};
  }
  return sensor_size;
}

Rect upright_to_sensor(const Rect& upright,
                       const Size& sensor_size,
                       ImageRotation rotation) noexcept {
  const float w = sensor_size.width;
  const float h = sensor_size.height;
  switch (rotation) {
    case ImageRotation::Rotation90:
      // sensor (x, y) -> upright (h - y, x)
      return Rect{upright.top, h - upright.right, upright.bottom, h - upright.left};
    case ImageRotation::Rotation180:
      // sensor (x, y) -> upright (w - x, h - y)
      return Rect{w - upright.right, h - upright.bottom, w - upright.left, h - upright.top};
    case ImageRotation::Rotation270:
      // sensor (x, y) -> upright (y, w - x)
      return Rect{w - upright.bottom, upright.left, w - upright.top, upright.right};
    case ImageRotation::Rotation0:
    default:
      return upright;
  }
}

}  // namespace facelens::core
