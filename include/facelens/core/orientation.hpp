#pragma once

#include <facelens/core/frame.hpp>
#include <facelens/core/geometry.hpp>

namespace facelens::core {

/// Size of the image after applying rotation (width and height swap for 90 and 270).
[[nodiscard]] Size upright_size(const Size& sensor_size, ImageRotation rotation) noexcept;

/// Maps a box found on the upright (rotated) image back into sensor space.
/// sensor_size is the frame size as delivered, before rotation.
[[nodiscard]] Rect upright_to_sensor(const Rect& upright,
                                     const Size& sensor_size,
                                     ImageRotation rotation) noexcept;

}  // namespace facelens::core
