#include <facelens/core/frame.hpp>
#include <cstddef>

namespace facelens::core {

std::optional<ImageRotation> rotation_from_degrees(int degrees) noexcept {
  const int normalized = ((degrees % 360) + 360) % 360;
  switch (normalized) {
    case 0:
      return ImageRotation::Rotation0;
    case 90:
      return ImageRotation::Rotation90;
    case 180:
      return ImageRotation::Rotation180;
    case 270:
      return ImageRotation::Rotation270;
    default:
      return std::nullopt;
  }
}

std::size_t CameraFrame::total_bytes() const noexcept {
  std::size_t total = 0;
  for (const auto& plane : planes_) {
    total += plane.bytes.size();
  }
  return total;
}

std::size_t CameraFrame::expected_planes(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Nv21:
      return 2;
    case PixelFormat::Yuv420:
      return 3;
    case PixelFormat::Bgra8888:
    case PixelFormat::Gray8:
      return 1;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t CameraFrame::min_bytes(std::uint32_t width,
                                   std::uint32_t height,
                                   PixelFormat format) noexcept {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Nv21:
    case PixelFormat::Yuv420:
      return pixels + pixels / 2;  // 4:2:0 chroma
    case PixelFormat::Bgra8888:
      return pixels * 4;
    case PixelFormat::Gray8:
      return pixels;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

}  // namespace facelens::core
