#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace facelens::core {

/// Memory: each Plane owns its bytes (std::vector<std::byte>); a CameraFrame owns its
/// planes and is move-only, so exactly one pipeline stage holds a frame at a time.
/// Thread-safety: distinct CameraFrame instances are independent.

/// Pixel layout tag as delivered by the camera and understood by the detector.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Nv21,      // Y plane + interleaved VU plane (Android default)
  Yuv420,    // three planes Y, U, V
  Bgra8888,  // single packed plane (iOS default)
  Gray8,
};

/// Clockwise rotation needed to bring the sensor image upright.
enum class ImageRotation : std::uint16_t {
  Rotation0 = 0,
  Rotation90 = 90,
  Rotation180 = 180,
  Rotation270 = 270,
};

/// Maps 0/90/180/270 (any multiple of 360 added) to ImageRotation; nullopt otherwise.
[[nodiscard]] std::optional<ImageRotation> rotation_from_degrees(int degrees) noexcept;

[[nodiscard]] constexpr int degrees(ImageRotation rotation) noexcept {
  return static_cast<int>(rotation);
}

/// True for 90 and 270: the upright image has width and height swapped.
[[nodiscard]] constexpr bool swaps_axes(ImageRotation rotation) noexcept {
  return rotation == ImageRotation::Rotation90 || rotation == ImageRotation::Rotation270;
}

/// One plane of a captured image.
struct Plane {
  std::vector<std::byte> bytes;
  std::uint32_t bytes_per_row{0};
  std::optional<std::uint32_t> bytes_per_pixel;
};

/// Single captured camera frame: dimensions, format, ordered planes, capture metadata.
class CameraFrame {
 public:
  using Clock = std::chrono::steady_clock;

  CameraFrame() = default;

  CameraFrame(std::uint32_t width,
              std::uint32_t height,
              PixelFormat format,
              std::vector<Plane> planes,
              std::uint64_t sequence = 0,
              Clock::time_point captured_at = Clock::now())
      : width_(width),
        height_(height),
        format_(format),
        planes_(std::move(planes)),
        sequence_(sequence),
        captured_at_(captured_at) {}

  CameraFrame(CameraFrame&&) noexcept = default;
  CameraFrame& operator=(CameraFrame&&) noexcept = default;
  CameraFrame(const CameraFrame&) = delete;
  CameraFrame& operator=(const CameraFrame&) = delete;

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
  [[nodiscard]] Clock::time_point captured_at() const noexcept { return captured_at_; }

  [[nodiscard]] std::span<const Plane> planes() const noexcept {
    return std::span<const Plane>(planes_.data(), planes_.size());
  }
  [[nodiscard]] std::size_t plane_count() const noexcept { return planes_.size(); }

  /// Sum of all plane sizes.
  [[nodiscard]] std::size_t total_bytes() const noexcept;

  /// Number of planes the format is delivered in (0 for Unknown).
  [[nodiscard]] static std::size_t expected_planes(PixelFormat format) noexcept;

  /// Minimum contiguous bytes for tightly packed data of this size and format.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<Plane> planes_;
  std::uint64_t sequence_{0};
  Clock::time_point captured_at_{};
};

}  // namespace facelens::core
