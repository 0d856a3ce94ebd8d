#pragma once

#include <facelens/core/frame.hpp>
#include <facelens/core/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace facelens::core {

/// Metadata the inference engine needs to interpret a contiguous image buffer.
struct ImageDescriptor {
  std::uint32_t width{0};
  std::uint32_t height{0};
  ImageRotation rotation{ImageRotation::Rotation0};
  PixelFormat format{PixelFormat::Unknown};
  std::uint32_t bytes_per_row{0};  // stride of the primary plane
  std::uint64_t sequence{0};

  /// Sensor-space size (pre-rotation).
  [[nodiscard]] Size size() const noexcept {
    return Size{static_cast<float>(width), static_cast<float>(height)};
  }
};

/// Detector input: one contiguous buffer plus its descriptor.
class InputImage {
 public:
  InputImage() = default;

  InputImage(std::vector<std::byte> bytes, ImageDescriptor descriptor)
      : bytes_(std::move(bytes)), descriptor_(descriptor) {}

  [[nodiscard]] const ImageDescriptor& descriptor() const noexcept { return descriptor_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(bytes_.data(), bytes_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return bytes_.size(); }

 private:
  std::vector<std::byte> bytes_;
  ImageDescriptor descriptor_{};
};

}  // namespace facelens::core
