#pragma once

#include <facelens/core/error.hpp>
#include <facelens/core/frame.hpp>
#include <facelens/core/input_image.hpp>
#include <facelens/core/sensor.hpp>
#include <expected>

namespace facelens::pipeline {

/// How the host delivers images relative to the sensor mounting.
struct RotationPolicy {
  core::Platform platform{core::Platform::Android};
  /// Android only: add 90 degrees for front-facing sensors. Observed to be needed on the
  /// devices this was built against; not derived from sensor metadata.
  bool compensate_front_rotation{true};
};

/// Rotation the detector must apply to see the image upright.
/// Android: sensor orientation, +90 (mod 360) for front sensors when compensation is on.
/// iOS: sensor orientation. Desktop: delivery is already upright, always 0.
/// Orientations that are not a multiple of 90 fall back to 0.
[[nodiscard]] core::ImageRotation effective_rotation(const core::SensorDescriptor& sensor,
                                                     const RotationPolicy& policy) noexcept;

/// Concatenates the frame's planes, in delivery order and without padding, into one buffer.
/// Descriptor bytes_per_row is the primary plane's stride.
/// Zero planes or a zero dimension yields InvalidFrame.
[[nodiscard]] std::expected<core::InputImage, core::PipelineError> assemble_frame(
    const core::CameraFrame& frame,
    core::ImageRotation rotation);

}  // namespace facelens::pipeline
