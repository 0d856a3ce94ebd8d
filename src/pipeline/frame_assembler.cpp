#include <facelens/pipeline/frame_assembler.hpp>
#include <facelens/core/logger.hpp>
#include <cstddef>
#include <vector>

namespace facelens::pipeline {

core::ImageRotation effective_rotation(const core::SensorDescriptor& sensor,
                                       const RotationPolicy& policy) noexcept {
  int degrees = 0;
  switch (policy.platform) {
    case core::Platform::Android:
      degrees = sensor.sensor_orientation;
      if (policy.compensate_front_rotation &&
          sensor.lens_direction == core::LensDirection::Front) {
        degrees = (sensor.sensor_orientation + 90) % 360;
      }
      break;
    case core::Platform::Ios:
      degrees = sensor.sensor_orientation;
      break;
    case core::Platform::Desktop:
      degrees = 0;
      break;
  }
  return core::rotation_from_degrees(degrees).value_or(core::ImageRotation::Rotation0);
}

std::expected<core::InputImage, core::PipelineError> assemble_frame(
    const core::CameraFrame& frame,
    core::ImageRotation rotation) {
  if (frame.plane_count() == 0 || frame.width() == 0 || frame.height() == 0) {
    core::Logger::debug("assemble_frame: rejecting frame #", frame.sequence(), " (",
                        frame.width(), "x", frame.height(), ", ", frame.plane_count(),
                        " planes)");
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  std::vector<std::byte> bytes;
  bytes.reserve(frame.total_bytes());
  for (const auto& plane : frame.planes()) {
    bytes.insert(bytes.end(), plane.bytes.begin(), plane.bytes.end());
  }

  core::ImageDescriptor descriptor;
  descriptor.width = frame.width();
  descriptor.height = frame.height();
  descriptor.rotation = rotation;
  descriptor.format = frame.format();
  descriptor.bytes_per_row = frame.planes().front().bytes_per_row;
  descriptor.sequence = frame.sequence();
  return core::InputImage(std::move(bytes), descriptor);
}

}  // namespace facelens::pipeline
