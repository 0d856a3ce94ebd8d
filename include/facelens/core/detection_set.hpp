#pragma once

#include <facelens/core/detection.hpp>
#include <facelens/core/frame.hpp>
#include <facelens/core/geometry.hpp>
#include <facelens/core/sensor.hpp>
#include <cstdint>
#include <vector>

namespace facelens::core {

/// Detections of one frame bundled with the geometry context they were computed under.
/// image_size, lens_direction and rotation always come from the same frame as detections.
struct DetectionSet {
  std::vector<Detection> detections;
  Size image_size{};
  LensDirection lens_direction{LensDirection::Back};
  ImageRotation rotation{ImageRotation::Rotation0};
  std::uint64_t sequence{0};      // source frame sequence number
  std::uint64_t sensor_epoch{0};  // PipelineState epoch the frame was captured in
};

}  // namespace facelens::core
