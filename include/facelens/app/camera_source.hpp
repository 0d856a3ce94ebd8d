#pragma once

#include <facelens/core/error.hpp>
#include <facelens/core/frame.hpp>
#include <facelens/core/sensor.hpp>
#include <expected>
#include <functional>
#include <vector>

namespace facelens::app {

/// Receives every delivered frame, on the source's delivery thread.
using FrameCallback = std::function<void(core::CameraFrame)>;

/// Camera / frame producer. Delivery runs on a thread owned by the source.
class ICameraSource {
 public:
  virtual ~ICameraSource() = default;

  /// Sensors that can be started. Empty when the device has no usable camera.
  [[nodiscard]] virtual std::vector<core::SensorDescriptor> available_sensors() = 0;

  /// Starts continuous delivery from sensor. ResourceUnavailable if it cannot be opened.
  /// A running source is stopped first.
  [[nodiscard]] virtual std::expected<void, core::PipelineError> start(
      const core::SensorDescriptor& sensor,
      FrameCallback callback) = 0;

  /// Stops delivery and releases the device. No callback runs after stop() returns.
  virtual void stop() = 0;

  [[nodiscard]] virtual bool running() const = 0;
};

}  // namespace facelens::app
