#pragma once

#include <facelens/core/detection.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/input_image.hpp>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace facelens::vision {

/// Abstract face-detection engine: InputImage -> detections in sensor-space pixels.
/// Implement detect(); optionally override validate_input, detect_batch, warmup, close.
/// Implementations need not be thread-safe: the pipeline never calls detect() concurrently.
class IFaceDetector {
 public:
  virtual ~IFaceDetector() = default;

  /// Single-image detection. Must be implemented.
  [[nodiscard]] virtual std::expected<std::vector<core::Detection>, core::PipelineError>
  detect(const core::InputImage& input) = 0;

  /// Checks buffer size against the descriptor. Override for engine-specific limits.
  [[nodiscard]] virtual std::expected<void, core::PipelineError>
  validate_input(const core::InputImage& input) const;

  /// Default: loop over detect(); stops at the first error.
  [[nodiscard]] virtual std::expected<std::vector<std::vector<core::Detection>>,
                                      core::PipelineError>
  detect_batch(std::span<const core::InputImage> inputs);

  /// Optional warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}

  /// Forgets tracking state so ids are not carried across a sensor switch. Default: no-op.
  virtual void reset_tracking() {}

  /// Releases engine resources. detect() after close() returns ResourceUnavailable.
  virtual void close() {}

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace facelens::vision
