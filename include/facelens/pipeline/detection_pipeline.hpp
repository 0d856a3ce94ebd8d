#pragma once

#include <facelens/core/detection_set.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/input_image.hpp>
#include <facelens/core/pipeline_state.hpp>
#include <facelens/pipeline/detection_publisher.hpp>
#include <facelens/vision/face_detector.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>

namespace facelens::pipeline {

/// Callback for per-inference timing: (frame sequence, duration_ms).
using InferenceTimingCallback = std::function<void(std::uint64_t sequence, double duration_ms)>;

struct DetectionPipelineOptions {
  /// Results arriving later than this are discarded as InferenceFailure. Zero disables.
  std::chrono::milliseconds inference_timeout{0};
};

/// Runs the face detector on an assembled image and publishes the result.
///
/// Success replaces the published DetectionSet (last-write-wins). Any failure (error return,
/// exception, timeout, malformed boxes) is logged and returned as InferenceFailure; the
/// previously published set stays visible. There are no retries. A result computed under a
/// sensor epoch that is no longer current is not published and returns StaleResult.
class DetectionPipeline {
 public:
  DetectionPipeline(std::unique_ptr<vision::IFaceDetector> detector,
                    DetectionPublisher& publisher,
                    DetectionPipelineOptions options = {});

  DetectionPipeline(const DetectionPipeline&) = delete;
  DetectionPipeline& operator=(const DetectionPipeline&) = delete;

  /// Detects faces in image. context is the sensor context captured with the source frame;
  /// it supplies the lens direction and epoch recorded in the DetectionSet.
  [[nodiscard]] std::expected<core::DetectionSet, core::PipelineError> process(
      const core::InputImage& image,
      const core::SensorContext& context);

  void set_timing_callback(InferenceTimingCallback callback) { timing_cb_ = std::move(callback); }

  /// Closes the detector; later process() calls fail with ResourceUnavailable.
  void close();

  /// Drops the detector's tracking state. Call only while no process() is running.
  void reset_tracking();

  [[nodiscard]] vision::IFaceDetector* detector() noexcept { return detector_.get(); }

  [[nodiscard]] std::uint64_t processed_count() const noexcept {
    return processed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] std::uint64_t failure_count() const noexcept {
    return failures_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] double last_inference_ms() const noexcept {
    return last_inference_ms_.load(std::memory_order_relaxed);
  }

 private:
  std::expected<std::vector<core::Detection>, core::PipelineError> run_detector(
      const core::InputImage& image);

  std::unique_ptr<vision::IFaceDetector> detector_;
  DetectionPublisher& publisher_;
  DetectionPipelineOptions options_;
  InferenceTimingCallback timing_cb_;
  bool closed_{false};

  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<double> last_inference_ms_{0.0};
};

/// True when every box is finite and has left <= right and top <= bottom.
[[nodiscard]] bool well_formed(const std::vector<core::Detection>& detections) noexcept;

}  // namespace facelens::pipeline
