#pragma once

#include <facelens/app/camera_source.hpp>
#include <facelens/core/error.hpp>
#include <facelens/core/pipeline_state.hpp>
#include <facelens/pipeline/detection_pipeline.hpp>
#include <facelens/pipeline/detection_publisher.hpp>
#include <facelens/pipeline/frame_assembler.hpp>
#include <facelens/pipeline/frame_processor.hpp>
#include <facelens/vision/face_detector.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace facelens::app {

struct SessionOptions {
  pipeline::RotationPolicy rotation{};
  pipeline::DetectionPipelineOptions pipeline{};
};

/// Owns the camera, the detector and the pipeline between them for one camera screen.
///
/// Control methods (initialize, switch_to, toggle_camera, shutdown) are meant for the UI thread
/// and are serialised internally. A sensor switch stops delivery, waits for the in-flight
/// inference, resets PipelineState and clears the published set before the new sensor
/// starts. Destruction shuts down: delivery stops, the worker joins and the detector is closed
/// even if an earlier teardown step throws.
class FaceCameraSession {
 public:
  using PreviewCallback = std::function<void(const core::CameraFrame&)>;

  FaceCameraSession(std::unique_ptr<ICameraSource> camera,
                    std::unique_ptr<vision::IFaceDetector> detector,
                    SessionOptions options = {});
  ~FaceCameraSession();

  FaceCameraSession(const FaceCameraSession&) = delete;
  FaceCameraSession& operator=(const FaceCameraSession&) = delete;

  /// Enumerates sensors and starts the first front-facing one (index 0 if there is none).
  /// ResourceUnavailable when there are no sensors or the camera cannot be started.
  [[nodiscard]] std::expected<void, core::PipelineError> initialize();

  /// Switches to sensors()[index]. InvalidConfig for an out-of-range index.
  [[nodiscard]] std::expected<void, core::PipelineError> switch_to(std::size_t index);

  /// Moves to the next sensor; a no-op on single-sensor devices.
  [[nodiscard]] std::expected<void, core::PipelineError> toggle_camera();

  /// Idempotent teardown.
  void shutdown();

  /// Receives every delivered frame (delivery thread), before back-pressure is applied.
  void set_preview_callback(PreviewCallback callback);

  [[nodiscard]] const pipeline::DetectionPublisher& publisher() const noexcept { return publisher_; }
  [[nodiscard]] pipeline::DetectionPublisher& publisher() noexcept { return publisher_; }
  [[nodiscard]] const core::PipelineState& state() const noexcept { return state_; }
  [[nodiscard]] pipeline::DetectionPipeline& detection_pipeline() noexcept { return pipeline_; }

  [[nodiscard]] std::vector<core::SensorDescriptor> sensors() const;
  [[nodiscard]] std::optional<std::size_t> selected_index() const;
  [[nodiscard]] std::size_t face_count() const;
  [[nodiscard]] pipeline::PipelineStats stats() const { return processor_.stats(); }
  [[nodiscard]] bool active() const noexcept { return camera_ && camera_->running(); }

 private:
  void on_frame(core::CameraFrame frame);
  void stop_delivery();
  // Requires control_mutex_.
  std::expected<void, core::PipelineError> switch_to_locked(std::size_t index);

  SessionOptions options_;
  core::PipelineState state_;
  pipeline::DetectionPublisher publisher_;
  pipeline::DetectionPipeline pipeline_;
  pipeline::FrameProcessor processor_;
  std::unique_ptr<ICameraSource> camera_;

  mutable std::mutex control_mutex_;
  std::vector<core::SensorDescriptor> sensors_;
  std::optional<std::size_t> selected_;
  bool shut_down_{false};

  mutable std::mutex preview_mutex_;
  PreviewCallback preview_;
};

}  // namespace facelens::app
