#pragma once

#include <facelens/app/camera_source.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace facelens::app {

struct SyntheticCameraOptions {
  std::vector<core::SensorDescriptor> sensors;
  std::uint32_t width{640};
  std::uint32_t height{480};
  std::uint32_t frame_rate{30};  // 0: no delivery thread, frames only via deliver()
  core::PixelFormat format{core::PixelFormat::Nv21};
};

/// Default sensor pair of a phone: back camera at 90 degrees, front camera at 270.
[[nodiscard]] std::vector<core::SensorDescriptor> default_phone_sensors();

/// Generates frames showing a face-like blob drifting across a gray background.
class SyntheticCameraSource : public ICameraSource {
 public:
  explicit SyntheticCameraSource(SyntheticCameraOptions options);
  ~SyntheticCameraSource() override;

  [[nodiscard]] std::vector<core::SensorDescriptor> available_sensors() override;

  [[nodiscard]] std::expected<void, core::PipelineError> start(const core::SensorDescriptor& sensor,
                                                               FrameCallback callback) override;
  void stop() override;
  [[nodiscard]] bool running() const override { return running_.load(); }

  /// Pushes a frame through the callback on the calling thread (no-op when stopped).
  /// Returns false when not running.
  bool deliver(core::CameraFrame frame);

  /// Renders the next generated frame without delivering it.
  [[nodiscard]] core::CameraFrame generate_frame();

  /// Make the next start() fail with ResourceUnavailable (permission denied, device busy).
  void fail_next_start(bool fail) { fail_next_start_.store(fail); }

  [[nodiscard]] std::uint32_t start_count() const noexcept { return start_count_.load(); }
  [[nodiscard]] std::optional<core::SensorDescriptor> active_sensor() const;

 private:
  void run();

  SyntheticCameraOptions options_;
  mutable std::mutex mutex_;  // guards callback_ and active_
  FrameCallback callback_;
  std::optional<core::SensorDescriptor> active_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> fail_next_start_{false};
  std::atomic<std::uint32_t> start_count_{0};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace facelens::app
