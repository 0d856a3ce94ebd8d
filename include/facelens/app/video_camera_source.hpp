#pragma once

#include <facelens/app/camera_source.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>


namespace facelens::app {

/// Frames from cv::VideoCapture (webcam index or video file), delivered as BGRA8888.
/// Exposes a single external sensor with orientation 0.
class VideoCameraSource : public ICameraSource {
 public:
  /// device: a decimal camera index ("0") or a file path / URL.
  VideoCameraSource(std::string device, std::uint32_t width, std::uint32_t height);
  ~VideoCameraSource() override;

  [[nodiscard]] std::vector<core::SensorDescriptor> available_sensors() override;

  [[nodiscard]] std::expected<void, core::PipelineError> start(const core::SensorDescriptor& sensor,
                                                               FrameCallback callback) override;
  void stop() override;
  [[nodiscard]] bool running() const override { return running_.load(); }

 private:
  struct Capture;

  void run();

  std::string device_;
  std::uint32_t width_;
  std::uint32_t height_;
  std::unique_ptr<Capture> capture_;
  FrameCallback callback_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace facelens::app
