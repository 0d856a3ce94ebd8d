#pragma once

#include <facelens/core/detector_options.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/core/sensor.hpp>
#include <cstdint>
#include <string>

namespace facelens::app {

/// Face detection engine: mock (synthetic), cascade (OpenCV) or onnx (ONNX Runtime model).
enum class DetectorBackendType {
  Mock,
  Cascade,
  Onnx,
};

/// Frame producer: synthetic (generated NV21 frames) or video (cv::VideoCapture).
enum class CameraSourceType {
  Synthetic,
  Video,
};

/// Application configuration: detector, camera delivery, rendering and logging.
struct AppConfig {
  DetectorBackendType detector_backend{DetectorBackendType::Mock};
  std::string model_path;
  core::DetectorOptions detector;
  std::uint32_t inference_timeout_ms{0};

  core::Platform platform{core::Platform::Android};
  bool compensate_front_rotation{true};

  CameraSourceType camera_source{CameraSourceType::Synthetic};
  std::string video_device{"0"};  // device index or file path
  std::uint32_t frame_width{640};
  std::uint32_t frame_height{480};
  std::uint32_t frame_rate{30};

  std::uint32_t render_width{480};
  std::uint32_t render_height{640};
  float label_offset{20.f};
  float stroke_width{3.f};

  core::LogLevel log_level{core::LogLevel::Info};
};

/// Load config from a key=value file (one per line, '#' comments) on top of the defaults.
/// A missing file yields the defaults; unknown keys and bad values are logged and skipped.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// Applies one key=value pair. Returns false for unknown keys or unparsable values.
bool apply_setting(AppConfig& config, const std::string& key, const std::string& value);

}  // namespace facelens::app
