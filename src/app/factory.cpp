#include <facelens/app/factory.hpp>
#include <facelens/app/synthetic_camera_source.hpp>
#include <facelens/app/video_camera_source.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/vision/cascade_face_detector.hpp>
#include <facelens/vision/mock_face_detector.hpp>
#ifdef FACELENS_HAS_ONNXRUNTIME
#include <facelens/vision/onnx_face_detector.hpp>
#endif
#include <chrono>
#include <exception>

namespace facelens::app {

namespace {

std::unique_ptr<vision::IFaceDetector> make_mock(const AppConfig& config) {
  const auto w = static_cast<float>(config.frame_width);
  const auto h = static_cast<float>(config.frame_height);
  core::Detection face;
  face.bounding_box = core::Rect{w * 0.35f, h * 0.3f, w * 0.65f, h * 0.7f};
  face.confidence = 0.95f;
  if (config.detector.tracking) face.tracking_id = 1;
  if (config.detector.classification) {
    face.classification = core::FaceClassification{0.8f, 0.9f, 0.9f};
  }
  auto mock = std::make_unique<vision::MockFaceDetector>();
  mock->set_detections({face});
  return mock;
}

}  // namespace

std::expected<std::unique_ptr<vision::IFaceDetector>, core::PipelineError>
make_face_detector(const AppConfig& config) {
  switch (config.detector_backend) {
  case DetectorBackendType::Mock:
    return make_mock(config);

  case DetectorBackendType::Cascade:
    if (config.model_path.empty()) {
      core::Logger::error("detector_backend=cascade requires model_path (cascade XML)");
      return std::unexpected(core::PipelineError::InvalidConfig);
    }
    try {
      return std::make_unique<vision::CascadeFaceDetector>(config.model_path, config.detector);
    } catch (const std::exception& e) {
      core::Logger::error("Cannot load cascade ", config.model_path, ": ", e.what());
      return std::unexpected(core::PipelineError::ResourceUnavailable);
    }

  case DetectorBackendType::Onnx:
    if (config.model_path.empty()) {
      core::Logger::error("detector_backend=onnx requires model_path (.onnx file)");
      return std::unexpected(core::PipelineError::InvalidConfig);
    }
#ifdef FACELENS_HAS_ONNXRUNTIME
    try {
      return std::make_unique<vision::OnnxFaceDetector>(config.model_path, config.detector);
    } catch (const std::exception& e) {
      core::Logger::error("Cannot load ONNX model ", config.model_path, ": ", e.what());
      return std::unexpected(core::PipelineError::ResourceUnavailable);
    }
#else
    core::Logger::error("ONNX backend not available (build with ONNX Runtime)");
    return std::unexpected(core::PipelineError::ResourceUnavailable);
#endif
  }
  return std::unexpected(core::PipelineError::InvalidConfig);
}

std::unique_ptr<ICameraSource> make_camera_source(const AppConfig& config) {
  if (config.camera_source == CameraSourceType::Video) {
    return std::make_unique<VideoCameraSource>(config.video_device, config.frame_width,
                                               config.frame_height);
  }
  SyntheticCameraOptions options;
  options.sensors = default_phone_sensors();
  options.width = config.frame_width;
  options.height = config.frame_height;
  options.frame_rate = config.frame_rate;
  return std::make_unique<SyntheticCameraSource>(std::move(options));
}

SessionOptions make_session_options(const AppConfig& config) {
  SessionOptions options;
  options.rotation.platform = config.platform;
  options.rotation.compensate_front_rotation = config.compensate_front_rotation;
  options.pipeline.inference_timeout = std::chrono::milliseconds(config.inference_timeout_ms);
  return options;
}

}  // namespace facelens::app
