#pragma once

#include <facelens/app/camera_source.hpp>
#include <facelens/app/config.hpp>
#include <facelens/app/face_camera_session.hpp>
#include <facelens/core/error.hpp>
#include <facelens/vision/face_detector.hpp>
#include <expected>
#include <memory>

namespace facelens::app {

/// Builds the detector selected by config.detector_backend.
/// Mock returns one tracked face in the centre of the frame. Cascade and onnx need model_path
/// (InvalidConfig when empty); a model that cannot be loaded, or onnx in a build without
/// ONNX Runtime, yields ResourceUnavailable.
[[nodiscard]] std::expected<std::unique_ptr<vision::IFaceDetector>, core::PipelineError>
make_face_detector(const AppConfig& config);

/// Builds the camera source selected by config.camera_source.
[[nodiscard]] std::unique_ptr<ICameraSource> make_camera_source(const AppConfig& config);

/// Rotation policy and pipeline options for a session built from config.
[[nodiscard]] SessionOptions make_session_options(const AppConfig& config);

}  // namespace facelens::app
