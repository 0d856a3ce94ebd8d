#pragma once

#include <facelens/core/detector_options.hpp>
#include <facelens/vision/face_detector.hpp>
#include <memory>
#include <string>

namespace facelens::vision {

/// ONNX Runtime face detector for UltraFace-style models.
///
/// Expected model: one float input [1,3,H,W] (RGB, (x - 127) / 128) and two outputs,
/// scores [1,N,2] (background, face) and boxes [1,N,4] (x1,y1,x2,y2 normalised 0..1).
/// Outputs named "scores" and "boxes" are used when present, otherwise the first two outputs
/// in that order.
///
/// The image is decoded to RGB, rotated upright, resized to the model input and run; boxes are
/// decoded (confidence threshold + NMS) and mapped back to sensor space.
class OnnxFaceDetector : public IFaceDetector {
 public:
  /// Throws Ort::Exception if the model cannot be loaded and std::runtime_error if its
  /// inputs or outputs do not match the layout above.
  OnnxFaceDetector(const std::string& model_path, core::DetectorOptions options);

  ~OnnxFaceDetector() override;

  OnnxFaceDetector(const OnnxFaceDetector&) = delete;
  OnnxFaceDetector& operator=(const OnnxFaceDetector&) = delete;

  [[nodiscard]] std::expected<std::vector<core::Detection>, core::PipelineError>
  detect(const core::InputImage& input) override;

  void warmup() override;
  void reset_tracking() override;
  void close() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "onnx"; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace facelens::vision
