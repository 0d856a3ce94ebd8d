#pragma once

#include <facelens/core/detector_options.hpp>
#include <facelens/vision/face_detector.hpp>
#include <facelens/vision/face_tracker.hpp>
#include <opencv2/objdetect.hpp>
#include <string>

namespace facelens::vision {

/// OpenCV Haar/LBP cascade face detector.
///
/// Detects on the upright grayscale image (luma plane for YUV input), then maps boxes back
/// to sensor space. performance_mode picks the speed/recall trade-off; min_face_size bounds
/// the smallest face. Tracking ids come from FaceTracker when options.tracking is set.
/// The cascade provides no classification or landmarks; those fields stay empty.
class CascadeFaceDetector : public IFaceDetector {
 public:
  /// Throws std::runtime_error if the cascade file cannot be loaded.
  CascadeFaceDetector(const std::string& cascade_path, core::DetectorOptions options);

  [[nodiscard]] std::expected<std::vector<core::Detection>, core::PipelineError>
  detect(const core::InputImage& input) override;

  void reset_tracking() override { tracker_.reset(); }
  void close() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "cascade"; }

 private:
  cv::CascadeClassifier classifier_;
  core::DetectorOptions options_;
  FaceTracker tracker_;
  bool closed_{false};
};

}  // namespace facelens::vision
