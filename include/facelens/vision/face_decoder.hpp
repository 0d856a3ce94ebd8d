#pragma once

#include <facelens/core/detection.hpp>
#include <facelens/core/geometry.hpp>
#include <facelens/vision/inference_result.hpp>
#include <cstddef>
#include <vector>

namespace facelens::vision {

/// Decodes InferenceResult -> vector<Detection> with a confidence threshold and greedy NMS.
class FaceDecoder {
 public:
  FaceDecoder(float confidence_threshold, float nms_iou_threshold, std::size_t max_detections = 64);

  /// Boxes are scaled from normalised coordinates to image_size pixels and clamped to it.
  /// Output is sorted by descending confidence.
  [[nodiscard]] std::vector<core::Detection> decode(const InferenceResult& result,
                                                    const core::Size& image_size) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept { return confidence_threshold_; }

 private:
  float confidence_threshold_;
  float nms_iou_threshold_;
  std::size_t max_detections_;
};

/// Greedy non-maximum suppression: keeps the highest-confidence box of each overlapping
/// group (IoU above iou_threshold).
[[nodiscard]] std::vector<core::Detection> non_max_suppression(std::vector<core::Detection> detections,
                                                               float iou_threshold);

}  // namespace facelens::vision
