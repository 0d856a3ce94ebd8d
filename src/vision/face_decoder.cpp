#include <facelens/vision/face_decoder.hpp>
#include <algorithm>
#include <cstddef>

namespace facelens::vision {

FaceDecoder::FaceDecoder(float confidence_threshold,
                         float nms_iou_threshold,
                         std::size_t max_detections)
    : confidence_threshold_(confidence_threshold),
      nms_iou_threshold_(nms_iou_threshold),
      max_detections_(max_detections) {}

std::vector<core::Detection> non_max_suppression(std::vector<core::Detection> detections,
                                                 float iou_threshold) {
  std::stable_sort(detections.begin(), detections.end(),
                   [](const core::Detection& a, const core::Detection& b) {
                     return a.confidence > b.confidence;
                   });
  std::vector<core::Detection> kept;
  std::vector<char> suppressed(detections.size(), 0);
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (suppressed[i]) continue;
    kept.push_back(detections[i]);
    for (std::size_t j = i + 1; j < detections.size(); ++j) {
      if (!suppressed[j] &&
          core::iou(detections[i].bounding_box, detections[j].bounding_box) > iou_threshold) {
        suppressed[j] = 1;
      }
    }
  }
  return kept;
}

std::vector<core::Detection> FaceDecoder::decode(const InferenceResult& result,
                                                 const core::Size& image_size) const {
  std::vector<core::Detection> candidates;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);

  for (std::size_t i = 0; i < n; ++i) {
    const float score = i < result.scores.size() ? result.scores[i] : 0.f;
    if (score < confidence_threshold_) {
      continue;
    }
    if (i * 4 + 3 >= result.boxes.size()) {
      break;
    }

    core::Detection d;
    d.confidence = score;
    d.bounding_box.left = std::clamp(result.boxes[i * 4 + 0], 0.f, 1.f) * image_size.width;
    d.bounding_box.top = std::clamp(result.boxes[i * 4 + 1], 0.f, 1.f) * image_size.height;
    d.bounding_box.right = std::clamp(result.boxes[i * 4 + 2], 0.f, 1.f) * image_size.width;
    d.bounding_box.bottom = std::clamp(result.boxes[i * 4 + 3], 0.f, 1.f) * image_size.height;
    if (d.bounding_box.right <= d.bounding_box.left || d.bounding_box.bottom <= d.bounding_box.top) {
      continue;
    }
    candidates.push_back(std::move(d));
  }

  auto kept = non_max_suppression(std::move(candidates), nms_iou_threshold_);
  if (kept.size() > max_detections_) {
    kept.resize(max_detections_);
  }
  return kept;
}

}  // namespace facelens::vision
