#include <facelens/vision/cascade_face_detector.hpp>
#include <facelens/core/logger.hpp>
#include <facelens/core/orientation.hpp>
#include <facelens/vision/image_convert.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace facelens::vision {

namespace {

// Fast mode detects on an image whose longer side is at most this many pixels.
constexpr int kFastMaxSide = 480;

struct CascadeParams {
  double scale_factor;
  int min_neighbors;
};

CascadeParams params_for(core::PerformanceMode mode) {
  if (mode == core::PerformanceMode::Accurate) {
    return {1.05, 5};
  }
  return {1.2, 3};
}

}  // namespace

CascadeFaceDetector::CascadeFaceDetector(const std::string& cascade_path,
                                         core::DetectorOptions options)
    : options_(options) {
  if (!classifier_.load(cascade_path)) {
    throw std::runtime_error("CascadeFaceDetector: cannot load cascade '" + cascade_path + "'");
  }
  core::Logger::info("CascadeFaceDetector: loaded ", cascade_path, " (",
                     options_.performance_mode == core::PerformanceMode::Fast ? "fast"
                                                                              : "accurate",
                     ")");
}

void CascadeFaceDetector::close() {
  closed_ = true;
  classifier_ = cv::CascadeClassifier();
  tracker_.reset();
}

std::expected<std::vector<core::Detection>, core::PipelineError> CascadeFaceDetector::detect(
    const core::InputImage& input) {
  if (closed_) {
    return std::unexpected(core::PipelineError::ResourceUnavailable);
  }
  auto gray = to_gray(input);
  if (!gray) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  const auto& descriptor = input.descriptor();
  cv::Mat upright = rotate_upright(*gray, descriptor.rotation);

  double scale = 1.0;
  if (options_.performance_mode == core::PerformanceMode::Fast) {
    const int longer = std::max(upright.cols, upright.rows);
    if (longer > kFastMaxSide) {
      scale = static_cast<double>(kFastMaxSide) / longer;
      cv::Mat small;
      cv::resize(upright, small, cv::Size(), scale, scale, cv::INTER_AREA);
      upright = small;
    }
  }
  cv::Mat equalized;
  cv::equalizeHist(upright, equalized);

  const int shorter = std::min(equalized.cols, equalized.rows);
  const int min_side = std::max(1, static_cast<int>(options_.min_face_size * shorter));
  const CascadeParams params = params_for(options_.performance_mode);

  std::vector<cv::Rect> faces;
  std::vector<int> reject_levels;
  std::vector<double> level_weights;
  classifier_.detectMultiScale(equalized, faces, reject_levels, level_weights, params.scale_factor,
                               params.min_neighbors, 0, cv::Size(min_side, min_side), cv::Size(),
                               true);

  const core::Size sensor_size = descriptor.size();
  std::vector<core::Detection> detections;
  detections.reserve(faces.size());
  for (std::size_t i = 0; i < faces.size(); ++i) {
    const cv::Rect& f = faces[i];
    const core::Rect upright_box{static_cast<float>(f.x / scale), static_cast<float>(f.y / scale),
                                 static_cast<float>((f.x + f.width) / scale),
                                 static_cast<float>((f.y + f.height) / scale)};
    core::Detection d;
    d.bounding_box = core::upright_to_sensor(upright_box, sensor_size, descriptor.rotation);
    d.confidence = i < level_weights.size() ? static_cast<float>(level_weights[i]) : 1.f;
    detections.push_back(std::move(d));
  }

  if (options_.tracking) {
    tracker_.update(detections);
  }
  return detections;
}

}  // namespace facelens::vision
